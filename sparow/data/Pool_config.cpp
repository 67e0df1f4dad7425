#include <sparow/data/Pool_config.hpp>

namespace sparow::data::detail {

  void
  to_json(json& j, Pool_config const& config)
  {
    j = {{"buffers", config.buffers}, {"buffer_length", config.buffer_length}};
  }

  void
  from_json(const json& j, Pool_config& config)
  {
    config = Pool_config{};
    if (j.contains("buffers")) {
      j.at("buffers").get_to(config.buffers);
    }
    if (j.contains("buffer_length")) {
      j.at("buffer_length").get_to(config.buffer_length);
    }
  }

} // end of namespace sparow::data::detail

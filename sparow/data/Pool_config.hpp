#pragma once

//
// ... sparow header files
//
#include <sparow/config.hpp>
#include <sparow/data/import.hpp>

namespace sparow::data::detail {

  /**
   * @brief Startup configuration of the scratch buffer pool.
   *
   * @c buffers is the number of buffers in the pool, which also bounds
   * the number of matrix products in their column-extraction phase at
   * once. @c buffer_length is the initial capacity reserved in each
   * buffer.
   */
  struct Pool_config
  {
    config::size_type buffers = config::scratch_buffers;
    config::size_type buffer_length = config::scratch_buffer_length;

    friend bool
    operator==(Pool_config const&, Pool_config const&) = default;
  };

  void
  to_json(json& j, Pool_config const& config);

  // Keys absent from @p j keep their compile-time defaults.
  void
  from_json(const json& j, Pool_config& config);

} // end of namespace sparow::data::detail

#pragma once

//
// ... sparow header files
//
#include <sparow/config.hpp>

namespace sparow::data::detail {

  /**
   * @brief A stored entry of a sparse row: its column index and value.
   */
  template<typename T = config::value_type>
  struct Element
  {
    config::size_type index;
    T value;

    friend bool
    operator==(Element const& a, Element const& b) = default;
  };

} // end of namespace sparow::data::detail

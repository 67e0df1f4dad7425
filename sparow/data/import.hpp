#pragma once

//
// ... Standard header files
//
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

//
// ... External header files
//
#include <nlohmann/json.hpp>

namespace sparow::data::detail {

  using size_type = std::ptrdiff_t;

  using nlohmann::json;

  using std::optional;
  using std::span;
  using std::vector;

  using std::logic_error;

} // end of namespace sparow::data::detail

#pragma once

//
// ... sparow header files
//
#include <sparow/config.hpp>
#include <sparow/data.hpp>

namespace sparow {
  using namespace ::sparow::data;
} // end of namespace sparow

#pragma once

//
// ... sparow header files
//
#include <sparow/config.hpp>
#include <sparow/data/Sparse_matrix.hpp>

namespace sparow::testing {

  // Every row strictly ascending with all indices inside [0, columns()).
  template <typename T>
  bool
  well_formed(sparow::data::detail::Sparse_matrix<T> const& m) {
    for (config::size_type r = 0; r < m.rows(); ++r) {
      config::size_type previous = -1;
      for (auto const& e : m.row(r)) {
        if (e.index <= previous || e.index >= m.columns()) {
          return false;
        }
        previous = e.index;
      }
    }
    return true;
  }

} // end of namespace sparow::testing

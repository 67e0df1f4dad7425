#pragma once

//
// ... Standard header files
//
#include <random>
#include <vector>

//
// ... sparow header files
//
#include <sparow/config.hpp>
#include <sparow/data/Shape.hpp>
#include <sparow/data/Sparse_matrix.hpp>

namespace sparow::data::detail {

  // Random matrix whose cells are each populated, with probability
  // `density`, by a call to `fn()`. Cells are written through set(), so
  // each populated cell costs a binary search of its row.
  //
  // Throws Zero_length_error if either dimension is less than one.
  template <typename T = config::value_type, typename F, typename URBG>
  Sparse_matrix<T>
  func_sparse(
    config::size_type rows,
    config::size_type cols,
    double density,
    F fn,
    URBG& urbg) {
    Sparse_matrix<T> m(Shape{rows, cols});
    std::uniform_real_distribution<double> draw(0.0, 1.0);

    for (config::size_type i = 0; i < rows; ++i) {
      for (config::size_type j = 0; j < cols; ++j) {
        if (draw(urbg) < density) {
          m.set(i, j, static_cast<T>(fn()));
        }
      }
    }
    return m;
  }

  // Build an n x n diagonal matrix from a vector of diagonal values.
  // Zero diagonal values are not stored.
  template <typename T = config::value_type>
  Sparse_matrix<T>
  diagonal_sparse(std::vector<T> const& diag) {
    auto n = static_cast<config::size_type>(diag.size());

    Sparse_matrix<T> m(Shape{n, n});
    for (config::size_type i = 0; i < n; ++i) {
      if (auto v = diag[static_cast<std::size_t>(i)]; v != T{0}) {
        m.set(i, i, v);
      }
    }
    return m;
  }

  // Build an n x n tridiagonal matrix with given sub-diagonal,
  // diagonal, and super-diagonal values.
  template <typename T = config::value_type>
  Sparse_matrix<T>
  tridiagonal_sparse(config::size_type n, T sub, T diag, T super) {
    Sparse_matrix<T> m(Shape{n, n});

    for (config::size_type i = 0; i < n; ++i) {
      if (i > 0) { m.set(i, i - 1, sub); }
      m.set(i, i, diag);
      if (i + 1 < n) { m.set(i, i + 1, super); }
    }
    return m;
  }

} // end of namespace sparow::data::detail

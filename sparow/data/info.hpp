#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <utility>

//
// ... External header files
//
#include <nlohmann/json.hpp>

//
// ... sparow header files
//
#include <sparow/data/Shape.hpp>
#include <sparow/data/Sparse_matrix.hpp>

namespace sparow::data::detail {

  // Number of stored elements whose value is exactly zero. Arithmetic
  // leaves these behind until the matrix is cleaned.
  template<typename T>
  config::size_type
  explicit_zero_count(Sparse_matrix<T> const& A)
  {
    config::size_type count = 0;
    for (config::size_type i = 0; i < A.rows(); ++i) {
      for (auto const& e : A.row(i)) {
        if (e.value == T{0}) {
          ++count;
        }
      }
    }
    return count;
  }

  // Fraction of the logical cells that are stored.
  template<typename T>
  double
  density(Sparse_matrix<T> const& A)
  {
    return static_cast<double>(A.size()) /
      (static_cast<double>(A.rows()) * static_cast<double>(A.columns()));
  }

  template<typename T>
  std::pair<config::size_type, config::size_type>
  bandwidth(Sparse_matrix<T> const& A)
  {
    config::size_type lower = 0;
    config::size_type upper = 0;

    for (config::size_type i = 0; i < A.rows(); ++i) {
      for (auto const& e : A.row(i)) {
        auto col = e.index;
        if (i >= col) {
          lower = std::max(lower, i - col);
        }
        if (col >= i) {
          upper = std::max(upper, col - i);
        }
      }
    }
    return {lower, upper};
  }

  template<typename T>
  config::size_type
  diagonal_occupancy(Sparse_matrix<T> const& A)
  {
    auto diag_len = std::min(A.rows(), A.columns());

    config::size_type count = 0;
    for (config::size_type i = 0; i < diag_len; ++i) {
      auto const& row = A.row(i);
      auto it = std::lower_bound(
        row.begin(), row.end(), i,
        [](auto const& e, config::size_type index) { return e.index < index; });
      if (it != row.end() && it->index == i) {
        ++count;
      }
    }
    return count;
  }

  // Structural summary of a matrix, suitable for logging.
  template<typename T>
  nlohmann::json
  info_report(Sparse_matrix<T> const& A)
  {
    auto [lower, upper] = bandwidth(A);

    nlohmann::json j;
    j["shape"] = A.shape();
    j["stored"] = A.size();
    j["explicit_zeros"] = explicit_zero_count(A);
    j["density"] = density(A);
    j["bandwidth"] = {{"lower", lower}, {"upper", upper}};
    j["diagonal_occupancy"] = diagonal_occupancy(A);
    j["frobenius_norm"] = A.norm(norm_fro);
    return j;
  }

} // end of namespace sparow::data::detail

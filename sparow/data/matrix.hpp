#pragma once

//
// ... Standard header files
//
#include <string>
#include <variant>
#include <vector>

//
// ... sparow header files
//
#include <sparow/config.hpp>
#include <sparow/data/Dense_matrix.hpp>
#include <sparow/data/Sparse_matrix.hpp>
#include <sparow/data/errors.hpp>

namespace sparow::data::detail {

  /**
   * @brief A matrix in any of the supported representations.
   *
   * The binary operations below are implemented for the sparse/sparse
   * pairing only. Any pairing involving another representation throws
   * Not_implemented_error instead of computing a result.
   */
  template <typename T = config::value_type>
  using Matrix = std::variant<Sparse_matrix<T>, Dense_matrix<T>>;

  template <typename T>
  char const*
  representation(Sparse_matrix<T> const&) {
    return "sparse";
  }

  template <typename T>
  char const*
  representation(Dense_matrix<T> const&) {
    return "dense";
  }

  template <typename T>
  char const*
  representation(Matrix<T> const& m) {
    return std::visit([](auto const& x) { return representation(x); }, m);
  }

  template <typename T, typename Op>
  decltype(auto)
  sparse_pair(char const* operation,
              Matrix<T> const& a,
              Matrix<T> const& b,
              Op op) {
    auto const* sa = std::get_if<Sparse_matrix<T>>(&a);
    auto const* sb = std::get_if<Sparse_matrix<T>>(&b);
    if (sa == nullptr || sb == nullptr) {
      throw Not_implemented_error(
        std::string(operation) + " of " + representation(a) + " and " +
        representation(b) + " matrices");
    }
    return op(*sa, *sb);
  }

  template <typename T>
  Matrix<T>
  add(Matrix<T> const& a, Matrix<T> const& b) {
    return sparse_pair("add", a, b, [](auto const& x, auto const& y) {
      return Matrix<T>{x.add(y)};
    });
  }

  template <typename T>
  Matrix<T>
  subtract(Matrix<T> const& a, Matrix<T> const& b) {
    return sparse_pair("subtract", a, b, [](auto const& x, auto const& y) {
      return Matrix<T>{x.subtract(y)};
    });
  }

  template <typename T>
  Matrix<T>
  multiply_elementwise(Matrix<T> const& a, Matrix<T> const& b) {
    return sparse_pair(
      "multiply_elementwise", a, b, [](auto const& x, auto const& y) {
        return Matrix<T>{x.multiply_elementwise(y)};
      });
  }

  template <typename T>
  bool
  equals(Matrix<T> const& a, Matrix<T> const& b) {
    return sparse_pair("equals", a, b, [](auto const& x, auto const& y) {
      return x.equals(y);
    });
  }

  template <typename T>
  bool
  approx_equals(Matrix<T> const& a, Matrix<T> const& b, T epsilon) {
    return sparse_pair(
      "approx_equals", a, b, [epsilon](auto const& x, auto const& y) {
        return x.approx_equals(y, epsilon);
      });
  }

  template <typename T>
  T
  inner_product(Matrix<T> const& a, Matrix<T> const& b) {
    return sparse_pair(
      "inner_product", a, b, [](auto const& x, auto const& y) {
        return x.inner_product(y);
      });
  }

  template <typename T>
  Matrix<T>
  dot(Matrix<T> const& a, Matrix<T> const& b) {
    return sparse_pair("dot", a, b, [](auto const& x, auto const& y) {
      return Matrix<T>{x.dot(y)};
    });
  }

  template <typename T>
  Matrix<T>
  augment(Matrix<T> const& a, Matrix<T> const& b) {
    return sparse_pair("augment", a, b, [](auto const& x, auto const& y) {
      return Matrix<T>{x.augment(y)};
    });
  }

  template <typename T>
  Matrix<T>
  stack(Matrix<T> const& a, Matrix<T> const& b) {
    return sparse_pair("stack", a, b, [](auto const& x, auto const& y) {
      return Matrix<T>{x.stack(y)};
    });
  }

  /**
   * @brief Concatenate the non-zero values of @p mats, row by row, into a
   *        1 x n row vector.
   *
   * Sparse operands contribute their non-zero stored values and dense
   * operands their non-zero cells, both in row-major order.
   *
   * @throws Zero_length_error if no operand holds a non-zero value.
   */
  template <typename T>
  Sparse_matrix<T>
  elements_sparse(std::vector<Matrix<T>> const& mats) {
    std::vector<T> values;
    for (auto const& m : mats) {
      if (auto const* s = std::get_if<Sparse_matrix<T>>(&m)) {
        auto v = s->elements_vector();
        values.insert(values.end(), v.begin(), v.end());
      } else {
        for (auto v : std::get<Dense_matrix<T>>(m).values()) {
          if (v != T{0}) {
            values.push_back(v);
          }
        }
      }
    }

    Sparse_matrix<T> result(Shape{1, static_cast<config::size_type>(values.size())});
    for (std::size_t k = 0; k < values.size(); ++k) {
      result.set(0, static_cast<config::size_type>(k), values[k]);
    }
    return result;
  }

} // end of namespace sparow::data::detail

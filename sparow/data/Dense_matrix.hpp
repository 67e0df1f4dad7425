#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <span>
#include <vector>

//
// ... sparow header files
//
#include <sparow/config.hpp>
#include <sparow/data/Shape.hpp>
#include <sparow/data/errors.hpp>

namespace sparow::data::detail {

  /**
   * @brief Row-major dense storage of every logical cell of a matrix.
   *
   * This is the target of Sparse_matrix::to_dense() and the dense
   * alternative of the Matrix variant. It holds values only; dense
   * arithmetic is not provided.
   */
  template <typename T = config::value_type>
  class Dense_matrix final {
  public:
    using size_type = config::size_type;

    explicit Dense_matrix(Shape shape)
        : shape_(shape)
        , values_(static_cast<std::size_t>(shape.row() * shape.column()), T{0}) {}

    /**
     * @throws Zero_length_error if @p rows or its first row is empty.
     * @throws Row_length_error if the rows differ in length.
     */
    explicit Dense_matrix(std::vector<std::vector<T>> const& rows)
        : Dense_matrix(shape_of(rows)) {
      auto cols = static_cast<std::size_t>(shape_.column());
      for (std::size_t i = 0; i < rows.size(); ++i) {
        std::copy(rows[i].begin(), rows[i].end(), values_.begin() + i * cols);
      }
    }

    Shape
    shape() const {
      return shape_;
    }

    T
    operator()(size_type row, size_type col) const {
      return values_[offset(row, col)];
    }

    T&
    operator()(size_type row, size_type col) {
      return values_[offset(row, col)];
    }

    std::span<T const>
    values() const {
      return {values_.data(), values_.size()};
    }

    std::vector<std::vector<T>>
    rows() const {
      auto cols = static_cast<std::size_t>(shape_.column());
      std::vector<std::vector<T>> result;
      result.reserve(static_cast<std::size_t>(shape_.row()));
      for (auto it = values_.begin(); it != values_.end(); it += cols) {
        result.emplace_back(it, it + cols);
      }
      return result;
    }

    friend bool
    operator==(Dense_matrix const& a, Dense_matrix const& b) = default;

  private:
    static Shape
    shape_of(std::vector<std::vector<T>> const& rows) {
      if (rows.empty() || rows.front().empty()) {
        throw Zero_length_error();
      }
      for (auto const& row : rows) {
        if (row.size() != rows.front().size()) {
          throw Row_length_error();
        }
      }
      return Shape{static_cast<size_type>(rows.size()),
                   static_cast<size_type>(rows.front().size())};
    }

    std::size_t
    offset(size_type row, size_type col) const {
      if (row < 0 || row >= shape_.row() || col < 0 || col >= shape_.column()) {
        throw Index_out_of_range_error();
      }
      return static_cast<std::size_t>(row * shape_.column() + col);
    }

    Shape shape_;
    std::vector<T> values_;

  }; // end of class Dense_matrix

} // end of namespace sparow::data::detail

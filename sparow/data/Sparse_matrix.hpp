#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

//
// ... sparow header files
//
#include <sparow/config.hpp>
#include <sparow/data/Dense_matrix.hpp>
#include <sparow/data/Element.hpp>
#include <sparow/data/Scratch_pool.hpp>
#include <sparow/data/Shape.hpp>
#include <sparow/data/Sparse_row.hpp>
#include <sparow/data/errors.hpp>
#include <sparow/data/summation.hpp>

namespace sparow::data::detail {

  /// Direction of an axis reduction.
  enum class Axis {
    row,   ///< one result per row: a rows x 1 column vector
    column ///< one result per column: a 1 x cols row vector
  };

  // Orders accepted by Sparse_matrix::norm besides 1 and -1.
  // Zero is an alias for norm_fro.
  inline constexpr int norm_inf = std::numeric_limits<int>::max();
  inline constexpr int norm_fro = norm_inf - 1;

  /**
   * @brief A matrix stored as one Sparse_row per matrix row.
   *
   * Every row holds elements strictly ascending by column index, all in
   * [0, columns()). Rows are owned by value: copying a matrix copies its
   * rows, and no two matrices share storage.
   *
   * Binary operations return a new matrix and never modify their
   * operands; set() is the only mutating operation. Arithmetic may leave
   * stored zeros behind. They read as zero but are kept until clean() is
   * called.
   *
   * Indexing, shape and square violations throw the corresponding
   * sparow exception.
   */
  template <typename T = config::value_type>
  class Sparse_matrix final {
  public:
    using size_type = config::size_type;
    using value_type = T;
    using row_type = Sparse_row<T>;
    using element_type = Element<T>;

    /**
     * @brief The zero matrix of the given shape.
     */
    explicit Sparse_matrix(Shape shape)
        : shape_(shape)
        , rows_(static_cast<std::size_t>(shape.row())) {}

    /**
     * @brief Construct from dense data, storing only the non-zero cells.
     *
     * @throws Zero_length_error if there are no rows or the first row is
     *         empty.
     * @throws Row_length_error if the rows differ in length.
     */
    explicit Sparse_matrix(std::vector<std::vector<T>> const& dense)
        : Sparse_matrix(shape_of(dense)) {
      for (std::size_t i = 0; i < dense.size(); ++i) {
        rows_[i] = row_type(std::span<T const>(dense[i]));
      }
    }

    Sparse_matrix(std::initializer_list<std::initializer_list<T>> const& dense)
        : Sparse_matrix(to_vectors(dense)) {}

    explicit Sparse_matrix(Dense_matrix<T> const& dense)
        : Sparse_matrix(dense.shape()) {
      auto cols = static_cast<std::size_t>(shape_.column());
      auto values = dense.values();
      for (std::size_t i = 0; i < rows_.size(); ++i) {
        rows_[i] = row_type(values.subspan(i * cols, cols));
      }
    }

    /**
     * @brief Construct from prepared rows.
     *
     * @throws Column_length_error if the number of rows is not
     *         @p shape.row().
     * @throws Index_out_of_range_error if a stored index is negative or
     *         not below @p shape.column().
     * @throws std::invalid_argument if the indices of a row are not
     *         strictly ascending.
     */
    Sparse_matrix(Shape shape, std::vector<row_type> rows)
        : shape_(shape), rows_(std::move(rows)) {
      if (static_cast<size_type>(rows_.size()) != shape_.row()) {
        throw Column_length_error();
      }
      for (auto const& row : rows_) {
        if (!row.strictly_ascending()) {
          throw std::invalid_argument(
            "sparse matrix: row indices must be strictly ascending");
        }
        // Ascending, so the ends bound every index of the row.
        if (!row.empty() &&
            (row.front().index < 0 || row.back().index >= shape_.column())) {
          throw Index_out_of_range_error();
        }
      }
    }

    Shape
    shape() const {
      return shape_;
    }

    size_type
    rows() const {
      return shape_.row();
    }

    size_type
    columns() const {
      return shape_.column();
    }

    /// @brief The number of stored elements, explicit zeros included.
    size_type
    size() const {
      size_type n = 0;
      for (auto const& row : rows_) {
        n += row.size();
      }
      return n;
    }

    row_type const&
    row(size_type r) const {
      if (r < 0 || r >= shape_.row()) {
        throw Index_out_of_range_error();
      }
      return rows_[static_cast<std::size_t>(r)];
    }

    T
    at(size_type r, size_type c) const {
      check_index(r, c);
      return rows_[static_cast<std::size_t>(r)].at(c);
    }

    void
    set(size_type r, size_type c, T value) {
      check_index(r, c);
      rows_[static_cast<std::size_t>(r)].set(c, value);
    }

    T
    trace() const {
      require_square();
      T t{0};
      for (size_type i = 0; i < shape_.row(); ++i) {
        t += rows_[static_cast<std::size_t>(i)].at(i);
      }
      return t;
    }

    /**
     * @brief Minimum over every logical cell, implicit zeros included.
     */
    T
    min() const {
      T m = std::numeric_limits<T>::max();
      for (auto const& row : rows_) {
        m = std::min(m, row.min());
        if (row.size() < shape_.column()) {
          m = std::min(m, T{0});
        }
      }
      return m;
    }

    T
    max() const {
      T m = std::numeric_limits<T>::lowest();
      for (auto const& row : rows_) {
        m = std::max(m, row.max());
        if (row.size() < shape_.column()) {
          m = std::max(m, T{0});
        }
      }
      return m;
    }

    // Zero when the matrix holds no non-zero value.
    T
    min_non_zero() const {
      std::optional<T> m;
      for (auto const& row : rows_) {
        if (auto r = row.min_non_zero(); r && (!m || *r < *m)) {
          m = r;
        }
      }
      return m.value_or(T{0});
    }

    T
    max_non_zero() const {
      std::optional<T> m;
      for (auto const& row : rows_) {
        if (auto r = row.max_non_zero(); r && (!m || *r > *m)) {
          m = r;
        }
      }
      return m.value_or(T{0});
    }

    /**
     * @brief Matrix norm of the given order.
     *
     * |  order     | norm                                        |
     * |------------|---------------------------------------------|
     * |  1         | max over columns of the sum of |a_ij|       |
     * | -1         | min over columns of the sum of |a_ij|       |
     * |  norm_inf  | max over rows of the sum of |a_ij|          |
     * | -norm_inf  | min over rows of the sum of |a_ij|          |
     * |  norm_fro  | Frobenius norm (0 is an alias)              |
     *
     * @throws Not_implemented_error for the 2-norms.
     * @throws Norm_order_error for any other order.
     */
    T
    norm(int order) const {
      if (order == 0) {
        order = norm_fro;
      }
      switch (order) {
      case 2:
      case -2:
        throw Not_implemented_error("2-norm requires singular values");
      case 1: {
        auto sums = column_absolute_sums();
        return *std::max_element(sums.begin(), sums.end());
      }
      case -1: {
        auto sums = column_absolute_sums();
        return *std::min_element(sums.begin(), sums.end());
      }
      case norm_inf: {
        auto sums = row_absolute_sums();
        return *std::max_element(sums.begin(), sums.end());
      }
      case -norm_inf: {
        auto sums = row_absolute_sums();
        return *std::min_element(sums.begin(), sums.end());
      }
      case norm_fro:
        return frobenius();
      default:
        throw Norm_order_error();
      }
    }

    Sparse_matrix
    sum_axis(Axis axis) const {
      return reduce_axis(
        axis,
        [](row_type const& row, size_type) { return row.sum(); },
        T{0},
        [](T acc, T v) { return acc + v; });
    }

    Sparse_matrix
    min_axis(Axis axis) const {
      return reduce_axis(
        axis,
        [](row_type const& row, size_type cols) {
          return row.size() < cols ? std::min(row.min(), T{0}) : row.min();
        },
        std::numeric_limits<T>::max(),
        [](T acc, T v) { return std::min(acc, v); });
    }

    Sparse_matrix
    max_axis(Axis axis) const {
      return reduce_axis(
        axis,
        [](row_type const& row, size_type cols) {
          return row.size() < cols ? std::max(row.max(), T{0}) : row.max();
        },
        std::numeric_limits<T>::lowest(),
        [](T acc, T v) { return std::max(acc, v); });
    }

    T
    det() const {
      throw Not_implemented_error("determinant");
    }

    /**
     * @throws Zero_length_error if @p r or @p c is less than one.
     * @throws Shape_error if @p r x @p c differs from the element count.
     * @throws Not_implemented_error otherwise.
     */
    Sparse_matrix
    reshape(size_type r, size_type c) const {
      if (r < 1 || c < 1) {
        throw Zero_length_error();
      }
      auto n = shape_.row() * shape_.column();
      // Compare against n / c first so that r * c cannot overflow.
      if (r > n / c || r * c != n) {
        throw Shape_error();
      }
      throw Not_implemented_error("reshape");
    }

    /**
     * @brief The transpose.
     *
     * Source rows are visited in ascending order, so each target row
     * receives its elements already sorted and no re-sort is needed.
     */
    Sparse_matrix
    transpose() const {
      auto result_shape = shape_.transposed();

      // A row vector becomes one single-element row per stored element.
      if (shape_.row() == 1) {
        std::vector<row_type> rows(static_cast<std::size_t>(result_shape.row()));
        for (auto const& e : rows_.front()) {
          rows[static_cast<std::size_t>(e.index)].push_back(element_type{0, e.value});
        }
        return Sparse_matrix(result_shape, std::move(rows), trusted);
      }

      // A column vector collapses into a single row.
      if (shape_.column() == 1) {
        std::vector<row_type> rows(1);
        rows.front().reserve(size());
        for (size_type i = 0; i < shape_.row(); ++i) {
          for (auto const& e : rows_[static_cast<std::size_t>(i)]) {
            rows.front().push_back(element_type{i, e.value});
          }
        }
        return Sparse_matrix(result_shape, std::move(rows), trusted);
      }

      std::vector<size_type> counts(static_cast<std::size_t>(shape_.column()), 0);
      for (auto const& row : rows_) {
        for (auto const& e : row) {
          ++counts[static_cast<std::size_t>(e.index)];
        }
      }

      std::vector<row_type> rows(static_cast<std::size_t>(result_shape.row()));
      for (std::size_t j = 0; j < rows.size(); ++j) {
        rows[j].reserve(counts[j]);
      }
      for (size_type i = 0; i < shape_.row(); ++i) {
        for (auto const& e : rows_[static_cast<std::size_t>(i)]) {
          rows[static_cast<std::size_t>(e.index)].push_back(element_type{i, e.value});
        }
      }
      return Sparse_matrix(result_shape, std::move(rows), trusted);
    }

    // Row i keeps its elements from the first index >= i onwards.
    Sparse_matrix
    upper_triangular() const {
      require_square();
      std::vector<row_type> rows(rows_.size());
      for (std::size_t i = 0; i < rows_.size(); ++i) {
        auto const& row = rows_[i];
        auto first = row.begin();
        while (first != row.end() && first->index < static_cast<size_type>(i)) {
          ++first;
        }
        rows[i] = row_type(first, row.end());
      }
      return Sparse_matrix(shape_, std::move(rows), trusted);
    }

    // Row i keeps its elements up to the last index <= i.
    Sparse_matrix
    lower_triangular() const {
      require_square();
      std::vector<row_type> rows(rows_.size());
      for (std::size_t i = 0; i < rows_.size(); ++i) {
        auto const& row = rows_[i];
        auto last = row.end();
        while (last != row.begin() && std::prev(last)->index > static_cast<size_type>(i)) {
          --last;
        }
        rows[i] = row_type(row.begin(), last);
      }
      return Sparse_matrix(shape_, std::move(rows), trusted);
    }

    /**
     * @brief Horizontal concatenation [this | b].
     *
     * @throws Column_length_error if the row counts differ.
     */
    Sparse_matrix
    augment(Sparse_matrix const& b) const {
      if (shape_.row() != b.shape_.row()) {
        throw Column_length_error();
      }
      auto offset = shape_.column();
      std::vector<row_type> rows(rows_);
      for (std::size_t i = 0; i < rows.size(); ++i) {
        rows[i].reserve(rows[i].size() + b.rows_[i].size());
        for (auto const& e : b.rows_[i]) {
          rows[i].push_back(element_type{e.index + offset, e.value});
        }
      }
      return Sparse_matrix(
        Shape{shape_.row(), shape_.column() + b.shape_.column()},
        std::move(rows),
        trusted);
    }

    /**
     * @brief Vertical concatenation of this above b.
     *
     * @throws Row_length_error if the column counts differ.
     */
    Sparse_matrix
    stack(Sparse_matrix const& b) const {
      if (shape_.column() != b.shape_.column()) {
        throw Row_length_error();
      }
      std::vector<row_type> rows;
      rows.reserve(rows_.size() + b.rows_.size());
      rows.insert(rows.end(), rows_.begin(), rows_.end());
      rows.insert(rows.end(), b.rows_.begin(), b.rows_.end());
      return Sparse_matrix(
        Shape{shape_.row() + b.shape_.row(), shape_.column()},
        std::move(rows),
        trusted);
    }

    /**
     * @brief Keep the stored elements for which @p pred(row, col, value)
     *        holds; the others become implicit zeros.
     */
    template <typename Pred>
    Sparse_matrix
    filter(Pred pred) const {
      return keep_if([&pred](size_type r, element_type const& e) {
        return static_cast<bool>(pred(r, e.index, e.value));
      });
    }

    /**
     * @brief Replace each stored element by @p fn(row, col, value).
     *
     * Implicit zeros are not visited.
     */
    template <typename F>
    Sparse_matrix
    apply(F fn) const {
      Sparse_matrix result(*this);
      for (std::size_t i = 0; i < result.rows_.size(); ++i) {
        auto r = static_cast<size_type>(i);
        result.rows_[i].transform_values(
          [&fn, r](element_type const& e) { return fn(r, e.index, e.value); });
      }
      return result;
    }

    /**
     * @brief Replace every logical cell by @p fn(row, col, value).
     *
     * Cells whose value changes are written with set(), so an implicit
     * zero can become a stored element.
     */
    template <typename F>
    Sparse_matrix
    apply_all(F fn) const {
      Sparse_matrix result(*this);
      for (size_type r = 0; r < shape_.row(); ++r) {
        auto const& row = rows_[static_cast<std::size_t>(r)];
        for (size_type c = 0; c < shape_.column(); ++c) {
          auto old = row.at(c);
          auto v = static_cast<T>(fn(r, c, old));
          if (v != old) {
            result.rows_[static_cast<std::size_t>(r)].set(c, v);
          }
        }
      }
      return result;
    }

    /// @brief Copy without stored zeros.
    Sparse_matrix
    clean() const {
      return keep_if([](size_type, element_type const& e) {
        return e.value != T{0};
      });
    }

    /// @brief Copy without stored elements within @p epsilon of zero.
    Sparse_matrix
    clean(T epsilon) const {
      return keep_if([epsilon](size_type, element_type const& e) {
        return std::abs(e.value) > epsilon;
      });
    }

    Sparse_matrix
    add(Sparse_matrix const& b) const {
      return combine(b, [](row_type const& x, row_type const& y) {
        return x.fold_add(y);
      });
    }

    Sparse_matrix
    subtract(Sparse_matrix const& b) const {
      return combine(b, [](row_type const& x, row_type const& y) {
        return x.fold_sub(y);
      });
    }

    Sparse_matrix
    multiply_elementwise(Sparse_matrix const& b) const {
      return combine(b, [](row_type const& x, row_type const& y) {
        return x.fold_mul(y);
      });
    }

    // False, rather than an error, when the shapes differ.
    bool
    equals(Sparse_matrix const& b) const {
      if (!(shape_ == b.shape_)) {
        return false;
      }
      for (std::size_t i = 0; i < rows_.size(); ++i) {
        if (!rows_[i].fold_equal(b.rows_[i])) {
          return false;
        }
      }
      return true;
    }

    bool
    approx_equals(Sparse_matrix const& b, T epsilon) const {
      if (!(shape_ == b.shape_)) {
        return false;
      }
      for (std::size_t i = 0; i < rows_.size(); ++i) {
        if (!rows_[i].fold_approx(b.rows_[i], epsilon)) {
          return false;
        }
      }
      return true;
    }

    Sparse_matrix
    scalar_multiply(T f) const {
      std::vector<row_type> rows;
      rows.reserve(rows_.size());
      for (auto const& row : rows_) {
        rows.push_back(row.scale(f));
      }
      return Sparse_matrix(shape_, std::move(rows), trusted);
    }

    T
    sum() const {
      T s{0};
      for (auto const& row : rows_) {
        s += row.sum();
      }
      return s;
    }

    /**
     * @brief Sum of the element-wise product.
     *
     * @throws Shape_error if the shapes differ.
     */
    T
    inner_product(Sparse_matrix const& b) const {
      require_same_shape(b);
      T p{0};
      for (std::size_t i = 0; i < rows_.size(); ++i) {
        p += rows_[i].fold_mul_sum(b.rows_[i]);
      }
      return p;
    }

    /**
     * @brief The matrix product this * b.
     *
     * Each column of @p b is gathered into a buffer leased from
     * Scratch_pool<T> and dotted with every row of this matrix. Only
     * non-zero results are stored. The lease returns the buffer on every
     * exit path.
     *
     * @throws Shape_error if columns() != b.rows().
     * @throws std::logic_error if the scratch pool is not initialized.
     */
    Sparse_matrix
    dot(Sparse_matrix const& b) const {
      if (shape_.column() != b.shape_.row()) {
        throw Shape_error();
      }

      std::vector<row_type> rows(rows_.size());

      auto lease = Scratch_pool<T>::instance().borrow();
      auto& column = lease.buffer();
      for (size_type i = 0; i < b.shape_.column(); ++i) {
        for (size_type j = 0; j < b.shape_.row(); ++j) {
          if (auto v = b.rows_[static_cast<std::size_t>(j)].at(i); v != T{0}) {
            column.push_back(element_type{j, v});
          }
        }
        for (std::size_t j = 0; j < rows_.size(); ++j) {
          if (auto v = rows_[j].fold_mul_sum(column); v != T{0}) {
            rows[j].push_back(element_type{i, v});
          }
        }
        column.clear();
      }

      return Sparse_matrix(
        Shape{shape_.row(), b.shape_.column()}, std::move(rows), trusted);
    }

    /// @brief Every logical cell, implicit zeros included.
    Dense_matrix<T>
    to_dense() const {
      Dense_matrix<T> d(shape_);
      for (size_type i = 0; i < shape_.row(); ++i) {
        for (auto const& e : rows_[static_cast<std::size_t>(i)]) {
          d(i, e.index) = e.value;
        }
      }
      return d;
    }

    /// @brief The non-zero stored values in row-major order.
    std::vector<T>
    elements_vector() const {
      std::vector<T> v;
      v.reserve(static_cast<std::size_t>(size()));
      for (auto const& row : rows_) {
        for (auto const& e : row) {
          if (e.value != T{0}) {
            v.push_back(e.value);
          }
        }
      }
      return v;
    }

  private:
    struct Trusted {};
    static constexpr Trusted trusted{};

    // Rows produced by this class already satisfy the invariants.
    Sparse_matrix(Shape shape, std::vector<row_type> rows, Trusted)
        : shape_(shape), rows_(std::move(rows)) {}

    static Shape
    shape_of(std::vector<std::vector<T>> const& dense) {
      if (dense.empty() || dense.front().empty()) {
        throw Zero_length_error();
      }
      for (auto const& row : dense) {
        if (row.size() != dense.front().size()) {
          throw Row_length_error();
        }
      }
      return Shape{static_cast<size_type>(dense.size()),
                   static_cast<size_type>(dense.front().size())};
    }

    static std::vector<std::vector<T>>
    to_vectors(std::initializer_list<std::initializer_list<T>> const& dense) {
      std::vector<std::vector<T>> result;
      result.reserve(dense.size());
      for (auto const& row : dense) {
        result.emplace_back(row);
      }
      return result;
    }

    void
    check_index(size_type r, size_type c) const {
      if (r < 0 || r >= shape_.row() || c < 0 || c >= shape_.column()) {
        throw Index_out_of_range_error();
      }
    }

    void
    require_square() const {
      if (!shape_.is_square()) {
        throw Square_error();
      }
    }

    void
    require_same_shape(Sparse_matrix const& b) const {
      if (!(shape_ == b.shape_)) {
        throw Shape_error();
      }
    }

    template <typename Fold>
    Sparse_matrix
    combine(Sparse_matrix const& b, Fold fold) const {
      require_same_shape(b);
      std::vector<row_type> rows;
      rows.reserve(rows_.size());
      for (std::size_t i = 0; i < rows_.size(); ++i) {
        rows.push_back(fold(rows_[i], b.rows_[i]));
      }
      return Sparse_matrix(shape_, std::move(rows), trusted);
    }

    template <typename Keep>
    Sparse_matrix
    keep_if(Keep keep) const {
      std::vector<row_type> rows(rows_.size());
      for (std::size_t i = 0; i < rows_.size(); ++i) {
        auto r = static_cast<size_type>(i);
        for (auto const& e : rows_[i]) {
          if (keep(r, e)) {
            rows[i].push_back(e);
          }
        }
      }
      return Sparse_matrix(shape_, std::move(rows), trusted);
    }

    // Row reductions use the row reducer directly. Column reductions
    // fold at(i) over every row, since rows carry no column index.
    template <typename Row_reduce, typename Fold>
    Sparse_matrix
    reduce_axis(Axis axis, Row_reduce row_reduce, T init, Fold fold) const {
      auto cols = shape_.column();
      if (axis == Axis::row) {
        std::vector<row_type> rows;
        rows.reserve(rows_.size());
        for (auto const& row : rows_) {
          rows.push_back(row_type{element_type{0, row_reduce(row, cols)}});
        }
        return Sparse_matrix(Shape{shape_.row(), 1}, std::move(rows), trusted);
      }

      std::vector<row_type> rows(1);
      rows.front().reserve(cols);
      for (size_type i = 0; i < cols; ++i) {
        T acc = init;
        for (auto const& row : rows_) {
          acc = fold(acc, row.at(i));
        }
        rows.front().push_back(element_type{i, acc});
      }
      return Sparse_matrix(Shape{1, cols}, std::move(rows), trusted);
    }

    std::vector<T>
    row_absolute_sums() const {
      std::vector<T> sums;
      sums.reserve(rows_.size());
      for (auto const& row : rows_) {
        Neumaier_sum<T> acc;
        for (auto const& e : row) {
          acc.add(std::abs(e.value));
        }
        sums.push_back(acc.result());
      }
      return sums;
    }

    std::vector<T>
    column_absolute_sums() const {
      std::vector<Neumaier_sum<T>> accumulators(
        static_cast<std::size_t>(shape_.column()));
      for (auto const& row : rows_) {
        for (auto const& e : row) {
          accumulators[static_cast<std::size_t>(e.index)].add(std::abs(e.value));
        }
      }
      std::vector<T> sums;
      sums.reserve(accumulators.size());
      for (auto const& acc : accumulators) {
        sums.push_back(acc.result());
      }
      return sums;
    }

    // Scaled by the largest magnitude to avoid overflow in the squares.
    T
    frobenius() const {
      T scale{0};
      for (auto const& row : rows_) {
        for (auto const& e : row) {
          scale = std::max(scale, std::abs(e.value));
        }
      }
      if (scale == T{0}) {
        return T{0};
      }

      Neumaier_sum<T> acc;
      for (auto const& row : rows_) {
        for (auto const& e : row) {
          auto scaled = e.value / scale;
          acc.add(scaled * scaled);
        }
      }
      return scale * std::sqrt(acc.result());
    }

    Shape shape_;
    std::vector<row_type> rows_;

  }; // end of class Sparse_matrix

  template <typename T = config::value_type>
  Sparse_matrix<T>
  zero_sparse(config::size_type rows, config::size_type cols) {
    return Sparse_matrix<T>(Shape{rows, cols});
  }

  template <typename T = config::value_type>
  Sparse_matrix<T>
  identity_sparse(config::size_type size) {
    Sparse_matrix<T> m(Shape{size, size});
    for (config::size_type i = 0; i < size; ++i) {
      m.set(i, i, T{1});
    }
    return m;
  }

} // end of namespace sparow::data::detail

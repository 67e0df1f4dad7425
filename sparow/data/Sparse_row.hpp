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
#include <vector>

//
// ... sparow header files
//
#include <sparow/config.hpp>
#include <sparow/data/Element.hpp>

namespace sparow::data::detail {

  /**
   * @brief One row of a row-sparse matrix.
   *
   * Stores (index, value) elements strictly ascending by index with no
   * duplicate indices. An absent index reads as zero. Stored zeros are
   * permitted: neither set() nor the arithmetic folds remove an element
   * whose value becomes zero.
   *
   * The row does not know its logical width. Bounds checking against the
   * matrix dimensions is the responsibility of Sparse_matrix.
   */
  template <typename T = config::value_type>
  class Sparse_row final {
  public:
    using size_type = config::size_type;
    using value_type = T;
    using element_type = Element<T>;
    using const_iterator = typename std::vector<element_type>::const_iterator;

    Sparse_row() = default;

    /**
     * @brief Construct from a dense row, storing only the non-zero cells.
     */
    explicit Sparse_row(std::span<T const> dense) {
      for (std::size_t j = 0; j < dense.size(); ++j) {
        if (dense[j] != T{0}) {
          elements_.push_back(
            element_type{static_cast<size_type>(j), dense[j]});
        }
      }
    }

    /**
     * @brief Construct from explicit elements.
     *
     * @throws std::invalid_argument unless the indices are non-negative
     *         and strictly ascending.
     */
    Sparse_row(std::initializer_list<element_type> const& input)
        : Sparse_row(input.begin(), input.end()) {}

    template <typename Iter>
    Sparse_row(Iter first, Iter last)
        : elements_(first, last) {
      if ((!elements_.empty() && elements_.front().index < 0) ||
          !strictly_ascending()) {
        throw std::invalid_argument(
          "sparse row: indices must be non-negative and strictly ascending");
      }
    }

    size_type
    size() const {
      return static_cast<size_type>(elements_.size());
    }

    bool
    empty() const {
      return elements_.empty();
    }

    size_type
    capacity() const {
      return static_cast<size_type>(elements_.capacity());
    }

    void
    reserve(size_type n) {
      elements_.reserve(static_cast<std::size_t>(n));
    }

    /// @brief Truncate to length zero, keeping the allocation.
    void
    clear() {
      elements_.clear();
    }

    /**
     * @brief Append an element past the last stored index.
     *
     * The caller guarantees @p e.index is greater than every stored
     * index; this is the building block of the merge and transpose loops.
     */
    void
    push_back(element_type e) {
      elements_.push_back(e);
    }

    const_iterator
    begin() const {
      return elements_.begin();
    }

    const_iterator
    end() const {
      return elements_.end();
    }

    std::span<element_type const>
    elements() const {
      return {elements_.data(), elements_.size()};
    }

    /// @brief True when no stored index repeats or decreases.
    bool
    strictly_ascending() const {
      return std::adjacent_find(
               elements_.begin(), elements_.end(),
               [](element_type const& a, element_type const& b) {
                 return a.index >= b.index;
               }) == elements_.end();
    }

    element_type const&
    front() const {
      return elements_.front();
    }

    element_type const&
    back() const {
      return elements_.back();
    }

    /**
     * @brief Return the value stored at @p index, or zero if absent.
     */
    T
    at(size_type index) const {
      auto it = find(index);
      if (it != elements_.end() && it->index == index) {
        return it->value;
      }
      return T{0};
    }

    /**
     * @brief Store @p value at @p index.
     *
     * An existing element is overwritten, even with zero. Otherwise a new
     * element is inserted at its ordered position; an index beyond the
     * last stored index is appended directly.
     */
    void
    set(size_type index, T value) {
      if (elements_.empty() || index > elements_.back().index) {
        elements_.push_back(element_type{index, value});
        return;
      }
      auto it = std::lower_bound(
        elements_.begin(), elements_.end(), index, by_index);
      if (it != elements_.end() && it->index == index) {
        it->value = value;
        return;
      }
      elements_.insert(it, element_type{index, value});
    }

    /**
     * @brief Replace every stored value with @p f(element).
     *
     * Indices are left untouched, so ordering is preserved.
     */
    template <typename F>
    void
    transform_values(F f) {
      for (auto& e : elements_) {
        e.value = f(static_cast<element_type const&>(e));
      }
    }

    // Minimum over stored values; the maximum of T for an empty row.
    T
    min() const {
      T m = std::numeric_limits<T>::max();
      for (auto const& e : elements_) {
        m = std::min(m, e.value);
      }
      return m;
    }

    // Maximum over stored values; the lowest value of T for an empty row.
    T
    max() const {
      T m = std::numeric_limits<T>::lowest();
      for (auto const& e : elements_) {
        m = std::max(m, e.value);
      }
      return m;
    }

    /**
     * @brief Minimum over stored non-zero values.
     *
     * @return An empty optional when the row holds no non-zero value,
     *         including a row made only of stored zeros.
     */
    std::optional<T>
    min_non_zero() const {
      std::optional<T> m;
      for (auto const& e : elements_) {
        if (e.value != T{0} && (!m || e.value < *m)) {
          m = e.value;
        }
      }
      return m;
    }

    std::optional<T>
    max_non_zero() const {
      std::optional<T> m;
      for (auto const& e : elements_) {
        if (e.value != T{0} && (!m || e.value > *m)) {
          m = e.value;
        }
      }
      return m;
    }

    T
    sum() const {
      T s{0};
      for (auto const& e : elements_) {
        s += e.value;
      }
      return s;
    }

    Sparse_row
    fold_add(Sparse_row const& other) const {
      return merge_union(
        other,
        [](T a, T b) { return a + b; },
        [](T b) { return b; });
    }

    Sparse_row
    fold_sub(Sparse_row const& other) const {
      return merge_union(
        other,
        [](T a, T b) { return a - b; },
        [](T b) { return -b; });
    }

    /**
     * @brief Element-wise product.
     *
     * Only indices stored in both rows are emitted.
     */
    Sparse_row
    fold_mul(Sparse_row const& other) const {
      Sparse_row result;
      auto a = elements_.begin();
      auto b = other.elements_.begin();
      while (a != elements_.end() && b != other.elements_.end()) {
        if (a->index < b->index) {
          ++a;
        } else if (b->index < a->index) {
          ++b;
        } else {
          result.elements_.push_back(element_type{a->index, a->value * b->value});
          ++a;
          ++b;
        }
      }
      return result;
    }

    /**
     * @brief Sparse dot product of two rows.
     */
    T
    fold_mul_sum(Sparse_row const& other) const {
      T sum{0};
      auto a = elements_.begin();
      auto b = other.elements_.begin();
      while (a != elements_.end() && b != other.elements_.end()) {
        if (a->index < b->index) {
          ++a;
        } else if (b->index < a->index) {
          ++b;
        } else {
          sum += a->value * b->value;
          ++a;
          ++b;
        }
      }
      return sum;
    }

    bool
    fold_equal(Sparse_row const& other) const {
      return merge_compare(other, [](T a, T b) { return a == b; });
    }

    bool
    fold_approx(Sparse_row const& other, T epsilon) const {
      return merge_compare(
        other, [epsilon](T a, T b) { return std::abs(a - b) <= epsilon; });
    }

    /**
     * @brief Multiply every stored value by @p f.
     *
     * Scaling by zero leaves stored zeros in place.
     */
    Sparse_row
    scale(T f) const {
      Sparse_row result(*this);
      for (auto& e : result.elements_) {
        e.value *= f;
      }
      return result;
    }

    friend bool
    operator==(Sparse_row const& a, Sparse_row const& b) = default;

  private:
    static bool
    by_index(element_type const& e, size_type index) {
      return e.index < index;
    }

    typename std::vector<element_type>::const_iterator
    find(size_type index) const {
      return std::lower_bound(
        elements_.begin(), elements_.end(), index, by_index);
    }

    // Ascending two-pointer merge over the union of the stored indices.
    // Indices present only on the left are copied, only on the right pass
    // through @p right_only, and in both through @p both.
    template <typename Both, typename Right_only>
    Sparse_row
    merge_union(Sparse_row const& other, Both both, Right_only right_only) const {
      Sparse_row result;
      result.elements_.reserve(elements_.size() + other.elements_.size());

      auto a = elements_.begin();
      auto a_end = elements_.end();
      auto b = other.elements_.begin();
      auto b_end = other.elements_.end();

      while (a != a_end && b != b_end) {
        if (a->index < b->index) {
          result.elements_.push_back(*a);
          ++a;
        } else if (b->index < a->index) {
          result.elements_.push_back(element_type{b->index, right_only(b->value)});
          ++b;
        } else {
          result.elements_.push_back(
            element_type{a->index, both(a->value, b->value)});
          ++a;
          ++b;
        }
      }
      for (; a != a_end; ++a) {
        result.elements_.push_back(*a);
      }
      for (; b != b_end; ++b) {
        result.elements_.push_back(element_type{b->index, right_only(b->value)});
      }
      return result;
    }

    // Merge comparison treating an absent index as a stored zero.
    template <typename Same>
    bool
    merge_compare(Sparse_row const& other, Same same) const {
      auto a = elements_.begin();
      auto a_end = elements_.end();
      auto b = other.elements_.begin();
      auto b_end = other.elements_.end();

      while (a != a_end && b != b_end) {
        if (a->index < b->index) {
          if (!same(a->value, T{0})) return false;
          ++a;
        } else if (b->index < a->index) {
          if (!same(T{0}, b->value)) return false;
          ++b;
        } else {
          if (!same(a->value, b->value)) return false;
          ++a;
          ++b;
        }
      }
      for (; a != a_end; ++a) {
        if (!same(a->value, T{0})) return false;
      }
      for (; b != b_end; ++b) {
        if (!same(T{0}, b->value)) return false;
      }
      return true;
    }

    std::vector<element_type> elements_;

  }; // end of class Sparse_row

} // end of namespace sparow::data::detail

#pragma once

//
// ... Standard header files
//
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

//
// ... sparow header files
//
#include <sparow/config.hpp>
#include <sparow/data/Sparse_matrix.hpp>
#include <sparow/data/errors.hpp>

namespace sparow::data::detail {

  /**
   * @brief Either a constructed matrix or the sparow error that prevented
   *        its construction.
   */
  template <typename T = config::value_type>
  class Maybe_sparse final {
  public:
    explicit Maybe_sparse(Sparse_matrix<T> matrix)
        : matrix_(std::move(matrix)) {}

    Maybe_sparse(Error const& error, std::exception_ptr exception)
        : code_(error.code()), exception_(std::move(exception)) {}

    explicit operator bool() const {
      return matrix_.has_value();
    }

    /// @brief Error_code::none when construction succeeded.
    Error_code
    error() const {
      return code_;
    }

    /**
     * @throws std::logic_error if construction failed.
     */
    Sparse_matrix<T> const&
    matrix() const& {
      if (!matrix_) {
        throw std::logic_error("maybe_sparse: no matrix was constructed");
      }
      return *matrix_;
    }

    /// @brief Rethrow the captured exception, if any.
    void
    rethrow() const {
      if (exception_) {
        std::rethrow_exception(exception_);
      }
    }

  private:
    std::optional<Sparse_matrix<T>> matrix_;
    Error_code code_{Error_code::none};
    std::exception_ptr exception_;

  }; // end of class Maybe_sparse

  /**
   * @brief Call @p fn and capture a sparow error instead of propagating it.
   *
   * Exceptions that are not sparow errors propagate unchanged.
   */
  template <typename F>
  auto
  maybe_sparse(F fn) -> Maybe_sparse<typename std::invoke_result_t<F>::value_type> {
    using result_type = Maybe_sparse<typename std::invoke_result_t<F>::value_type>;
    try {
      return result_type(fn());
    } catch (Error const& error) {
      return result_type(error, std::current_exception());
    }
  }

  /**
   * @brief Unwrap @p result, rethrowing the captured sparow error.
   */
  template <typename T>
  Sparse_matrix<T>
  must_sparse(Maybe_sparse<T> const& result) {
    result.rethrow();
    return result.matrix();
  }

} // end of namespace sparow::data::detail

#pragma once

//
// ... Standard header files
//
#include <stdexcept>
#include <string>

//
// ... sparow header files
//
#include <sparow/data/import.hpp>

namespace sparow::data::detail {

  /**
   * @brief Classification of the failures raised by sparow.
   */
  enum class Error_code {
    none,
    zero_length,
    row_length,
    column_length,
    shape,
    square,
    index_out_of_range,
    norm_order,
    not_implemented
  };

  /**
   * @brief Return the default message associated with an error code.
   */
  char const*
  message(Error_code code);

  /**
   * @brief Base class of every exception thrown by sparow.
   *
   * All sparow errors report caller misuse, so they derive from
   * std::logic_error. The operation that throws never returns a partial
   * result.
   */
  class Error : public logic_error {
  public:
    Error(Error_code code, std::string const& what);

    Error_code
    code() const noexcept;

  private:
    Error_code code_;

  }; // end of class Error

  /// A requested dimension (rows, columns or vector length) is less than one.
  class Zero_length_error final : public Error {
  public:
    Zero_length_error();
  };

  /// Rows of unequal length, or stacking matrices with different column counts.
  class Row_length_error final : public Error {
  public:
    Row_length_error();
  };

  /// Augmenting matrices with different row counts.
  class Column_length_error final : public Error {
  public:
    Column_length_error();
  };

  /// Binary arithmetic or product between incompatible dimensions.
  class Shape_error final : public Error {
  public:
    Shape_error();
  };

  /// An operation requiring a square matrix was applied to a non-square one.
  class Square_error final : public Error {
  public:
    Square_error();
  };

  class Index_out_of_range_error final : public Error {
  public:
    Index_out_of_range_error();
  };

  class Norm_order_error final : public Error {
  public:
    Norm_order_error();
  };

  /// Unsupported representation pairings and deliberately absent operations.
  class Not_implemented_error final : public Error {
  public:
    explicit Not_implemented_error(std::string const& what);
  };

} // end of namespace sparow::data::detail

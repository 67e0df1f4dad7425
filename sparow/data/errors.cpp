#include <sparow/data/errors.hpp>

namespace sparow::data::detail {

  char const*
  message(Error_code code)
  {
    switch (code) {
    case Error_code::none:
      return "no error";
    case Error_code::zero_length:
      return "zero length in matrix definition";
    case Error_code::row_length:
      return "row length mismatch";
    case Error_code::column_length:
      return "column length mismatch";
    case Error_code::shape:
      return "dimension mismatch";
    case Error_code::square:
      return "expect square matrix";
    case Error_code::index_out_of_range:
      return "index out of range";
    case Error_code::norm_order:
      return "invalid norm order for matrix";
    case Error_code::not_implemented:
      return "not implemented";
    }
    return "unknown error";
  }

  Error::Error(Error_code code, std::string const& what)
      : logic_error(what)
      , code_(code)
    {}

  Error_code
  Error::code() const noexcept { return code_; }

  Zero_length_error::Zero_length_error()
      : Error(Error_code::zero_length, message(Error_code::zero_length))
    {}

  Row_length_error::Row_length_error()
      : Error(Error_code::row_length, message(Error_code::row_length))
    {}

  Column_length_error::Column_length_error()
      : Error(Error_code::column_length, message(Error_code::column_length))
    {}

  Shape_error::Shape_error()
      : Error(Error_code::shape, message(Error_code::shape))
    {}

  Square_error::Square_error()
      : Error(Error_code::square, message(Error_code::square))
    {}

  Index_out_of_range_error::Index_out_of_range_error()
      : Error(Error_code::index_out_of_range,
              message(Error_code::index_out_of_range))
    {}

  Norm_order_error::Norm_order_error()
      : Error(Error_code::norm_order, message(Error_code::norm_order))
    {}

  Not_implemented_error::Not_implemented_error(std::string const& what)
      : Error(Error_code::not_implemented,
              std::string(message(Error_code::not_implemented)) + ": " + what)
    {}

} // end of namespace sparow::data::detail

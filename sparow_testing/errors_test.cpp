//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>

//
// ... Standard header files
//
#include <stdexcept>
#include <string>

//
// ... sparow header files
//
#include <sparow/data/errors.hpp>

namespace sparow::testing {

  using sparow::data::detail::Column_length_error;
  using sparow::data::detail::Error;
  using sparow::data::detail::Error_code;
  using sparow::data::detail::Index_out_of_range_error;
  using sparow::data::detail::Norm_order_error;
  using sparow::data::detail::Not_implemented_error;
  using sparow::data::detail::Row_length_error;
  using sparow::data::detail::Shape_error;
  using sparow::data::detail::Square_error;
  using sparow::data::detail::Zero_length_error;
  using sparow::data::detail::message;

  TEST_CASE("errors - codes", "[errors]") {
    CHECK(Zero_length_error().code() == Error_code::zero_length);
    CHECK(Row_length_error().code() == Error_code::row_length);
    CHECK(Column_length_error().code() == Error_code::column_length);
    CHECK(Shape_error().code() == Error_code::shape);
    CHECK(Square_error().code() == Error_code::square);
    CHECK(Index_out_of_range_error().code() == Error_code::index_out_of_range);
    CHECK(Norm_order_error().code() == Error_code::norm_order);
    CHECK(Not_implemented_error("x").code() == Error_code::not_implemented);
  }

  TEST_CASE("errors - what is the code message", "[errors]") {
    CHECK(std::string(Square_error().what()) == message(Error_code::square));
  }

  TEST_CASE("errors - not implemented names the operation", "[errors]") {
    std::string what = Not_implemented_error("determinant").what();
    CHECK(what.find("determinant") != std::string::npos);
  }

  TEST_CASE("errors - all derive from logic_error", "[errors]") {
    CHECK_THROWS_AS(throw Shape_error(), Error);
    CHECK_THROWS_AS(throw Shape_error(), std::logic_error);
    CHECK_THROWS_AS(throw Not_implemented_error("reshape"), std::logic_error);
  }

} // end of namespace sparow::testing

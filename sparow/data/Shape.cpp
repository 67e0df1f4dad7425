#include <sparow/data/Shape.hpp>

//
// ... sparow header files
//
#include <sparow/data/errors.hpp>

namespace sparow::data::detail
{

  Shape::Shape(size_type row, size_type column)
      : row_(row)
      , column_(column)
    {
      if (row_ < 1 || column_ < 1) {
        throw Zero_length_error();
      }
    }

  config::size_type
  Shape::row() const { return row_; }

  config::size_type
  Shape::column() const { return column_; }

  bool
  Shape::is_square() const { return row_ == column_; }

  bool
  Shape::is_vector() const { return row_ == 1 || column_ == 1; }

  Shape
  Shape::transposed() const { return Shape(column_, row_); }

  bool
  operator==(const Shape& shape1, const Shape& shape2){
    return shape1.row_ == shape2.row_ && shape1.column_ == shape2.column_;
  }

} // end of namespace sparow::data::detail

namespace nlohmann {

  sparow::data::detail::Shape
  adl_serializer<sparow::data::detail::Shape>::from_json(json const& j)
  {
    return sparow::data::detail::Shape{
      j.at(0).get<sparow::config::size_type>(),
      j.at(1).get<sparow::config::size_type>()};
  }

  void
  adl_serializer<sparow::data::detail::Shape>::to_json(
    json& j, sparow::data::detail::Shape const& shape)
  {
    j = {shape.row(), shape.column()};
  }

} // end of namespace nlohmann

#pragma once

//
// ... sparow header files
//
#include <sparow/config.hpp>
#include <sparow/data/import.hpp>

namespace sparow::data::detail {

  /**
   * @brief A type describing a matrix shape: the number of rows and columns
   *
   * Both extents are at least one; row and column vectors are shapes with
   * a unit extent.
   */
  class Shape final {
  public:
    using size_type = config::size_type;

    /**
     * @throws Zero_length_error if either extent is less than one.
     */
    Shape(size_type row, size_type column);
    Shape(const Shape& input) = default;
    Shape&
    operator=(const Shape& input) = default;
    Shape(Shape&& input) = default;
    Shape&
    operator=(Shape&& input) = default;
    ~Shape() = default;

    size_type
    row() const;

    size_type
    column() const;

    bool
    is_square() const;

    /// @brief True for a 1 x n or n x 1 shape.
    bool
    is_vector() const;

    /// @brief The shape with the extents exchanged.
    Shape
    transposed() const;

    friend bool
    operator==(const Shape& shape1, const Shape& shape2);

  private:
    size_type row_{};
    size_type column_{};

  }; // end of class Shape

} // namespace sparow::data::detail

// Shape has no default constructor, so get<Shape>() needs an
// adl_serializer specialization rather than free to_json/from_json.
namespace nlohmann {

  template <>
  struct adl_serializer<sparow::data::detail::Shape> {
    static sparow::data::detail::Shape
    from_json(json const& j);

    static void
    to_json(json& j, sparow::data::detail::Shape const& shape);
  };

} // end of namespace nlohmann

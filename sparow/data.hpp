#pragma once

//
// ... sparow header files
//
#include <sparow/data/Dense_matrix.hpp>
#include <sparow/data/Element.hpp>
#include <sparow/data/Pool_config.hpp>
#include <sparow/data/Scratch_pool.hpp>
#include <sparow/data/Shape.hpp>
#include <sparow/data/Sparse_matrix.hpp>
#include <sparow/data/Sparse_row.hpp>
#include <sparow/data/errors.hpp>
#include <sparow/data/info.hpp>
#include <sparow/data/matgen.hpp>
#include <sparow/data/matrix.hpp>
#include <sparow/data/maybe.hpp>

namespace sparow::data {
  using ::sparow::data::detail::Axis;
  using ::sparow::data::detail::Dense_matrix;
  using ::sparow::data::detail::Element;
  using ::sparow::data::detail::Matrix;
  using ::sparow::data::detail::Maybe_sparse;
  using ::sparow::data::detail::Pool_config;
  using ::sparow::data::detail::Scratch_pool;
  using ::sparow::data::detail::Shape;
  using ::sparow::data::detail::Sparse_matrix;
  using ::sparow::data::detail::Sparse_row;

  using ::sparow::data::detail::Column_length_error;
  using ::sparow::data::detail::Error;
  using ::sparow::data::detail::Error_code;
  using ::sparow::data::detail::Index_out_of_range_error;
  using ::sparow::data::detail::Norm_order_error;
  using ::sparow::data::detail::Not_implemented_error;
  using ::sparow::data::detail::Row_length_error;
  using ::sparow::data::detail::Shape_error;
  using ::sparow::data::detail::Square_error;
  using ::sparow::data::detail::Zero_length_error;

  using ::sparow::data::detail::norm_fro;
  using ::sparow::data::detail::norm_inf;

  using ::sparow::data::detail::identity_sparse;
  using ::sparow::data::detail::zero_sparse;
  using ::sparow::data::detail::func_sparse;
  using ::sparow::data::detail::diagonal_sparse;
  using ::sparow::data::detail::tridiagonal_sparse;
  using ::sparow::data::detail::elements_sparse;
  using ::sparow::data::detail::maybe_sparse;
  using ::sparow::data::detail::must_sparse;
  using ::sparow::data::detail::add;
  using ::sparow::data::detail::approx_equals;
  using ::sparow::data::detail::augment;
  using ::sparow::data::detail::dot;
  using ::sparow::data::detail::equals;
  using ::sparow::data::detail::inner_product;
  using ::sparow::data::detail::multiply_elementwise;
  using ::sparow::data::detail::representation;
  using ::sparow::data::detail::stack;
  using ::sparow::data::detail::subtract;

  using ::sparow::data::detail::bandwidth;
  using ::sparow::data::detail::density;
  using ::sparow::data::detail::diagonal_occupancy;
  using ::sparow::data::detail::explicit_zero_count;
  using ::sparow::data::detail::info_report;

  using ::sparow::data::detail::initialize_scratch_pool;
  using ::sparow::data::detail::teardown_scratch_pool;

} // end of namespace sparow::data

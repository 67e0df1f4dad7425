//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>

//
// ... Standard header files
//
#include <limits>
#include <random>

//
// ... sparow header files
//
#include <sparow/data/Sparse_matrix.hpp>
#include <sparow/data/errors.hpp>
#include <sparow/data/matgen.hpp>

#include "well_formed.hpp"

namespace sparow::testing {

  using sparow::data::detail::Column_length_error;
  using sparow::data::detail::Not_implemented_error;
  using sparow::data::detail::Row_length_error;
  using sparow::data::detail::Shape;
  using sparow::data::detail::Shape_error;
  using sparow::data::detail::Sparse_matrix;
  using sparow::data::detail::Square_error;
  using sparow::data::detail::Zero_length_error;
  using sparow::data::detail::func_sparse;
  using sparow::data::detail::zero_sparse;

  namespace {

    // [[1, 2, 3],
    //  [0, 5, 0],
    //  [7, 0, 9]]
    Sparse_matrix<double>
    square() {
      return Sparse_matrix<double>{
        {1.0, 2.0, 3.0}, {0.0, 5.0, 0.0}, {7.0, 0.0, 9.0}};
    }

  } // end of anonymous namespace

  // -- transpose --

  TEST_CASE("sparse_matrix_transform - transpose", "[sparse_matrix_transform]") {
    Sparse_matrix<double> m{{1.0, 2.0}, {3.0, 4.0}};
    CHECK(m.transpose().at(0, 1) == 3.0);
  }

  TEST_CASE("sparse_matrix_transform - transpose rectangular",
            "[sparse_matrix_transform]") {
    Sparse_matrix<double> m{{1.0, 0.0, 2.0}, {0.0, 3.0, 0.0}};
    auto t = m.transpose();

    REQUIRE(t.shape() == Shape(3, 2));
    CHECK(well_formed(t));
    CHECK(t.at(0, 0) == 1.0);
    CHECK(t.at(2, 0) == 2.0);
    CHECK(t.at(1, 1) == 3.0);
    CHECK(t.size() == 3);
  }

  TEST_CASE("sparse_matrix_transform - transpose of vectors",
            "[sparse_matrix_transform]") {
    Sparse_matrix<double> row{{0.0, 2.0, 0.0, 4.0}};
    auto column = row.transpose();

    REQUIRE(column.shape() == Shape(4, 1));
    CHECK(well_formed(column));
    CHECK(column.at(1, 0) == 2.0);
    CHECK(column.at(3, 0) == 4.0);
    CHECK(column.at(0, 0) == 0.0);

    auto back = column.transpose();
    REQUIRE(back.shape() == Shape(1, 4));
    CHECK(well_formed(back));
    CHECK(back.equals(row));
  }

  TEST_CASE("sparse_matrix_transform - transpose is an involution",
            "[sparse_matrix_transform]") {
    std::mt19937 urbg(42);
    std::uniform_real_distribution<double> value(-1.0, 1.0);
    for (int trial = 0; trial < 10; ++trial) {
      auto m = func_sparse(5 + trial, 7, 0.3, [&] { return value(urbg); }, urbg);
      auto t = m.transpose();
      CHECK(well_formed(t));
      CHECK(t.transpose().equals(m));
    }
  }

  // -- triangular parts --

  TEST_CASE("sparse_matrix_transform - upper triangular",
            "[sparse_matrix_transform]") {
    auto u = square().upper_triangular();
    CHECK(u.equals(Sparse_matrix<double>{
      {1.0, 2.0, 3.0}, {0.0, 5.0, 0.0}, {0.0, 0.0, 9.0}}));
    CHECK(well_formed(u));
  }

  TEST_CASE("sparse_matrix_transform - lower triangular",
            "[sparse_matrix_transform]") {
    auto l = square().lower_triangular();
    CHECK(l.equals(Sparse_matrix<double>{
      {1.0, 0.0, 0.0}, {0.0, 5.0, 0.0}, {7.0, 0.0, 9.0}}));
    CHECK(well_formed(l));
  }

  TEST_CASE("sparse_matrix_transform - triangular parts without diagonal",
            "[sparse_matrix_transform]") {
    Sparse_matrix<double> m{{0.0, 1.0}, {2.0, 0.0}};
    auto u = m.upper_triangular();
    auto l = m.lower_triangular();
    CHECK(u.size() == 1);
    CHECK(u.at(0, 1) == 1.0);
    CHECK(l.size() == 1);
    CHECK(l.at(1, 0) == 2.0);
  }

  TEST_CASE("sparse_matrix_transform - triangular parts require square",
            "[sparse_matrix_transform]") {
    CHECK_THROWS_AS(zero_sparse(2, 3).upper_triangular(), Square_error);
    CHECK_THROWS_AS(zero_sparse(3, 2).lower_triangular(), Square_error);
  }

  // -- augment / stack --

  TEST_CASE("sparse_matrix_transform - augment", "[sparse_matrix_transform]") {
    Sparse_matrix<double> a{{1.0, 0.0}, {0.0, 2.0}};
    Sparse_matrix<double> b{{3.0}, {4.0}};
    auto c = a.augment(b);

    REQUIRE(c.shape() == Shape(2, 3));
    CHECK(well_formed(c));
    CHECK(c.equals(Sparse_matrix<double>{{1.0, 0.0, 3.0}, {0.0, 2.0, 4.0}}));
  }

  TEST_CASE("sparse_matrix_transform - augment requires equal rows",
            "[sparse_matrix_transform]") {
    CHECK_THROWS_AS(zero_sparse(2, 2).augment(zero_sparse(3, 2)),
                    Column_length_error);
  }

  TEST_CASE("sparse_matrix_transform - stack", "[sparse_matrix_transform]") {
    Sparse_matrix<double> a{{1.0, 0.0}};
    Sparse_matrix<double> b{{0.0, 2.0}, {3.0, 0.0}};
    auto c = a.stack(b);

    REQUIRE(c.shape() == Shape(3, 2));
    CHECK(well_formed(c));
    CHECK(c.equals(Sparse_matrix<double>{{1.0, 0.0}, {0.0, 2.0}, {3.0, 0.0}}));

    c.set(1, 1, 9.0);
    CHECK(b.at(0, 1) == 2.0);
  }

  TEST_CASE("sparse_matrix_transform - stack requires equal columns",
            "[sparse_matrix_transform]") {
    CHECK_THROWS_AS(zero_sparse(2, 2).stack(zero_sparse(2, 3)),
                    Row_length_error);
  }

  // -- filter / apply --

  TEST_CASE("sparse_matrix_transform - filter receives row and column",
            "[sparse_matrix_transform]") {
    auto upper = square().filter(
      [](long r, long c, double) { return c >= r; });
    CHECK(upper.equals(square().upper_triangular()));
  }

  TEST_CASE("sparse_matrix_transform - filter drops elements",
            "[sparse_matrix_transform]") {
    auto big = square().filter([](long, long, double v) { return v > 4.0; });
    CHECK(big.size() == 3);
    CHECK(big.at(0, 0) == 0.0);
    CHECK(big.at(2, 2) == 9.0);
    CHECK(well_formed(big));
  }

  TEST_CASE("sparse_matrix_transform - apply visits stored elements only",
            "[sparse_matrix_transform]") {
    int calls = 0;
    auto m = square().apply([&calls](long r, long c, double v) {
      ++calls;
      return v + 10.0 * static_cast<double>(r) + static_cast<double>(c);
    });
    CHECK(calls == 6);
    CHECK(m.size() == 6);
    CHECK(well_formed(m));
    CHECK(m.at(0, 2) == 5.0);
    CHECK(m.at(2, 0) == 27.0);
    CHECK(m.at(1, 0) == 0.0);
  }

  TEST_CASE("sparse_matrix_transform - apply_all fills implicit zeros",
            "[sparse_matrix_transform]") {
    int calls = 0;
    auto m = square().apply_all([&calls](long, long, double v) {
      ++calls;
      return v + 1.0;
    });
    CHECK(calls == 9);
    CHECK(m.size() == 9);
    CHECK(m.at(1, 0) == 1.0);
    CHECK(m.at(2, 2) == 10.0);
    CHECK(well_formed(m));
  }

  TEST_CASE("sparse_matrix_transform - apply_all leaves unchanged zeros",
            "[sparse_matrix_transform]") {
    auto m = square().apply_all(
      [](long, long, double v) { return v * 2.0; });
    CHECK(m.size() == 6);
    CHECK(m.at(2, 2) == 18.0);
  }

  TEST_CASE("sparse_matrix_transform - operand is not modified",
            "[sparse_matrix_transform]") {
    auto m = square();
    auto ignored = m.apply_all([](long, long, double) { return 1.0; });
    CHECK(m.equals(square()));
    CHECK(ignored.sum() == 9.0);
  }

  // -- clean --

  TEST_CASE("sparse_matrix_transform - clean removes arithmetic zeros",
            "[sparse_matrix_transform]") {
    Sparse_matrix<double> a{{2.0, 0.0}, {0.0, 3.0}};
    Sparse_matrix<double> b{{-2.0, 0.0}, {0.0, 0.0}};
    auto sum = a.add(b);

    REQUIRE(sum.row(0).size() == 1);
    CHECK(sum.row(0).front().value == 0.0);
    CHECK(sum.at(0, 0) == 0.0);

    auto cleaned = sum.clean();
    CHECK(well_formed(cleaned));
    CHECK(cleaned.row(0).empty());
    CHECK(cleaned.at(0, 0) == 0.0);
    CHECK(cleaned.size() == 1);
  }

  TEST_CASE("sparse_matrix_transform - clean is idempotent",
            "[sparse_matrix_transform]") {
    auto m = square();
    m.set(0, 1, 0.0);
    m.set(1, 0, 0.0);

    auto once = m.clean();
    auto twice = once.clean();
    CHECK(well_formed(once));
    CHECK(twice.equals(once));
    CHECK(twice.size() == once.size());
    for (long r = 0; r < once.rows(); ++r) {
      for (auto const& e : once.row(r)) {
        CHECK(e.value != 0.0);
      }
    }
  }

  TEST_CASE("sparse_matrix_transform - clean with tolerance",
            "[sparse_matrix_transform]") {
    Sparse_matrix<double> m{{1e-12, 1.0}, {-1e-9, 0.5}};
    auto c = m.clean(1e-6);
    CHECK(well_formed(c));
    CHECK(c.size() == 2);
    CHECK(c.at(0, 1) == 1.0);
    CHECK(c.at(1, 0) == 0.0);
  }

  // -- deliberately unsupported --

  TEST_CASE("sparse_matrix_transform - reshape", "[sparse_matrix_transform]") {
    auto m = zero_sparse(2, 3);
    CHECK_THROWS_AS(m.reshape(4, 2), Shape_error);
    CHECK_THROWS_AS(m.reshape(3, 2), Not_implemented_error);
  }

  TEST_CASE("sparse_matrix_transform - reshape rejects empty extents",
            "[sparse_matrix_transform]") {
    auto m = zero_sparse(2, 3);
    CHECK_THROWS_AS(m.reshape(0, 6), Zero_length_error);
    CHECK_THROWS_AS(m.reshape(6, -1), Zero_length_error);
    CHECK_THROWS_AS(m.reshape(-2, -3), Zero_length_error);
  }

  TEST_CASE("sparse_matrix_transform - reshape with huge extents",
            "[sparse_matrix_transform]") {
    auto huge = std::numeric_limits<sparow::config::size_type>::max();
    auto m = zero_sparse(2, 3);
    CHECK_THROWS_AS(m.reshape(huge, huge), Shape_error);
    CHECK_THROWS_AS(m.reshape(huge / 2, 3), Shape_error);
  }

  TEST_CASE("sparse_matrix_transform - determinant",
            "[sparse_matrix_transform]") {
    CHECK_THROWS_AS(square().det(), Not_implemented_error);
  }

} // end of namespace sparow::testing

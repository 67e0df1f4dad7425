//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>

//
// ... Standard header files
//
#include <random>
#include <vector>

//
// ... sparow header files
//
#include <sparow/data/errors.hpp>
#include <sparow/data/matgen.hpp>

namespace sparow::testing {

  using sparow::data::detail::Shape;
  using sparow::data::detail::Zero_length_error;
  using sparow::data::detail::diagonal_sparse;
  using sparow::data::detail::func_sparse;
  using sparow::data::detail::identity_sparse;
  using sparow::data::detail::tridiagonal_sparse;

  TEST_CASE("matgen - func_sparse shape", "[matgen]") {
    std::mt19937 urbg(3);
    auto m = func_sparse(4, 9, 0.5, [] { return 1.0; }, urbg);
    CHECK(m.shape() == Shape(4, 9));
    CHECK(m.size() <= 36);
    CHECK(m.sum() == static_cast<double>(m.size()));
  }

  TEST_CASE("matgen - func_sparse density bounds", "[matgen]") {
    std::mt19937 urbg(5);
    CHECK(func_sparse(5, 5, 0.0, [] { return 1.0; }, urbg).size() == 0);

    auto full = func_sparse(5, 5, 1.0, [] { return 2.0; }, urbg);
    CHECK(full.size() == 25);
    CHECK(full.min() == 2.0);
  }

  TEST_CASE("matgen - func_sparse is reproducible", "[matgen]") {
    std::mt19937 first(17);
    std::mt19937 second(17);
    std::normal_distribution<double> a_values;
    std::normal_distribution<double> b_values;

    auto a = func_sparse(6, 6, 0.3, [&] { return a_values(first); }, first);
    auto b = func_sparse(6, 6, 0.3, [&] { return b_values(second); }, second);
    CHECK(a.equals(b));
  }

  TEST_CASE("matgen - func_sparse requires a shape", "[matgen]") {
    std::mt19937 urbg(1);
    CHECK_THROWS_AS(func_sparse(0, 3, 0.5, [] { return 1.0; }, urbg),
                    Zero_length_error);
    CHECK_THROWS_AS(func_sparse(3, 0, 0.5, [] { return 1.0; }, urbg),
                    Zero_length_error);
  }

  TEST_CASE("matgen - identity", "[matgen]") {
    auto i = identity_sparse(4);
    CHECK(i.shape() == Shape(4, 4));
    CHECK(i.size() == 4);
    CHECK(i.trace() == 4.0);
    CHECK(i.at(1, 2) == 0.0);
    CHECK_THROWS_AS(identity_sparse(0), Zero_length_error);
  }

  TEST_CASE("matgen - diagonal", "[matgen]") {
    auto d = diagonal_sparse(std::vector<double>{1.0, 0.0, 3.0});
    CHECK(d.shape() == Shape(3, 3));
    CHECK(d.size() == 2);
    CHECK(d.trace() == 4.0);
    CHECK(d.at(2, 2) == 3.0);
  }

  TEST_CASE("matgen - tridiagonal", "[matgen]") {
    auto t = tridiagonal_sparse(4, -1.0, 2.0, -1.0);
    CHECK(t.size() == 10);
    CHECK(t.trace() == 8.0);
    CHECK(t.at(0, 1) == -1.0);
    CHECK(t.at(3, 2) == -1.0);
    CHECK(t.at(0, 2) == 0.0);
    CHECK(t.transpose().equals(t));
  }

} // end of namespace sparow::testing

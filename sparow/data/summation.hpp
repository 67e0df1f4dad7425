#pragma once

//
// ... Standard header files
//
#include <cmath>

namespace sparow::data::detail {

  // Compensated summation that keeps a running correction term for the
  // low-order bits lost by each addition. The correction is taken from
  // whichever of the sum and the new term is larger in magnitude, so a
  // term that dwarfs the running sum does not discard it.
  template<typename T>
  class Neumaier_sum final
  {
  public:
    void
    add(T term)
    {
      T next = total_ + term;
      correction_ += std::abs(total_) >= std::abs(term)
        ? (total_ - next) + term
        : (term - next) + total_;
      total_ = next;
    }

    T
    result() const
    {
      return total_ + correction_;
    }

  private:
    T total_{0};
    T correction_{0};
  };

} // end of namespace sparow::data::detail

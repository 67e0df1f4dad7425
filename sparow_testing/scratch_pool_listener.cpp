//
// ... Test header files
//
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>

//
// ... sparow header files
//
#include <sparow/data/Scratch_pool.hpp>

namespace sparow::testing {

  class Scratch_pool_listener final : public Catch::EventListenerBase {
  public:
    using Catch::EventListenerBase::EventListenerBase;

    void
    testCaseStarting(Catch::TestCaseInfo const&) override {
      sparow::data::detail::initialize_scratch_pool();
    }
  };

} // end of namespace sparow::testing

CATCH_REGISTER_LISTENER(sparow::testing::Scratch_pool_listener)

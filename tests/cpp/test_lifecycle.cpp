#include <catch2/catch_test_macros.hpp>

#include <timedate/util/lifecycle.h>

#include <stdexcept>

struct MockLifecycle : timedate::ComponentLifeCycle {
    int starts{0};
    int stops{0};
    bool fail_start{false};
    bool saw_starting{false};
    bool saw_stopping{false};

protected:
    void start() override {
        saw_starting = is_starting();
        if (fail_start) { throw std::runtime_error("start failed"); }
        ++starts;
    }

    void stop() override {
        saw_stopping = is_stopping();
        ++stops;
    }
};

TEST_CASE("Test the life-cycle component", "[lifecycle]") {
    using namespace timedate;
    MockLifecycle mock{};
    REQUIRE_FALSE(mock.is_started());
    REQUIRE_FALSE(mock.is_starting());
    REQUIRE_FALSE(mock.is_stopping());

    start_component(mock);
    REQUIRE(mock.is_started());
    REQUIRE(mock.saw_starting);
    REQUIRE_FALSE(mock.is_starting());

    // Starting twice is a no-op
    start_component(mock);
    REQUIRE(mock.starts == 1);

    stop_component(mock);
    REQUIRE_FALSE(mock.is_started());
    REQUIRE(mock.saw_stopping);
    REQUIRE_FALSE(mock.is_stopping());

    stop_component(mock);
    REQUIRE(mock.stops == 1);

    // And the component can be started again
    start_component(mock);
    REQUIRE(mock.is_started());
    REQUIRE(mock.starts == 2);
}

TEST_CASE("A failed start leaves the component stopped", "[lifecycle]") {
    using namespace timedate;
    MockLifecycle mock{};
    mock.fail_start = true;
    REQUIRE_THROWS_AS(start_component(mock), std::runtime_error);
    REQUIRE_FALSE(mock.is_started());
    REQUIRE_FALSE(mock.is_starting());

    mock.fail_start = false;
    start_component(mock);
    REQUIRE(mock.is_started());
}

TEST_CASE("StartStopContext", "[lifecycle]") {
    using namespace timedate;
    MockLifecycle mock{};
    {
        StartStopContext context{mock};
        REQUIRE(mock.is_started());
    }
    REQUIRE_FALSE(mock.is_started());
    REQUIRE(mock.stops == 1);
}

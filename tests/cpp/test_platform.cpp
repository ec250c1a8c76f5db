#include <catch2/catch_test_macros.hpp>

#include <timedate/platform.h>
#include <timedate/runtime/real_time_timer_service.h>
#include <timedate/runtime/simulation_timer_service.h>
#include <timedate/util/errors.h>
#include <timedate/value_sink.h>

#include "test_support.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

using namespace timedate;
using namespace timedate::testing;
using namespace std::chrono_literals;

namespace {
    struct PlatformHarness {
        PlatformHarness() : platform{RuntimeContext{timers, timers, store, diagnostics}} {}

        std::shared_ptr<SimulationTimerService> timers{std::make_shared<SimulationTimerService>(utc(2023, 1, 1, 23))};
        std::shared_ptr<ValueStore> store{std::make_shared<ValueStore>()};
        std::shared_ptr<RecordingDiagnostics> diagnostics{std::make_shared<RecordingDiagnostics>()};
        TimeDatePlatform platform;
    };

    // Publishing takes the host's lock, the way a sink calling into an interpreter needs its global lock
    struct HostLockedSink : ValueSink {
        explicit HostLockedSink(std::mutex &host_lock) : _host_lock{host_lock} {}

        void publish(const PublishedValue &value) override {
            std::lock_guard<std::mutex> lock(_host_lock);
            store.publish(value);
        }

        void retract(std::string_view unique_id) override {
            std::lock_guard<std::mutex> lock(_host_lock);
            store.retract(unique_id);
        }

        ValueStore store;

    private:
        std::mutex &_host_lock;
    };

    struct FrozenClock : Clock {
        explicit FrozenClock(instant_t t) : _t{t} {}

        [[nodiscard]] instant_t now() const override { return _t; }

    private:
        instant_t _t;
    };
}

TEST_CASE("Setting up an entry creates a publisher per enabled kind", "[platform]") {
    PlatformHarness harness;
    harness.platform.setup_entry(
        TimeDateConfig{"entry", "UTC", {RepresentationKind::Beat, RepresentationKind::Time}});

    REQUIRE(harness.platform.is_loaded());
    CHECK(harness.platform.size() == 2);
    CHECK(harness.platform.entry_id() == "entry");
    CHECK(harness.platform.zone()->name() == "UTC");
    CHECK(harness.platform.kinds() == std::vector<RepresentationKind>{RepresentationKind::Time, RepresentationKind::Beat});
    CHECK(harness.platform.unique_ids() == std::vector<std::string>{"entry_time", "entry_beat"});

    CHECK(harness.store->get("entry_time")->value == "23:00");
    CHECK(harness.store->get("entry_beat")->value == "@000");
    CHECK(harness.timers->pending() == 2);

    REQUIRE(harness.platform.publisher(RepresentationKind::Beat) != nullptr);
    CHECK(harness.platform.publisher(RepresentationKind::Beat)->state() == PublisherState::Armed);
    CHECK(harness.platform.publisher(RepresentationKind::Date) == nullptr);
    CHECK(harness.diagnostics->contains(LogLevel::Info, "Set up entry in UTC with [time, beat]"));

    harness.timers->advance_by(1min);
    CHECK(harness.store->get("entry_time")->value == "23:01");
    CHECK(harness.store->get("entry_beat")->value == "@000");
}

TEST_CASE("An entry without a zone sets nothing up", "[platform]") {
    PlatformHarness harness;

    SECTION("Missing") {
        CHECK_THROWS_AS(harness.platform.setup_entry(TimeDateConfig{"entry", std::nullopt}), SetupError);
    }

    SECTION("Empty") {
        CHECK_THROWS_AS(harness.platform.setup_entry(TimeDateConfig{"entry", ""}), SetupError);
    }

    SECTION("Unknown") {
        CHECK_THROWS_AS(harness.platform.setup_entry(TimeDateConfig{"entry", "Atlantis/Lost"}), SetupError);
    }

    SECTION("Null resolved zone") {
        CHECK_THROWS_AS(harness.platform.setup_entry(TimeDateConfig{"entry", "UTC"}, nullptr), SetupError);
    }

    CHECK_FALSE(harness.platform.is_loaded());
    CHECK(harness.platform.size() == 0);
    CHECK(harness.store->size() == 0);
    CHECK(harness.timers->pending() == 0);
    CHECK(harness.diagnostics->count(LogLevel::Error) == 1);
}

TEST_CASE("An entry requires an id", "[platform]") {
    PlatformHarness harness;
    CHECK_THROWS_AS(harness.platform.setup_entry(TimeDateConfig{"", "UTC"}), ConfigError);
    CHECK(harness.store->size() == 0);
}

TEST_CASE("Disabled kinds are removed from the host", "[platform]") {
    PlatformHarness harness;
    // Left over from an earlier configuration
    harness.store->publish(PublishedValue{"entry_date", RepresentationKind::Date, "Date", "mdi:calendar", "stale"});
    harness.store->publish(PublishedValue{"other_date", RepresentationKind::Date, "Date", "mdi:calendar", "kept"});

    harness.platform.setup_entry(TimeDateConfig{"entry", "UTC", {RepresentationKind::Time}});
    CHECK_FALSE(harness.store->contains("entry_date"));
    CHECK(harness.store->contains("other_date"));
    CHECK(harness.store->contains("entry_time"));
}

TEST_CASE("Reloading with other options", "[platform]") {
    PlatformHarness harness;
    harness.platform.setup_entry(TimeDateConfig{"entry", "UTC", {RepresentationKind::Time, RepresentationKind::Beat}});
    REQUIRE(harness.timers->pending() == 2);

    harness.platform.reload(TimeDateConfig{"entry", "+02:00", {RepresentationKind::Date}});
    CHECK(harness.platform.kinds() == std::vector<RepresentationKind>{RepresentationKind::Date});
    CHECK(harness.timers->pending() == 1);
    CHECK_FALSE(harness.store->contains("entry_time"));
    CHECK_FALSE(harness.store->contains("entry_beat"));
    CHECK(harness.store->get("entry_date")->value == "2023-01-02");

    // Setting up again over a loaded entry does not double up
    harness.platform.setup_entry(TimeDateConfig{"entry", "+02:00", {RepresentationKind::Date}});
    CHECK(harness.timers->pending() == 1);
    CHECK(harness.store->size() == 1);
}

TEST_CASE("A zone resolved by the host", "[platform]") {
    PlatformHarness harness;
    auto zone = std::make_shared<TransitionTimeZone>(
        "Pacific/Example", 10h, std::vector<TransitionTimeZone::Transition>{{utc(2023, 1, 2), 11h}});
    harness.platform.setup_entry(TimeDateConfig{"entry", std::nullopt, {RepresentationKind::DateTime}}, zone);
    CHECK(harness.platform.zone()->name() == "Pacific/Example");
    CHECK(harness.store->get("entry_date_time")->value == "2023-01-02, 09:00");
}

TEST_CASE("An entry configured with a named zone", "[platform]") {
    PlatformHarness harness;
    harness.platform.setup_entry(
        TimeDateConfig{"entry", "Europe/Berlin", {RepresentationKind::Time, RepresentationKind::Date}});
    CHECK(harness.platform.zone()->name() == "Europe/Berlin");
    // 2023-01-01T23:00Z is already the next day in Berlin
    CHECK(harness.store->get("entry_time")->value == "00:00");
    CHECK(harness.store->get("entry_date")->value == "2023-01-02");
    CHECK(harness.platform.publisher(RepresentationKind::Date)->next_update() == utc(2023, 1, 2, 23));
}

TEST_CASE("Unloading cancels and retracts everything", "[platform]") {
    PlatformHarness harness;
    harness.platform.setup_entry(TimeDateConfig{"entry", "UTC", options_from_display_options(
                                                                    {"time", "date", "date_time", "date_time_utc",
                                                                     "date_time_iso", "time_date", "beat",
                                                                     "time_utc"})});
    REQUIRE(harness.platform.size() == ALL_REPRESENTATION_KINDS.size());
    REQUIRE(harness.timers->pending() == ALL_REPRESENTATION_KINDS.size());

    harness.platform.unload();
    CHECK_FALSE(harness.platform.is_loaded());
    CHECK(harness.platform.size() == 0);
    CHECK(harness.timers->pending() == 0);
    CHECK(harness.store->size() == 0);
    CHECK_NOTHROW(harness.platform.unload());

    CHECK(harness.timers->advance_by(24h) == 0);
}

TEST_CASE("Releasing the platform unloads it", "[platform]") {
    auto timers = std::make_shared<SimulationTimerService>(utc(2023, 1, 1));
    auto store = std::make_shared<ValueStore>();
    {
        TimeDatePlatform platform{RuntimeContext{timers, timers, store, nullptr}};
        platform.setup_entry(TimeDateConfig{"entry", "UTC", {RepresentationKind::Time, RepresentationKind::Date}});
        REQUIRE(timers->pending() == 2);
    }
    CHECK(timers->pending() == 0);
    CHECK(store->size() == 0);
}

TEST_CASE("Releasing a platform while a fire waits for the host lock", "[platform][real_time]") {
    // Every boundary from the frozen clock is already due, the worker publishes back to back
    auto clock = std::make_shared<FrozenClock>(utc(2000, 1, 1));
    auto timers = std::make_shared<RealTimeTimerService>();
    std::mutex host_lock;
    auto sink = std::make_shared<HostLockedSink>(host_lock);

    for (int round = 0; round < 10; ++round) {
        auto platform = std::make_unique<TimeDatePlatform>(RuntimeContext{clock, timers, sink, nullptr});
        platform->setup_entry(TimeDateConfig{"entry", "UTC", {RepresentationKind::Time, RepresentationKind::Beat}});

        std::unique_lock<std::mutex> host(host_lock);
        // Leaves the worker blocked in publish, waiting for the lock this thread holds
        std::this_thread::sleep_for(5ms);

        // Teardown waits on the worker only with the host lock given up
        host.unlock();
        platform->unload();
        host.lock();
        platform.reset();
        host.unlock();

        REQUIRE(timers->pending() == 0);
        REQUIRE(sink->store.size() == 0);
    }
    timers->shutdown();
}

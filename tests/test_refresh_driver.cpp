#include <catch2/catch_test_macros.hpp>
#include "engine/refresh_driver.hpp"
#include "mocks/usage_log_fixture.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace ccdash;
using namespace std::chrono_literals;
using ccdash::testing::TempLogTree;
using ccdash::testing::UsageLine;

namespace {

const TimePoint kT0 = utils::from_epoch_ms(1762161330250);

/**
 * Clock that can hold the calling build until the test releases it,
 * so a tick can be kept in flight deterministically.
 */
class GateClock {
public:
    UsageEngine::ClockFn fn() {
        return [this] {
            std::unique_lock lock(mutex_);
            if (armed_) {
                armed_ = false;
                entered_ = true;
                cv_.notify_all();
                cv_.wait(lock, [this] { return released_; });
            }
            return kT0 + 120s;
        };
    }

    void arm() {
        std::lock_guard lock(mutex_);
        armed_ = true;
        entered_ = false;
        released_ = false;
    }

    void wait_entered() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return entered_; });
    }

    void release() {
        std::lock_guard lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool armed_ = false;
    bool entered_ = false;
    bool released_ = false;
};

void write_session(TempLogTree& tree) {
    UsageLine a;
    a.message_id = "m1";
    a.timestamp = kT0;
    a.input = 100;
    a.output = 50;

    UsageLine b;
    b.message_id = "m2";
    b.timestamp = kT0 + 90s;
    b.model = "claude-haiku-4-5";
    b.input = 10;
    b.output = 5;

    tree.write("-home-me-app/session.jsonl", a.line() + b.line());
}

UsageEngine::Config engine_config(const std::string& root) {
    UsageEngine::Config cfg;
    cfg.locator.root_dir = root;
    return cfg;
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // anonymous namespace

TEST_CASE("RefreshDriver: tick publishes the latest snapshot", "[refresh]") {
    TempLogTree tree("driver_publish");
    write_session(tree);
    GateClock clock;
    UsageEngine engine(engine_config(tree.root()), clock.fn());

    RefreshDriver driver(engine, WindowSpec::preset(WindowKind::ALL_TIME));
    CHECK(driver.latest() == nullptr);

    SnapshotPtr seen;
    driver.set_on_publish([&](const SnapshotPtr& s) { seen = s; });

    REQUIRE(driver.tick());
    const auto latest = driver.latest();
    REQUIRE(latest != nullptr);
    CHECK(latest->total_tokens == 165);
    CHECK(latest->window_key == "all");
    CHECK(seen == latest);

    const auto stats = driver.get_stats();
    CHECK(stats.ticks_run == 1);
    CHECK(stats.published == 1);
    CHECK(stats.failed == 0);
}

TEST_CASE("RefreshDriver: tick due during a running build is skipped", "[refresh]") {
    TempLogTree tree("driver_overlap");
    write_session(tree);
    GateClock clock;
    UsageEngine engine(engine_config(tree.root()), clock.fn());
    RefreshDriver driver(engine, WindowSpec::preset(WindowKind::ALL_TIME));

    clock.arm();
    std::thread builder([&] { driver.tick(); });
    clock.wait_entered();

    CHECK_FALSE(driver.tick());

    clock.release();
    builder.join();

    const auto stats = driver.get_stats();
    CHECK(stats.ticks_skipped == 1);
    CHECK(stats.ticks_run == 1);
    CHECK(stats.published == 1);
    REQUIRE(driver.latest() != nullptr);
}

TEST_CASE("RefreshDriver: result for a replaced window is discarded", "[refresh]") {
    TempLogTree tree("driver_stale");
    write_session(tree);
    GateClock clock;
    UsageEngine engine(engine_config(tree.root()), clock.fn());
    RefreshDriver driver(engine, WindowSpec::preset(WindowKind::ALL_TIME));

    clock.arm();
    std::thread builder([&] { driver.tick(); });
    clock.wait_entered();

    const auto generation = driver.set_window(WindowSpec::custom(kT0, kT0 + 60s));
    REQUIRE(generation.is_ok());
    CHECK(generation.value() == 1);

    clock.release();
    builder.join();

    CHECK(driver.latest() == nullptr);
    CHECK(driver.get_stats().stale_discarded == 1);

    // The next tick builds the new window and publishes it
    REQUIRE(driver.tick());
    const auto latest = driver.latest();
    REQUIRE(latest != nullptr);
    CHECK(latest->window_key == WindowSpec::custom(kT0, kT0 + 60s).key());
    CHECK(latest->total_tokens == 150);
}

TEST_CASE("RefreshDriver: invalid window keeps the current one", "[refresh]") {
    TempLogTree tree("driver_invalid");
    write_session(tree);
    GateClock clock;
    UsageEngine engine(engine_config(tree.root()), clock.fn());

    const auto initial = WindowSpec::preset(WindowKind::WEEK);
    RefreshDriver driver(engine, initial);

    const auto result = driver.set_window(WindowSpec::custom(kT0 + 1s, kT0));
    CHECK(result.is_error());
    CHECK(result.error_category() == ErrorCategory::INVALID_WINDOW);
    CHECK(driver.current_window() == initial);
    CHECK(driver.get_stats().generation == 0);
}

TEST_CASE("RefreshDriver: failed build is counted, previous snapshot kept", "[refresh]") {
    TempLogTree tree("driver_failed");
    write_session(tree);
    GateClock clock;
    UsageEngine engine(engine_config(tree.root()), clock.fn());
    RefreshDriver driver(engine, WindowSpec::preset(WindowKind::ALL_TIME));

    REQUIRE(driver.tick());
    const auto before = driver.latest();
    REQUIRE(before != nullptr);

    // Passes set_window validation but cannot be resolved: starts in the future
    REQUIRE(driver.set_window(WindowSpec::since(kT0 + 1h)).is_ok());
    REQUIRE(driver.tick());

    CHECK(driver.get_stats().failed == 1);
    CHECK(driver.latest() == before);
}

TEST_CASE("RefreshDriver: background thread ticks until stopped", "[refresh]") {
    TempLogTree tree("driver_thread");
    write_session(tree);
    GateClock clock;
    UsageEngine engine(engine_config(tree.root()), clock.fn());

    RefreshDriver::Config cfg;
    cfg.interval = 20ms;
    RefreshDriver driver(engine, WindowSpec::preset(WindowKind::ALL_TIME), cfg);

    std::atomic<int> callbacks{0};
    driver.set_on_publish([&](const SnapshotPtr&) { callbacks.fetch_add(1); });

    driver.start();
    CHECK(driver.is_running());
    CHECK(wait_until([&] { return driver.get_stats().ticks_run >= 3; }));

    driver.stop();
    CHECK_FALSE(driver.is_running());
    CHECK(callbacks.load() >= 1);
    REQUIRE(driver.latest() != nullptr);
    CHECK(driver.latest()->total_tokens == 165);

    const auto ticks = driver.get_stats().ticks_run;
    std::this_thread::sleep_for(60ms);
    CHECK(driver.get_stats().ticks_run == ticks);
}

TEST_CASE("RefreshDriver: set_window wakes the background thread", "[refresh]") {
    TempLogTree tree("driver_wake");
    write_session(tree);
    GateClock clock;
    UsageEngine engine(engine_config(tree.root()), clock.fn());

    RefreshDriver::Config cfg;
    cfg.interval = 1h;
    RefreshDriver driver(engine, WindowSpec::preset(WindowKind::ALL_TIME), cfg);

    driver.start();
    REQUIRE(wait_until([&] { return driver.latest() != nullptr; }));

    const auto custom = WindowSpec::custom(kT0, kT0 + 60s);
    REQUIRE(driver.set_window(custom).is_ok());
    CHECK(wait_until([&] {
        const auto s = driver.latest();
        return s && s->window_key == custom.key();
    }));
    driver.stop();
}

TEST_CASE("RefreshDriver: request_refresh picks up new log lines", "[refresh]") {
    TempLogTree tree("driver_request");
    write_session(tree);
    GateClock clock;
    UsageEngine engine(engine_config(tree.root()), clock.fn());

    RefreshDriver::Config cfg;
    cfg.interval = 1h;
    RefreshDriver driver(engine, WindowSpec::preset(WindowKind::ALL_TIME), cfg);

    driver.start();
    REQUIRE(wait_until([&] { return driver.latest() != nullptr; }));
    CHECK(driver.latest()->total_tokens == 165);

    UsageLine c;
    c.message_id = "m3";
    c.timestamp = kT0 + 100s;
    c.input = 1000;
    (void)tree.append("-home-me-app/session.jsonl", c.line());

    driver.request_refresh();
    CHECK(wait_until([&] {
        const auto s = driver.latest();
        return s && s->total_tokens == 1165;
    }));
    driver.stop();
}

TEST_CASE("RefreshDriver: throwing publish callback does not wedge ticks", "[refresh]") {
    TempLogTree tree("driver_callback_throws");
    write_session(tree);
    GateClock clock;
    UsageEngine engine(engine_config(tree.root()), clock.fn());
    RefreshDriver driver(engine, WindowSpec::preset(WindowKind::ALL_TIME));

    driver.set_on_publish([](const SnapshotPtr&) {
        throw std::runtime_error("render failed");
    });

    CHECK(driver.tick());
    CHECK(driver.tick());

    const auto stats = driver.get_stats();
    CHECK(stats.ticks_run == 2);
    CHECK(stats.ticks_skipped == 0);
    CHECK(stats.published == 2);
    CHECK(stats.callback_errors == 2);
    REQUIRE(driver.latest() != nullptr);
    CHECK(driver.latest()->total_tokens == 165);
}

TEST_CASE("RefreshDriver: publish callback may replace itself", "[refresh]") {
    TempLogTree tree("driver_callback_replace");
    write_session(tree);
    GateClock clock;
    UsageEngine engine(engine_config(tree.root()), clock.fn());
    RefreshDriver driver(engine, WindowSpec::preset(WindowKind::ALL_TIME));

    int first_calls = 0;
    int second_calls = 0;
    driver.set_on_publish([&](const SnapshotPtr&) {
        ++first_calls;
        driver.set_on_publish([&](const SnapshotPtr&) { ++second_calls; });
    });

    REQUIRE(driver.tick());
    REQUIRE(driver.tick());
    CHECK(first_calls == 1);
    CHECK(second_calls == 1);
}

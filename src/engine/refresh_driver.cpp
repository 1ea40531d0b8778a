#include "engine/refresh_driver.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>

namespace ccdash {

namespace {

// RAII reset of the in-flight flag
struct InFlightGuard {
    std::atomic<bool>& flag;
    ~InFlightGuard() { flag.store(false, std::memory_order_release); }
};

} // anonymous namespace

RefreshDriver::RefreshDriver(UsageEngine& engine, WindowSpec initial_window, Config config)
    : engine_(engine),
      config_(config),
      window_(std::move(initial_window)) {
    if (config_.interval.count() <= 0) {
        config_.interval = std::chrono::milliseconds{3000};
    }
}

RefreshDriver::RefreshDriver(UsageEngine& engine, WindowSpec initial_window)
    : RefreshDriver(engine, std::move(initial_window), Config{}) {}

RefreshDriver::~RefreshDriver() {
    stop();
}

void RefreshDriver::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;

    refresh_thread_ = std::thread(&RefreshDriver::refresh_loop, this);
    utils::log::info(std::format("Refresh driver started (interval {}ms, window {})",
                                 config_.interval.count(), current_window().key()));
}

void RefreshDriver::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) return;

    {
        std::lock_guard lock(cv_mutex_);
        refresh_requested_ = true;
    }
    cv_.notify_one();
    if (refresh_thread_.joinable()) {
        refresh_thread_.join();
    }
    utils::log::info("Refresh driver stopped");
}

Result<uint64_t> RefreshDriver::set_window(const WindowSpec& spec) {
    if (auto problem = validate_window(spec); !problem.empty()) {
        return Result<uint64_t>::error(ErrorCategory::INVALID_WINDOW, std::move(problem));
    }

    uint64_t generation;
    {
        std::lock_guard lock(window_mutex_);
        window_ = spec;
        generation = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
    }
    request_refresh();
    return Result<uint64_t>::ok(generation);
}

WindowSpec RefreshDriver::current_window() const {
    std::lock_guard lock(window_mutex_);
    return window_;
}

void RefreshDriver::request_refresh() {
    {
        std::lock_guard lock(cv_mutex_);
        refresh_requested_ = true;
    }
    cv_.notify_one();
}

bool RefreshDriver::tick() {
    bool expected = false;
    if (!tick_in_flight_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        ticks_skipped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    InFlightGuard guard{tick_in_flight_};

    WindowSpec spec;
    uint64_t generation;
    {
        std::lock_guard lock(window_mutex_);
        spec = window_;
        generation = generation_.load(std::memory_order_acquire);
    }
    const auto sequence = next_sequence_.fetch_add(1, std::memory_order_relaxed);

    auto result = Result<SnapshotPtr>::error(ErrorCategory::INTERNAL_ERROR, "not run");
    try {
        result = engine_.query(spec);
    } catch (const std::exception& e) {
        result = Result<SnapshotPtr>::error(ErrorCategory::INTERNAL_ERROR, e.what());
    }
    ticks_run_.fetch_add(1, std::memory_order_relaxed);

    if (result.is_error()) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Refresh for window {} failed: {}",
                                     spec.key(), result.error_message()));
    } else {
        publish(result.value(), generation, sequence);
    }
    return true;
}

void RefreshDriver::publish(SnapshotPtr snapshot, uint64_t generation, uint64_t sequence) {
    PublishCallback callback;
    {
        std::lock_guard lock(publish_mutex_);

        // Window changed while this build was in flight
        if (generation != generation_.load(std::memory_order_acquire)) {
            stale_discarded_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        if (sequence <= last_published_sequence_) {
            stale_discarded_.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        last_published_sequence_ = sequence;
        std::atomic_store_explicit(&latest_, snapshot, std::memory_order_release);
        published_.fetch_add(1, std::memory_order_relaxed);
        callback = on_publish_;
    }

    if (!callback) return;
    try {
        callback(snapshot);
    } catch (const std::exception& e) {
        callback_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Publish callback for window {} failed: {}",
                                     snapshot->window_key, e.what()));
    }
}

SnapshotPtr RefreshDriver::latest() const {
    return std::atomic_load_explicit(&latest_, std::memory_order_acquire);
}

void RefreshDriver::set_on_publish(PublishCallback callback) {
    std::lock_guard lock(publish_mutex_);
    on_publish_ = std::move(callback);
}

void RefreshDriver::refresh_loop() {
    while (running_.load(std::memory_order_acquire)) {
        tick();

        std::unique_lock lock(cv_mutex_);
        cv_.wait_for(lock, config_.interval, [this] {
            return refresh_requested_ || !running_.load(std::memory_order_acquire);
        });
        refresh_requested_ = false;
    }
}

RefreshDriver::Stats RefreshDriver::get_stats() const {
    Stats s;
    s.ticks_run = ticks_run_.load(std::memory_order_relaxed);
    s.ticks_skipped = ticks_skipped_.load(std::memory_order_relaxed);
    s.stale_discarded = stale_discarded_.load(std::memory_order_relaxed);
    s.published = published_.load(std::memory_order_relaxed);
    s.failed = failed_.load(std::memory_order_relaxed);
    s.callback_errors = callback_errors_.load(std::memory_order_relaxed);
    s.generation = generation_.load(std::memory_order_relaxed);
    return s;
}

} // namespace ccdash

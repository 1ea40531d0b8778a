#pragma once

#include "core/error.hpp"
#include "engine/usage_engine.hpp"
#include "window/window_spec.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace ccdash {

/**
 * @brief Periodic background driver for UsageEngine::query()
 *
 * One thread runs a tick every interval (and immediately on start,
 * set_window or request_refresh). A tick that is due while another is
 * still running is skipped, never queued.
 *
 * Each tick captures the window generation and a sequence number before
 * building. On arrival the result is dropped if the window changed while
 * it was in flight, or if a newer tick already published. Readers get the
 * last published snapshot through latest(), a wait-free atomic load.
 */
class RefreshDriver {
public:
    using PublishCallback = std::function<void(const SnapshotPtr&)>;

    struct Config {
        std::chrono::milliseconds interval{3000};
    };

    RefreshDriver(UsageEngine& engine, WindowSpec initial_window, Config config);
    RefreshDriver(UsageEngine& engine, WindowSpec initial_window);
    ~RefreshDriver();

    RefreshDriver(const RefreshDriver&) = delete;
    RefreshDriver& operator=(const RefreshDriver&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }

    /**
     * @brief Switch the window; the next tick builds it
     * @return The new window generation, or INVALID_WINDOW (current window kept)
     */
    [[nodiscard]] Result<uint64_t> set_window(const WindowSpec& spec);

    [[nodiscard]] WindowSpec current_window() const;

    /// Wake the background thread for an immediate tick.
    void request_refresh();

    /// Run one build on the calling thread. False if a tick was already running.
    bool tick();

    /// Last published snapshot, nullptr before the first publish.
    [[nodiscard]] SnapshotPtr latest() const;

    /**
     * @brief Called on the building thread after each publish, outside the
     * publish lock. An exception from it is logged and counted.
     */
    void set_on_publish(PublishCallback callback);

    struct Stats {
        uint64_t ticks_run = 0;
        uint64_t ticks_skipped = 0;
        uint64_t stale_discarded = 0;
        uint64_t published = 0;
        uint64_t failed = 0;
        uint64_t callback_errors = 0;
        uint64_t generation = 0;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    void refresh_loop();
    void publish(SnapshotPtr snapshot, uint64_t generation, uint64_t sequence);

    UsageEngine& engine_;
    Config config_;

    // Window selection
    mutable std::mutex window_mutex_;
    WindowSpec window_;
    std::atomic<uint64_t> generation_{0};

    // Single-slot handoff
    std::shared_ptr<const Snapshot> latest_;
    std::mutex publish_mutex_;
    uint64_t last_published_sequence_ = 0;
    PublishCallback on_publish_;

    std::atomic<bool> tick_in_flight_{false};
    std::atomic<uint64_t> next_sequence_{1};

    // Background thread
    std::thread refresh_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool refresh_requested_ = false;

    // Stats
    std::atomic<uint64_t> ticks_run_{0};
    std::atomic<uint64_t> ticks_skipped_{0};
    std::atomic<uint64_t> stale_discarded_{0};
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> callback_errors_{0};
};

} // namespace ccdash

#include "config/config_loader.hpp"
#include "core/format.hpp"
#include "core/utils.hpp"
#include "engine/refresh_driver.hpp"
#include "engine/usage_engine.hpp"
#include "window/window_spec.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

using namespace ccdash;

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void signal_handler(int) {
    g_stop_requested = 1;
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    const std::filesystem::path base = (home && *home) ? std::filesystem::path(home)
                                                       : std::filesystem::path(".");
    return (base / ".ccdash" / "config.toml").string();
}

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} [config.toml] [--window <week|today|24h|7d|30d|all|since:<ms>|custom:<ms>:<ms>>] [--once]\n",
        argv0);
}

void print_report(const Snapshot& snap) {
    std::string out;
    out += std::format("== {} ==\n", snap.window_label);
    out += std::format("  window    {} .. {}{}\n",
                       utils::format_timestamp(snap.window_start),
                       utils::format_timestamp(snap.window_end),
                       snap.open_ended ? " (now)" : "");

    if (!snap.source_available || snap.record_count == 0) {
        out += std::format("  {}\n", snap.status_message);
    }

    out += std::format("  tokens    {} (in {}, out {}, cache read {}, cache write {})\n",
                       format::tokens(snap.total_tokens),
                       format::tokens(snap.tokens.input),
                       format::tokens(snap.tokens.output),
                       format::tokens(snap.tokens.cache_read),
                       format::tokens(snap.tokens.cache_creation));
    out += std::format("  cost      {}\n", format::cost(snap.total_cost_usd));
    out += std::format("  rate      {} (last 60s), {} (window avg)\n",
                       format::token_rate(snap.rate_60s),
                       format::token_rate(snap.rate_session_avg));

    if (snap.earliest_timestamp && snap.latest_timestamp) {
        const auto span = std::chrono::duration_cast<std::chrono::milliseconds>(
            *snap.latest_timestamp - *snap.earliest_timestamp);
        out += std::format("  active    {} across {} requests\n",
                           format::duration(span), snap.record_count);
    }

    for (const auto& m : snap.per_model) {
        out += std::format("    {:<32} {:>14} tok {:>12}  ({} req)\n",
                           m.model, format::tokens(m.total_tokens),
                           format::cost(m.total_cost_usd), m.record_count);
    }

    if (snap.skipped_lines > 0 || snap.unreadable_files > 0) {
        out += std::format("  {} lines skipped / {} files unreadable\n",
                           snap.skipped_lines, snap.unreadable_files);
    }
    out += std::format("  built     {}\n", utils::format_timestamp(snap.built_at));

    static std::mutex out_mutex;
    std::lock_guard lock(out_mutex);
    std::cout << out << std::flush;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_file;
        std::string window_arg;
        bool once = false;

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--once") {
                once = true;
            } else if (arg == "--window" && i + 1 < argc) {
                window_arg = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (config_file.empty() && !utils::starts_with(arg, "-")) {
                config_file = arg;
            } else {
                print_usage(argv[0]);
                return 2;
            }
        }

        // Configuration
        DashboardConfig config;
        const bool explicit_config = !config_file.empty();
        if (!explicit_config) config_file = default_config_path();

        std::error_code ec;
        if (std::filesystem::exists(config_file, ec)) {
            auto loaded = ConfigLoader::load_from_file(config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return 1;
            }
            config = std::move(loaded.config);
        } else {
            if (explicit_config) {
                utils::log::warn(std::format("Config file {} not found, using defaults", config_file));
            }
            config = ConfigLoader::defaults();
        }

        const auto level = utils::log::parse_level(config.logging.level).value_or(utils::log::Level::INFO);
        if (!utils::log::configure(level, config.logging.file)) {
            utils::log::warn(std::format("Cannot open log file {}, logging to stderr",
                                         config.logging.file));
        }
        for (const auto& warning : ConfigLoader::config_warnings(config)) {
            utils::log::warn(warning);
        }

        const auto window_key = window_arg.empty() ? config.refresh.default_window : window_arg;
        const auto window = WindowSpec::parse(window_key);
        if (!window) {
            utils::log::error(std::format("Unknown window '{}'", window_key));
            return 2;
        }

        UsageEngine engine(UsageEngine::config_from(config));
        utils::log::info(std::format("Reading usage logs from {}", config.usage.root_dir));

        if (once) {
            auto result = engine.query(*window);
            if (result.is_error()) {
                utils::log::error(std::format("{}: {}",
                    error_category_name(result.error_category()), result.error_message()));
                return 1;
            }
            print_report(*result.value());
            return 0;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        RefreshDriver::Config driver_config;
        driver_config.interval = config.refresh.interval;
        RefreshDriver driver(engine, *window, driver_config);
        driver.set_on_publish([](const SnapshotPtr& snap) { print_report(*snap); });
        driver.start();

        while (!g_stop_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        utils::log::info("Shutting down...");
        driver.stop();

        const auto stats = engine.get_stats();
        utils::log::info(std::format("{} queries, {} cache hits, {} rebuilds, {} records",
                                     stats.queries, stats.cache_hits, stats.rebuilds,
                                     stats.aggregator.record_count));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}

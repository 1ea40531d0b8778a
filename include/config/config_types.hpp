#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ccdash {

// ============================================================================
// Configuration Types
// ============================================================================

struct UsageConfig {
    std::string root_dir;                 // Default: $HOME/.claude/projects
    std::string project_filter;           // One project directory name, empty = all
    bool current_project_only = false;    // Derive project_filter from the cwd
    bool exclude_agent_logs = false;
    size_t max_line_bytes = 10 * 1024 * 1024;
};

struct CacheConfig {
    size_t max_entries = 8;
    std::chrono::milliseconds snapshot_ttl{5000};
    bool persist = true;
    std::string persist_path;             // Default: $HOME/.ccdash/snapshot_cache.json
};

struct RefreshConfig {
    std::chrono::milliseconds interval{3000};
    std::string default_window = "week";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;                     // Empty = stderr
};

struct PricingConfig {
    std::optional<ModelRate> default_rate;
    std::vector<ModelRate> models;
};

struct DashboardConfig {
    UsageConfig usage;
    CacheConfig cache;
    RefreshConfig refresh;
    LoggingConfig logging;
    PricingConfig pricing;
};

} // namespace ccdash

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ccdash {

/**
 * @brief One transcript file found under the projects root
 *
 * size and mtime_ns come from the same stat call and feed both the
 * aggregator's incremental reads and the source fingerprint.
 */
struct LogFileInfo {
    std::string path;
    std::string project_id;
    uint64_t size = 0;
    int64_t mtime_ns = 0;

    bool operator==(const LogFileInfo&) const = default;
};

struct LocateResult {
    bool root_exists = false;
    std::vector<LogFileInfo> files;        // Sorted by path
    std::vector<std::string> errors;       // Per-subpath failures (skipped)
    std::string warning;                   // Set when the root itself is unusable
};

/**
 * @brief Enumerates .jsonl transcripts at any depth below <root>/<project>
 *
 * A missing root is not an error (token tracking is optional): the result
 * simply has root_exists=false and no files. Errors on individual
 * subdirectories or files are collected and the walk continues.
 *
 * Stateless apart from its config; safe to call from any thread.
 */
class LogLocator {
public:
    struct Config {
        std::string root_dir;
        std::string project_filter;        // Empty = all project directories
        bool exclude_agent_logs = false;   // Skip files named agent-*.jsonl
    };

    explicit LogLocator(Config config);

    [[nodiscard]] LocateResult locate() const;

    [[nodiscard]] const Config& config() const { return config_; }

    /**
     * @brief Project directory name the assistant uses for a working directory
     *
     * Every '/' becomes '-': "/workspaces/app" -> "-workspaces-app".
     */
    [[nodiscard]] static std::string encode_project_dir(const std::string& cwd);

private:
    void scan_project(const std::string& project_dir, const std::string& project_id,
                      LocateResult& out) const;
    void add_if_log_file(const std::filesystem::directory_entry& entry,
                         const std::string& project_id, LocateResult& out) const;

    Config config_;
};

} // namespace ccdash

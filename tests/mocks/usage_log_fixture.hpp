#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <string>
#include <unistd.h>

namespace ccdash::testing {

/// RFC 3339 in UTC with milliseconds, as the assistant writes it.
inline std::string iso_utc(TimePoint tp) {
    const auto ms = utils::to_epoch_ms(tp);
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    ::gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::format("{}.{:03d}Z", buf, static_cast<int>(ms % 1000));
}

/**
 * @brief One assistant transcript line carrying message.usage
 */
struct UsageLine {
    TimePoint timestamp{};
    std::string model = "claude-opus-4-5-20251101";
    int64_t input = 0;
    int64_t output = 0;
    int64_t cache_read = 0;
    int64_t cache_creation = 0;
    std::string message_id;
    std::string request_id;
    std::string uuid;
    std::string session_id = "session-1";
    std::optional<double> cost_usd;

    [[nodiscard]] std::string json() const {
        std::string message = "{";
        if (!message_id.empty()) message += std::format(R"("id":"{}",)", message_id);
        if (!model.empty()) message += std::format(R"("model":"{}",)", model);
        message += std::format(
            R"("usage":{{"input_tokens":{},"output_tokens":{},"cache_read_input_tokens":{},"cache_creation_input_tokens":{}}}}})",
            input, output, cache_read, cache_creation);

        std::string line = std::format(R"({{"type":"assistant","timestamp":"{}","sessionId":"{}")",
                                       iso_utc(timestamp), session_id);
        if (!uuid.empty()) line += std::format(R"(,"uuid":"{}")", uuid);
        if (!request_id.empty()) line += std::format(R"(,"requestId":"{}")", request_id);
        if (cost_usd) line += std::format(R"(,"costUSD":{})", *cost_usd);
        line += std::format(R"(,"message":{}}})", message);
        return line;
    }

    [[nodiscard]] std::string line() const { return json() + "\n"; }
};

/**
 * @brief Scratch <root>/<project>/... tree removed on destruction
 *
 * Every write moves the file's mtime forward by a whole second so that
 * size+mtime change detection never depends on filesystem timestamp
 * granularity.
 */
class TempLogTree {
public:
    explicit TempLogTree(const std::string& name) {
        static std::atomic<int> counter{0};
        root_ = (std::filesystem::temp_directory_path() /
                 std::format("ccdash_test_{}_{}_{}", name, ::getpid(), counter.fetch_add(1)))
                    .string();
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
    }

    ~TempLogTree() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempLogTree(const TempLogTree&) = delete;
    TempLogTree& operator=(const TempLogTree&) = delete;

    [[nodiscard]] const std::string& root() const { return root_; }

    [[nodiscard]] std::string path(const std::string& rel) const {
        return (std::filesystem::path(root_) / rel).string();
    }

    std::string write(const std::string& rel, const std::string& content) {
        return put(rel, content, std::ios::trunc);
    }

    std::string append(const std::string& rel, const std::string& content) {
        return put(rel, content, std::ios::app);
    }

    void remove(const std::string& rel) {
        std::filesystem::remove(path(rel));
    }

private:
    std::string put(const std::string& rel, const std::string& content,
                    std::ios::openmode mode) {
        const auto full = path(rel);
        std::filesystem::create_directories(std::filesystem::path(full).parent_path());
        {
            std::ofstream out(full, std::ios::binary | mode);
            out << content;
        }
        ++ticks_;
        std::filesystem::last_write_time(
            full, std::filesystem::file_time_type::clock::now() + std::chrono::seconds(ticks_));
        return full;
    }

    std::string root_;
    int ticks_ = 0;
};

} // namespace ccdash::testing

#include "usage/log_locator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <system_error>

namespace ccdash {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kLogExtension = ".jsonl";
constexpr std::string_view kAgentPrefix = "agent-";

} // anonymous namespace

LogLocator::LogLocator(Config config)
    : config_(std::move(config)) {}

std::string LogLocator::encode_project_dir(const std::string& cwd) {
    std::string encoded = cwd;
    std::replace(encoded.begin(), encoded.end(), '/', '-');
    return encoded;
}

LocateResult LogLocator::locate() const {
    LocateResult result;
    if (config_.root_dir.empty()) {
        result.warning = "Usage root directory is not configured";
        return result;
    }

    std::error_code ec;
    const fs::path root(config_.root_dir);
    const auto root_status = fs::status(root, ec);
    if (ec || !fs::exists(root_status)) {
        // Absent root: token tracking simply isn't available
        return result;
    }
    if (!fs::is_directory(root_status)) {
        result.warning = std::format("Usage root {} is not a directory", config_.root_dir);
        return result;
    }

    // No skip_permission_denied here: an unreadable root must surface as a warning
    fs::directory_iterator it(root, ec);
    if (ec) {
        result.warning = std::format("Cannot read usage root {}: {}", config_.root_dir, ec.message());
        return result;
    }
    result.root_exists = true;

    const fs::directory_iterator end;
    while (it != end) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec) && !entry_ec) {
            const auto project_id = it->path().filename().string();
            if (config_.project_filter.empty() || project_id == config_.project_filter) {
                scan_project(it->path().string(), project_id, result);
            }
        }

        it.increment(ec);
        if (ec) {
            result.errors.push_back(std::format("{}: {}", config_.root_dir, ec.message()));
            break;
        }
    }

    std::sort(result.files.begin(), result.files.end(),
              [](const LogFileInfo& a, const LogFileInfo& b) { return a.path < b.path; });
    return result;
}

void LogLocator::scan_project(const std::string& project_dir, const std::string& project_id,
                              LocateResult& out) const {
    std::error_code ec;
    fs::recursive_directory_iterator it(
        project_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        out.errors.push_back(std::format("{}: {}", project_dir, ec.message()));
        return;
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        add_if_log_file(*it, project_id, out);

        it.increment(ec);
        if (ec) {
            out.errors.push_back(std::format("{}: {}", project_dir, ec.message()));
            break;
        }
    }
}

void LogLocator::add_if_log_file(const fs::directory_entry& entry, const std::string& project_id,
                                 LocateResult& out) const {
    const auto& path = entry.path();
    if (path.extension().string() != kLogExtension) return;

    std::error_code ec;
    if (!entry.is_regular_file(ec) || ec) return;

    const auto filename = path.filename().string();
    if (config_.exclude_agent_logs && utils::starts_with(filename, kAgentPrefix)) {
        return;
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        out.errors.push_back(std::format("{}: {}", path.string(), ec.message()));
        return;
    }
    const auto mtime = fs::last_write_time(path, ec);
    if (ec) {
        out.errors.push_back(std::format("{}: {}", path.string(), ec.message()));
        return;
    }

    LogFileInfo info;
    info.path = path.string();
    info.project_id = project_id;
    info.size = static_cast<uint64_t>(size);
    info.mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        mtime.time_since_epoch()).count();
    out.files.push_back(std::move(info));
}

} // namespace ccdash

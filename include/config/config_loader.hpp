#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace ccdash {

/**
 * @brief Loads the dashboard configuration from TOML
 *
 * Every section is optional; missing keys keep their defaults. String
 * values undergo ${VAR} environment expansion before extraction. The
 * loaded config is validated as a whole and all problems are reported
 * together.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        std::vector<std::string> warnings;   // Valid but likely unintended settings
        DashboardConfig config;

        static LoadResult ok(DashboardConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to ccdash.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from a TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Defaults with HOME-relative paths filled in; used when no file exists.
    [[nodiscard]] static DashboardConfig defaults();

    [[nodiscard]] static std::vector<std::string> validate_config(const DashboardConfig& config);

    /// Non-fatal findings, e.g. a snapshot TTL that expires before the next refresh.
    [[nodiscard]] static std::vector<std::string> config_warnings(const DashboardConfig& config);

private:
    static DashboardConfig extract_all_sections(const toml::table& root);
    static UsageConfig extract_usage(const toml::table& root);
    static CacheConfig extract_cache(const toml::table& root);
    static RefreshConfig extract_refresh(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static PricingConfig extract_pricing(const toml::table& root);

    static void apply_path_defaults(DashboardConfig& config);
    static LoadResult validate_and_return(DashboardConfig config);
};

} // namespace ccdash

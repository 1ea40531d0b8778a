#include "config/config_loader.hpp"
#include "cache/cache_persistence.hpp"
#include "core/utils.hpp"
#include "window/window_spec.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace ccdash {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        } else if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

// Negative integers clamp to 0 so validation reports them instead of
// wrapping around in an unsigned field.
size_t toml_size(const toml::table& tbl, std::string_view key, int64_t def) {
    const int64_t v = tbl[key].value_or(def);
    return v < 0 ? 0 : static_cast<size_t>(v);
}

// Missing prices read as -1 so a partial entry fails validation rather
// than pricing a category at zero.
ModelRate extract_rate(const toml::table& t, std::string prefix) {
    ModelRate rate;
    rate.prefix = std::move(prefix);
    rate.input_per_million = t["input_per_million"].value_or(-1.0);
    rate.output_per_million = t["output_per_million"].value_or(-1.0);
    rate.cache_read_per_million = t["cache_read_per_million"].value_or(-1.0);
    rate.cache_creation_per_million = t["cache_creation_per_million"].value_or(-1.0);
    return rate;
}

void validate_rate(const ModelRate& rate, const std::string& where,
                   std::vector<std::string>& errors) {
    const std::pair<const char*, double> fields[] = {
        {"input_per_million", rate.input_per_million},
        {"output_per_million", rate.output_per_million},
        {"cache_read_per_million", rate.cache_read_per_million},
        {"cache_creation_per_million", rate.cache_creation_per_million},
    };
    for (const auto& [name, value] : fields) {
        if (!std::isfinite(value) || value < 0.0) {
            errors.push_back(std::format("{}.{} must be set and >= 0", where, name));
        }
    }
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

UsageConfig ConfigLoader::extract_usage(const toml::table& root) {
    UsageConfig cfg;
    const auto* usage = root["usage"].as_table();
    if (!usage) return cfg;
    const auto& u = *usage;

    cfg.root_dir = u["root_dir"].value_or(""s);
    cfg.project_filter = u["project_filter"].value_or(""s);
    cfg.current_project_only = u["current_project_only"].value_or(false);
    cfg.exclude_agent_logs = u["exclude_agent_logs"].value_or(false);
    cfg.max_line_bytes = toml_size(u, "max_line_bytes", 10 * 1024 * 1024);
    return cfg;
}

CacheConfig ConfigLoader::extract_cache(const toml::table& root) {
    CacheConfig cfg;
    const auto* cache = root["cache"].as_table();
    if (!cache) return cfg;
    const auto& c = *cache;

    cfg.max_entries = toml_size(c, "max_entries", 8);
    cfg.snapshot_ttl = std::chrono::milliseconds(c["snapshot_ttl_ms"].value_or(int64_t{5000}));
    cfg.persist = c["persist"].value_or(true);
    cfg.persist_path = c["persist_path"].value_or(""s);
    return cfg;
}

RefreshConfig ConfigLoader::extract_refresh(const toml::table& root) {
    RefreshConfig cfg;
    const auto* refresh = root["refresh"].as_table();
    if (!refresh) return cfg;
    const auto& r = *refresh;

    cfg.interval = std::chrono::milliseconds(r["interval_ms"].value_or(int64_t{3000}));
    cfg.default_window = r["default_window"].value_or("week"s);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    cfg.file = l["file"].value_or(""s);
    return cfg;
}

PricingConfig ConfigLoader::extract_pricing(const toml::table& root) {
    PricingConfig cfg;
    const auto* pricing = root["pricing"].as_table();
    if (!pricing) return cfg;
    const auto& p = *pricing;

    if (const auto* def = p["default"].as_table()) {
        cfg.default_rate = extract_rate(*def, "default");
    }

    if (const auto* models = p["models"].as_array()) {
        cfg.models.reserve(models->size());
        for (const auto& elem : *models) {
            const auto* m = elem.as_table();
            if (!m) continue;
            cfg.models.push_back(extract_rate(*m, (*m)["prefix"].value_or(""s)));
        }
    }
    return cfg;
}

DashboardConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    DashboardConfig config;
    config.usage = extract_usage(root);
    config.cache = extract_cache(root);
    config.refresh = extract_refresh(root);
    config.logging = extract_logging(root);
    config.pricing = extract_pricing(root);
    apply_path_defaults(config);
    return config;
}

void ConfigLoader::apply_path_defaults(DashboardConfig& config) {
    if (config.usage.root_dir.empty()) {
        const char* home = std::getenv("HOME");
        const std::filesystem::path base =
            (home && *home) ? std::filesystem::path(home) : std::filesystem::path(".");
        config.usage.root_dir = (base / ".claude" / "projects").string();
    }
    if (config.cache.persist_path.empty()) {
        config.cache.persist_path = CachePersistence::default_path();
    }
}

DashboardConfig ConfigLoader::defaults() {
    DashboardConfig config;
    apply_path_defaults(config);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(DashboardConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    auto warnings = config_warnings(config);
    auto result = ConfigLoader::LoadResult::ok(std::move(config));
    result.warnings = std::move(warnings);
    return result;
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const DashboardConfig& config) {
    std::vector<std::string> errors;

    if (config.usage.max_line_bytes == 0) {
        errors.push_back("usage.max_line_bytes must be > 0");
    }

    if (config.cache.max_entries == 0) {
        errors.push_back("cache.max_entries must be > 0");
    }
    if (config.cache.snapshot_ttl.count() < 0) {
        errors.push_back(std::format("cache.snapshot_ttl_ms must be >= 0, got {}",
                                     config.cache.snapshot_ttl.count()));
    }

    if (config.refresh.interval.count() <= 0) {
        errors.push_back(std::format("refresh.interval_ms must be > 0, got {}",
                                     config.refresh.interval.count()));
    }
    if (const auto window = WindowSpec::parse(config.refresh.default_window); !window) {
        errors.push_back(std::format(
            "refresh.default_window '{}' is not one of week, today, 24h, 7d, 30d, all, "
            "since:<ms>, custom:<start_ms>:<end_ms>",
            config.refresh.default_window));
    } else if (auto problem = validate_window(*window); !problem.empty()) {
        errors.push_back(std::format("refresh.default_window '{}': {}",
                                     config.refresh.default_window, problem));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of info, warn, error",
                                     config.logging.level));
    }

    if (config.pricing.default_rate) {
        validate_rate(*config.pricing.default_rate, "pricing.default", errors);
    }
    for (size_t i = 0; i < config.pricing.models.size(); ++i) {
        const auto& rate = config.pricing.models[i];
        const auto where = std::format("pricing.models[{}]", i);
        if (rate.prefix.empty()) {
            errors.push_back(std::format("{}.prefix is required", where));
        }
        validate_rate(rate, where, errors);
    }

    return errors;
}

std::vector<std::string> ConfigLoader::config_warnings(const DashboardConfig& config) {
    std::vector<std::string> warnings;
    if (config.cache.snapshot_ttl.count() > 0 &&
        config.cache.snapshot_ttl < config.refresh.interval) {
        warnings.push_back(std::format(
            "cache.snapshot_ttl_ms ({}) is shorter than refresh.interval_ms ({}); "
            "every refresh will rebuild its snapshot",
            config.cache.snapshot_ttl.count(), config.refresh.interval.count()));
    }
    return warnings;
}

} // namespace ccdash

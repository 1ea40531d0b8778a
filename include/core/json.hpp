#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace ccdash {

/**
 * @brief Read-only view over glz::json_t for transcript lines
 *
 * Stores json_t by value. Const operator[] returns copies, and a missing key
 * or a type mismatch yields a null value rather than throwing, so nested
 * lookups like line["message"]["usage"]["input_tokens"] are always safe.
 */
class JsonValue {
public:
    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double; cast to target integral type
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    /// String member, or default_value when absent or not a string.
    [[nodiscard]] std::string string_or(std::string_view key, std::string default_value) const {
        const auto v = (*this)[key];
        return v.is_string() ? v.get<std::string>() : std::move(default_value);
    }

    /// Non-negative integer member, or default_value when absent, not a
    /// number, negative or not finite.
    [[nodiscard]] int64_t count_or(std::string_view key, int64_t default_value) const {
        const auto v = (*this)[key];
        if (!v.is_number()) return default_value;
        const double d = v.get<double>();
        // 2^63 and above does not fit int64_t
        if (!std::isfinite(d) || d < 0 || d >= 9223372036854775808.0) return default_value;
        return static_cast<int64_t>(d);
    }

    /// Numeric member as double, nullopt when absent or not a number.
    [[nodiscard]] std::optional<double> number(std::string_view key) const {
        const auto v = (*this)[key];
        if (!v.is_number()) return std::nullopt;
        return v.get<double>();
    }

    // ===== Static Factories =====

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    /// Non-throwing parse for hot loops (one call per transcript line).
    [[nodiscard]] static std::optional<JsonValue> try_parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) return std::nullopt;
        return JsonValue(std::move(result));
    }

    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

} // namespace ccdash

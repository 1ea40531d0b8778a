#include "core/format.hpp"

#include <cmath>
#include <format>

namespace ccdash::format {

std::string tokens(int64_t count) {
    const bool negative = count < 0;
    // Via unsigned so INT64_MIN does not overflow on negation
    const uint64_t magnitude = negative ? (~static_cast<uint64_t>(count) + 1)
                                        : static_cast<uint64_t>(count);
    const auto digits = std::format("{}", magnitude);

    std::string out;
    out.reserve(digits.size() + digits.size() / 3 + 1);
    if (negative) out += '-';
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && (digits.size() - i) % 3 == 0) out += ',';
        out += digits[i];
    }
    return out;
}

std::string cost(double usd) {
    if (usd == 0.0) return "$0.00";
    if (usd < 0.01) return std::format("${:.4f}", usd);

    if (usd >= 1000.0) {
        const auto cents = static_cast<int64_t>(std::llround(usd * 100.0));
        return std::format("${}.{:02d}", tokens(cents / 100), cents % 100);
    }
    return std::format("${:.2f}", usd);
}

std::string token_rate(double tokens_per_second) {
    const double per_minute = tokens_per_second * 60.0;
    if (per_minute <= 0.0 || !std::isfinite(per_minute)) return "0 tok/min";
    if (per_minute < 1000.0) return std::format("{:.0f} tok/min", per_minute);
    return std::format("{} tok/min", tokens(static_cast<int64_t>(per_minute)));
}

std::string duration(std::chrono::milliseconds d) {
    using namespace std::chrono_literals;
    if (d < 1min) {
        return std::format("{:.0f}s", std::chrono::duration<double>(d).count());
    }
    if (d < 1h) {
        return std::format("{:.1f}m", std::chrono::duration<double, std::ratio<60>>(d).count());
    }
    const auto hours = std::chrono::duration_cast<std::chrono::hours>(d).count();
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(d).count() % 60;
    return std::format("{}h{}m", hours, minutes);
}

} // namespace ccdash::format

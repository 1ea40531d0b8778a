#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ccdash::format {

/// 1234567 -> "1,234,567"; sign preserved.
[[nodiscard]] std::string tokens(int64_t count);

/// "$0.00" for zero, "$0.0042" below one cent, "$1,234.50" from $1,000.
[[nodiscard]] std::string cost(double usd);

/// Takes tokens/sec, shows tokens/min: "0 tok/min", "450 tok/min", "12,000 tok/min".
[[nodiscard]] std::string token_rate(double tokens_per_second);

/// "45s", "12.5m", "3h7m".
[[nodiscard]] std::string duration(std::chrono::milliseconds d);

} // namespace ccdash::format

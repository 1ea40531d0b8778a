#pragma once

#include "core/types.hpp"
#include "window/window_spec.hpp"

#include <chrono>
#include <vector>

namespace ccdash {

struct Rates {
    double rate_60s = 0.0;           // Tokens/sec over the trailing minute
    double session_avg = 0.0;        // Tokens/sec over the elapsed window
};

/**
 * @brief Derives both token rates for a built window
 *
 * rate_60s counts filtered records with timestamp in [now - 60s, now].
 * session_avg divides the window total by max(1s, end - start) for closed
 * windows and max(1s, now - start) for open ones. Neither goes negative.
 */
class RateCalculator {
public:
    static constexpr std::chrono::seconds kTrailingSpan{60};

    [[nodiscard]] static Rates compute(const std::vector<UsageRecordPtr>& filtered,
                                       int64_t window_total_tokens,
                                       const ResolvedWindow& window,
                                       TimePoint now);

    [[nodiscard]] static double trailing_rate(const std::vector<UsageRecordPtr>& filtered,
                                              TimePoint now);

    [[nodiscard]] static double session_average(int64_t window_total_tokens,
                                                const ResolvedWindow& window,
                                                TimePoint now);
};

} // namespace ccdash

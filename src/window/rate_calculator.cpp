#include "window/rate_calculator.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace ccdash {

double RateCalculator::trailing_rate(const std::vector<UsageRecordPtr>& filtered, TimePoint now) {
    const auto from = now - kTrailingSpan;
    int64_t tokens = 0;
    for (const auto& r : filtered) {
        if (r->timestamp >= from && r->timestamp <= now) {
            tokens = utils::saturating_add(tokens, r->total_tokens());
        }
    }
    if (tokens <= 0) return 0.0;
    return static_cast<double>(tokens) / static_cast<double>(kTrailingSpan.count());
}

double RateCalculator::session_average(int64_t window_total_tokens, const ResolvedWindow& window,
                                       TimePoint now) {
    if (window_total_tokens <= 0) return 0.0;

    const auto until = window.open_ended ? now : window.end;
    const double elapsed = std::chrono::duration<double>(until - window.start).count();
    return static_cast<double>(window_total_tokens) / std::max(1.0, elapsed);
}

Rates RateCalculator::compute(const std::vector<UsageRecordPtr>& filtered,
                              int64_t window_total_tokens,
                              const ResolvedWindow& window,
                              TimePoint now) {
    Rates rates;
    rates.rate_60s = trailing_rate(filtered, now);
    rates.session_avg = session_average(window_total_tokens, window, now);
    return rates;
}

} // namespace ccdash

#include "snapshot/snapshot_builder.hpp"
#include "window/rate_calculator.hpp"

#include <algorithm>
#include <map>

namespace ccdash {

SnapshotBuilder::SnapshotBuilder(const CostModel& cost_model)
    : cost_model_(cost_model) {}

void SnapshotBuilder::sort_models(std::vector<ModelUsage>& models) {
    std::sort(models.begin(), models.end(), [](const ModelUsage& a, const ModelUsage& b) {
        if (a.total_cost_usd != b.total_cost_usd) return a.total_cost_usd > b.total_cost_usd;
        return a.model < b.model;
    });
}

Snapshot SnapshotBuilder::build(const WindowSpec& spec,
                                const ResolvedWindow& window,
                                const std::vector<UsageRecordPtr>& filtered,
                                TimePoint now) const {
    Snapshot snap;
    snap.window_key = spec.key();
    snap.window_label = spec.label();
    snap.window_start = window.start;
    snap.window_end = window.end;
    snap.open_ended = window.open_ended;
    snap.built_at = now;

    std::map<std::string, ModelUsage> by_model;
    for (const auto& r : filtered) {
        auto& mu = by_model[r->model];
        mu.model = r->model;
        mu.tokens += r->tokens;
        mu.total_cost_usd += cost_model_.cost(*r);
        ++mu.record_count;

        snap.tokens += r->tokens;
        ++snap.record_count;

        if (!snap.earliest_timestamp || r->timestamp < *snap.earliest_timestamp) {
            snap.earliest_timestamp = r->timestamp;
        }
        if (!snap.latest_timestamp || r->timestamp > *snap.latest_timestamp) {
            snap.latest_timestamp = r->timestamp;
        }
    }

    snap.per_model.reserve(by_model.size());
    for (auto& [model, mu] : by_model) {
        mu.total_tokens = mu.tokens.total();
        snap.total_cost_usd += mu.total_cost_usd;
        snap.per_model.push_back(std::move(mu));
    }
    sort_models(snap.per_model);

    snap.total_tokens = snap.tokens.total();

    const auto rates = RateCalculator::compute(filtered, snap.total_tokens, window, now);
    snap.rate_60s = rates.rate_60s;
    snap.rate_session_avg = rates.session_avg;

    if (snap.record_count == 0) {
        snap.status_message = "no usage data in window";
    }
    return snap;
}

} // namespace ccdash

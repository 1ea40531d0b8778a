#pragma once

#include "core/types.hpp"
#include "finops/cost_model.hpp"
#include "window/window_spec.hpp"

#include <vector>

namespace ccdash {

/**
 * @brief Assembles a Snapshot from records already filtered to a window
 *
 * Groups by model, prices each record through the CostModel (reported cost
 * first), sorts per_model by cost descending then model ascending, derives
 * the rates and stamps built_at = now. Holds no state besides the cost
 * model reference; the same inputs always give the same snapshot.
 */
class SnapshotBuilder {
public:
    explicit SnapshotBuilder(const CostModel& cost_model);

    [[nodiscard]] Snapshot build(const WindowSpec& spec,
                                 const ResolvedWindow& window,
                                 const std::vector<UsageRecordPtr>& filtered,
                                 TimePoint now) const;

    /// per_model ordering: cost descending, ties by model ascending.
    static void sort_models(std::vector<ModelUsage>& models);

private:
    const CostModel& cost_model_;
};

} // namespace ccdash

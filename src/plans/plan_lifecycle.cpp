#include "plans/plan_lifecycle.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

#include "store/record_store.hpp"
#include "utils/common.hpp"

namespace mailkeep::plans {

store::RetentionOutcome ApplyLifecycle(std::vector<PlanRecord>& plans,
                                       utils::TimePoint now,
                                       const config::PlanRetentionConfig& config) {
    store::RetentionOutcome outcome;
    const auto archive_after = utils::Days(config.archive_after_days);
    const auto delete_after = utils::Days(config.delete_after_days);

    std::vector<bool> deleted(plans.size(), false);
    for (std::size_t i = 0; i < plans.size(); ++i) {
        auto& plan = plans[i];
        if (plan.status == PlanStatus::kCompleted && now - plan.status_changed_at >= archive_after) {
            plan.status = PlanStatus::kArchived;
            plan.status_changed_at += archive_after;
            ++outcome.archived;
        }
        if (plan.status == PlanStatus::kArchived && now - plan.status_changed_at >= delete_after) {
            plan.status = PlanStatus::kDeleted;
        }
        if (plan.status == PlanStatus::kDeleted) {
            deleted[i] = true;
        }
    }
    outcome.removed = store::EraseFlagged(plans, deleted);
    return outcome;
}

store::RetentionOutcome ApplyActiveCap(std::vector<PlanRecord>& plans,
                                       utils::TimePoint now,
                                       const config::PlanRetentionConfig& config) {
    store::RetentionOutcome outcome;
    const auto cap = static_cast<std::size_t>(config.max_active_per_group > 0 ? config.max_active_per_group : 0);

    std::unordered_map<std::string, std::size_t> active_counts;
    for (const auto& plan : plans) {
        if (IsActive(plan.status)) {
            ++active_counts[utils::FoldGroupKey(plan.group_key)];
        }
    }
    std::unordered_map<std::string, std::size_t> excess;
    for (const auto& [group, count] : active_counts) {
        if (count > cap) {
            excess[group] = count - cap;
        }
    }
    if (excess.empty()) {
        return outcome;
    }

    for (const auto index : store::ChronologicalOrder(plans)) {
        auto& plan = plans[index];
        if (!IsActive(plan.status)) {
            continue;
        }
        auto it = excess.find(utils::FoldGroupKey(plan.group_key));
        if (it == excess.end() || it->second == 0) {
            continue;
        }
        plan.status = PlanStatus::kArchived;
        plan.status_changed_at = std::max(now, plan.created_at);
        --it->second;
        ++outcome.archived;
    }
    return outcome;
}

PlanRetentionPolicy::PlanRetentionPolicy(config::PlanRetentionConfig config)
    : config_(config) {}

store::RetentionOutcome PlanRetentionPolicy::BeforeWrite(std::vector<PlanRecord>& plans,
                                                         utils::TimePoint now) const {
    return ApplyLifecycle(plans, now, config_);
}

store::RetentionOutcome PlanRetentionPolicy::AfterWrite(std::vector<PlanRecord>& plans,
                                                        utils::TimePoint now) const {
    return ApplyActiveCap(plans, now, config_);
}

}  // namespace mailkeep::plans

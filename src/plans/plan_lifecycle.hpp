#pragma once

#include <vector>

#include "config/config_schema.hpp"
#include "plans/plan_types.hpp"
#include "store/retention_policy.hpp"

namespace mailkeep::plans {

/*
  Age-driven transitions, evaluated lazily at write time:
    completed -> archived  once now - status_changed_at >= archive_after_days
    archived  -> deleted   once now - status_changed_at >= delete_after_days
  A deleted plan is removed from the vector. A caught-up archive is stamped
  with the moment it fell due, so an idle store replays the chain in order.
*/
store::RetentionOutcome ApplyLifecycle(std::vector<PlanRecord>& plans,
                                       utils::TimePoint now,
                                       const config::PlanRetentionConfig& config);

// Per group, archives the oldest active plans beyond max_active_per_group.
store::RetentionOutcome ApplyActiveCap(std::vector<PlanRecord>& plans,
                                       utils::TimePoint now,
                                       const config::PlanRetentionConfig& config);

class PlanRetentionPolicy : public store::RetentionPolicy<PlanRecord> {
public:
    explicit PlanRetentionPolicy(config::PlanRetentionConfig config);

    store::RetentionOutcome BeforeWrite(std::vector<PlanRecord>& plans, utils::TimePoint now) const override;
    store::RetentionOutcome AfterWrite(std::vector<PlanRecord>& plans, utils::TimePoint now) const override;

private:
    config::PlanRetentionConfig config_;
};

}  // namespace mailkeep::plans

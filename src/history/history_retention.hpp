#pragma once

#include <vector>

#include "config/config_schema.hpp"
#include "history/history_types.hpp"
#include "store/retention_policy.hpp"

namespace mailkeep::history {

// Two-tier cap. First each group is trimmed to max_per_group, dropping its
// oldest records; then, if the total still exceeds max_total, the globally
// oldest survivors go regardless of group.
store::RetentionOutcome ApplyHistoryRetention(std::vector<HistoryRecord>& records,
                                              const config::HistoryRetentionConfig& config);

class HistoryRetentionPolicy : public store::RetentionPolicy<HistoryRecord> {
public:
    explicit HistoryRetentionPolicy(config::HistoryRetentionConfig config);

    store::RetentionOutcome AfterWrite(std::vector<HistoryRecord>& records, utils::TimePoint now) const override;

private:
    config::HistoryRetentionConfig config_;
};

}  // namespace mailkeep::history

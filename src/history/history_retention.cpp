#include "history/history_retention.hpp"

#include <string>
#include <unordered_map>

#include "store/record_store.hpp"
#include "utils/common.hpp"

namespace mailkeep::history {

store::RetentionOutcome ApplyHistoryRetention(std::vector<HistoryRecord>& records,
                                              const config::HistoryRetentionConfig& config) {
    store::RetentionOutcome outcome;
    if (records.empty()) {
        return outcome;
    }
    const auto max_per_group = static_cast<std::size_t>(config.max_per_group > 0 ? config.max_per_group : 0);
    const auto max_total = static_cast<std::size_t>(config.max_total > 0 ? config.max_total : 0);

    const auto order = store::ChronologicalOrder(records);
    std::vector<bool> dropped(records.size(), false);

    std::unordered_map<std::string, std::size_t> group_sizes;
    for (const auto& record : records) {
        ++group_sizes[utils::FoldGroupKey(record.group_key)];
    }
    std::unordered_map<std::string, std::size_t> excess;
    for (const auto& [group, size] : group_sizes) {
        if (size > max_per_group) {
            excess[group] = size - max_per_group;
        }
    }

    std::size_t survivors = records.size();
    if (!excess.empty()) {
        for (const auto index : order) {
            auto it = excess.find(utils::FoldGroupKey(records[index].group_key));
            if (it == excess.end() || it->second == 0) {
                continue;
            }
            dropped[index] = true;
            --it->second;
            --survivors;
        }
    }

    if (survivors > max_total) {
        auto global_excess = survivors - max_total;
        for (const auto index : order) {
            if (global_excess == 0) {
                break;
            }
            if (dropped[index]) {
                continue;
            }
            dropped[index] = true;
            --global_excess;
        }
    }

    outcome.removed = store::EraseFlagged(records, dropped);
    return outcome;
}

HistoryRetentionPolicy::HistoryRetentionPolicy(config::HistoryRetentionConfig config)
    : config_(config) {}

store::RetentionOutcome HistoryRetentionPolicy::AfterWrite(std::vector<HistoryRecord>& records,
                                                           utils::TimePoint now) const {
    (void)now;
    return ApplyHistoryRetention(records, config_);
}

}  // namespace mailkeep::history

#include "history/history_store.hpp"

#include "history/history_retention.hpp"

namespace mailkeep::history {

HistoryStore::HistoryStore(std::filesystem::path path,
                           config::HistoryRetentionConfig config,
                           utils::Clock clock)
    : config_(config)
    , store_(std::move(path), "h", std::make_unique<HistoryRetentionPolicy>(config), std::move(clock)) {}

HistoryRecord HistoryStore::Append(HistoryRecord record) {
    return store_.Append(std::move(record));
}

HistoryRecord HistoryStore::LogInteraction(const std::string& group_key, nlohmann::json payload) {
    HistoryRecord record;
    record.group_key = group_key;
    record.payload = std::move(payload);
    auto stored = store_.Append(std::move(record));
    utils::LogInfo("history", "logged interaction", {{"group", stored.group_key}, {"id", stored.id}});
    return stored;
}

std::vector<HistoryRecord> HistoryStore::Query(const std::string& group_key, std::size_t limit) const {
    return store_.Query(group_key, limit);
}

std::vector<HistoryRecord> HistoryStore::All() const {
    return store_.All();
}

std::vector<std::string> HistoryStore::RecentValues(const std::string& group_key,
                                                    const std::string& field,
                                                    std::size_t limit) const {
    std::vector<std::string> values;
    for (const auto& record : store_.Query(group_key, limit)) {
        if (!record.payload.is_object() || !record.payload.contains(field)) {
            continue;
        }
        const auto& value = record.payload[field];
        if (value.is_null()) {
            continue;
        }
        values.push_back(value.is_string() ? value.get<std::string>() : value.dump());
    }
    return values;
}

store::RetentionOutcome HistoryStore::ApplyRetention() {
    return store_.ApplyRetention();
}

HistoryStats HistoryStore::Stats() const {
    HistoryStats stats;
    stats.entries_by_group = store_.GroupCounts();
    for (const auto& [group, count] : stats.entries_by_group) {
        (void)group;
        stats.total_entries += count;
    }
    stats.groups = stats.entries_by_group.size();
    stats.max_per_group = config_.max_per_group;
    stats.max_total = config_.max_total;
    return stats;
}

}  // namespace mailkeep::history

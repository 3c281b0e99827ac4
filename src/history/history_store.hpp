#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "history/history_types.hpp"
#include "store/record_store.hpp"

namespace mailkeep::history {

struct HistoryStats {
    std::size_t total_entries = 0;
    std::size_t groups = 0;
    std::map<std::string, std::size_t> entries_by_group;
    int max_per_group = 0;
    int max_total = 0;
};

// Interaction log for downstream "last N for this brand" queries. Every append
// is trimmed by HistoryRetentionPolicy before it reaches disk.
class HistoryStore {
public:
    HistoryStore(std::filesystem::path path,
                 config::HistoryRetentionConfig config,
                 utils::Clock clock = utils::SystemClock());

    // Returns the record as stored. A backdated record older than the group's
    // newest max_per_group entries is trimmed by the same write, so the
    // returned record may not be in the store afterwards.
    HistoryRecord Append(HistoryRecord record);
    HistoryRecord LogInteraction(const std::string& group_key, nlohmann::json payload);

    // Up to limit most recent records of the group, oldest first.
    std::vector<HistoryRecord> Query(const std::string& group_key, std::size_t limit) const;
    std::vector<HistoryRecord> All() const;

    // String values of one payload field across the group's recent records;
    // records without the field are skipped.
    std::vector<std::string> RecentValues(const std::string& group_key,
                                          const std::string& field,
                                          std::size_t limit) const;

    store::RetentionOutcome ApplyRetention();
    HistoryStats Stats() const;

    std::size_t Size() const { return store_.Size(); }
    const std::filesystem::path& Path() const { return store_.Path(); }
    bool Persisted() const { return store_.Persisted(); }

private:
    config::HistoryRetentionConfig config_;
    store::RecordStore<HistoryRecord> store_;
};

}  // namespace mailkeep::history

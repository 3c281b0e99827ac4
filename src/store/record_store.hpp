#pragma once

#include <algorithm>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <numeric>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"
#include "store/json_file.hpp"
#include "store/retention_policy.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include "utils/time.hpp"

namespace mailkeep::store {

// Indices of records ordered oldest first by created_at. Equal timestamps keep
// insertion (vector) order.
template <typename RecordT>
std::vector<std::size_t> ChronologicalOrder(const std::vector<RecordT>& records) {
    std::vector<std::size_t> order(records.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&records](std::size_t a, std::size_t b) {
        return records[a].created_at < records[b].created_at;
    });
    return order;
}

// Removes every record whose flag is set, preserving the order of the rest.
template <typename RecordT>
std::size_t EraseFlagged(std::vector<RecordT>& records, const std::vector<bool>& flagged) {
    std::vector<RecordT> kept;
    kept.reserve(records.size());
    std::size_t removed = 0;
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (flagged[i]) {
            ++removed;
            continue;
        }
        kept.push_back(std::move(records[i]));
    }
    records = std::move(kept);
    return removed;
}

/*
  Disk-persisted ordered collection of group-tagged records.

  RecordT needs public id, group_key and created_at members, nlohmann
  to_json/from_json overloads, and two functions found by ADL:
    void ValidateRecord(const RecordT&);            // throws InvalidRecordError
    void PrepareForInsert(RecordT&, utils::TimePoint now);

  Every mutation works on a copy: retention policy, caller change, policy
  again, atomic persist, and only then the copy replaces the live collection.
*/
template <typename RecordT>
class RecordStore {
public:
    using Policy = RetentionPolicy<RecordT>;
    using Mutation = std::function<void(std::vector<RecordT>&, utils::TimePoint)>;

    RecordStore(std::filesystem::path path,
                std::string id_prefix,
                std::unique_ptr<Policy> policy,
                utils::Clock clock = utils::SystemClock())
        : path_(std::move(path))
        , id_prefix_(std::move(id_prefix))
        , policy_(std::move(policy))
        , clock_(clock ? std::move(clock) : utils::SystemClock()) {
        Load();
    }

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    // The returned copy reflects the inserted record; the AfterWrite pass of
    // the same commit may already have removed it.
    RecordT Append(RecordT record) {
        RecordT stored;
        Commit([&](std::vector<RecordT>& records, utils::TimePoint now) {
            if (record.group_key.empty()) {
                throw utils::InvalidRecordError("record group_key must not be empty");
            }
            if (record.created_at == utils::TimePoint{}) {
                record.created_at = now;
            }
            record.created_at = utils::TruncateToMillis(record.created_at);
            if (record.id.empty()) {
                record.id = NextId(records, now);
            } else if (IndexOf(records, record.id).has_value()) {
                throw utils::InvalidRecordError("record id already exists: " + record.id);
            }
            PrepareForInsert(record, now);
            ValidateRecord(record);
            records.push_back(record);
            stored = record;
        }, true);
        return stored;
    }

    RetentionOutcome Mutate(const Mutation& mutation) {
        return Commit(mutation, true);
    }

    // A mutation that adds nothing. Persists only when the policy changed
    // something or the store has never been written.
    RetentionOutcome ApplyRetention() {
        return Commit(Mutation{}, false);
    }

    std::vector<RecordT> Query(const std::string& group_key, std::size_t limit) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<RecordT> matches;
        for (const auto& record : records_) {
            if (utils::SameGroup(record.group_key, group_key)) {
                matches.push_back(record);
            }
        }
        const auto order = ChronologicalOrder(matches);
        const auto start = order.size() > limit ? order.size() - limit : 0;
        std::vector<RecordT> recent;
        recent.reserve(order.size() - start);
        for (std::size_t i = start; i < order.size(); ++i) {
            recent.push_back(matches[order[i]]);
        }
        return recent;
    }

    std::vector<RecordT> All() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return records_;
    }

    std::optional<RecordT> Find(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const auto index = IndexOf(records_, id);
        if (!index.has_value()) {
            return std::nullopt;
        }
        return records_[*index];
    }

    std::size_t Size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return records_.size();
    }

    // Keyed by the spelling of the first record seen in each group.
    std::map<std::string, std::size_t> GroupCounts() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::map<std::string, std::string> display;
        std::map<std::string, std::size_t> counts;
        for (const auto& record : records_) {
            const auto folded = utils::FoldGroupKey(record.group_key);
            const auto it = display.emplace(folded, record.group_key).first;
            ++counts[it->second];
        }
        return counts;
    }

    const std::filesystem::path& Path() const { return path_; }

    bool Persisted() const {
        std::error_code ec;
        return std::filesystem::exists(path_, ec);
    }

    utils::TimePoint Now() const { return utils::TruncateToMillis(clock_()); }

private:
    static std::optional<std::size_t> IndexOf(const std::vector<RecordT>& records, const std::string& id) {
        for (std::size_t i = 0; i < records.size(); ++i) {
            if (records[i].id == id) {
                return i;
            }
        }
        return std::nullopt;
    }

    std::string NextId(const std::vector<RecordT>& records, utils::TimePoint now) const {
        auto id = utils::GenerateRecordId(id_prefix_, now);
        while (IndexOf(records, id).has_value()) {
            id = utils::GenerateRecordId(id_prefix_, now);
        }
        return id;
    }

    void Load() {
        const auto document = ReadJsonDocument(path_);
        if (!document.has_value()) {
            return;
        }
        if (!document->is_array()) {
            throw utils::CorruptStoreError(path_.string(), "expected a JSON array of records");
        }
        std::vector<RecordT> records;
        records.reserve(document->size());
        std::unordered_set<std::string> ids;
        for (std::size_t i = 0; i < document->size(); ++i) {
            RecordT record;
            try {
                record = (*document)[i].template get<RecordT>();
                ValidateRecord(record);
            } catch (const nlohmann::json::exception& ex) {
                throw utils::CorruptStoreError(path_.string(), "record " + std::to_string(i) + ": " + ex.what());
            } catch (const utils::InvalidRecordError& ex) {
                throw utils::CorruptStoreError(path_.string(), "record " + std::to_string(i) + ": " + ex.what());
            }
            if (!ids.insert(record.id).second) {
                throw utils::CorruptStoreError(path_.string(), "duplicate id " + record.id);
            }
            records.push_back(std::move(record));
        }
        records_ = std::move(records);
        utils::LogDebug("store", "loaded", {{"path", path_.string()}, {"records", std::to_string(records_.size())}});
    }

    void Persist(const std::vector<RecordT>& records) const {
        nlohmann::json data = nlohmann::json::array();
        for (const auto& record : records) {
            data.push_back(nlohmann::json(record));
        }
        WriteJsonAtomic(path_, data);
    }

    RetentionOutcome Commit(const Mutation& mutation, bool always_persist) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto next = records_;
        const auto now = utils::TruncateToMillis(clock_());
        auto outcome = policy_->BeforeWrite(next, now);
        if (mutation) {
            mutation(next, now);
        }
        outcome += policy_->AfterWrite(next, now);

        std::error_code ec;
        const bool exists = std::filesystem::exists(path_, ec);
        if (always_persist || outcome.Changed() || !exists) {
            Persist(next);
        }
        records_ = std::move(next);
        if (outcome.Changed()) {
            utils::LogInfo("store", "retention applied", {
                {"path", path_.filename().string()},
                {"removed", std::to_string(outcome.removed)},
                {"archived", std::to_string(outcome.archived)}});
        }
        return outcome;
    }

    std::filesystem::path path_;
    std::string id_prefix_;
    std::unique_ptr<Policy> policy_;
    utils::Clock clock_;
    std::vector<RecordT> records_;
    mutable std::shared_mutex mutex_;
};

}  // namespace mailkeep::store

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "plans/plan_types.hpp"
#include "store/record_store.hpp"

namespace mailkeep::plans {

struct PlanStats {
    std::size_t total_plans = 0;
    std::size_t groups = 0;
    std::map<std::string, std::size_t> plans_by_group;
    std::map<std::string, std::size_t> plans_by_status;
    int max_active_per_group = 0;
    int archive_after_days = 0;
    int delete_after_days = 0;
};

/*
  Campaign plans with a forward-only status machine.

  Every write first replays due age transitions (ApplyLifecycle), then applies
  the change, then archives the oldest active plans of any group above the cap,
  and finally persists atomically.
*/
class PlanStore {
public:
    PlanStore(std::filesystem::path path,
              config::PlanRetentionConfig config,
              utils::Clock clock = utils::SystemClock());

    // New plan only; an existing id is rejected with InvalidRecordError.
    PlanRecord Append(PlanRecord plan);

    // Upsert: unknown ids are appended; for a known id the slots and payload
    // are replaced while identity, timestamps and status are kept.
    PlanRecord Save(PlanRecord plan);

    // Throws NotFoundError or InvalidTransitionError; the store is unchanged
    // on failure. Moving to kDeleted removes the plan.
    void UpdateStatus(const std::string& id, PlanStatus new_status);

    // Throws NotFoundError when absent or deleted.
    PlanRecord Get(const std::string& id) const;

    std::vector<PlanRecord> Query(const std::string& group_key, std::size_t limit) const;
    std::vector<PlanRecord> All() const;

    // Non-archived plans of the group, newest first.
    std::vector<PlanRecord> ListByGroup(const std::string& group_key) const;

    std::optional<PlanSlot> GetSlot(const std::string& id, int slot_number) const;

    // Strict sync from an imported sheet. The imported rows become the slot
    // list; a row matching an existing slot number keeps the existing fields
    // and overlays every non-null imported field. Returns whether anything
    // changed. Throws NotFoundError, or InvalidRecordError when the result
    // breaks slot numbering.
    bool SyncSlots(const std::string& id, const std::vector<nlohmann::json>& imported);

    store::RetentionOutcome ApplyRetention();
    PlanStats Stats() const;

    std::size_t Size() const { return store_.Size(); }
    const std::filesystem::path& Path() const { return store_.Path(); }
    bool Persisted() const { return store_.Persisted(); }

private:
    config::PlanRetentionConfig config_;
    store::RecordStore<PlanRecord> store_;
};

}  // namespace mailkeep::plans

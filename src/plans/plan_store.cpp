#include "plans/plan_store.hpp"

#include <algorithm>

#include "plans/plan_lifecycle.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace mailkeep::plans {
namespace {

std::vector<PlanRecord>::iterator FindPlan(std::vector<PlanRecord>& plans, const std::string& id) {
    return std::find_if(plans.begin(), plans.end(), [&id](const PlanRecord& plan) {
        return plan.id == id;
    });
}

int ReadSlotNumber(const nlohmann::json& row) {
    if (!row.is_object() || !row.contains("slot_number") || !row["slot_number"].is_number_integer()) {
        throw utils::InvalidRecordError("imported slot without integer slot_number");
    }
    return row["slot_number"].get<int>();
}

}  // namespace

PlanStore::PlanStore(std::filesystem::path path,
                     config::PlanRetentionConfig config,
                     utils::Clock clock)
    : config_(config)
    , store_(std::move(path), "p", std::make_unique<PlanRetentionPolicy>(config), std::move(clock)) {}

PlanRecord PlanStore::Append(PlanRecord plan) {
    auto stored = store_.Append(std::move(plan));
    utils::LogInfo("plans", "saved plan", {{"id", stored.id}, {"group", stored.group_key}});
    return stored;
}

PlanRecord PlanStore::Save(PlanRecord plan) {
    if (plan.id.empty() || !store_.Find(plan.id).has_value()) {
        return Append(std::move(plan));
    }
    ValidateSlots(plan.slots);
    PlanRecord stored;
    store_.Mutate([&](std::vector<PlanRecord>& plans, utils::TimePoint now) {
        (void)now;
        auto it = FindPlan(plans, plan.id);
        if (it == plans.end()) {
            throw utils::NotFoundError("plan " + plan.id + " was removed before it could be updated");
        }
        it->slots = plan.slots;
        it->payload = plan.payload.is_null() ? nlohmann::json::object() : plan.payload;
        stored = *it;
    });
    utils::LogInfo("plans", "updated plan", {{"id", stored.id}, {"group", stored.group_key}});
    return stored;
}

void PlanStore::UpdateStatus(const std::string& id, PlanStatus new_status) {
    PlanStatus previous = PlanStatus::kDraft;
    store_.Mutate([&](std::vector<PlanRecord>& plans, utils::TimePoint now) {
        auto it = FindPlan(plans, id);
        if (it == plans.end()) {
            throw utils::NotFoundError("plan not found: " + id);
        }
        previous = it->status;
        if (!CanTransition(it->status, new_status)) {
            throw utils::InvalidTransitionError(
                std::string("cannot move plan ") + id + " from " + ToString(it->status) +
                " to " + ToString(new_status));
        }
        if (new_status == PlanStatus::kDeleted) {
            plans.erase(it);
            return;
        }
        it->status = new_status;
        it->status_changed_at = std::max(now, it->created_at);
    });
    utils::LogInfo("plans", "status changed", {
        {"id", id}, {"from", ToString(previous)}, {"to", ToString(new_status)}});
}

PlanRecord PlanStore::Get(const std::string& id) const {
    auto plan = store_.Find(id);
    if (!plan.has_value() || plan->status == PlanStatus::kDeleted) {
        throw utils::NotFoundError("plan not found: " + id);
    }
    return *plan;
}

std::vector<PlanRecord> PlanStore::Query(const std::string& group_key, std::size_t limit) const {
    return store_.Query(group_key, limit);
}

std::vector<PlanRecord> PlanStore::All() const {
    return store_.All();
}

std::vector<PlanRecord> PlanStore::ListByGroup(const std::string& group_key) const {
    std::vector<PlanRecord> listed;
    for (auto& plan : store_.All()) {
        if (!utils::SameGroup(plan.group_key, group_key)) {
            continue;
        }
        if (plan.status == PlanStatus::kArchived || plan.status == PlanStatus::kDeleted) {
            continue;
        }
        listed.push_back(std::move(plan));
    }
    std::stable_sort(listed.begin(), listed.end(), [](const PlanRecord& a, const PlanRecord& b) {
        return a.created_at > b.created_at;
    });
    return listed;
}

std::optional<PlanSlot> PlanStore::GetSlot(const std::string& id, int slot_number) const {
    const auto plan = store_.Find(id);
    if (!plan.has_value()) {
        return std::nullopt;
    }
    for (const auto& slot : plan->slots) {
        if (slot.slot_number == slot_number) {
            return slot;
        }
    }
    return std::nullopt;
}

bool PlanStore::SyncSlots(const std::string& id, const std::vector<nlohmann::json>& imported) {
    bool changed = false;
    std::size_t before = 0;
    std::size_t after = 0;
    store_.Mutate([&](std::vector<PlanRecord>& plans, utils::TimePoint now) {
        (void)now;
        auto it = FindPlan(plans, id);
        if (it == plans.end()) {
            throw utils::NotFoundError("plan not found: " + id);
        }

        std::vector<PlanSlot> synced;
        synced.reserve(imported.size());
        for (const auto& row : imported) {
            const auto number = ReadSlotNumber(row);
            const auto existing = std::find_if(it->slots.begin(), it->slots.end(), [number](const PlanSlot& slot) {
                return slot.slot_number == number;
            });
            PlanSlot slot;
            slot.slot_number = number;
            if (existing != it->slots.end()) {
                slot.directive = existing->directive;
            } else {
                changed = true;
            }
            for (const auto& item : row.items()) {
                if (item.key() == "slot_number" || item.value().is_null()) {
                    continue;
                }
                if (!slot.directive.contains(item.key()) || slot.directive[item.key()] != item.value()) {
                    slot.directive[item.key()] = item.value();
                    changed = true;
                }
            }
            synced.push_back(std::move(slot));
        }

        before = it->slots.size();
        after = synced.size();
        if (before != after) {
            changed = true;
        } else {
            for (std::size_t i = 0; i < synced.size(); ++i) {
                if (synced[i].slot_number != it->slots[i].slot_number) {
                    changed = true;
                    break;
                }
            }
        }
        ValidateSlots(synced);
        if (changed) {
            it->slots = std::move(synced);
        }
    });
    if (changed) {
        utils::LogInfo("plans", "synced slots", {
            {"id", id}, {"before", std::to_string(before)}, {"after", std::to_string(after)}});
    } else {
        utils::LogInfo("plans", "no slot changes", {{"id", id}});
    }
    return changed;
}

store::RetentionOutcome PlanStore::ApplyRetention() {
    return store_.ApplyRetention();
}

PlanStats PlanStore::Stats() const {
    PlanStats stats;
    stats.plans_by_group = store_.GroupCounts();
    for (const auto& plan : store_.All()) {
        ++stats.plans_by_status[ToString(plan.status)];
    }
    stats.total_plans = store_.Size();
    stats.groups = stats.plans_by_group.size();
    stats.max_active_per_group = config_.max_active_per_group;
    stats.archive_after_days = config_.archive_after_days;
    stats.delete_after_days = config_.delete_after_days;
    return stats;
}

}  // namespace mailkeep::plans

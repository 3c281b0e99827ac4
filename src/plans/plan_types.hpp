#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"
#include "utils/time.hpp"

namespace mailkeep::plans {

enum class PlanStatus : std::uint8_t {
    kDraft = 0,
    kApproved = 1,
    kInProgress = 2,
    kCompleted = 3,
    kArchived = 4,
    kDeleted = 5,
};

// Forward-only, one step at a time. Anything not listed is rejected.
constexpr std::array<std::pair<PlanStatus, PlanStatus>, 5> kPlanTransitions{{
    {PlanStatus::kDraft, PlanStatus::kApproved},
    {PlanStatus::kApproved, PlanStatus::kInProgress},
    {PlanStatus::kInProgress, PlanStatus::kCompleted},
    {PlanStatus::kCompleted, PlanStatus::kArchived},
    {PlanStatus::kArchived, PlanStatus::kDeleted},
}};

constexpr bool CanTransition(PlanStatus from, PlanStatus to) {
    for (const auto& transition : kPlanTransitions) {
        if (transition.first == from && transition.second == to) {
            return true;
        }
    }
    return false;
}

// Draft through completed count against the per-group active cap.
constexpr bool IsActive(PlanStatus status) {
    return status == PlanStatus::kDraft || status == PlanStatus::kApproved ||
           status == PlanStatus::kInProgress || status == PlanStatus::kCompleted;
}

const char* ToString(PlanStatus status);
std::optional<PlanStatus> ParsePlanStatus(const std::string& value);

// Directive content is opaque here; it is persisted flat beside slot_number.
struct PlanSlot {
    int slot_number = 0;
    nlohmann::json directive = nlohmann::json::object();
};

struct PlanRecord {
    std::string id;
    std::string group_key;
    utils::TimePoint created_at{};
    PlanStatus status = PlanStatus::kDraft;
    utils::TimePoint status_changed_at{};
    std::vector<PlanSlot> slots;
    nlohmann::json payload = nlohmann::json::object();
};

void to_json(nlohmann::json& json, const PlanSlot& slot);
void from_json(const nlohmann::json& json, PlanSlot& slot);
void to_json(nlohmann::json& json, const PlanRecord& plan);
void from_json(const nlohmann::json& json, PlanRecord& plan);

// Slot numbers must read 1, 2, ..., n in list order.
void ValidateSlots(const std::vector<PlanSlot>& slots);
void ValidateRecord(const PlanRecord& plan);
void PrepareForInsert(PlanRecord& plan, utils::TimePoint now);

}  // namespace mailkeep::plans

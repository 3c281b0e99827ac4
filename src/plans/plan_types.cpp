#include "plans/plan_types.hpp"

#include "utils/errors.hpp"

namespace mailkeep::plans {
namespace {

utils::TimePoint ReadTimestamp(const nlohmann::json& json, const char* key) {
    const auto text = json.at(key).get<std::string>();
    const auto parsed = utils::ParseIso(text);
    if (!parsed.has_value()) {
        throw utils::InvalidRecordError(std::string("unparsable ") + key + ": " + text);
    }
    return *parsed;
}

}  // namespace

const char* ToString(PlanStatus status) {
    switch (status) {
        case PlanStatus::kDraft: return "draft";
        case PlanStatus::kApproved: return "approved";
        case PlanStatus::kInProgress: return "in_progress";
        case PlanStatus::kCompleted: return "completed";
        case PlanStatus::kArchived: return "archived";
        case PlanStatus::kDeleted: return "deleted";
    }
    return "unknown";
}

std::optional<PlanStatus> ParsePlanStatus(const std::string& value) {
    for (const auto status : {PlanStatus::kDraft, PlanStatus::kApproved, PlanStatus::kInProgress,
                              PlanStatus::kCompleted, PlanStatus::kArchived, PlanStatus::kDeleted}) {
        if (value == ToString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

void to_json(nlohmann::json& json, const PlanSlot& slot) {
    json = slot.directive.is_object() ? slot.directive : nlohmann::json::object();
    json["slot_number"] = slot.slot_number;
}

void from_json(const nlohmann::json& json, PlanSlot& slot) {
    if (!json.is_object()) {
        throw utils::InvalidRecordError("slot is not an object");
    }
    slot.slot_number = json.at("slot_number").get<int>();
    slot.directive = json;
    slot.directive.erase("slot_number");
}

void to_json(nlohmann::json& json, const PlanRecord& plan) {
    json = nlohmann::json{
        {"id", plan.id},
        {"group_key", plan.group_key},
        {"created_at", utils::FormatIso(plan.created_at)},
        {"status", ToString(plan.status)},
        {"status_changed_at", utils::FormatIso(plan.status_changed_at)},
        {"slots", plan.slots},
        {"payload", plan.payload}
    };
}

void from_json(const nlohmann::json& json, PlanRecord& plan) {
    plan.id = json.at("id").get<std::string>();
    plan.group_key = json.at("group_key").get<std::string>();
    plan.created_at = ReadTimestamp(json, "created_at");
    const auto status_text = json.at("status").get<std::string>();
    const auto status = ParsePlanStatus(status_text);
    if (!status.has_value()) {
        throw utils::InvalidRecordError("unknown status: " + status_text);
    }
    plan.status = *status;
    plan.status_changed_at = ReadTimestamp(json, "status_changed_at");
    plan.slots = json.value("slots", nlohmann::json::array()).get<std::vector<PlanSlot>>();
    if (json.contains("payload") && !json["payload"].is_null()) {
        plan.payload = json["payload"];
    } else {
        plan.payload = nlohmann::json::object();
    }
}

void ValidateSlots(const std::vector<PlanSlot>& slots) {
    for (std::size_t i = 0; i < slots.size(); ++i) {
        const auto expected = static_cast<int>(i + 1);
        if (slots[i].slot_number != expected) {
            throw utils::InvalidRecordError(
                "slot numbers must be contiguous from 1: position " + std::to_string(expected) +
                " holds slot " + std::to_string(slots[i].slot_number));
        }
    }
}

void ValidateRecord(const PlanRecord& plan) {
    if (plan.id.empty()) {
        throw utils::InvalidRecordError("plan without id");
    }
    if (plan.group_key.empty()) {
        throw utils::InvalidRecordError("plan " + plan.id + " without group_key");
    }
    if (plan.status == PlanStatus::kDeleted) {
        throw utils::InvalidRecordError("plan " + plan.id + " is deleted; deleted plans are not stored");
    }
    if (plan.status_changed_at < plan.created_at) {
        throw utils::InvalidRecordError("plan " + plan.id + " has status_changed_at before created_at");
    }
    ValidateSlots(plan.slots);
}

void PrepareForInsert(PlanRecord& plan, utils::TimePoint now) {
    (void)now;
    if (plan.status_changed_at == utils::TimePoint{}) {
        plan.status_changed_at = plan.created_at;
    }
    plan.status_changed_at = utils::TruncateToMillis(plan.status_changed_at);
    if (plan.payload.is_null()) {
        plan.payload = nlohmann::json::object();
    }
}

}  // namespace mailkeep::plans

#include "history/history_types.hpp"

#include "utils/errors.hpp"

namespace mailkeep::history {

void to_json(nlohmann::json& json, const HistoryRecord& record) {
    json = nlohmann::json{
        {"id", record.id},
        {"group_key", record.group_key},
        {"created_at", utils::FormatIso(record.created_at)},
        {"payload", record.payload}
    };
}

void from_json(const nlohmann::json& json, HistoryRecord& record) {
    record.id = json.at("id").get<std::string>();
    record.group_key = json.at("group_key").get<std::string>();
    const auto created_at = json.at("created_at").get<std::string>();
    const auto parsed = utils::ParseIso(created_at);
    if (!parsed.has_value()) {
        throw utils::InvalidRecordError("unparsable created_at: " + created_at);
    }
    record.created_at = *parsed;
    if (json.contains("payload") && !json["payload"].is_null()) {
        record.payload = json["payload"];
    } else {
        record.payload = nlohmann::json::object();
    }
}

void ValidateRecord(const HistoryRecord& record) {
    if (record.id.empty()) {
        throw utils::InvalidRecordError("history record without id");
    }
    if (record.group_key.empty()) {
        throw utils::InvalidRecordError("history record " + record.id + " without group_key");
    }
}

void PrepareForInsert(HistoryRecord& record, utils::TimePoint now) {
    (void)now;
    if (record.payload.is_null()) {
        record.payload = nlohmann::json::object();
    }
}

}  // namespace mailkeep::history

#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "utils/time.hpp"

namespace mailkeep::history {

// One completed interaction (an email send), kept for variety checks.
struct HistoryRecord {
    std::string id;
    std::string group_key;
    utils::TimePoint created_at{};
    nlohmann::json payload = nlohmann::json::object();
};

void to_json(nlohmann::json& json, const HistoryRecord& record);
void from_json(const nlohmann::json& json, HistoryRecord& record);

void ValidateRecord(const HistoryRecord& record);
void PrepareForInsert(HistoryRecord& record, utils::TimePoint now);

}  // namespace mailkeep::history

#pragma once

#include <filesystem>
#include <optional>

#include "nlohmann/json.hpp"

namespace mailkeep::store {

// Reads the JSON document at path. std::nullopt when the file does not exist;
// CorruptStoreError when it exists but does not parse.
std::optional<nlohmann::json> ReadJsonDocument(const std::filesystem::path& path);

// Writes data to "<path>.tmp" and renames it over path. Throws StoreIOError;
// on failure the previous file at path is untouched.
void WriteJsonAtomic(const std::filesystem::path& path, const nlohmann::json& data);

}  // namespace mailkeep::store

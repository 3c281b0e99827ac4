#include "store/json_file.hpp"

#include <fstream>
#include <system_error>

#include "utils/errors.hpp"

namespace mailkeep::store {
namespace {

void RemoveQuietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace

std::optional<nlohmann::json> ReadJsonDocument(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            throw utils::CorruptStoreError(path.string(), "cannot stat: " + ec.message());
        }
        return std::nullopt;
    }
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        throw utils::CorruptStoreError(path.string(), "cannot open for reading");
    }
    try {
        return nlohmann::json::parse(input);
    } catch (const nlohmann::json::parse_error& ex) {
        throw utils::CorruptStoreError(path.string(), ex.what());
    }
}

void WriteJsonAtomic(const std::filesystem::path& path, const nlohmann::json& data) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw utils::StoreIOError("cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    auto temp_path = path;
    temp_path += ".tmp";
    {
        std::ofstream output(temp_path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!output) {
            throw utils::StoreIOError("cannot open " + temp_path.string() + " for writing");
        }
        output << data.dump(2);
        output.flush();
        if (!output) {
            output.close();
            RemoveQuietly(temp_path);
            throw utils::StoreIOError("write failed for " + temp_path.string());
        }
    }

    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        RemoveQuietly(temp_path);
        throw utils::StoreIOError("cannot replace " + path.string() + ": " + ec.message());
    }
}

}  // namespace mailkeep::store

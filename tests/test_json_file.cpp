#include <catch2/catch.hpp>

#include "store/json_file.hpp"
#include "test_helpers.hpp"
#include "utils/errors.hpp"

using namespace mailkeep;
using mailkeep::testing::ReadFile;
using mailkeep::testing::TempDir;
using mailkeep::testing::WriteFile;

TEST_CASE("JSON documents on disk", "[store]") {
    TempDir dir;
    const auto path = dir / "nested" / "data.json";

    SECTION("missing file reads as nothing") {
        REQUIRE_FALSE(store::ReadJsonDocument(path).has_value());
    }

    SECTION("atomic write creates parents and leaves no temp file") {
        store::WriteJsonAtomic(path, nlohmann::json::array({1, 2, 3}));
        REQUIRE(std::filesystem::exists(path));
        REQUIRE_FALSE(std::filesystem::exists(dir / "nested" / "data.json.tmp"));

        const auto document = store::ReadJsonDocument(path);
        REQUIRE(document.has_value());
        REQUIRE(*document == nlohmann::json::array({1, 2, 3}));
    }

    SECTION("rewrite replaces the previous content") {
        store::WriteJsonAtomic(path, nlohmann::json::array({1}));
        store::WriteJsonAtomic(path, nlohmann::json::array());
        REQUIRE(nlohmann::json::parse(ReadFile(path)).empty());
    }

    SECTION("unparsable content is a corrupt store") {
        WriteFile(path, "[{\"id\": ");
        REQUIRE_THROWS_AS(store::ReadJsonDocument(path), utils::CorruptStoreError);
    }

    SECTION("an empty file is a corrupt store") {
        WriteFile(path, "");
        REQUIRE_THROWS_AS(store::ReadJsonDocument(path), utils::CorruptStoreError);
    }
}

TEST_CASE("JSON atomic write failure keeps the previous file", "[store]") {
    TempDir dir;
    const auto path = dir / "data.json";
    store::WriteJsonAtomic(path, nlohmann::json::array({1}));
    const auto before = ReadFile(path);

    // A directory squatting on the temp name blocks the write.
    std::filesystem::create_directories(dir / "data.json.tmp");

    REQUIRE_THROWS_AS(store::WriteJsonAtomic(path, nlohmann::json::array({2})), utils::StoreIOError);
    REQUIRE(ReadFile(path) == before);
}

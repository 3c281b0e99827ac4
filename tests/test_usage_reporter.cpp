#include <catch2/catch.hpp>

#include "config/config_loader.hpp"
#include "history/history_store.hpp"
#include "plans/plan_store.hpp"
#include "report/usage_reporter.hpp"
#include "test_helpers.hpp"
#include "utils/errors.hpp"

using namespace mailkeep;
using mailkeep::testing::At;
using mailkeep::testing::ManualClock;
using mailkeep::testing::TempDir;
using mailkeep::testing::WriteFile;

namespace {

config::Config ConfigIn(const TempDir& dir) {
    config::Config config;
    config.storage.data_dir = dir.Path().string();
    return config;
}

}  // namespace

TEST_CASE("Usage report on an empty data directory", "[report]") {
    TempDir dir;
    const auto config = ConfigIn(dir);
    report::UsageReporter reporter(config);

    const auto usage = reporter.Report();

    REQUIRE_FALSE(usage.history.exists);
    REQUIRE_FALSE(usage.plans.exists);
    REQUIRE_FALSE(usage.outputs.exists);
    REQUIRE_FALSE(std::filesystem::exists(config::HistoryStorePath(config)));
    REQUIRE_FALSE(std::filesystem::exists(config::PlanStorePath(config)));

    SECTION("forced cleanup does not create missing stores") {
        reporter.Report(true);
        REQUIRE_FALSE(std::filesystem::exists(config::HistoryStorePath(config)));
        REQUIRE_FALSE(std::filesystem::exists(config::PlanStorePath(config)));
    }

    SECTION("the formatted report marks stores as absent") {
        const auto text = report::FormatReport(usage, config);
        REQUIRE(text.find("NOT FOUND") != std::string::npos);
        REQUIRE(text.find("RETENTION POLICIES") != std::string::npos);
    }
}

TEST_CASE("Usage report aggregates stores and directories", "[report]") {
    TempDir dir;
    const auto config = ConfigIn(dir);
    ManualClock clock(At("2026-04-01T08:00:00Z"));

    {
        history::HistoryStore history_store(config::HistoryStorePath(config), config.history, clock.AsClock());
        history_store.LogInteraction("Acme", {{"offer", "a"}});
        history_store.LogInteraction("Acme", {{"offer", "b"}});
        history_store.LogInteraction("Globex", {{"offer", "c"}});

        plans::PlanStore plan_store(config::PlanStorePath(config), config.plans, clock.AsClock());
        plans::PlanRecord plan;
        plan.group_key = "Acme";
        const auto id = plan_store.Append(plan).id;
        plan_store.UpdateStatus(id, plans::PlanStatus::kApproved);
        plan_store.Append(plan);
    }
    WriteFile(config::OutputsPath(config) / "one.txt", "12345");
    WriteFile(config::OutputsPath(config) / "archive" / "2026-01" / "old.txt", "123");
    WriteFile(config::TracesPath(config) / "trace.json", "{}");

    report::UsageReporter reporter(config, clock.AsClock());
    const auto usage = reporter.Report();

    REQUIRE(usage.history.exists);
    REQUIRE(usage.history.record_count == 3);
    REQUIRE(usage.history.by_group.at("Acme") == 2);
    REQUIRE(usage.history.size_bytes > 0);

    REQUIRE(usage.plans.record_count == 2);
    REQUIRE(usage.plans.by_status.at("approved") == 1);
    REQUIRE(usage.plans.by_status.at("draft") == 1);

    REQUIRE(usage.outputs.file_count == 1);
    REQUIRE(usage.outputs.size_bytes == 5);
    REQUIRE(usage.outputs.archived_file_count == 1);
    REQUIRE(usage.outputs.archived_size_bytes == 3);
    REQUIRE(usage.traces.file_count == 1);

    const auto text = report::FormatReport(usage, config);
    REQUIRE(text.find("Globex") != std::string::npos);
    REQUIRE(text.find("approved") != std::string::npos);
    REQUIRE(text.find("Keep last 50 entries per brand") != std::string::npos);
}

TEST_CASE("Forced cleanup runs the store policies", "[report]") {
    TempDir dir;
    auto config = ConfigIn(dir);
    ManualClock clock(At("2026-04-01T08:00:00Z"));

    nlohmann::json history = nlohmann::json::array();
    for (int i = 0; i < 5; ++i) {
        history.push_back({{"id", "h" + std::to_string(i)},
                           {"group_key", "Acme"},
                           {"created_at", "2026-03-0" + std::to_string(i + 1) + "T00:00:00Z"},
                           {"payload", nlohmann::json::object()}});
    }
    WriteFile(config::HistoryStorePath(config), history.dump());
    config.history.max_per_group = 3;

    report::UsageReporter reporter(config, clock.AsClock());

    const auto plain = reporter.Report();
    REQUIRE(plain.history.record_count == 5);

    const auto forced = reporter.Report(true);
    REQUIRE(forced.history.cleaned_removed == 2);
    REQUIRE(forced.history.record_count == 3);
    REQUIRE(report::FormatReport(forced, config).find("cleanup: 2 removed") != std::string::npos);
}

TEST_CASE("Usage report surfaces corrupt stores", "[report]") {
    TempDir dir;
    const auto config = ConfigIn(dir);
    WriteFile(config::PlanStorePath(config), "{ broken");

    report::UsageReporter reporter(config);
    REQUIRE_THROWS_AS(reporter.Report(), utils::CorruptStoreError);
}

#include <catch2/catch.hpp>

#include "plans/plan_store.hpp"
#include "test_helpers.hpp"
#include "utils/errors.hpp"

using namespace mailkeep;
using mailkeep::testing::At;
using mailkeep::testing::ManualClock;
using mailkeep::testing::ReadFile;
using mailkeep::testing::TempDir;
using mailkeep::testing::WriteFile;
using plans::PlanStatus;

namespace {

const config::PlanRetentionConfig kDefaults{10, 90, 365};

plans::PlanRecord Draft(const std::string& group, int slot_count = 0) {
    plans::PlanRecord plan;
    plan.group_key = group;
    for (int i = 1; i <= slot_count; ++i) {
        plans::PlanSlot slot;
        slot.slot_number = i;
        slot.directive = {{"theme", "theme " + std::to_string(i)}};
        plan.slots.push_back(slot);
    }
    return plan;
}

void Advance(plans::PlanStore& store, const std::string& id, PlanStatus target) {
    const PlanStatus chain[] = {PlanStatus::kApproved, PlanStatus::kInProgress,
                                PlanStatus::kCompleted, PlanStatus::kArchived};
    for (const auto status : chain) {
        store.UpdateStatus(id, status);
        if (status == target) {
            return;
        }
    }
}

}  // namespace

TEST_CASE("Plan store archives the oldest draft above the active cap", "[plans]") {
    TempDir dir;
    ManualClock clock(At("2026-03-01T10:00:00Z"));
    plans::PlanStore store(dir / "campaign_plans.json", kDefaults, clock.AsClock());

    std::vector<std::string> ids;
    for (int i = 0; i < 11; ++i) {
        ids.push_back(store.Append(Draft("Acme")).id);
        clock.Advance(std::chrono::minutes(1));
    }

    const auto oldest = store.Get(ids.front());
    REQUIRE(oldest.status == PlanStatus::kArchived);
    REQUIRE(oldest.status_changed_at == At("2026-03-01T10:10:00Z"));

    std::size_t active = 0;
    for (const auto& plan : store.All()) {
        if (plans::IsActive(plan.status)) {
            ++active;
        }
    }
    REQUIRE(active == 10);
    REQUIRE(store.ListByGroup("Acme").size() == 10);
}

TEST_CASE("Plan store rejects skipped transitions", "[plans]") {
    TempDir dir;
    ManualClock clock(At("2026-03-01T10:00:00Z"));
    plans::PlanStore store(dir / "campaign_plans.json", kDefaults, clock.AsClock());
    const auto id = store.Append(Draft("Acme", 2)).id;
    const auto before = ReadFile(store.Path());

    clock.Advance(std::chrono::hours(1));
    REQUIRE_THROWS_AS(store.UpdateStatus(id, PlanStatus::kCompleted), utils::InvalidTransitionError);
    REQUIRE(store.Get(id).status == PlanStatus::kDraft);
    REQUIRE(ReadFile(store.Path()) == before);

    REQUIRE_THROWS_AS(store.UpdateStatus(id, PlanStatus::kDraft), utils::InvalidTransitionError);
}

TEST_CASE("Plan store walks the full lifecycle", "[plans]") {
    TempDir dir;
    ManualClock clock(At("2026-03-01T10:00:00Z"));
    plans::PlanStore store(dir / "campaign_plans.json", kDefaults, clock.AsClock());
    const auto id = store.Append(Draft("Acme")).id;

    clock.Advance(std::chrono::hours(2));
    Advance(store, id, PlanStatus::kCompleted);
    auto plan = store.Get(id);
    REQUIRE(plan.status == PlanStatus::kCompleted);
    REQUIRE(plan.status_changed_at == At("2026-03-01T12:00:00Z"));

    SECTION("manual archive and delete") {
        store.UpdateStatus(id, PlanStatus::kArchived);
        REQUIRE(store.Get(id).status == PlanStatus::kArchived);
        store.UpdateStatus(id, PlanStatus::kDeleted);
        REQUIRE(store.Size() == 0);
        REQUIRE_THROWS_AS(store.Get(id), utils::NotFoundError);
    }

    SECTION("age-driven archive on the next write") {
        clock.Advance(utils::Days(90));
        store.ApplyRetention();
        plan = store.Get(id);
        REQUIRE(plan.status == PlanStatus::kArchived);
        REQUIRE(plan.status_changed_at == At("2026-03-01T12:00:00Z") + utils::Days(90));

        clock.Advance(utils::Days(365));
        store.Append(Draft("Globex"));
        REQUIRE_THROWS_AS(store.Get(id), utils::NotFoundError);
        REQUIRE(store.Size() == 1);
    }
}

TEST_CASE("Plan store reports unknown ids", "[plans]") {
    TempDir dir;
    plans::PlanStore store(dir / "campaign_plans.json", kDefaults);

    REQUIRE_THROWS_AS(store.Get("p-missing"), utils::NotFoundError);
    REQUIRE_THROWS_AS(store.UpdateStatus("p-missing", PlanStatus::kApproved), utils::NotFoundError);
    REQUIRE_THROWS_AS(store.SyncSlots("p-missing", {}), utils::NotFoundError);
    REQUIRE_FALSE(store.GetSlot("p-missing", 1).has_value());
}

TEST_CASE("Plan store save is an upsert", "[plans]") {
    TempDir dir;
    ManualClock clock(At("2026-03-01T10:00:00Z"));
    plans::PlanStore store(dir / "campaign_plans.json", kDefaults, clock.AsClock());

    auto saved = store.Save(Draft("Acme", 3));
    REQUIRE_FALSE(saved.id.empty());
    store.UpdateStatus(saved.id, PlanStatus::kApproved);

    clock.Advance(std::chrono::hours(1));
    auto edited = Draft("Acme", 1);
    edited.id = saved.id;
    edited.payload = {{"campaign_name", "Spring"}};
    const auto updated = store.Save(edited);

    REQUIRE(updated.id == saved.id);
    REQUIRE(updated.created_at == saved.created_at);
    REQUIRE(updated.status == PlanStatus::kApproved);
    REQUIRE(updated.slots.size() == 1);
    REQUIRE(updated.payload["campaign_name"] == "Spring");
    REQUIRE(store.Size() == 1);

    auto broken = Draft("Acme");
    broken.id = saved.id;
    plans::PlanSlot slot;
    slot.slot_number = 2;
    broken.slots.push_back(slot);
    REQUIRE_THROWS_AS(store.Save(broken), utils::InvalidRecordError);
    REQUIRE(store.Get(saved.id).slots.size() == 1);
}

TEST_CASE("Plan store lists and looks up slots", "[plans]") {
    TempDir dir;
    ManualClock clock(At("2026-03-01T10:00:00Z"));
    plans::PlanStore store(dir / "campaign_plans.json", kDefaults, clock.AsClock());

    const auto first = store.Append(Draft("Acme", 2)).id;
    clock.Advance(std::chrono::minutes(5));
    const auto second = store.Append(Draft("acme")).id;
    clock.Advance(std::chrono::minutes(5));
    store.Append(Draft("Globex"));
    Advance(store, second, PlanStatus::kArchived);

    const auto listed = store.ListByGroup("ACME");
    REQUIRE(listed.size() == 1);
    REQUIRE(listed[0].id == first);

    const auto slot = store.GetSlot(first, 2);
    REQUIRE(slot.has_value());
    REQUIRE(slot->directive["theme"] == "theme 2");
    REQUIRE_FALSE(store.GetSlot(first, 3).has_value());

    const auto stats = store.Stats();
    REQUIRE(stats.total_plans == 3);
    REQUIRE(stats.groups == 2);
    REQUIRE(stats.plans_by_group.at("Acme") == 2);
    REQUIRE(stats.plans_by_status.at("archived") == 1);
    REQUIRE(stats.plans_by_status.at("draft") == 2);
    REQUIRE(stats.max_active_per_group == 10);
}

TEST_CASE("Plan store syncs slots from an import", "[plans]") {
    TempDir dir;
    ManualClock clock(At("2026-03-01T10:00:00Z"));
    plans::PlanStore store(dir / "campaign_plans.json", kDefaults, clock.AsClock());
    const auto id = store.Append(Draft("Acme", 3)).id;

    SECTION("identical rows change nothing") {
        std::vector<nlohmann::json> rows;
        for (int i = 1; i <= 3; ++i) {
            rows.push_back({{"slot_number", i}, {"theme", "theme " + std::to_string(i)}});
        }
        REQUIRE_FALSE(store.SyncSlots(id, rows));
    }

    SECTION("rows overlay fields and drop missing slots") {
        std::vector<nlohmann::json> rows{
            {{"slot_number", 1}, {"theme", "new theme"}, {"offer", nullptr}},
            {{"slot_number", 2}, {"offer", "20% off"}},
        };
        REQUIRE(store.SyncSlots(id, rows));

        const auto plan = store.Get(id);
        REQUIRE(plan.slots.size() == 2);
        REQUIRE(plan.slots[0].directive["theme"] == "new theme");
        REQUIRE_FALSE(plan.slots[0].directive.contains("offer"));
        REQUIRE(plan.slots[1].directive["theme"] == "theme 2");
        REQUIRE(plan.slots[1].directive["offer"] == "20% off");
    }

    SECTION("broken numbering is refused") {
        std::vector<nlohmann::json> rows{
            {{"slot_number", 1}},
            {{"slot_number", 3}},
        };
        REQUIRE_THROWS_AS(store.SyncSlots(id, rows), utils::InvalidRecordError);
        REQUIRE(store.Get(id).slots.size() == 3);
    }
}

TEST_CASE("Plan store persists slots flat and reloads them", "[plans]") {
    TempDir dir;
    ManualClock clock(At("2026-03-01T10:00:00Z"));
    const auto path = dir / "campaign_plans.json";
    std::string id;
    {
        plans::PlanStore store(path, kDefaults, clock.AsClock());
        id = store.Append(Draft("Acme", 2)).id;
    }

    const auto on_disk = nlohmann::json::parse(ReadFile(path));
    REQUIRE(on_disk[0]["status"] == "draft");
    REQUIRE(on_disk[0]["slots"][1]["slot_number"] == 2);
    REQUIRE(on_disk[0]["slots"][1]["theme"] == "theme 2");

    plans::PlanStore reopened(path, kDefaults, clock.AsClock());
    REQUIRE(reopened.Get(id).slots[1].directive["theme"] == "theme 2");
}

TEST_CASE("Plan store refuses corrupt plans", "[plans]") {
    TempDir dir;
    const auto path = dir / "campaign_plans.json";

    SECTION("unknown status") {
        WriteFile(path, R"([{"id": "p-1", "group_key": "Acme", "created_at": "2026-01-01T00:00:00Z",
                            "status": "paused", "status_changed_at": "2026-01-01T00:00:00Z", "slots": []}])");
        REQUIRE_THROWS_AS(plans::PlanStore(path, kDefaults), utils::CorruptStoreError);
    }

    SECTION("status change before creation") {
        WriteFile(path, R"([{"id": "p-1", "group_key": "Acme", "created_at": "2026-01-02T00:00:00Z",
                            "status": "draft", "status_changed_at": "2026-01-01T00:00:00Z", "slots": []}])");
        REQUIRE_THROWS_AS(plans::PlanStore(path, kDefaults), utils::CorruptStoreError);
    }

    SECTION("gap in slot numbers") {
        WriteFile(path, R"([{"id": "p-1", "group_key": "Acme", "created_at": "2026-01-01T00:00:00Z",
                            "status": "draft", "status_changed_at": "2026-01-01T00:00:00Z",
                            "slots": [{"slot_number": 2}]}])");
        REQUIRE_THROWS_AS(plans::PlanStore(path, kDefaults), utils::CorruptStoreError);
    }
}

TEST_CASE("Plan store never stores a deleted plan", "[plans]") {
    TempDir dir;
    ManualClock clock(At("2026-03-01T10:00:00Z"));
    plans::PlanStore store(dir / "campaign_plans.json", kDefaults, clock.AsClock());

    auto plan = Draft("Acme");
    plan.status = PlanStatus::kDeleted;

    REQUIRE_THROWS_AS(store.Append(plan), utils::InvalidRecordError);
    REQUIRE_THROWS_AS(store.Save(plan), utils::InvalidRecordError);
    REQUIRE(store.Size() == 0);
    REQUIRE_FALSE(store.Persisted());
    REQUIRE(store.Stats().plans_by_status.count("deleted") == 0);
}

TEST_CASE("Plan store treats a stored deleted plan as corruption", "[plans]") {
    TempDir dir;
    const auto path = dir / "campaign_plans.json";
    WriteFile(path, R"([{"id": "p-1", "group_key": "Acme", "created_at": "2026-01-01T00:00:00Z",
                        "status": "deleted", "status_changed_at": "2026-01-01T00:00:00Z", "slots": []}])");
    REQUIRE_THROWS_AS(plans::PlanStore(path, kDefaults), utils::CorruptStoreError);
}

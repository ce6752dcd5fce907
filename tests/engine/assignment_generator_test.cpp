/**
 * @file assignment_generator_test.cpp
 * @brief Unit tests for weekly rota generation
 */

#include <rota/engine/assignment_generator.hpp>
#include <rota/engine/conflict_detector.hpp>

#include <catch2/catch_test_macros.hpp>

#include "../test_fixtures.hpp"

#include <algorithm>
#include <iterator>

using namespace rota;
using namespace rota::engine;
using namespace rota::test;

namespace {

auto request_for(std::vector<std::string> staff, std::set<unsigned> weekdays = {1})
    -> generation_request {
    generation_request request;
    request.week_start = monday;
    request.staff_ids = std::move(staff);
    request.selected_weekdays = std::move(weekdays);
    request.generated_by = "tester";
    request.generated_at = fixed_now();
    return request;
}

auto rows_at(const rota_document& doc, const std::string& location)
    -> std::vector<assignment> {
    std::vector<assignment> rows;
    std::copy_if(doc.assignments.begin(), doc.assignments.end(),
                 std::back_inserter(rows),
                 [&](const assignment& a) { return a.location == location; });
    return rows;
}

}  // namespace

// =============================================================================
// Preconditions
// =============================================================================

TEST_CASE("generation preconditions", "[generator][precondition]") {
    assignment_generator generator;
    auto snapshot = sample_snapshot();

    SECTION("no staff selected") {
        auto result = generator.generate(request_for({}), snapshot);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::no_staff_selected);
    }

    SECTION("no weekday selected") {
        auto result = generator.generate(request_for({"s1"}, {}), snapshot);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::no_weekday_selected);
    }

    SECTION("week must start on a Monday") {
        auto request = request_for({"s1"});
        request.week_start = day_of_week(1);
        auto result = generator.generate(request, snapshot);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_week_start);
    }

    SECTION("unknown staff id") {
        auto result = generator.generate(request_for({"s1", "ghost"}), snapshot);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::staff_not_found);
    }
}

// =============================================================================
// Weekly Shape
// =============================================================================

TEST_CASE("generation produces seven documents", "[generator][week]") {
    assignment_generator generator;
    auto result = generator.generate(request_for({"s1", "s2", "s3", "s4"}, {1, 3}),
                                     sample_snapshot());
    REQUIRE(result.is_ok());
    const auto& week = result.value();

    REQUIRE(week.size() == 7);
    for (std::size_t i = 0; i < week.size(); ++i) {
        CHECK(week[i].date == day_of_week(static_cast<int>(i)));
        CHECK(week[i].week_start == monday);
        CHECK(week[i].status == rota_status::draft);
        CHECK(week[i].generated_by == "tester");
    }

    SECTION("only selected weekdays are staffed") {
        CHECK_FALSE(week[0].assignments.empty());
        CHECK(week[1].assignments.empty());
        CHECK_FALSE(week[2].assignments.empty());
        CHECK(week[5].assignments.empty());
    }

    SECTION("every row lies on its document date") {
        for (const auto& doc : week) {
            for (const auto& row : doc.assignments) {
                CHECK(row.date == doc.date);
            }
        }
    }
}

TEST_CASE("work list ordering", "[generator][priority]") {
    assignment_generator generator;
    auto snapshot = sample_snapshot();
    snapshot.requirements.push_back(make_requirement("Management", "management", 1, 1, 9));
    auto items = generator.build_work_list(monday, request_for({"s1"}), snapshot);

    REQUIRE(items.size() == 4);
    // Equal difficulty falls back to the category tier
    CHECK(items[0].name == "EAU");
    CHECK(items[1].name == "Management");
    CHECK(items[2].name == "Ward 2");
    CHECK(items[3].name == "Dispensary");
}

TEST_CASE("scarce staff go to the hardest duty first", "[generator][priority]") {
    assignment_generator generator;
    auto result = generator.generate(request_for({"s1", "s2", "s3", "s4"}),
                                     sample_snapshot());
    REQUIRE(result.is_ok());
    const auto& doc = result.value().front();

    REQUIRE(doc.assignments.size() == 3);
    CHECK(doc.assignments[0].location == "EAU");
    CHECK(doc.assignments[0].staff_id == std::optional<std::string>{"s1"});
    CHECK(doc.assignments[1].staff_id == std::optional<std::string>{"s2"});
    CHECK(doc.assignments[2].staff_id == std::optional<std::string>{"s3"});
}

// =============================================================================
// Determinism
// =============================================================================

TEST_CASE("regeneration is reproducible", "[generator][idempotence]") {
    assignment_generator generator;
    auto snapshot = sample_snapshot();
    auto request = request_for({"s4", "s2", "s1", "s3"}, weekdays_mon_to_fri());

    auto first = generator.generate(request, snapshot);
    auto second = generator.generate(request, snapshot);
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());

    for (std::size_t i = 0; i < 7; ++i) {
        CHECK(first.value()[i].assignments == second.value()[i].assignments);
        CHECK(first.value()[i].targets == second.value()[i].targets);
    }
}

// =============================================================================
// Coverage
// =============================================================================

TEST_CASE("one eligible staff member below ideal", "[generator][coverage]") {
    reference_snapshot snapshot;
    snapshot.staff = {make_staff("s1", "Alice")};
    snapshot.requirements = {make_requirement("Ward 7", "ward", 1, 2, 9)};

    assignment_generator generator;
    auto result = generator.generate(request_for({"s1"}), snapshot);
    REQUIRE(result.is_ok());
    const auto& doc = result.value().front();

    REQUIRE(doc.assignments.size() == 1);
    CHECK(doc.assignments[0].held_by("s1"));

    conflict_detector detector(snapshot.staff);
    auto conflicts = detector.detect(doc);
    REQUIRE(conflicts.size() == 1);
    CHECK(conflicts[0].type == conflict_type::below_ideal);
    CHECK(conflicts[0].severity == conflict_severity::warning);
}

TEST_CASE("unfilled minimum leaves a visible gap", "[generator][coverage]") {
    reference_snapshot snapshot;
    snapshot.staff = {make_staff("s1", "Alice")};
    snapshot.requirements = {make_requirement("EAU", "eau", 1, 1, 9),
                             make_requirement("Ward 2", "ward", 2, 3, 5)};

    assignment_generator generator;
    auto result = generator.generate(request_for({"s1"}), snapshot);
    REQUIRE(result.is_ok());
    const auto& doc = result.value().front();

    auto ward = rows_at(doc, "Ward 2");
    REQUIRE(ward.size() == 2);
    CHECK_FALSE(ward[0].is_filled());
    CHECK_FALSE(ward[1].is_filled());

    conflict_detector detector(snapshot.staff);
    auto conflicts = detector.detect(doc);
    REQUIRE(conflicts.size() == 1);
    CHECK(conflicts[0].type == conflict_type::understaffed);
    CHECK(conflicts[0].severity == conflict_severity::error);
    CHECK(conflicts[0].location == "Ward 2");
}

TEST_CASE("half-day duties share a staff member", "[generator][half_day]") {
    reference_snapshot snapshot;
    snapshot.staff = {make_staff("s1", "Alice")};
    auto morning = make_requirement("Ward 1", "ward", 1, 1, 8);
    morning.window = span(9, 13);
    auto afternoon = make_requirement("Ward 2", "ward", 1, 1, 7);
    afternoon.window = span(13, 17);
    auto full_day = make_requirement("Dispensary", "dispensary", 1, 1, 5);
    snapshot.requirements = {morning, afternoon, full_day};

    assignment_generator generator;
    auto result = generator.generate(request_for({"s1"}), snapshot);
    REQUIRE(result.is_ok());
    const auto& doc = result.value().front();

    CHECK(rows_at(doc, "Ward 1").at(0).held_by("s1"));
    CHECK(rows_at(doc, "Ward 2").at(0).held_by("s1"));
    CHECK_FALSE(rows_at(doc, "Dispensary").at(0).is_filled());
}

TEST_CASE("clinic preferences come first", "[generator][clinic]") {
    auto snapshot = sample_snapshot();
    clinic_slot clinic;
    clinic.id = "c1";
    clinic.name = "Anticoagulation Clinic";
    clinic.weekday = std::chrono::Monday;
    clinic.window = span(9, 12);
    clinic.preferred_staff = {"s4", "s3"};
    snapshot.clinics.push_back(clinic);

    assignment_generator generator;
    auto request = request_for({"s1", "s2", "s3", "s4"});
    request.selected_clinic_ids = {"c1"};
    auto result = generator.generate(request, snapshot);
    REQUIRE(result.is_ok());
    const auto& doc = result.value().front();

    auto rows = rows_at(doc, "Anticoagulation Clinic");
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].held_by("s4"));
    CHECK(rows[0].type == assignment_type::clinic);

    SECTION("an unknown clinic is rejected") {
        request.selected_clinic_ids = {"nope"};
        CHECK(generator.generate(request, snapshot).is_err());
    }
}

TEST_CASE("default roster staff are preferred", "[generator][roster]") {
    reference_snapshot snapshot;
    snapshot.staff = {make_staff("s1", "Alice"), make_staff("s2", "Zed")};
    snapshot.staff[1].default_roster = true;
    snapshot.requirements = {make_requirement("Ward 1", "ward", 1, 1, 5)};

    assignment_generator generator;
    auto result = generator.generate(request_for({"s1", "s2"}), snapshot);
    REQUIRE(result.is_ok());
    CHECK(result.value().front().assignments.at(0).held_by("s2"));
}

TEST_CASE("extra roles are staffed on their weekday", "[generator][roles]") {
    auto snapshot = sample_snapshot();
    snapshot.requirements.clear();

    auto request = request_for({"s1", "s2"}, {1, 2});
    role_request role;
    role.name = "On-call";
    role.window = span(17, 20);
    role.count = 2;
    request.extra_roles_by_weekday[2] = {role};

    assignment_generator generator;
    auto result = generator.generate(request, snapshot);
    REQUIRE(result.is_ok());

    CHECK(result.value()[0].assignments.empty());
    auto tuesday = rows_at(result.value()[1], "On-call");
    REQUIRE(tuesday.size() == 2);
    CHECK(tuesday[0].type == assignment_type::role);
    CHECK(tuesday[0].is_filled());
    CHECK(tuesday[1].is_filled());
}

TEST_CASE("unavailability is honoured during generation", "[generator][constraint]") {
    auto snapshot = sample_snapshot();
    snapshot.staff[0].unavailability.push_back({std::chrono::Monday, span(9, 17)});

    assignment_generator generator;
    auto request = request_for({"s1", "s2", "s3", "s4"});
    auto result = generator.generate(request, snapshot);
    REQUIRE(result.is_ok());
    const auto& rows = result.value().front().assignments;
    CHECK(std::none_of(rows.begin(), rows.end(),
                       [](const assignment& a) { return a.held_by("s1"); }));

    SECTION("ignoring the rule restores the placement") {
        request.ignored_rules["s1"] = {0};
        auto again = generator.generate(request, snapshot);
        REQUIRE(again.is_ok());
        CHECK(again.value().front().assignments.at(0).held_by("s1"));
    }
}

TEST_CASE("do-not-split duties are marked on rows and targets", "[generator][split]") {
    auto snapshot = sample_snapshot();
    snapshot.requirements[0].do_not_split = true;

    assignment_generator generator;
    auto result = generator.generate(request_for({"s1", "s2", "s3", "s4"}), snapshot);
    REQUIRE(result.is_ok());
    const auto& doc = result.value().front();

    auto eau = rows_at(doc, "EAU");
    REQUIRE_FALSE(eau.empty());
    CHECK(eau.front().do_not_split);
    CHECK_FALSE(rows_at(doc, "Ward 2").front().do_not_split);

    auto target = std::find_if(doc.targets.begin(), doc.targets.end(),
                               [](const coverage_target& t) { return t.location == "EAU"; });
    REQUIRE(target != doc.targets.end());
    CHECK(target->do_not_split);
}

TEST_CASE("week-specific unavailability blocks placement", "[generator][constraint]") {
    auto snapshot = sample_snapshot();

    assignment_generator generator;
    auto request = request_for({"s1", "s2", "s3", "s4"}, {1, 2});
    request.extra_unavailability["s1"] = {{std::chrono::Monday, span(9, 12)}};
    auto result = generator.generate(request, snapshot);
    REQUIRE(result.is_ok());

    const auto& monday_rows = result.value().front().assignments;
    CHECK(std::none_of(monday_rows.begin(), monday_rows.end(),
                       [](const assignment& a) { return a.held_by("s1"); }));

    // Other days keep the usual placement
    const auto& tuesday_rows = result.value()[1].assignments;
    CHECK(std::any_of(tuesday_rows.begin(), tuesday_rows.end(),
                      [](const assignment& a) { return a.held_by("s1"); }));
}

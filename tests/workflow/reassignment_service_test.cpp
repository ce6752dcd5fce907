/**
 * @file reassignment_service_test.cpp
 * @brief Unit tests for slot, day and week reassignment and swaps
 */

#include <rota/workflow/reassignment_service.hpp>

#include <catch2/catch_test_macros.hpp>

#include "../test_fixtures.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace rota;
using namespace rota::test;
using namespace rota::workflow;

namespace {

auto row(const std::string& staff, const std::string& location,
         engine::assignment_type type, const core::date& date,
         core::time_window window) -> engine::assignment {
    engine::assignment a;
    if (!staff.empty()) a.staff_id = staff;
    a.type = type;
    a.location = location;
    a.date = date;
    a.window = window;
    a.category = type == engine::assignment_type::dispensary ? "dispensary" : "ward";
    return a;
}

auto target(const std::string& location, engine::assignment_type type,
            core::time_window window) -> engine::coverage_target {
    engine::coverage_target t;
    t.type = type;
    t.location = location;
    t.category = type == engine::assignment_type::dispensary ? "dispensary" : "ward";
    t.window = window;
    return t;
}

/// The standard weekday layout: s1 on EAU, s2 on Ward 2, s3 on the dispensary
auto weekday_rows(const core::date& date) -> std::vector<engine::assignment> {
    using engine::assignment_type;
    return {row("s1", "EAU", assignment_type::ward, date, span(9, 17)),
            row("s2", "Ward 2", assignment_type::ward, date, span(9, 17)),
            row("s3", "Dispensary", assignment_type::dispensary, date, span(9, 13))};
}

/// Stores a draft week with the standard layout on weekdays
auto store_week(storage::rota_database& db) -> std::map<core::date, std::int64_t> {
    using engine::assignment_type;
    std::map<core::date, std::int64_t> ids;
    for (const auto& date : core::week_dates(monday)) {
        engine::rota_document doc;
        doc.date = date;
        doc.week_start = monday;
        doc.generated_by = "planner";
        doc.generated_at = fixed_now();
        doc.included_weekdays = weekdays_mon_to_fri();
        if (std::chrono::weekday{std::chrono::sys_days{date}}.iso_encoding() <= 5) {
            doc.assignments = weekday_rows(date);
            doc.targets = {target("EAU", assignment_type::ward, span(9, 17)),
                           target("Ward 2", assignment_type::ward, span(9, 17)),
                           target("Dispensary", assignment_type::dispensary, span(9, 13))};
        }
        auto id = db.rotas().insert(doc);
        REQUIRE(id.is_ok());
        ids[date] = id.value();
    }
    return ids;
}

/// Loads a stored document, applies @p edit and writes it back
template <typename Edit>
void update_document(storage::rota_database& db, std::int64_t id, Edit edit) {
    auto doc = db.rotas().find_by_id(id);
    REQUIRE(doc);
    edit(*doc);
    REQUIRE(db.rotas().save(*doc).is_ok());
}

void make_wards_shareable(engine::rota_document& doc) {
    for (auto& a : doc.assignments) {
        if (a.location == "EAU" || a.location == "Ward 2") {
            a.split_shareable = true;
        }
    }
}

auto rows_of(const std::vector<engine::assignment>& rows, const std::string& staff)
    -> std::vector<engine::assignment> {
    std::vector<engine::assignment> out;
    std::copy_if(rows.begin(), rows.end(), std::back_inserter(out),
                 [&](const engine::assignment& a) { return a.held_by(staff); });
    return out;
}

auto has_conflict(const engine::rota_document& doc, engine::conflict_type type) -> bool {
    return std::any_of(doc.conflicts.begin(), doc.conflicts.end(),
                       [&](const engine::conflict& c) { return c.type == type; });
}

auto slot_request(const std::map<core::date, std::int64_t>& ids,
                  const std::string& location, core::time_of_day start,
                  const std::string& original, std::optional<std::string> replacement)
    -> reassignment_request {
    reassignment_request request;
    request.rota_ids_by_date = ids;
    request.location = location;
    request.date = monday;
    request.start_time = start;
    request.original_staff_id = original;
    request.new_staff_id = std::move(replacement);
    request.requested_by = "planner";
    return request;
}

}  // namespace

// ============================================================================
// Slot scope
// ============================================================================

TEST_CASE("slot reassignment", "[reassignment][slot]") {
    test_store store;
    engine::in_memory_reference_data reference(sample_snapshot());
    reassignment_service service(store.db(), reference);
    auto ids = store_week(store.db());

    SECTION("exact slot is handed over") {
        auto request = slot_request(ids, "Dispensary", at(9), "s3", "s4");
        request.end_time = at(13);
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_ok());
        CHECK(result.value().success);
        REQUIRE(result.value().outcomes.size() == 1);
        CHECK(result.value().outcomes.front().rows_changed == 1);

        auto doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(doc);
        CHECK(rows_of(doc->assignments, "s3").empty());
        REQUIRE(rows_of(doc->assignments, "s4").size() == 1);
        CHECK(doc->last_edited == fixed_now());
        CHECK(doc->assignments == result.value().updated_assignments);
    }

    SECTION("afternoon of a full-day row splits it") {
        auto request = slot_request(ids, "Ward 2", at(13), "s2", "s4");
        request.end_time = at(17);
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_ok());

        auto doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(doc);
        auto kept = rows_of(doc->assignments, "s2");
        REQUIRE(kept.size() == 1);
        CHECK(kept.front().window == span(9, 13));
        CHECK(kept.front().location == "Ward 2");
        auto moved = rows_of(doc->assignments, "s4");
        REQUIRE(moved.size() == 1);
        CHECK(moved.front().window == span(13, 17));
        CHECK(moved.front().location == "Ward 2");
    }

    SECTION("open end on a mid-morning start takes the morning half") {
        auto request = slot_request(ids, "Ward 2", at(10), "s2", "s4");
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_ok());

        auto doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(doc);
        auto moved = rows_of(doc->assignments, "s4");
        REQUIRE(moved.size() == 1);
        CHECK(moved.front().window.start == at(10));
        CHECK(moved.front().window.end == at(13));
        CHECK_FALSE(rows_of(doc->assignments, "s2").empty());
    }

    SECTION("vacating leaves an open gap") {
        auto request = slot_request(ids, "Dispensary", at(9), "s3", std::nullopt);
        REQUIRE(service.reassign(request, fixed_now()).is_ok());

        auto doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(doc);
        CHECK(doc->assignments.size() == 3);
        auto open = std::count_if(doc->assignments.begin(), doc->assignments.end(),
                                  [](const engine::assignment& a) {
                                      return !a.is_filled();
                                  });
        CHECK(open == 1);
        CHECK(has_conflict(*doc, engine::conflict_type::understaffed));
    }

    SECTION("slot outside every stored row is stale") {
        auto request = slot_request(ids, "Dispensary", at(14), "s3", "s4");
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::stale_reference);
    }

    SECTION("slot scope needs a location and start") {
        auto request = slot_request(ids, "Dispensary", at(9), "s3", "s4");
        request.location.reset();
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::precondition_failed);
    }

    SECTION("end before start") {
        auto request = slot_request(ids, "Dispensary", at(12), "s3", "s4");
        request.end_time = at(10);
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_time);
    }
}

TEST_CASE("reassignment validation", "[reassignment]") {
    test_store store;
    engine::in_memory_reference_data reference(sample_snapshot());
    reassignment_service service(store.db(), reference);
    auto ids = store_week(store.db());

    SECTION("unknown replacement") {
        auto request = slot_request(ids, "EAU", at(9), "s1", "nobody");
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::staff_not_found);
    }

    SECTION("same person on both sides") {
        auto request = slot_request(ids, "EAU", at(9), "s1", "s1");
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::precondition_failed);
    }

    SECTION("nothing is written on rejection") {
        auto request = slot_request(ids, "EAU", at(9), "", "s4");
        CHECK(service.reassign(request, fixed_now()).is_err());
        auto doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(doc);
        CHECK_FALSE(doc->last_edited.has_value());
    }
}

// ============================================================================
// Day scope
// ============================================================================

TEST_CASE("day reassignment", "[reassignment][day]") {
    test_store store;
    engine::in_memory_reference_data reference(sample_snapshot());
    reassignment_service service(store.db(), reference);
    auto ids = store_week(store.db());

    reassignment_request request;
    request.rota_ids_by_date = ids;
    request.date = monday;
    request.scope = reassignment_scope::day;
    request.requested_by = "planner";

    SECTION("original keeps no rows on the date") {
        request.original_staff_id = "s3";
        request.new_staff_id = "s4";
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_ok());

        auto doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(doc);
        CHECK(rows_of(doc->assignments, "s3").empty());
        CHECK(rows_of(doc->assignments, "s4").size() == 1);

        // Other dates are untouched
        auto tuesday = store.db().rotas().find_by_id(ids.at(day_of_week(1)));
        REQUIRE(tuesday);
        CHECK(rows_of(tuesday->assignments, "s3").size() == 1);
    }

    SECTION("nobody to move") {
        request.original_staff_id = "s4";
        request.new_staff_id = "s3";
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::assignment_not_found);
    }

    SECTION("continuity block is protected") {
        update_document(store.db(), ids.at(monday), make_wards_shareable);
        request.original_staff_id = "s1";
        request.new_staff_id = "s2";
        request.location = "EAU";

        auto refused = service.reassign(request, fixed_now());
        REQUIRE(refused.is_err());
        CHECK(refused.error().code == error_codes::continuity_violation);
        auto unchanged = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(unchanged);
        CHECK(rows_of(unchanged->assignments, "s1").size() == 1);

        request.respect_special_continuity = false;
        auto forced = service.reassign(request, fixed_now());
        REQUIRE(forced.is_ok());
        auto doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(doc);
        CHECK(rows_of(doc->assignments, "s2").size() == 2);
        CHECK_FALSE(has_conflict(*doc, engine::conflict_type::double_booking));
    }

    SECTION("archived rotas cannot change") {
        REQUIRE(store.db()
                    .rotas()
                    .update_status(ids.at(monday), engine::rota_status::published)
                    .is_ok());
        REQUIRE(store.db()
                    .rotas()
                    .update_status(ids.at(monday), engine::rota_status::archived)
                    .is_ok());
        request.original_staff_id = "s3";
        request.new_staff_id = "s4";
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::immutable_document);
    }
}

// ============================================================================
// Incoming staff member
// ============================================================================

TEST_CASE("incoming staff member must be free", "[reassignment][occupant]") {
    test_store store;
    engine::in_memory_reference_data reference(sample_snapshot());
    reassignment_service service(store.db(), reference);
    auto ids = store_week(store.db());

    auto expect_unchanged = [&](const core::date& date) {
        auto doc = store.db().rotas().find_by_id(ids.at(date));
        REQUIRE(doc);
        CHECK(doc->assignments == weekday_rows(date));
        CHECK_FALSE(doc->last_edited.has_value());
    };

    SECTION("overlapping rows are refused") {
        auto request = slot_request(ids, "Ward 2", at(9), "s2", "s1");
        request.end_time = at(17);
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::overlapping_assignment);
        expect_unchanged(monday);
    }

    SECTION("a split piece is checked before the row is split") {
        auto request = slot_request(ids, "Ward 2", at(13), "s2", "s1");
        request.end_time = at(17);
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::overlapping_assignment);
        expect_unchanged(monday);
    }

    SECTION("split-shareable rows may overlap") {
        update_document(store.db(), ids.at(monday), make_wards_shareable);
        auto request = slot_request(ids, "Ward 2", at(9), "s2", "s1");
        request.end_time = at(17);
        REQUIRE(service.reassign(request, fixed_now()).is_ok());

        auto doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(doc);
        CHECK(rows_of(doc->assignments, "s1").size() == 2);
        CHECK_FALSE(has_conflict(*doc, engine::conflict_type::double_booking));
    }

    SECTION("day scope is refused as a whole") {
        reassignment_request request;
        request.rota_ids_by_date = ids;
        request.date = monday;
        request.scope = reassignment_scope::day;
        request.original_staff_id = "s2";
        request.new_staff_id = "s3";
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::overlapping_assignment);
        expect_unchanged(monday);
    }

    SECTION("week scope reports the clash on every date") {
        reassignment_request request;
        request.rota_ids_by_date = ids;
        request.date = monday;
        request.scope = reassignment_scope::week;
        request.original_staff_id = "s1";
        request.new_staff_id = "s2";
        request.respect_special_continuity = false;
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().success);

        auto clashes = std::count_if(
            result.value().outcomes.begin(), result.value().outcomes.end(),
            [](const date_outcome& o) {
                return o.error && o.error->code == error_codes::overlapping_assignment;
            });
        CHECK(clashes == 5);
        expect_unchanged(monday);
        expect_unchanged(day_of_week(4));
    }

    SECTION("holder of a do-not-split duty takes nothing else") {
        update_document(store.db(), ids.at(monday), [](engine::rota_document& doc) {
            auto clinic = row("s4", "Anticoagulation", engine::assignment_type::clinic,
                              doc.date, span(14, 17));
            clinic.do_not_split = true;
            doc.assignments.push_back(clinic);
        });
        auto request = slot_request(ids, "Dispensary", at(9), "s3", "s4");
        request.end_time = at(13);
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::do_not_split_violation);

        auto doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(doc);
        CHECK(rows_of(doc->assignments, "s3").size() == 1);
        CHECK(rows_of(doc->assignments, "s4").size() == 1);
    }

    SECTION("a do-not-split row goes only to someone free all day") {
        update_document(store.db(), ids.at(monday), [](engine::rota_document& doc) {
            for (auto& a : doc.assignments) {
                if (a.location == "Dispensary") a.do_not_split = true;
            }
            doc.assignments.push_back(row("s4", "Management",
                                          engine::assignment_type::management,
                                          doc.date, span(14, 17)));
        });
        auto request = slot_request(ids, "Dispensary", at(9), "s3", "s4");
        request.end_time = at(13);
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::do_not_split_violation);

        // Someone with no other duty that day may take it
        update_document(store.db(), ids.at(monday), [](engine::rota_document& doc) {
            doc.assignments.pop_back();
        });
        REQUIRE(service.reassign(request, fixed_now()).is_ok());
        auto doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(doc);
        auto moved = rows_of(doc->assignments, "s4");
        REQUIRE(moved.size() == 1);
        CHECK(moved.front().do_not_split);
    }
}

TEST_CASE("unreadable dates are not rewritten", "[reassignment][corruption]") {
    test_store store;
    engine::in_memory_reference_data reference(sample_snapshot());
    reassignment_service service(store.db(), reference);
    auto ids = store_week(store.db());

    auto set_type = [&](const std::string& type) {
        const auto sql = "UPDATE rota_assignments SET assignment_type = '" + type +
                         "' WHERE rota_pk = " + std::to_string(ids.at(monday)) +
                         " AND location = 'Dispensary';";
        REQUIRE(sqlite3_exec(store.db().native_handle(), sql.c_str(), nullptr,
                             nullptr, nullptr) == SQLITE_OK);
    };
    set_type("rounds");

    auto request = slot_request(ids, "EAU", at(9), "s1", "s4");
    request.end_time = at(17);
    auto result = service.reassign(request, fixed_now());
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::rota_not_found);

    set_type("dispensary");
    auto doc = store.db().rotas().find_by_id(ids.at(monday));
    REQUIRE(doc);
    CHECK(doc->assignments == weekday_rows(monday));
    CHECK_FALSE(doc->last_edited.has_value());
}

// ============================================================================
// Week scope
// ============================================================================

TEST_CASE("week reassignment", "[reassignment][week]") {
    test_store store;
    engine::in_memory_reference_data reference(sample_snapshot());
    reassignment_service service(store.db(), reference);
    auto ids = store_week(store.db());

    reassignment_request request;
    request.rota_ids_by_date = ids;
    request.date = day_of_week(2);
    request.scope = reassignment_scope::week;
    request.original_staff_id = "s3";
    request.new_staff_id = "s4";
    request.requested_by = "planner";

    SECTION("every weekday moves") {
        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_ok());
        CHECK(result.value().success);
        CHECK(result.value().outcomes.size() == 7);
        CHECK(rows_of(result.value().updated_assignments, "s4").size() == 5);

        for (const auto& date : core::week_dates(monday)) {
            auto doc = store.db().rotas().find_by_id(ids.at(date));
            REQUIRE(doc);
            CHECK(rows_of(doc->assignments, "s3").empty());
        }
    }

    SECTION("a failed date does not undo the others") {
        auto wednesday = ids.at(day_of_week(2));
        REQUIRE(store.db()
                    .rotas()
                    .update_status(wednesday, engine::rota_status::archived)
                    .is_ok());

        auto result = service.reassign(request, fixed_now());
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().success);

        const auto& outcomes = result.value().outcomes;
        auto failed = std::find_if(outcomes.begin(), outcomes.end(),
                                   [](const date_outcome& o) { return !o.success; });
        REQUIRE(failed != outcomes.end());
        CHECK(failed->date == day_of_week(2));
        REQUIRE(failed->error);
        CHECK(failed->error->code == error_codes::immutable_document);

        auto monday_doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(monday_doc);
        CHECK(rows_of(monday_doc->assignments, "s4").size() == 1);
        auto wednesday_doc = store.db().rotas().find_by_id(wednesday);
        REQUIRE(wednesday_doc);
        CHECK(rows_of(wednesday_doc->assignments, "s3").size() == 1);
    }
}

// ============================================================================
// Swaps
// ============================================================================

TEST_CASE("swapping slots", "[reassignment][swap]") {
    test_store store;
    engine::in_memory_reference_data reference(sample_snapshot());
    reassignment_service service(store.db(), reference);
    auto ids = store_week(store.db());

    swap_request request;
    request.rota_ids_by_date = ids;
    request.requested_by = "planner";

    SECTION("two occupied slots exchange staff") {
        request.source = slot_ref{monday, "EAU", span(9, 17), std::string{"s1"}};
        request.target = slot_ref{monday, "Ward 2", span(9, 17), std::string{"s2"}};
        auto result = service.swap(request, fixed_now());
        REQUIRE(result.is_ok());
        CHECK(result.value().success);

        auto doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(doc);
        auto s1 = rows_of(doc->assignments, "s1");
        auto s2 = rows_of(doc->assignments, "s2");
        REQUIRE(s1.size() == 1);
        REQUIRE(s2.size() == 1);
        CHECK(s1.front().location == "Ward 2");
        CHECK(s2.front().location == "EAU");
        CHECK(result.value().updated_assignments == doc->assignments);
        CHECK_FALSE(has_conflict(*doc, engine::conflict_type::double_booking));
    }

    SECTION("moving into an open slot") {
        request.source = slot_ref{monday, "Dispensary", span(9, 13), std::string{"s3"}};
        request.target = slot_ref{day_of_week(1), "Dispensary", span(13, 17),
                                  std::nullopt};
        auto result = service.swap(request, fixed_now());
        REQUIRE(result.is_ok());
        CHECK(result.value().success);

        auto source_doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(source_doc);
        CHECK(rows_of(source_doc->assignments, "s3").empty());

        auto target_doc = store.db().rotas().find_by_id(ids.at(day_of_week(1)));
        REQUIRE(target_doc);
        auto moved = rows_of(target_doc->assignments, "s3");
        REQUIRE(moved.size() == 2);
        auto afternoon = std::find_if(moved.begin(), moved.end(),
                                      [](const engine::assignment& a) {
                                          return a.window == span(13, 17);
                                      });
        REQUIRE(afternoon != moved.end());
        CHECK(afternoon->type == engine::assignment_type::dispensary);
        CHECK(afternoon->category == "dispensary");
        CHECK(result.value().updated_assignments.size() ==
              source_doc->assignments.size() + target_doc->assignments.size());
    }

    SECTION("a busy source member cannot take an open slot") {
        request.source = slot_ref{monday, "Dispensary", span(9, 13), std::string{"s3"}};
        request.target = slot_ref{day_of_week(1), "EAU", span(9, 17), std::nullopt};
        auto result = service.swap(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::overlapping_assignment);

        // The source is not vacated
        auto source_doc = store.db().rotas().find_by_id(ids.at(monday));
        REQUIRE(source_doc);
        CHECK(rows_of(source_doc->assignments, "s3").size() == 1);
        CHECK_FALSE(source_doc->last_edited.has_value());
    }

    SECTION("open target needs slot scope") {
        request.scope = reassignment_scope::day;
        request.source = slot_ref{monday, "EAU", span(9, 17), std::string{"s1"}};
        request.target = slot_ref{monday, "Ward 2", span(9, 17), std::nullopt};
        auto result = service.swap(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::precondition_failed);
    }

    SECTION("source must be occupied") {
        request.source = slot_ref{monday, "EAU", span(9, 17), std::nullopt};
        request.target = slot_ref{monday, "Ward 2", span(9, 17), std::string{"s2"}};
        auto result = service.swap(request, fixed_now());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::precondition_failed);
    }
}

TEST_CASE("reassignment scope names", "[reassignment]") {
    CHECK(to_string(reassignment_scope::week) == "week");
    CHECK(parse_reassignment_scope("day") == reassignment_scope::day);
    CHECK_FALSE(parse_reassignment_scope("month").has_value());
}

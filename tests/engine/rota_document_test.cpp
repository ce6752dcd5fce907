/**
 * @file rota_document_test.cpp
 * @brief Unit tests for cell keys and rota value types
 */

#include <rota/engine/rota_document.hpp>

#include <catch2/catch_test_macros.hpp>

#include "../test_fixtures.hpp"

using namespace rota::engine;
using rota::test::monday;

TEST_CASE("cell_key parsing", "[engine][cell_key]") {
    SECTION("plain location") {
        auto key = cell_key::parse("ward-EAU-2024-03-04-09:00-17:00");
        REQUIRE(key);
        CHECK(key->cell_type == "ward");
        CHECK(key->location == "EAU");
        CHECK(key->date == monday);
        CHECK(key->start == "09:00");
        CHECK(key->end == "17:00");
    }

    SECTION("location containing hyphens") {
        auto key = cell_key::parse("clinic-Anti-coagulation - Day Unit-2024-03-04-13:00-17:00");
        REQUIRE(key);
        CHECK(key->cell_type == "clinic");
        CHECK(key->location == "Anti-coagulation - Day Unit");
        CHECK(key->start == "13:00");
    }

    SECTION("whole-day unavailability note") {
        auto key = cell_key::parse("unavailable-2024-03-04-09:00-17:00");
        REQUIRE(key);
        CHECK(key->is_unavailable_note());
        CHECK(key->location.empty());
        CHECK(key->to_string() == "unavailable-2024-03-04-09:00-17:00");
    }

    SECTION("malformed keys") {
        CHECK_FALSE(cell_key::parse(""));
        CHECK_FALSE(cell_key::parse("ward-EAU"));
        CHECK_FALSE(cell_key::parse("ward-EAU-2024-02-30-09:00-17:00"));
        CHECK_FALSE(cell_key::parse("ward-2024-03-04-09:00-17:00"));
        CHECK_FALSE(cell_key::parse("ward-EAU-2024-03-04-09:00-"));
    }

    SECTION("rendering is the inverse of parsing") {
        cell_key key{"dispensary", "Main Dispensary", monday, "09:00", "13:00"};
        auto text = key.to_string();
        CHECK(text == "dispensary-Main Dispensary-2024-03-04-09:00-13:00");
        CHECK(cell_key::parse(text) == key);
    }
}

TEST_CASE("rota value type names", "[engine]") {
    CHECK(to_string(rota_status::published) == "published");
    CHECK(parse_rota_status("archived") == rota_status::archived);
    CHECK_FALSE(parse_rota_status("deleted"));

    CHECK(to_string(assignment_type::management) == "management");
    CHECK(parse_assignment_type("clinic") == assignment_type::clinic);
    CHECK_FALSE(parse_assignment_type("Ward"));

    CHECK(to_string(conflict_type::double_booking) == "double_booking");
    CHECK(parse_conflict_severity("error") == conflict_severity::error);
}

TEST_CASE("rota_document error flag", "[engine]") {
    rota_document doc;
    CHECK_FALSE(doc.has_errors());
    doc.conflicts.push_back(conflict{conflict_type::below_ideal, "Ward 2 below ideal",
                                     conflict_severity::warning, "Ward 2", std::nullopt});
    CHECK_FALSE(doc.has_errors());
    doc.conflicts.push_back(conflict{conflict_type::understaffed, "EAU unstaffed",
                                     conflict_severity::error, "EAU", std::nullopt});
    CHECK(doc.has_errors());
    CHECK(doc.is_editable());
    doc.status = rota_status::archived;
    CHECK_FALSE(doc.is_editable());
}

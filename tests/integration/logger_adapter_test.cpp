/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter and the rota audit trail
 */

#include <rota/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace rota::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

auto create_temp_log_directory() -> std::filesystem::path {
    auto temp_dir = std::filesystem::temp_directory_path() / "rota_logger_test";
    std::filesystem::remove_all(temp_dir);
    std::filesystem::create_directories(temp_dir);
    return temp_dir;
}

auto read_lines(const std::filesystem::path& path) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

auto contains(const std::string& haystack, const std::string& needle) -> bool {
    return haystack.find(needle) != std::string::npos;
}

auto quiet_config(const std::filesystem::path& dir) -> logger_config {
    logger_config config;
    config.log_directory = dir;
    config.enable_console = false;
    config.enable_file = false;
    config.async_mode = false;
    return config;
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config)
        : log_dir_(config.log_directory) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
        std::filesystem::remove_all(log_dir_);
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;

    [[nodiscard]] auto audit_path() const -> std::filesystem::path {
        return log_dir_ / "audit.json";
    }

private:
    std::filesystem::path log_dir_;
};

}  // namespace

// =============================================================================
// Initialization
// =============================================================================

TEST_CASE("logger_adapter initialization", "[logger_adapter][init]") {
    auto dir = create_temp_log_directory();

    SECTION("calls before initialize are dropped") {
        REQUIRE_FALSE(logger_adapter::is_initialized());
        logger_adapter::info("nobody listens");
        logger_adapter::log_rota_archived("2024-03-04", 7);
        CHECK_FALSE(std::filesystem::exists(dir / "audit.json"));
        std::filesystem::remove_all(dir);
    }

    SECTION("initialize and shutdown") {
        {
            logger_test_fixture fixture(quiet_config(dir));
            CHECK(logger_adapter::is_initialized());
            CHECK(logger_adapter::get_config().log_directory == dir);
        }
        CHECK_FALSE(logger_adapter::is_initialized());
    }
}

TEST_CASE("logger_adapter level filtering", "[logger_adapter][level]") {
    auto config = quiet_config(create_temp_log_directory());
    config.min_level = log_level::warn;
    logger_test_fixture fixture(config);

    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::info));
    CHECK(logger_adapter::is_level_enabled(log_level::warn));
    CHECK(logger_adapter::is_level_enabled(log_level::error));

    logger_adapter::set_min_level(log_level::debug);
    CHECK(logger_adapter::get_min_level() == log_level::debug);
    CHECK(logger_adapter::is_level_enabled(log_level::info));

    CHECK(logger_adapter::log_level_to_string(log_level::warn) == "WARN");
    CHECK(logger_adapter::log_level_to_string(log_level::off) == "OFF");
}

// =============================================================================
// Audit Trail
// =============================================================================

TEST_CASE("rota audit events", "[logger_adapter][audit]") {
    logger_test_fixture fixture(quiet_config(create_temp_log_directory()));

    SECTION("generation") {
        logger_adapter::log_rota_generated("2024-03-04", 7, 2, 1, "planner");
        auto lines = read_lines(fixture.audit_path());
        REQUIRE(lines.size() == 1);
        CHECK(contains(lines[0], "\"event_type\":\"ROTA_GENERATED\""));
        CHECK(contains(lines[0], "\"outcome\":\"incomplete\""));
        CHECK(contains(lines[0], "\"gaps\":\"2\""));
        CHECK(contains(lines[0], "\"timestamp\":\""));
    }

    SECTION("publication and archive") {
        logger_adapter::log_rota_published("2024-03-04", "2024-03-04-1709539200000", 7,
                                           "Chief Pharmacist");
        logger_adapter::log_rota_archived("2024-03-04", 7);
        auto lines = read_lines(fixture.audit_path());
        REQUIRE(lines.size() == 2);
        CHECK(contains(lines[0], "\"published_set_id\":\"2024-03-04-1709539200000\""));
        CHECK(contains(lines[1], "\"event_type\":\"ROTA_ARCHIVED\""));
    }

    SECTION("partial reassignment") {
        logger_adapter::log_reassignment("week 2024-03-06", "s3", "s4", 6, 1);
        auto lines = read_lines(fixture.audit_path());
        REQUIRE(lines.size() == 1);
        CHECK(contains(lines[0], "\"event_type\":\"ROTA_REASSIGNED\""));
        CHECK(contains(lines[0], "\"outcome\":\"partial\""));
    }

    SECTION("rejections escape their reason") {
        logger_adapter::log_request_rejected("publish", "week \"2024-03-04\" is draft");
        auto lines = read_lines(fixture.audit_path());
        REQUIRE(lines.size() == 1);
        CHECK(contains(lines[0], "\"event_type\":\"REQUEST_REJECTED\""));
        CHECK(contains(lines[0], "week \\\"2024-03-04\\\" is draft"));
    }

    SECTION("retention events") {
        logger_adapter::log_drafts_swept("2024-01-04", 7, 7);
        logger_adapter::log_archives_deleted(3);
        auto lines = read_lines(fixture.audit_path());
        REQUIRE(lines.size() == 2);
        CHECK(contains(lines[0], "\"event_type\":\"DRAFTS_SWEPT\""));
        CHECK(contains(lines[1], "\"event_type\":\"ARCHIVES_DELETED\""));
    }
}

TEST_CASE("audit log can be disabled", "[logger_adapter][audit]") {
    auto config = quiet_config(create_temp_log_directory());
    config.enable_audit_log = false;
    logger_test_fixture fixture(config);

    logger_adapter::log_configuration_saved("2024-03-04", "planner");
    CHECK_FALSE(std::filesystem::exists(fixture.audit_path()));
}

/**
 * @file configuration_repository.cpp
 * @brief SQLite implementation of the rota configuration repository
 */

#include <rota/storage/configuration_repository.hpp>

#include "sqlite_helpers.hpp"

#include <cctype>
#include <sstream>

namespace rota::storage {

using detail::get_optional_timestamp;
using detail::get_text;
using detail::statement;

namespace {

void write_escaped(std::ostringstream& oss, std::string_view text) {
    oss << "\"";
    for (char c : text) {
        if (c == '"') oss << "\\\"";
        else if (c == '\\') oss << "\\\\";
        else oss << c;
    }
    oss << "\"";
}

/// Reads a quoted string starting at json[pos] == '"'; pos ends past it
auto read_quoted(std::string_view json, std::size_t& pos) -> std::string {
    std::string value;
    ++pos;
    while (pos < json.size() && json[pos] != '"') {
        if (json[pos] == '\\' && pos + 1 < json.size()) {
            ++pos;
        }
        value += json[pos];
        ++pos;
    }
    ++pos;
    return value;
}

template <typename Index>
void write_numbers(std::ostringstream& oss, const std::set<Index>& values) {
    oss << "[";
    bool first = true;
    for (auto v : values) {
        if (!first) oss << ",";
        first = false;
        oss << v;
    }
    oss << "]";
}

/// Reads "[1,2,3]" starting at the '['; pos ends past the ']'
template <typename Index>
auto read_numbers(std::string_view json, std::size_t& pos) -> std::set<Index> {
    std::set<Index> values;
    ++pos;
    Index current = 0;
    bool in_number = false;
    while (pos < json.size() && json[pos] != ']') {
        auto c = static_cast<unsigned char>(json[pos]);
        if (std::isdigit(c)) {
            current = static_cast<Index>(current * 10 + (c - '0'));
            in_number = true;
        } else if (in_number) {
            values.insert(current);
            current = 0;
            in_number = false;
        }
        ++pos;
    }
    if (in_number) values.insert(current);
    ++pos;
    return values;
}

/// Reads the fields of one {"weekday":1,"start":"09:00","end":"12:00"} entry
auto read_rule(std::string_view body) -> std::optional<engine::unavailability_rule> {
    std::optional<unsigned> weekday;
    std::optional<core::time_of_day> start;
    std::optional<core::time_of_day> end;
    std::size_t pos = 0;
    while ((pos = body.find('"', pos)) != std::string_view::npos) {
        auto name = read_quoted(body, pos);
        pos = body.find(':', pos);
        if (pos == std::string_view::npos) break;
        ++pos;
        while (pos < body.size() && body[pos] == ' ') ++pos;
        if (pos < body.size() && body[pos] == '"') {
            auto value = read_quoted(body, pos);
            if (name == "start") start = core::time_of_day::parse(value);
            if (name == "end") end = core::time_of_day::parse(value);
            continue;
        }
        unsigned number = 0;
        bool any = false;
        while (pos < body.size() && std::isdigit(static_cast<unsigned char>(body[pos]))) {
            number = number * 10 + static_cast<unsigned>(body[pos] - '0');
            any = true;
            ++pos;
        }
        if (name == "weekday" && any) weekday = number;
    }
    if (!weekday || *weekday > 6 || !start || !end) {
        return std::nullopt;
    }
    return engine::unavailability_rule{std::chrono::weekday{*weekday},
                                       core::time_window{*start, *end}};
}

}  // namespace

configuration_repository::configuration_repository(sqlite3* db) : db_(db) {}

// =============================================================================
// JSON Serialization (Simple Implementation)
// =============================================================================

auto configuration_repository::serialize_strings(
    const std::vector<std::string>& values) -> std::string {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ",";
        write_escaped(oss, values[i]);
    }
    oss << "]";
    return oss.str();
}

auto configuration_repository::deserialize_strings(std::string_view json)
    -> std::vector<std::string> {
    std::vector<std::string> result;
    std::size_t pos = 0;
    while (pos < json.size()) {
        pos = json.find('"', pos);
        if (pos == std::string_view::npos) break;
        result.push_back(read_quoted(json, pos));
    }
    return result;
}

template <typename Index>
auto configuration_repository::serialize_index_map(
    const std::map<std::string, std::set<Index>>& values) -> std::string {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, indices] : values) {
        if (!first) oss << ",";
        first = false;
        write_escaped(oss, key);
        oss << ":";
        write_numbers(oss, indices);
    }
    oss << "}";
    return oss.str();
}

template <typename Index>
auto configuration_repository::deserialize_index_map(std::string_view json)
    -> std::map<std::string, std::set<Index>> {
    std::map<std::string, std::set<Index>> result;
    std::size_t pos = 0;
    while (pos < json.size()) {
        pos = json.find('"', pos);
        if (pos == std::string_view::npos) break;
        auto key = read_quoted(json, pos);
        pos = json.find('[', pos);
        if (pos == std::string_view::npos) break;
        result[key] = read_numbers<Index>(json, pos);
    }
    return result;
}

template auto configuration_repository::serialize_index_map<unsigned>(
    const std::map<std::string, std::set<unsigned>>&) -> std::string;
template auto configuration_repository::serialize_index_map<std::size_t>(
    const std::map<std::string, std::set<std::size_t>>&) -> std::string;
template auto configuration_repository::deserialize_index_map<unsigned>(
    std::string_view) -> std::map<std::string, std::set<unsigned>>;
template auto configuration_repository::deserialize_index_map<std::size_t>(
    std::string_view) -> std::map<std::string, std::set<std::size_t>>;

auto configuration_repository::serialize_rule_map(
    const std::map<std::string, std::vector<engine::unavailability_rule>>& values)
    -> std::string {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, rules] : values) {
        if (!first) oss << ",";
        first = false;
        write_escaped(oss, key);
        oss << ":[";
        for (std::size_t i = 0; i < rules.size(); ++i) {
            if (i > 0) oss << ",";
            oss << "{\"weekday\":" << rules[i].weekday.c_encoding()
                << ",\"start\":\"" << rules[i].window.start.to_string()
                << "\",\"end\":\"" << rules[i].window.end.to_string() << "\"}";
        }
        oss << "]";
    }
    oss << "}";
    return oss.str();
}

auto configuration_repository::deserialize_rule_map(std::string_view json)
    -> std::map<std::string, std::vector<engine::unavailability_rule>> {
    std::map<std::string, std::vector<engine::unavailability_rule>> result;
    std::size_t pos = json.find('{');
    if (pos == std::string_view::npos) return result;
    ++pos;
    while (pos < json.size()) {
        pos = json.find('"', pos);
        if (pos == std::string_view::npos) break;
        auto key = read_quoted(json, pos);
        auto open = json.find('[', pos);
        if (open == std::string_view::npos) break;
        auto close = json.find(']', open);
        if (close == std::string_view::npos) break;

        auto& rules = result[key];
        auto entries = json.substr(open + 1, close - open - 1);
        std::size_t entry = 0;
        while ((entry = entries.find('{', entry)) != std::string_view::npos) {
            auto entry_end = entries.find('}', entry);
            if (entry_end == std::string_view::npos) break;
            if (auto rule = read_rule(entries.substr(entry + 1, entry_end - entry - 1))) {
                rules.push_back(*rule);
            }
            entry = entry_end + 1;
        }
        pos = close + 1;
    }
    return result;
}

// =============================================================================
// Persistence
// =============================================================================

auto configuration_repository::save(const rota_configuration& config)
    -> VoidResult {
    if (!config.week_start.ok() || !core::is_week_start(config.week_start)) {
        return rota_void_error(error_codes::invalid_week_start,
                               "Configuration week must start on a Monday");
    }

    statement stmt(db_, R"(
        INSERT INTO rota_configurations (
            week_start, staff_ids, clinic_ids, weekdays, working_days,
            ignored_rules, last_modified, last_modified_by, generated_at,
            is_generated, extra_unavailability
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(week_start) DO UPDATE SET
            staff_ids = excluded.staff_ids,
            clinic_ids = excluded.clinic_ids,
            weekdays = excluded.weekdays,
            working_days = excluded.working_days,
            ignored_rules = excluded.ignored_rules,
            extra_unavailability = excluded.extra_unavailability,
            last_modified = excluded.last_modified,
            last_modified_by = excluded.last_modified_by,
            generated_at = COALESCE(excluded.generated_at,
                                    rota_configurations.generated_at),
            is_generated = MAX(rota_configurations.is_generated,
                               excluded.is_generated);
    )");
    if (!stmt.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare configuration save failed"));
    }

    std::ostringstream weekdays;
    write_numbers(weekdays, config.weekdays);

    stmt.bind(1, core::format_date(config.week_start));
    stmt.bind(2, serialize_strings(config.staff_ids));
    stmt.bind(3, serialize_strings(config.clinic_ids));
    stmt.bind(4, weekdays.str());
    stmt.bind(5, serialize_index_map(config.working_days_override));
    stmt.bind(6, serialize_index_map(config.ignored_rules));
    stmt.bind(7, core::to_iso8601(config.last_modified));
    stmt.bind(8, config.last_modified_by);
    if (config.generated_at) {
        stmt.bind(9, core::to_iso8601(*config.generated_at));
    } else {
        stmt.bind_null(9);
    }
    stmt.bind_int(10, config.is_generated ? 1 : 0);
    stmt.bind(11, serialize_rule_map(config.extra_unavailability));

    if (stmt.step() != SQLITE_DONE) {
        return VoidResult(detail::query_error(db_, "Configuration save failed"));
    }
    return ok();
}

auto configuration_repository::mark_generated(
    const core::date& week_start, std::chrono::system_clock::time_point at)
    -> VoidResult {
    statement stmt(db_,
                   "UPDATE rota_configurations SET is_generated = 1, "
                   "generated_at = ? WHERE week_start = ?;");
    if (!stmt.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare mark generated failed"));
    }
    stmt.bind(1, core::to_iso8601(at));
    stmt.bind(2, core::format_date(week_start));
    if (stmt.step() != SQLITE_DONE) {
        return VoidResult(detail::query_error(db_, "Mark generated failed"));
    }
    if (sqlite3_changes(db_) == 0) {
        return rota_void_error(error_codes::configuration_not_found,
                               "No configuration for week",
                               core::format_date(week_start));
    }
    return ok();
}

auto configuration_repository::find(const core::date& week_start) const
    -> std::optional<rota_configuration> {
    statement stmt(db_,
                   "SELECT week_start, staff_ids, clinic_ids, weekdays, "
                   "working_days, ignored_rules, last_modified, "
                   "last_modified_by, generated_at, is_generated, "
                   "extra_unavailability "
                   "FROM rota_configurations WHERE week_start = ?;");
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bind(1, core::format_date(week_start));
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }

    auto* s = stmt.get();
    rota_configuration config;
    config.week_start = week_start;
    config.staff_ids = deserialize_strings(get_text(s, 1));
    config.clinic_ids = deserialize_strings(get_text(s, 2));

    auto weekdays = get_text(s, 3);
    std::size_t pos = weekdays.find('[');
    if (pos != std::string::npos) {
        config.weekdays = read_numbers<unsigned>(weekdays, pos);
    }
    config.working_days_override = deserialize_index_map<unsigned>(get_text(s, 4));
    config.ignored_rules = deserialize_index_map<std::size_t>(get_text(s, 5));
    config.last_modified = get_optional_timestamp(s, 6).value_or(
        std::chrono::system_clock::time_point{});
    config.last_modified_by = get_text(s, 7);
    config.generated_at = get_optional_timestamp(s, 8);
    config.is_generated = sqlite3_column_int(s, 9) != 0;
    config.extra_unavailability = deserialize_rule_map(get_text(s, 10));
    return config;
}

auto configuration_repository::remove(const core::date& week_start) -> VoidResult {
    statement stmt(db_, "DELETE FROM rota_configurations WHERE week_start = ?;");
    if (!stmt.ok()) {
        return VoidResult(detail::query_error(db_, "Prepare delete failed"));
    }
    stmt.bind(1, core::format_date(week_start));
    if (stmt.step() != SQLITE_DONE) {
        return VoidResult(detail::query_error(db_, "Delete configuration failed"));
    }
    return ok();
}

auto configuration_repository::list_weeks() const -> std::vector<core::date> {
    std::vector<core::date> weeks;
    statement stmt(db_,
                   "SELECT week_start FROM rota_configurations ORDER BY week_start;");
    if (!stmt.ok()) {
        return weeks;
    }
    while (stmt.step() == SQLITE_ROW) {
        if (auto d = core::parse_date(get_text(stmt.get(), 0))) {
            weeks.push_back(*d);
        }
    }
    return weeks;
}

}  // namespace rota::storage

/**
 * @file rota_document.hpp
 * @brief Per-date rota document, its lifecycle status and cell overrides
 */

#pragma once

#include <rota/core/calendar.hpp>
#include <rota/engine/assignment.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rota::engine {

/**
 * @brief Status of one rota document
 *
 * @code
 *    generate                publish               archive
 *  ───────────▶ ┌───────┐ ──────────▶ ┌───────────┐ ──────────▶ ┌──────────┐
 *               │ DRAFT │             │ PUBLISHED │             │ ARCHIVED │
 *               └───┬───┘             └───────────┘             └──────────┘
 *                   │ older than retention window
 *                   ▼
 *                deleted by the stale-draft sweep
 * @endcode
 *
 * ARCHIVED is final. There is no way back from PUBLISHED to DRAFT.
 */
enum class rota_status {
    draft,
    published,
    archived
};

[[nodiscard]] auto to_string(rota_status status) -> std::string;

[[nodiscard]] auto parse_rota_status(std::string_view str)
    -> std::optional<rota_status>;

/**
 * @brief Provenance stamped when a week is published
 */
struct publication_info {
    std::string published_by;
    std::chrono::system_clock::time_point published_at;

    /// Human-readable stamp shown on the printed rota ("17/10/2026")
    std::string publish_date;

    /// Human-readable stamp shown on the printed rota ("09:30")
    std::string publish_time;

    /// Shared by all documents published together ("<week>-<epoch ms>")
    std::string published_set_id;
};

/**
 * @brief Composite key of a free-text cell override
 *
 * Rendered as "type-location-YYYY-MM-DD-start-end", or
 * "unavailable-YYYY-MM-DD-start-end" for whole-day notes. The location may
 * itself contain hyphens, so parsing works from both ends of the string.
 */
struct cell_key {
    std::string cell_type;
    std::string location;
    core::date date;
    std::string start;
    std::string end;

    [[nodiscard]] auto is_unavailable_note() const -> bool {
        return cell_type == "unavailable";
    }

    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] static auto parse(std::string_view text)
        -> std::optional<cell_key>;

    auto operator<=>(const cell_key& other) const {
        if (auto c = cell_type <=> other.cell_type; c != 0) return c;
        if (auto c = location <=> other.location; c != 0) return c;
        if (auto c = std::chrono::sys_days{date} <=>
                     std::chrono::sys_days{other.date};
            c != 0) {
            return c;
        }
        if (auto c = start <=> other.start; c != 0) return c;
        return end <=> other.end;
    }

    bool operator==(const cell_key&) const = default;
};

/**
 * @brief All assignments for one calendar date
 */
struct rota_document {
    /// Primary key (0 until stored)
    std::int64_t id{0};

    core::date date;

    /// Monday of the week this document belongs to
    core::date week_start;

    rota_status status{rota_status::draft};

    std::vector<assignment> assignments;
    std::vector<coverage_target> targets;
    std::vector<conflict> conflicts;

    std::string generated_by;
    std::chrono::system_clock::time_point generated_at;

    /// Weekdays (c_encoding) selected when the week was generated
    std::set<unsigned> included_weekdays;

    std::optional<publication_info> publication;

    std::optional<std::chrono::system_clock::time_point> last_edited;

    std::map<cell_key, std::string> cell_text;

    [[nodiscard]] auto is_editable() const noexcept -> bool {
        return status != rota_status::archived;
    }

    [[nodiscard]] auto has_errors() const -> bool;
};

}  // namespace rota::engine

/**
 * @file reassignment_service.hpp
 * @brief Replaces one staff member with another in stored rotas
 *
 * Reassignment is the only way to change a published rota. Every edited
 * document has its conflicts re-derived before it is written back, and
 * the caller receives the stored rows so it can drop any local copy.
 */

#pragma once

#include <rota/core/calendar.hpp>
#include <rota/core/result.hpp>
#include <rota/engine/conflict_detector.hpp>
#include <rota/engine/engine_config.hpp>
#include <rota/engine/reference_data.hpp>
#include <rota/engine/rota_document.hpp>
#include <rota/storage/rota_database.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rota::workflow {

/**
 * @brief How far a reassignment reaches
 */
enum class reassignment_scope {
    slot,  ///< One time slot at one location
    day,   ///< Every row of the staff member on one date
    week   ///< Every row of the staff member across the week
};

[[nodiscard]] auto to_string(reassignment_scope scope) -> std::string;

[[nodiscard]] auto parse_reassignment_scope(std::string_view str)
    -> std::optional<reassignment_scope>;

struct reassignment_request {
    /// Known document ids; dates missing here are looked up by date
    std::map<core::date, std::int64_t> rota_ids_by_date;

    /// Restricts day and week scope; required to pick a slot
    std::optional<std::string> location;

    core::date date;

    /// Slot scope only
    std::optional<core::time_of_day> start_time;
    std::optional<core::time_of_day> end_time;

    std::string original_staff_id;

    /// Empty leaves the rows as open gaps
    std::optional<std::string> new_staff_id;

    reassignment_scope scope{reassignment_scope::slot};

    /// Refuse day and week moves that would break up a continuity block
    bool respect_special_continuity{true};

    std::string requested_by;
};

/**
 * @brief Result of editing one document
 */
struct date_outcome {
    core::date date;
    std::int64_t rota_id{0};
    bool success{false};
    std::size_t rows_changed{0};
    std::optional<error_info> error;
};

struct reassignment_result {
    /// False when any date failed
    bool success{false};

    /// Stored rows of every document that was written
    std::vector<engine::assignment> updated_assignments;

    /// One entry per document touched, in date order
    std::vector<date_outcome> outcomes;
};

/**
 * @brief One side of a swap
 */
struct slot_ref {
    core::date date;
    std::string location;
    core::time_window window;

    /// Empty for an open slot
    std::optional<std::string> staff_id;
};

struct swap_request {
    std::map<core::date, std::int64_t> rota_ids_by_date;
    slot_ref source;
    slot_ref target;
    reassignment_scope scope{reassignment_scope::slot};
    bool respect_special_continuity{true};
    std::string requested_by;
};

class reassignment_service {
public:
    reassignment_service(storage::rota_database& db,
                         engine::reference_data_source& reference_data,
                         engine::engine_config config = {});

    /**
     * @brief Move rows from one staff member to another (or to nobody)
     *
     * Slot and day scope fail as a whole. Week scope edits each date on its
     * own: dates already written stay written when a later date fails, and
     * the failure is reported in that date's outcome.
     *
     * A slot request finer than the stored row splits the row first, so
     * the untouched part keeps its staff and bounds.
     *
     * The new staff member is refused with overlapping_assignment or
     * do_not_split_violation when the moved rows clash with duties they
     * already hold that day; the date is then left unchanged.
     */
    [[nodiscard]] auto reassign(const reassignment_request& request,
                                std::chrono::system_clock::time_point now =
                                    std::chrono::system_clock::now())
        -> Result<reassignment_result>;

    /**
     * @brief Exchange the occupants of two slots
     *
     * Runs as two reassignments, source first. When the target slot is
     * open the source is vacated and the source staff member takes the
     * target slot, reusing an open row there or adding one.
     *
     * A failure of the first step is returned as an error and nothing is
     * written. A failure of the second step leaves the first in place and
     * is reported with success set to false.
     */
    [[nodiscard]] auto swap(const swap_request& request,
                            std::chrono::system_clock::time_point now =
                                std::chrono::system_clock::now())
        -> Result<reassignment_result>;

private:
    struct edit_context {
        const engine::reference_snapshot* snapshot{nullptr};

        /// Rows here held by the incoming staff member are being swapped out
        std::optional<std::string> swapped_location;
    };

    [[nodiscard]] auto validate(const reassignment_request& request,
                                const engine::reference_snapshot& snapshot) const
        -> VoidResult;

    [[nodiscard]] auto resolve_document(
        const std::map<core::date, std::int64_t>& rota_ids_by_date,
        const core::date& date) const -> Result<engine::rota_document>;

    /**
     * @brief Refuse a staff member who cannot take @p incoming on this date
     *
     * Overlapping rows are allowed only when both are split-shareable.
     * A do-not-split duty excludes every other duty that day. Rows at the
     * context's swapped location are ignored.
     */
    [[nodiscard]] auto check_occupant(const engine::rota_document& doc,
                                      const std::string& staff_id,
                                      const std::vector<engine::assignment>& incoming,
                                      const edit_context& context) const
        -> VoidResult;

    [[nodiscard]] auto apply_slot(engine::rota_document& doc,
                                  const reassignment_request& request,
                                  const edit_context& context) const
        -> Result<std::size_t>;

    [[nodiscard]] auto apply_rows(engine::rota_document& doc,
                                  const reassignment_request& request,
                                  const edit_context& context) const
        -> Result<std::size_t>;

    [[nodiscard]] auto occupy(engine::rota_document& doc, const slot_ref& slot,
                              const std::string& staff_id,
                              const edit_context& context) const
        -> Result<std::size_t>;

    /// Edit one date and write it back
    [[nodiscard]] auto edit_date(const reassignment_request& request,
                                 const core::date& date,
                                 const edit_context& context,
                                 std::chrono::system_clock::time_point now,
                                 reassignment_result& result) -> date_outcome;

    [[nodiscard]] auto commit(engine::rota_document& doc,
                              const engine::reference_snapshot& snapshot,
                              std::chrono::system_clock::time_point now) -> VoidResult;

    [[nodiscard]] auto run(const reassignment_request& request,
                           const edit_context& context,
                           std::chrono::system_clock::time_point now)
        -> Result<reassignment_result>;

    storage::rota_database& db_;
    engine::reference_data_source& reference_data_;
    engine::engine_config config_;
};

}  // namespace rota::workflow

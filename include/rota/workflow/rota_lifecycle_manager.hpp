/**
 * @file rota_lifecycle_manager.hpp
 * @brief Week-level lifecycle: configuring, draft, published, archived
 *
 * @code
 *  configuring ──generate──▶ draft ──publish──▶ published ──archive──▶ archived
 *       ▲                      │
 *       └──── drafts cleared ──┘   (drafts past retention are swept)
 * @endcode
 *
 * There is no transition from published back to draft. Published rotas
 * change only through the reassignment service.
 */

#pragma once

#include <rota/core/calendar.hpp>
#include <rota/core/result.hpp>
#include <rota/engine/rota_document.hpp>
#include <rota/storage/rota_database.hpp>
#include <rota/workflow/lifecycle_config.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rota::workflow {

enum class week_state {
    empty,        ///< Nothing stored for the week
    configuring,  ///< Configuration saved, no documents
    draft,
    published,
    archived
};

[[nodiscard]] auto to_string(week_state state) -> std::string;

class rota_lifecycle_manager {
public:
    explicit rota_lifecycle_manager(storage::rota_database& db,
                                    lifecycle_config config = {});

    [[nodiscard]] auto state_of(const core::date& week_start) const -> week_state;

    /**
     * @brief Publish every draft of a week under one published set id
     *
     * Fails with invalid_transition when the week has no drafts.
     */
    [[nodiscard]] auto publish(const core::date& week_start,
                               const std::string& published_by,
                               std::chrono::system_clock::time_point now =
                                   std::chrono::system_clock::now())
        -> Result<engine::publication_info>;

    /// Archive every published document of a week
    [[nodiscard]] auto archive_week(const core::date& week_start)
        -> Result<std::size_t>;

    /// Archive one published document; the rest of its week is untouched
    [[nodiscard]] auto archive_document(std::int64_t rota_id) -> VoidResult;

    /// today minus the retention window
    [[nodiscard]] auto retention_cutoff(const core::date& today) const -> core::date;

    /**
     * @brief Delete drafts older than the retention window
     *
     * Unconditional and irreversible. Published and archived documents
     * are never affected.
     */
    [[nodiscard]] auto sweep_stale_drafts(const core::date& today)
        -> Result<storage::sweep_result>;

    /**
     * @brief Permanently delete archived documents
     * @param confirmation Must equal lifecycle_config::deletion_confirmation
     */
    [[nodiscard]] auto delete_archived(std::string_view confirmation,
                                       const std::optional<core::date>& week_start,
                                       const std::optional<core::date>& before)
        -> Result<std::size_t>;

    /**
     * @brief Set (or clear with empty text) one free-text cell of a draft
     */
    [[nodiscard]] auto set_cell_text(std::int64_t rota_id,
                                     const engine::cell_key& key,
                                     const std::string& text) -> VoidResult;

    /**
     * @brief Replace a draft's free-text cells from presentation-layer keys
     *
     * Keys use the "type-location-YYYY-MM-DD-start-end" encoding.
     */
    [[nodiscard]] auto save_cell_text(std::int64_t rota_id,
                                      const std::map<std::string, std::string>& cells)
        -> VoidResult;

    [[nodiscard]] auto config() const noexcept -> const lifecycle_config& {
        return config_;
    }

private:
    [[nodiscard]] auto load_draft(std::int64_t rota_id) const
        -> Result<engine::rota_document>;

    storage::rota_database& db_;
    lifecycle_config config_;
};

}  // namespace rota::workflow

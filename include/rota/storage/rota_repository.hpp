/**
 * @file rota_repository.hpp
 * @brief SQLite persistence for rota documents
 *
 * A document and its child rows (assignments, targets, conflicts, cell
 * text) are written in one transaction, so each date is updated
 * atomically. Multi-date operations are not wrapped in a single
 * transaction unless stated.
 *
 * Thread Safety: NOT thread-safe.
 */

#pragma once

#include <rota/core/calendar.hpp>
#include <rota/core/result.hpp>
#include <rota/engine/rota_document.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace rota::storage {

/**
 * @brief Outcome of a stale-draft sweep
 */
struct sweep_result {
    std::size_t total_found{0};
    std::size_t deleted{0};
};

class rota_repository {
public:
    explicit rota_repository(sqlite3* db);

    rota_repository(const rota_repository&) = delete;
    auto operator=(const rota_repository&) -> rota_repository& = delete;
    rota_repository(rota_repository&&) noexcept = default;
    auto operator=(rota_repository&&) noexcept -> rota_repository& = default;

    /**
     * @brief Store a new document
     * @return The assigned primary key
     */
    [[nodiscard]] auto insert(const engine::rota_document& doc)
        -> Result<std::int64_t>;

    /**
     * @brief Overwrite an existing document and all of its child rows
     *
     * Last write wins; there is no version check.
     */
    [[nodiscard]] auto save(const engine::rota_document& doc) -> VoidResult;

    /**
     * @brief Load one document with its child rows
     *
     * Every read below skips a document whose rows cannot be read in
     * full, so a corrupted date is never handed out for editing.
     */
    [[nodiscard]] auto find_by_id(std::int64_t id) const
        -> std::optional<engine::rota_document>;

    [[nodiscard]] auto find_by_date(const core::date& date) const
        -> std::vector<engine::rota_document>;

    /// Documents of a week, ordered by date
    [[nodiscard]] auto find_by_week(
        const core::date& week_start,
        std::optional<engine::rota_status> status = std::nullopt) const
        -> std::vector<engine::rota_document>;

    [[nodiscard]] auto find_by_status(engine::rota_status status) const
        -> std::vector<engine::rota_document>;

    [[nodiscard]] auto find_by_published_set(const std::string& set_id) const
        -> std::vector<engine::rota_document>;

    [[nodiscard]] auto update_status(std::int64_t id, engine::rota_status status)
        -> VoidResult;

    /**
     * @brief Publish every draft of a week in one statement
     * @return Number of documents published
     */
    [[nodiscard]] auto mark_week_published(const core::date& week_start,
                                           const engine::publication_info& info)
        -> Result<std::size_t>;

    /// Published documents of a week become archived
    [[nodiscard]] auto archive_week(const core::date& week_start)
        -> Result<std::size_t>;

    [[nodiscard]] auto delete_drafts_for_week(const core::date& week_start)
        -> Result<std::size_t>;

    /**
     * @brief Delete drafts dated before @p cutoff
     *
     * Published and archived documents are never touched.
     */
    [[nodiscard]] auto delete_stale_drafts(const core::date& cutoff)
        -> Result<sweep_result>;

    /**
     * @brief Delete archived documents
     *
     * With no filter every archived document goes.
     */
    [[nodiscard]] auto delete_archived(
        const std::optional<core::date>& week_start,
        const std::optional<core::date>& before) -> Result<std::size_t>;

    /**
     * @brief Set or clear (empty @p text) one free-text cell
     */
    [[nodiscard]] auto set_cell_text(std::int64_t id, const engine::cell_key& key,
                                     const std::string& text) -> VoidResult;

    [[nodiscard]] auto count() const -> std::size_t;

    [[nodiscard]] auto count_by_status(engine::rota_status status) const
        -> std::size_t;

    [[nodiscard]] auto is_valid() const noexcept -> bool { return db_ != nullptr; }

private:
    [[nodiscard]] auto query_documents(const std::string& where_clause,
                                       const std::vector<std::string>& params) const
        -> std::vector<engine::rota_document>;

    /// Fails with serialization_error on a child row that does not parse
    [[nodiscard]] auto load_children(engine::rota_document& doc) const
        -> VoidResult;

    [[nodiscard]] auto write_children(const engine::rota_document& doc)
        -> VoidResult;

    [[nodiscard]] auto execute_delete(const std::string& where_clause,
                                      const std::vector<std::string>& params)
        -> Result<std::size_t>;

    sqlite3* db_{nullptr};
};

}  // namespace rota::storage

/**
 * @file configuration_repository.hpp
 * @brief SQLite persistence for rota configurations
 */

#pragma once

#include <rota/core/calendar.hpp>
#include <rota/core/result.hpp>
#include <rota/storage/rota_configuration.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace rota::storage {

class configuration_repository {
public:
    explicit configuration_repository(sqlite3* db);

    configuration_repository(const configuration_repository&) = delete;
    auto operator=(const configuration_repository&)
        -> configuration_repository& = delete;
    configuration_repository(configuration_repository&&) noexcept = default;
    auto operator=(configuration_repository&&) noexcept
        -> configuration_repository& = default;

    /**
     * @brief Insert or update the configuration of a week
     *
     * is_generated never goes from true back to false, and an existing
     * generated_at is kept when @p config carries none.
     */
    [[nodiscard]] auto save(const rota_configuration& config) -> VoidResult;

    /// Flag the week as generated at @p at
    [[nodiscard]] auto mark_generated(const core::date& week_start,
                                      std::chrono::system_clock::time_point at)
        -> VoidResult;

    [[nodiscard]] auto find(const core::date& week_start) const
        -> std::optional<rota_configuration>;

    [[nodiscard]] auto remove(const core::date& week_start) -> VoidResult;

    [[nodiscard]] auto list_weeks() const -> std::vector<core::date>;

    [[nodiscard]] auto is_valid() const noexcept -> bool { return db_ != nullptr; }

    // JSON encoding of the list and map columns

    [[nodiscard]] static auto serialize_strings(const std::vector<std::string>& values)
        -> std::string;
    [[nodiscard]] static auto deserialize_strings(std::string_view json)
        -> std::vector<std::string>;

    template <typename Index>
    [[nodiscard]] static auto serialize_index_map(
        const std::map<std::string, std::set<Index>>& values) -> std::string;

    template <typename Index>
    [[nodiscard]] static auto deserialize_index_map(std::string_view json)
        -> std::map<std::string, std::set<Index>>;

    /// {"s1":[{"weekday":1,"start":"09:00","end":"12:00"}]}
    [[nodiscard]] static auto serialize_rule_map(
        const std::map<std::string, std::vector<engine::unavailability_rule>>& values)
        -> std::string;
    [[nodiscard]] static auto deserialize_rule_map(std::string_view json)
        -> std::map<std::string, std::vector<engine::unavailability_rule>>;

private:
    sqlite3* db_{nullptr};
};

}  // namespace rota::storage

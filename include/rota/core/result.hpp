/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for the rota engine
 *
 * Wraps common_system's Result pattern and defines the engine's error
 * taxonomy. Multi-date partial failures are not errors; they are reported
 * as per-date outcome lists by the operations that produce them.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace rota {

/**
 * @brief Result type alias for rota operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief Rota-specific error codes
 *
 * Error code range: -900 to -999
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int rota_base = -900;

    // Request precondition errors (-900 to -919)
    constexpr int precondition_failed = rota_base - 0;
    constexpr int no_staff_selected = rota_base - 1;
    constexpr int no_weekday_selected = rota_base - 2;
    constexpr int invalid_week_start = rota_base - 3;
    constexpr int invalid_date = rota_base - 4;
    constexpr int invalid_time = rota_base - 5;
    constexpr int invalid_cell_key = rota_base - 6;
    constexpr int confirmation_required = rota_base - 7;

    // Lookup errors (-920 to -929)
    constexpr int rota_not_found = rota_base - 20;
    constexpr int staff_not_found = rota_base - 21;
    constexpr int assignment_not_found = rota_base - 22;
    constexpr int configuration_not_found = rota_base - 23;

    // Lifecycle errors (-930 to -939)
    constexpr int invalid_transition = rota_base - 30;
    constexpr int immutable_document = rota_base - 31;
    constexpr int week_already_published = rota_base - 32;

    // Reassignment errors (-940 to -949)
    constexpr int stale_reference = rota_base - 40;
    constexpr int continuity_violation = rota_base - 41;
    constexpr int overlapping_assignment = rota_base - 42;
    constexpr int do_not_split_violation = rota_base - 43;

    // Storage errors (-980 to -999)
    constexpr int database_open_error = rota_base - 80;
    constexpr int database_query_error = rota_base - 81;
    constexpr int database_transaction_error = rota_base - 82;
    constexpr int database_migration_error = rota_base - 83;
    constexpr int serialization_error = rota_base - 84;
} // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a rota error result with module context
 * @tparam T The result value type
 * @param code Error code from rota::error_codes
 * @param message Error message
 * @param details Optional additional details
 */
template <typename T>
inline Result<T> rota_error(int code, const std::string& message,
                            const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "rota");
    }
    return kcenon::common::make_error<T>(code, message, "rota", details);
}

/**
 * @brief Create a rota void error result
 */
inline VoidResult rota_void_error(int code, const std::string& message,
                                  const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "rota"});
    }
    return VoidResult(error_info{code, message, "rota", details});
}

} // namespace rota

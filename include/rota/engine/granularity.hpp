/**
 * @file granularity.hpp
 * @brief Reconciles stored assignment rows with finer-grained edit requests
 */

#pragma once

#include <rota/engine/assignment.hpp>
#include <rota/engine/engine_config.hpp>

#include <vector>

namespace rota::engine {

/**
 * @brief Split @p row so that @p requested matches one resulting row exactly
 *
 * A full-day row edited within one half becomes the morning and afternoon
 * rows. Any other row containing @p requested is cut at the requested
 * boundaries. Every piece keeps the original staff, location and flags;
 * pieces are returned in time order.
 *
 * A row that already equals @p requested, or that does not contain it, is
 * returned unchanged as the only element.
 */
[[nodiscard]] auto normalize_granularity(const assignment& row,
                                         const core::time_window& requested,
                                         const engine_config& config = {})
    -> std::vector<assignment>;

}  // namespace rota::engine

/**
 * @file conflict_detector.hpp
 * @brief Audits a rota document for staffing and booking problems
 *
 * Rules:
 *   - filled cover below a target's minimum: error
 *   - below ideal but at or above minimum: warning
 *   - one staff member in two overlapping rows (unless both rows are
 *     split-shareable): error
 *   - staff placed outside their trained locations: warning
 *
 * Detection is pure and can be re-run after every edit.
 */

#pragma once

#include <rota/engine/engine_config.hpp>
#include <rota/engine/reference_data.hpp>
#include <rota/engine/rota_document.hpp>

#include <vector>

namespace rota::engine {

class conflict_detector {
public:
    /**
     * @param staff Staff directory used for the training audit
     * @param config Engine tunables
     */
    explicit conflict_detector(std::vector<staff_member> staff,
                               engine_config config = {});

    [[nodiscard]] auto detect(const rota_document& document) const
        -> std::vector<conflict>;

    /**
     * @brief Filled cover of a target
     *
     * The lowest number of filled rows at the target's location covering
     * any part of its window, so two half-day rows cover a full-day target
     * once.
     */
    [[nodiscard]] static auto coverage(const coverage_target& target,
                                       const std::vector<assignment>& rows)
        -> int;

private:
    void check_staffing(const rota_document& document,
                        std::vector<conflict>& out) const;
    void check_double_booking(const rota_document& document,
                              std::vector<conflict>& out) const;
    void check_training(const rota_document& document,
                        std::vector<conflict>& out) const;

    std::vector<staff_member> staff_;
    engine_config config_;
};

}  // namespace rota::engine

/**
 * @file lifecycle_config.hpp
 * @brief Retention and deletion settings for the rota lifecycle
 */

#pragma once

#include <string>

namespace rota::workflow {

struct lifecycle_config {
    /// Drafts dated earlier than this many months ago are swept
    int retention_months{2};

    /// Token that must accompany a request to delete archived rotas
    std::string deletion_confirmation{"CONFIRM_DELETE_ARCHIVED_ROTAS"};

    /// Formats for the human-readable publication stamp (strftime)
    std::string publish_date_format{"%d/%m/%Y"};
    std::string publish_time_format{"%H:%M"};
};

}  // namespace rota::workflow

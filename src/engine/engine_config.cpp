/**
 * @file engine_config.cpp
 */

#include <rota/engine/engine_config.hpp>

#include <algorithm>
#include <cctype>

namespace rota::engine {

namespace {

auto to_lower(std::string_view text) -> std::string {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

}  // namespace

auto engine_config::category_rank(std::string_view category) const -> int {
    auto needle = to_lower(category);
    for (size_t tier = 0; tier < category_tiers.size(); ++tier) {
        for (const auto& name : category_tiers[tier]) {
            if (to_lower(name) == needle) {
                return static_cast<int>(tier);
            }
        }
    }
    return static_cast<int>(category_tiers.size());
}

auto engine_config::is_continuity_sensitive(std::string_view location) const
    -> bool {
    auto haystack = to_lower(location);
    return std::any_of(continuity_locations.begin(), continuity_locations.end(),
                       [&](const std::string& name) {
                           return !name.empty() &&
                                  haystack.find(to_lower(name)) != std::string::npos;
                       });
}

}  // namespace rota::engine

/// @file cache_types.cpp
/// @brief Cache category names and the built-in policy table.

#include "sluice/service/cache_types.hpp"

namespace sluice::service {

std::optional<CacheCategory> parseCacheCategory(std::string_view name) {
    for (auto category : kAllCacheCategories) {
        if (toString(category) == name) {
            return category;
        }
    }
    return std::nullopt;
}

CachePolicyTable defaultCachePolicies() {
    using std::chrono::seconds;
    CachePolicyTable table;
    table[categoryIndex(CacheCategory::ModelResponse)] = CachePolicy{seconds(3600), 10000, 0.02};
    table[categoryIndex(CacheCategory::UserSession)] = CachePolicy{seconds(7200), 5000, 0.0};
    table[categoryIndex(CacheCategory::SystemData)] = CachePolicy{seconds(86400), 1000, 0.0};
    table[categoryIndex(CacheCategory::Embedding)] = CachePolicy{seconds(604800), 50000, 0.001};
    return table;
}

} // namespace sluice::service

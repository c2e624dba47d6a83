#include "catalog_types.hpp"
#include <algorithm>

namespace Catalog {

const char* health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Warning: return "warning";
        case HealthStatus::Error: return "error";
        case HealthStatus::Unknown: break;
    }
    return "unknown";
}

HealthStatus health_status_from_string(const std::string& value) {
    if (value == "healthy") return HealthStatus::Healthy;
    if (value == "warning") return HealthStatus::Warning;
    if (value == "error") return HealthStatus::Error;
    return HealthStatus::Unknown;
}

std::string kind_for_site_type(int type) {
    switch (type) {
        case 0: return "video";
        case 1: return "video_api";
        case 3: return "video_script";
        default: return "other";
    }
}

std::string category_display_name(const std::string& kind) {
    if (kind == "video") return "Video sites";
    if (kind == "video_api") return "API sources";
    if (kind == "video_script") return "Script sources";
    return "Other";
}

const AggregatedSiteEntry* AggregatedDirectory::find(const std::string& key) const {
    for (const auto& entry : sites) {
        if (entry.site.key == key) {
            return &entry;
        }
    }
    return nullptr;
}

std::vector<AggregatedSiteEntry> AggregatedDirectory::by_category(const std::string& category_id) const {
    std::vector<AggregatedSiteEntry> result;
    for (const auto& entry : sites) {
        if (entry.site.kind == category_id) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<CategoryInfo> build_categories(const std::vector<AggregatedSiteEntry>& sites) {
    std::vector<CategoryInfo> categories;

    for (const auto& entry : sites) {
        auto it = std::find_if(categories.begin(), categories.end(),
                               [&entry](const CategoryInfo& c) { return c.id == entry.site.kind; });
        if (it == categories.end()) {
            CategoryInfo category;
            category.id = entry.site.kind;
            category.name = category_display_name(entry.site.kind);
            categories.push_back(category);
            it = categories.end() - 1;
        }
        it->site_keys.push_back(entry.site.key);
    }

    std::stable_sort(categories.begin(), categories.end(),
                     [](const CategoryInfo& a, const CategoryInfo& b) {
                         if (a.site_keys.size() != b.site_keys.size()) {
                             return a.site_keys.size() > b.site_keys.size();
                         }
                         return a.id < b.id;
                     });
    return categories;
}

} // namespace Catalog

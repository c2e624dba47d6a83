#include "scorer.hpp"
#include <algorithm>

namespace Catalog {

namespace {

constexpr double kNeutralReliability = 0.5;

double clamp_unit(double value) {
    return std::clamp(value, 0.0, 1.0);
}

} // namespace

Scorer::Scorer(int history_window, double decay, int64_t staleness_threshold_ms)
    : history_window_(std::max(1, history_window))
    , decay_(decay)
    , staleness_threshold_ms_(std::max<int64_t>(1, staleness_threshold_ms)) {
}

double Scorer::reliability(const std::vector<FetchRecord>& history) const {
    if (history.empty()) {
        return kNeutralReliability;
    }

    double weighted = 0.0;
    double total = 0.0;
    double weight = 1.0;

    int counted = 0;
    for (auto it = history.rbegin(); it != history.rend() && counted < history_window_; ++it, ++counted) {
        if (it->success) {
            weighted += weight;
        }
        total += weight;
        weight *= decay_;
    }

    return clamp_unit(weighted / total);
}

double Scorer::freshness(std::vector<int64_t> entry_ages_ms) const {
    if (entry_ages_ms.empty()) {
        return 1.0;
    }

    std::sort(entry_ages_ms.begin(), entry_ages_ms.end());
    size_t mid = entry_ages_ms.size() / 2;
    double median = static_cast<double>(entry_ages_ms[mid]);
    if (entry_ages_ms.size() % 2 == 0) {
        median = (static_cast<double>(entry_ages_ms[mid - 1]) + median) / 2.0;
    }

    if (median <= static_cast<double>(staleness_threshold_ms_)) {
        return 1.0;
    }
    return clamp_unit(static_cast<double>(staleness_threshold_ms_) / median);
}

Score Scorer::score(const std::vector<FetchRecord>& history,
                    const std::vector<int64_t>& entry_ages_ms) const {
    Score result;
    result.reliability = reliability(history);
    result.quality = clamp_unit(result.reliability * freshness(entry_ages_ms));
    return result;
}

Score Scorer::score(const ConfigSource& source, const CatalogFragment& fragment, int64_t now) const {
    return score(source.history, entry_ages(fragment, now));
}

std::vector<int64_t> Scorer::entry_ages(const CatalogFragment& fragment, int64_t now) {
    std::vector<int64_t> ages;
    ages.reserve(fragment.sites.size());
    for (const auto& site : fragment.sites) {
        int64_t stamp = site.updated_at.value_or(fragment.fetched_at);
        ages.push_back(std::max<int64_t>(0, now - stamp));
    }
    return ages;
}

} // namespace Catalog

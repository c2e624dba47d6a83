#pragma once

#include "catalog_types.hpp"
#include <cstdint>
#include <vector>

namespace Catalog {

struct Score {
    double quality = 0.0;
    double reliability = 0.0;
};

/**
 * Source quality and reliability scoring. Stateless.
 *
 * Reliability is the success rate over the last history_window fetches,
 * the most recent weighted 1 and each older one multiplied by decay.
 * Quality is reliability scaled down when the median entry age exceeds
 * the staleness threshold.
 */
class Scorer {
public:
    Scorer(int history_window, double decay, int64_t staleness_threshold_ms);

    // history is oldest first
    double reliability(const std::vector<FetchRecord>& history) const;
    double freshness(std::vector<int64_t> entry_ages_ms) const;

    Score score(const std::vector<FetchRecord>& history,
                const std::vector<int64_t>& entry_ages_ms) const;

    /**
     * Score a source from its history and the ages of the sites in its
     * latest fragment, measured against now.
     */
    Score score(const ConfigSource& source, const CatalogFragment& fragment, int64_t now) const;

    static std::vector<int64_t> entry_ages(const CatalogFragment& fragment, int64_t now);

private:
    int history_window_;
    double decay_;
    int64_t staleness_threshold_ms_;
};

} // namespace Catalog

#include "cgloc/loc/FeatureFilter.hpp"

#include <algorithm>
#include <numeric>
#include <vector>

namespace cgloc {
namespace loc {

std::size_t dedupeFeatures(msg::FeatureTable& features, float min_separation) {
    const std::size_t n = features.size();
    if (n < 2 || !(min_separation > 0.0f)) {
        return 0;
    }

    // Visit order: descending mass, earlier index first on ties
    std::vector<std::size_t> by_mass(n);
    std::iota(by_mass.begin(), by_mass.end(), std::size_t(0));
    std::stable_sort(by_mass.begin(), by_mass.end(),
                     [&](std::size_t a, std::size_t b) {
                         return features[a].mass > features[b].mass;
                     });

    // Sweep index along x to limit the neighbour search
    std::vector<std::size_t> by_x(n);
    std::iota(by_x.begin(), by_x.end(), std::size_t(0));
    std::sort(by_x.begin(), by_x.end(),
              [&](std::size_t a, std::size_t b) {
                  return features[a].x < features[b].x;
              });

    const float sep2 = min_separation * min_separation;
    std::vector<bool> keep(n, true);

    for (std::size_t i : by_mass) {
        if (!keep[i]) continue;
        const msg::Feature& fi = features[i];

        auto lo = std::lower_bound(by_x.begin(), by_x.end(), fi.x - min_separation,
                                   [&](std::size_t k, float x) { return features[k].x < x; });

        for (auto it = lo; it != by_x.end(); ++it) {
            const std::size_t j = *it;
            const msg::Feature& fj = features[j];
            if (fj.x > fi.x + min_separation) break;
            if (j == i || !keep[j]) continue;

            const float dx = fj.x - fi.x;
            const float dy = fj.y - fi.y;
            if (dx * dx + dy * dy < sep2) {
                keep[j] = false;
            }
        }
    }

    msg::FeatureTable kept;
    kept.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (keep[i]) kept.push_back(features[i]);
    }

    const std::size_t removed = n - kept.size();
    features.swap(kept);
    return removed;
}

std::size_t filterByMass(msg::FeatureTable& features, float mass_thresh) {
    const std::size_t before = features.size();
    features.erase(std::remove_if(features.begin(), features.end(),
                                  [&](const msg::Feature& f) { return f.mass < mass_thresh; }),
                   features.end());
    return before - features.size();
}

} // namespace loc
} // namespace cgloc

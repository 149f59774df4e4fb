#pragma once
#include <cstddef>

#include "cgloc/msg/FeatureFrame.hpp"

namespace cgloc {
namespace loc {

// Collapse features closer than `min_separation` to each other, keeping the
// one with the larger mass (ties: the earlier one). Survivors keep their
// relative order. Returns the number of features removed.
std::size_t dedupeFeatures(msg::FeatureTable& features, float min_separation);

// Drop features with mass < mass_thresh. Returns the number removed.
std::size_t filterByMass(msg::FeatureTable& features, float mass_thresh);

} // namespace loc
} // namespace cgloc

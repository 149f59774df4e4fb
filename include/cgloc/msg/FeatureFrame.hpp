#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "cgloc/msg/ImageFrame.hpp"

namespace cgloc {
namespace msg {

// Pixel coords: origin = centre of the top-left pixel; x -> right, y -> down.

// One localized feature. Created once per converged candidate, never
// modified afterwards (the batch adapter only stamps `frame`).
struct Feature {
    float x    = 0.0f;      // column, sub-pixel
    float y    = 0.0f;      // row, sub-pixel
    float mass = 0.0f;      // background-subtracted intensity inside the disk (> 0)
    float size = 0.0f;      // radius of gyration about (x, y) [pixels] (>= 0)
    float ecc  = 0.0f;      // moment eccentricity, 0 = circular (0..1)

    int32_t frame = NO_FRAME;   // frame number, NO_FRAME for single-image results
};

// Canonical column order of a feature table. Downstream code indexes
// positionally, so this order is part of the output contract.
enum class Column : uint8_t {
    X    = 0,
    Y    = 1,
    MASS = 2,
    SIZE = 3,
    ECC  = 4
};

constexpr std::size_t NUM_PEAK_PARAMS = 5;
constexpr std::array<const char*, NUM_PEAK_PARAMS> PEAK_PARAMS = {"x", "y", "mass", "size", "ecc"};

// Name of the column appended by the batch adapter.
constexpr const char* FRAME_COLUMN = "frame";

// Rows in raster order of their candidates (single frame) or concatenated
// in frame order (batch).
using FeatureTable = std::vector<Feature>;

// Positional access in canonical column order
inline float columnValue(const Feature& f, Column c) {
    switch (c) {
        case Column::X:    return f.x;
        case Column::Y:    return f.y;
        case Column::MASS: return f.mass;
        case Column::SIZE: return f.size;
        case Column::ECC:  return f.ecc;
    }
    return 0.0f;
}

} // namespace msg
} // namespace cgloc

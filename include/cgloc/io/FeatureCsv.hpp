#pragma once
#include <iosfwd>
#include <string>

#include "cgloc/msg/FeatureFrame.hpp"

namespace cgloc {
namespace io {

// Header line "x,y,mass,size,ecc" (+ ",frame"), one row per feature in
// table order. Returns false if the stream went bad.
bool writeFeatureCsv(std::ostream& os, const msg::FeatureTable& features, bool with_frame);

// Same, to a file. Parent directories are created.
bool writeFeatureCsv(const std::string& path, const msg::FeatureTable& features, bool with_frame);

// Reads a table written by writeFeatureCsv (columns matched by header name,
// "frame" optional). Returns false on a malformed header or row.
bool readFeatureCsv(std::istream& is, msg::FeatureTable& features);

} // namespace io
} // namespace cgloc

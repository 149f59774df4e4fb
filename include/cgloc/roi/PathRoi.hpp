#pragma once
#include <vector>
#include <opencv2/core.hpp>

#include "cgloc/loc/Locator.hpp"
#include "cgloc/loc/BatchLocator.hpp"
#include "cgloc/msg/FeatureFrame.hpp"

namespace cgloc {
namespace roi {

// What to put into cropped pixels that lie outside the ROI
enum class FillMode : uint8_t {
    MEAN     = 0,   // mean of the pixels inside the ROI
    CONSTANT = 1,   // a caller supplied value
};

// ---------------------------------------------------------------------------
// PathRoi: closed polygon region of interest, optionally grown by `buffer`
// pixels when cropping (so features near the boundary get full windows).
// Vertices are in full-frame pixel coordinates.
// ---------------------------------------------------------------------------
class PathRoi {
public:
    explicit PathRoi(const std::vector<cv::Point2f>& vertices, float buffer = 0.0f);

    const std::vector<cv::Point2f>& vertices() const { return m_vertices; }
    float buffer() const { return m_buffer; }

    // floor(min vertex) .. ceil(max vertex), unbuffered
    cv::Rect boundingRect() const { return m_bbox; }

    // Strictly inside the polygon grown by `grow` pixels
    bool contains(const cv::Point2f& p, float grow = 0.0f) const;

    // Region of a frame of `frame_size` covered by the buffered bounding rect
    cv::Rect cropRect(const cv::Size& frame_size) const;

    // Crop `frame` to cropRect() as CV_32F, filling pixels outside the
    // buffered polygon. Returns false when the ROI misses the frame.
    bool crop(const cv::Mat& frame, cv::Mat& out, cv::Rect& rect,
              FillMode mode = FillMode::MEAN, float fill_value = 0.0f) const;

    // Keep features strictly inside the polygon (full-frame coordinates).
    // With reset_origin, shift them so boundingRect().tl() becomes (0, 0).
    void filter(msg::FeatureTable& features, bool reset_origin = true) const;

private:
    std::vector<cv::Point2f> m_vertices;
    float    m_buffer;
    cv::Rect m_bbox;
};

// Axis aligned rectangle spanned by two corners
PathRoi RectangleRoi(const cv::Point2f& top_left, const cv::Point2f& bottom_right,
                     float buffer = 0.0f);

// Ellipse with semi-axes `axes`, rotated by `angle_deg` (polygonal approximation)
PathRoi EllipseRoi(const cv::Point2f& center, const cv::Size2f& axes,
                   float angle_deg = 0.0f, float buffer = 0.0f);

// ---- Restricted localization ----

// Crop, locate, shift back to full-frame coordinates, filter.
bool locateRoi(loc::Locator& locator, const cv::Mat& frame, const PathRoi& roi,
               msg::FeatureTable& out, bool reset_origin = true,
               int32_t frame_no = msg::NO_FRAME);

// Batch version; the frame column is the index in `frames`.
bool batchRoi(loc::BatchLocator& batch, const std::vector<cv::Mat>& frames,
              const PathRoi& roi, msg::FeatureTable& out, bool reset_origin = true);

} // namespace roi
} // namespace cgloc

#include "cgloc/roi/PathRoi.hpp"
#include "cgloc/loc/ImageConvert.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/imgproc.hpp>

namespace cgloc {
namespace roi {

PathRoi::PathRoi(const std::vector<cv::Point2f>& vertices, float buffer) :
    m_vertices(vertices),
    m_buffer(std::max(buffer, 0.0f))
{
    if (m_vertices.size() < 3) {
        std::cerr << "[PathRoi] Need at least 3 vertices, got " << m_vertices.size() << "\n";
        return;
    }

    float x_min = m_vertices[0].x, x_max = m_vertices[0].x;
    float y_min = m_vertices[0].y, y_max = m_vertices[0].y;
    for (const cv::Point2f& p : m_vertices) {
        x_min = std::min(x_min, p.x);
        x_max = std::max(x_max, p.x);
        y_min = std::min(y_min, p.y);
        y_max = std::max(y_max, p.y);
    }

    const int x0 = static_cast<int>(std::floor(x_min));
    const int y0 = static_cast<int>(std::floor(y_min));
    const int x1 = static_cast<int>(std::ceil(x_max));
    const int y1 = static_cast<int>(std::ceil(y_max));
    m_bbox = cv::Rect(x0, y0, x1 - x0, y1 - y0);
}

bool PathRoi::contains(const cv::Point2f& p, float grow) const {
    if (m_vertices.size() < 3) return false;

    if (grow > 0.0f) {
        // Signed distance, positive inside
        return cv::pointPolygonTest(m_vertices, p, true) > -grow;
    }
    return cv::pointPolygonTest(m_vertices, p, false) > 0.0;
}

cv::Rect PathRoi::cropRect(const cv::Size& frame_size) const {
    if (m_vertices.size() < 3) return cv::Rect();

    const int b  = static_cast<int>(std::ceil(m_buffer));
    const int x0 = m_bbox.x - b;
    const int y0 = m_bbox.y - b;
    const int x1 = m_bbox.x + m_bbox.width + b;    // inclusive
    const int y1 = m_bbox.y + m_bbox.height + b;

    const cv::Rect grown(x0, y0, x1 - x0 + 1, y1 - y0 + 1);
    return grown & cv::Rect(0, 0, frame_size.width, frame_size.height);
}

bool PathRoi::crop(const cv::Mat& frame, cv::Mat& out, cv::Rect& rect,
                   FillMode mode, float fill_value) const {
    rect = cropRect(frame.size());
    if (rect.area() <= 0 || !loc::isSupportedMat(frame)) {
        return false;
    }

    cv::Mat frame_f;
    loc::toFloat(frame, frame_f);
    frame_f(rect).copyTo(out);

    // Pixel centres inside the buffered polygon
    cv::Mat inside(out.size(), CV_8U, cv::Scalar(0));
    double sum = 0.0;
    int    n   = 0;
    for (int v = 0; v < out.rows; ++v) {
        const float* row = out.ptr<float>(v);
        uint8_t*     in  = inside.ptr<uint8_t>(v);
        for (int u = 0; u < out.cols; ++u) {
            const cv::Point2f p(float(rect.x + u), float(rect.y + v));
            if (contains(p, m_buffer)) {
                in[u] = 1;
                sum += row[u];
                ++n;
            }
        }
    }

    float fill = fill_value;
    if (mode == FillMode::MEAN) {
        fill = (n > 0) ? static_cast<float>(sum / n) : 0.0f;
    }

    const cv::Mat outside = (inside == 0);
    out.setTo(fill, outside);
    return true;
}

void PathRoi::filter(msg::FeatureTable& features, bool reset_origin) const {
    msg::FeatureTable kept;
    kept.reserve(features.size());

    for (const msg::Feature& f : features) {
        if (!contains(cv::Point2f(f.x, f.y))) continue;

        msg::Feature g = f;
        if (reset_origin) {
            g.x -= static_cast<float>(m_bbox.x);
            g.y -= static_cast<float>(m_bbox.y);
        }
        kept.push_back(g);
    }
    features.swap(kept);
}

PathRoi RectangleRoi(const cv::Point2f& top_left, const cv::Point2f& bottom_right, float buffer) {
    const std::vector<cv::Point2f> vertices = {
        {top_left.x,     top_left.y},
        {bottom_right.x, top_left.y},
        {bottom_right.x, bottom_right.y},
        {top_left.x,     bottom_right.y},
    };
    return PathRoi(vertices, buffer);
}

PathRoi EllipseRoi(const cv::Point2f& center, const cv::Size2f& axes, float angle_deg, float buffer) {
    std::vector<cv::Point2d> poly;
    cv::ellipse2Poly(cv::Point2d(center.x, center.y),
                     cv::Size2d(axes.width, axes.height),
                     static_cast<int>(std::lround(angle_deg)), 0, 360, 5, poly);

    std::vector<cv::Point2f> vertices;
    vertices.reserve(poly.size());
    for (const cv::Point2d& p : poly) {
        vertices.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
    }
    return PathRoi(vertices, buffer);
}

// ---------------------------------------------------------------------------
// Restricted localization
// ---------------------------------------------------------------------------

static void shiftFeatures(msg::FeatureTable& features, const cv::Point& offset) {
    for (msg::Feature& f : features) {
        f.x += static_cast<float>(offset.x);
        f.y += static_cast<float>(offset.y);
    }
}

bool locateRoi(loc::Locator& locator, const cv::Mat& frame, const PathRoi& roi,
               msg::FeatureTable& out, bool reset_origin, int32_t frame_no) {
    out.clear();

    // Let the Locator report config / format problems
    if (!locator.configValid() || frame.empty() || !loc::isSupportedMat(frame)) {
        return locator.locate(frame, out, frame_no);
    }

    cv::Mat cropped;
    cv::Rect rect;
    if (!roi.crop(frame, cropped, rect)) {
        std::cerr << "[PathRoi] ROI does not overlap the " << frame.cols << "x"
                  << frame.rows << " frame\n";
        return true;
    }

    msg::FeatureTable found;
    if (!locator.locate(cropped, found, frame_no)) {
        return false;
    }

    shiftFeatures(found, rect.tl());
    roi.filter(found, reset_origin);
    out.swap(found);
    return true;
}

bool batchRoi(loc::BatchLocator& batch, const std::vector<cv::Mat>& frames,
              const PathRoi& roi, msg::FeatureTable& out, bool reset_origin) {
    out.clear();

    for (const cv::Mat& f : frames) {
        if (f.empty() || !loc::isSupportedMat(f)) {
            // Fails validation before any job is dispatched
            return batch.run(frames, out);
        }
    }

    std::vector<cv::Mat>  crops(frames.size());
    std::vector<cv::Rect> rects(frames.size());
    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (!roi.crop(frames[i], crops[i], rects[i])) {
            std::cerr << "[PathRoi] ROI does not overlap frame " << i << "\n";
            return false;
        }
    }

    msg::FeatureTable found;
    const bool ok = batch.run(crops, found);

    // A cancelled batch still returns its completed frames
    for (msg::Feature& f : found) {
        const cv::Rect& r = rects[static_cast<std::size_t>(f.frame)];
        f.x += static_cast<float>(r.x);
        f.y += static_cast<float>(r.y);
    }
    roi.filter(found, reset_origin);
    out.swap(found);
    return ok;
}

} // namespace roi
} // namespace cgloc

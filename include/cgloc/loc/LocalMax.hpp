#pragma once
#include <vector>
#include <opencv2/core.hpp>

namespace cgloc {
namespace loc {

// ---------------------------------------------------------------------------
// LocalMax: candidate search on a (filtered) CV_32F image.
//
// A pixel qualifies when nothing inside its disk of `radius` is brighter and
// its value is strictly above `signal_thresh`. Valid pixels satisfy
// r + 1 <= x < width - r - 1 (same for y). A connected plateau of equal
// values yields one candidate, its first pixel in raster order. Output is in
// raster order.
// ---------------------------------------------------------------------------
class LocalMax {
public:
    LocalMax();
    LocalMax(int radius, float signal_thresh);

    void find(const cv::Mat& img, std::vector<cv::Point>& candidates);

    int   getRadius() const { return m_radius; }
    float getSignalThresh() const { return m_signal_thresh; }

private:
    int   m_radius;
    float m_signal_thresh;

    cv::Mat m_disk;         // CV_8U structuring element

    // Scratch, reused between calls
    cv::Mat m_dilated;
    cv::Mat m_fill_mask;    // (rows+2) x (cols+2), floodFill mask
    cv::Mat m_suppressed;   // interior view of m_fill_mask

    void suppressPlateau(const cv::Mat& img, cv::Point seed);
};

// Disk structuring element, (2r+1)^2, 1 where x^2 + y^2 <= r^2.
cv::Mat diskElement(int radius);

// One-shot helper.
std::vector<cv::Point> findLocalMaxima(const cv::Mat& img, int radius, float signal_thresh);

} // namespace loc
} // namespace cgloc

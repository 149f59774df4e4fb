#include "cgloc/loc/LocalMax.hpp"

#include <opencv2/imgproc.hpp>

namespace cgloc {
namespace loc {

cv::Mat diskElement(int radius) {
    const int d = 2 * radius + 1;
    cv::Mat disk(d, d, CV_8U, cv::Scalar(0));
    const int r2 = radius * radius;
    for (int ky = -radius; ky <= radius; ++ky) {
        uint8_t* row = disk.ptr<uint8_t>(ky + radius);
        for (int kx = -radius; kx <= radius; ++kx) {
            if (kx * kx + ky * ky <= r2) row[kx + radius] = 1;
        }
    }
    return disk;
}

LocalMax::LocalMax() :
    m_radius(0),
    m_signal_thresh(0.0f)
{}

LocalMax::LocalMax(int radius, float signal_thresh) :
    m_radius(radius),
    m_signal_thresh(signal_thresh)
{
    m_disk = diskElement(m_radius);
}

void LocalMax::find(const cv::Mat& img, std::vector<cv::Point>& candidates) {
    CV_Assert(img.type() == CV_32FC1);
    candidates.clear();

    // Valid pixels: r + 1 <= x < cols - r - 1, same for y
    const int r = m_radius;
    if (img.rows < 2 * r + 3 || img.cols < 2 * r + 3) {
        return;
    }

    // Grey dilation with the disk. The default border value acts as -inf,
    // so pixels outside the image never win.
    cv::dilate(img, m_dilated, m_disk);

    // floodFill wants a mask one pixel larger on every side
    m_fill_mask.create(img.rows + 2, img.cols + 2, CV_8U);
    m_fill_mask.setTo(0);
    m_suppressed = m_fill_mask(cv::Rect(1, 1, img.cols, img.rows));

    for (int y = r + 1; y < img.rows - r - 1; ++y) {
        const float*   p = img.ptr<float>(y);
        const float*   d = m_dilated.ptr<float>(y);
        const uint8_t* s = m_suppressed.ptr<uint8_t>(y);

        for (int x = r + 1; x < img.cols - r - 1; ++x) {
            const float v = p[x];
            if (!(v > m_signal_thresh)) continue;   // also rejects NaN
            if (v < d[x]) continue;                 // something brighter nearby
            if (s[x]) continue;                     // plateau already reported

            candidates.emplace_back(x, y);
            suppressPlateau(img, cv::Point(x, y));
        }
    }
}

void LocalMax::suppressPlateau(const cv::Mat& img, cv::Point seed) {
    // Mark the 8-connected component of pixels equal to the seed value.
    // Zero tolerance with a fixed range means exact equality.
    const int flags = 8 | (1 << 8) | cv::FLOODFILL_FIXED_RANGE | cv::FLOODFILL_MASK_ONLY;
    cv::floodFill(img, m_fill_mask, seed, cv::Scalar(), nullptr,
                  cv::Scalar(0), cv::Scalar(0), flags);
}

std::vector<cv::Point> findLocalMaxima(const cv::Mat& img, int radius, float signal_thresh) {
    cv::Mat img_f;
    if (img.type() == CV_32FC1) {
        img_f = img;
    } else {
        img.convertTo(img_f, CV_32F);
    }

    std::vector<cv::Point> candidates;
    LocalMax(radius, signal_thresh).find(img_f, candidates);
    return candidates;
}

} // namespace loc
} // namespace cgloc

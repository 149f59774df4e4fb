#pragma once
#include <opencv2/core.hpp>

namespace cgloc {
namespace loc {

// ---------------------------------------------------------------------------
// BandPass: Gaussian noise suppression minus boxcar background.
//
//   filtered = G_noise * img - B_(2r+1) * img
//
// Both kernels are separable, (2r+1) taps wide, applied with
// BORDER_REPLICATE. A margin of `radius` pixels along every edge is then
// zeroed. Negative output values are kept.
// ---------------------------------------------------------------------------
class BandPass {
public:
    BandPass();
    BandPass(int radius, float noise_radius);

    // in: single channel CV_32F. filtered: CV_32F, same size.
    void apply(const cv::Mat& in, cv::Mat& filtered) const;

    int   getRadius() const { return m_radius; }
    float getNoiseRadius() const { return m_noise_radius; }

private:
    int   m_radius;
    float m_noise_radius;
    cv::Mat m_gauss_kernel;  // (2r+1) x 1, sums to 1
    cv::Mat m_box_kernel;    // (2r+1) x 1, all 1/(2r+1)
};

// One-shot helper. Returns a CV_32F image the size of `in`.
cv::Mat bandpass(const cv::Mat& in, int radius, float noise_radius = 1.0f);

} // namespace loc
} // namespace cgloc

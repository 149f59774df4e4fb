#include "cgloc/sim/GaussSim.hpp"

#include <algorithm>
#include <cmath>

namespace cgloc {
namespace sim {

float massToAmplitude(float mass, float sigma_x, float sigma_y) {
    return static_cast<float>(mass / (2.0 * CV_PI * sigma_x * sigma_y));
}

cv::Mat simulateGauss(int width, int height, const std::vector<GaussSpot>& spots, float cutoff) {
    cv::Mat img(std::max(height, 0), std::max(width, 0), CV_32F, cv::Scalar(0.0f));

    for (const GaussSpot& s : spots) {
        if (!(s.sigma_x > 0.0f) || !(s.sigma_y > 0.0f)) continue;

        const int cx = static_cast<int>(std::lround(s.x));
        const int cy = static_cast<int>(std::lround(s.y));
        const int hx = static_cast<int>(std::lround(cutoff * s.sigma_x));
        const int hy = static_cast<int>(std::lround(cutoff * s.sigma_y));

        const int x0 = std::max(cx - hx, 0);
        const int x1 = std::min(cx + hx, img.cols - 1);
        const int y0 = std::max(cy - hy, 0);
        const int y1 = std::min(cy + hy, img.rows - 1);

        const double ax = 1.0 / (2.0 * double(s.sigma_x) * s.sigma_x);
        const double ay = 1.0 / (2.0 * double(s.sigma_y) * s.sigma_y);

        for (int v = y0; v <= y1; ++v) {
            float* row = img.ptr<float>(v);
            const double dy = v - double(s.y);
            for (int u = x0; u <= x1; ++u) {
                const double dx = u - double(s.x);
                row[u] += static_cast<float>(s.amplitude * std::exp(-dx * dx * ax - dy * dy * ay));
            }
        }
    }
    return img;
}

void addBackgroundNoise(cv::Mat& img, float background, float noise_sigma, uint64_t seed) {
    CV_Assert(img.type() == CV_32FC1);

    cv::Mat noise(img.size(), CV_32F);
    cv::RNG rng(seed);
    rng.fill(noise, cv::RNG::NORMAL, cv::Scalar(background), cv::Scalar(std::max(noise_sigma, 0.0f)));
    img += noise;
}

} // namespace sim
} // namespace cgloc

#pragma once
#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>

namespace cgloc {
namespace sim {

struct GaussSpot {
    float x         = 0.0f;   // centre column [pixels]
    float y         = 0.0f;   // centre row [pixels]
    float amplitude = 0.0f;   // peak value
    float sigma_x   = 1.0f;   // [pixels]
    float sigma_y   = 1.0f;
};

// Peak amplitude of a Gaussian whose integral is `mass`.
float massToAmplitude(float mass, float sigma_x, float sigma_y);

// Sum of Gaussians on a width x height CV_32F canvas. Each spot is evaluated
// only inside a box of half-width round(cutoff * sigma) around its centre.
cv::Mat simulateGauss(int width, int height, const std::vector<GaussSpot>& spots,
                      float cutoff = 5.0f);

// Add a constant background and zero-mean Gaussian noise, reproducible by seed.
void addBackgroundNoise(cv::Mat& img, float background, float noise_sigma, uint64_t seed);

} // namespace sim
} // namespace cgloc

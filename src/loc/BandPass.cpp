#include "cgloc/loc/BandPass.hpp"

#include <opencv2/imgproc.hpp>

namespace cgloc {
namespace loc {

BandPass::BandPass() :
    m_radius(0),
    m_noise_radius(0.0f)
{}

BandPass::BandPass(int radius, float noise_radius) :
    m_radius(radius),
    m_noise_radius(noise_radius)
{
    const int diameter = 2 * m_radius + 1;

    // Noise kernel, normalised so a constant image passes unchanged
    m_gauss_kernel = cv::getGaussianKernel(diameter, m_noise_radius, CV_32F);

    // Boxcar background estimate
    m_box_kernel = cv::Mat(diameter, 1, CV_32F, cv::Scalar(1.0 / diameter));
}

void BandPass::apply(const cv::Mat& in, cv::Mat& filtered) const {
    CV_Assert(in.type() == CV_32FC1);

    cv::Mat smooth, background;
    cv::sepFilter2D(in, smooth, CV_32F, m_gauss_kernel, m_gauss_kernel,
                    cv::Point(-1, -1), 0.0, cv::BORDER_REPLICATE);
    cv::sepFilter2D(in, background, CV_32F, m_box_kernel, m_box_kernel,
                    cv::Point(-1, -1), 0.0, cv::BORDER_REPLICATE);

    cv::subtract(smooth, background, filtered);

    // Zero the margin where the kernels do not have full support
    const int r = m_radius;
    if (filtered.rows <= 2 * r || filtered.cols <= 2 * r) {
        filtered.setTo(0.0f);
        return;
    }
    filtered.rowRange(0, r).setTo(0.0f);
    filtered.rowRange(filtered.rows - r, filtered.rows).setTo(0.0f);
    filtered.colRange(0, r).setTo(0.0f);
    filtered.colRange(filtered.cols - r, filtered.cols).setTo(0.0f);
}

cv::Mat bandpass(const cv::Mat& in, int radius, float noise_radius) {
    cv::Mat in_f;
    if (in.type() == CV_32FC1) {
        in_f = in;
    } else {
        in.convertTo(in_f, CV_32F);
    }

    cv::Mat out;
    BandPass(radius, noise_radius).apply(in_f, out);
    return out;
}

} // namespace loc
} // namespace cgloc

#pragma once
#include <opencv2/core.hpp>

#include "cgloc/msg/ImageFrame.hpp"

namespace cgloc {
namespace loc {

// Wrap an ImageFrame as a cv::Mat header (no copy). The Mat must not be
// written to. Returns false when stride or format cannot be expressed.
bool toMat(const msg::ImageFrame& img, cv::Mat& view);

// Describe a single-channel cv::Mat as an ImageFrame (no copy). The Mat must
// outlive the frame. Returns false for multi-channel or unsupported depths.
bool toImageFrame(const cv::Mat& m, msg::ImageFrame& img, int32_t frame_no = msg::NO_FRAME);

// Single channel 8U / 16U / 32F / 64F.
bool isSupportedMat(const cv::Mat& m);

// CV_32F version of `in`. Shares data when `in` already is CV_32F.
void toFloat(const cv::Mat& in, cv::Mat& out);

} // namespace loc
} // namespace cgloc

#include "cgloc/loc/ImageConvert.hpp"

namespace cgloc {
namespace loc {

static int cvDepth(msg::PixelFormat fmt) {
    switch (fmt) {
        case msg::PixelFormat::GRAY8:   return CV_8U;
        case msg::PixelFormat::GRAY16:  return CV_16U;
        case msg::PixelFormat::GRAY32F: return CV_32F;
        case msg::PixelFormat::GRAY64F: return CV_64F;
    }
    return -1;
}

bool toMat(const msg::ImageFrame& img, cv::Mat& view) {
    const int depth = cvDepth(img.format);
    if (depth < 0) return false;

    const uint32_t bpp = msg::bytesPerPixel(img.format);
    if (img.stride < img.width * bpp || img.stride % bpp != 0) {
        return false;
    }

    // cv::Mat takes a non-const pointer; the view is only ever read
    view = cv::Mat(static_cast<int>(img.height), static_cast<int>(img.width),
                   CV_MAKETYPE(depth, 1),
                   const_cast<uint8_t*>(img.data), static_cast<size_t>(img.stride));
    return true;
}

bool isSupportedMat(const cv::Mat& m) {
    if (m.channels() != 1) return false;
    const int d = m.depth();
    return d == CV_8U || d == CV_16U || d == CV_32F || d == CV_64F;
}

bool toImageFrame(const cv::Mat& m, msg::ImageFrame& img, int32_t frame_no) {
    if (!isSupportedMat(m) || m.dims != 2) return false;

    switch (m.depth()) {
        case CV_8U:  img.format = msg::PixelFormat::GRAY8;   break;
        case CV_16U: img.format = msg::PixelFormat::GRAY16;  break;
        case CV_32F: img.format = msg::PixelFormat::GRAY32F; break;
        default:     img.format = msg::PixelFormat::GRAY64F; break;
    }

    img.data     = m.data;
    img.width    = static_cast<uint32_t>(m.cols);
    img.height   = static_cast<uint32_t>(m.rows);
    img.stride   = static_cast<uint32_t>(m.step[0]);
    img.frame_no = frame_no;
    return true;
}

void toFloat(const cv::Mat& in, cv::Mat& out) {
    if (in.type() == CV_32FC1) {
        out = in;
    } else {
        in.convertTo(out, CV_32F);
    }
}

} // namespace loc
} // namespace cgloc

#pragma once
#include <cstdint>

namespace cgloc {
namespace msg {

// Frame number placeholder: "not tagged by the producer".
constexpr int32_t NO_FRAME = -1;

// Storage layout of one pixel sample (single channel only).
enum class PixelFormat : uint8_t {
    GRAY8   = 0,    // uint8_t
    GRAY16  = 1,    // uint16_t
    GRAY32F = 2,    // float
    GRAY64F = 3     // double
};

constexpr uint8_t bytesPerPixel(PixelFormat fmt) {
    return fmt == PixelFormat::GRAY8   ? 1 :
           fmt == PixelFormat::GRAY16  ? 2 :
           fmt == PixelFormat::GRAY32F ? 4 : 8;
}

struct ImageFrame {
    // Non-owning pointer to the first byte of a contiguous image buffer
    // const to prevent modification
    const uint8_t* data = nullptr;

    // Image dimensions in pixels
    uint32_t width  = 0;    // pixels (x, columns)
    uint32_t height = 0;    // pixels (y, rows)

    // Stride = number of BYTES between the start of row y and the start of row y+1.
    // For tightly packed images: stride == width * bytesPerPixel(format).
    uint32_t stride = 0;

    PixelFormat format = PixelFormat::GRAY32F;

    // Position of this frame in its acquisition sequence, NO_FRAME if unknown.
    // Copied into the "frame" column of every feature found in it.
    int32_t frame_no = NO_FRAME;

    constexpr bool empty() const { return data == nullptr || width == 0 || height == 0; }
};

} // namespace msg
} // namespace cgloc

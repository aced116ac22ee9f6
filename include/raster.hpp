#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/// Width of the print head in dots; every printed bitmap has exactly this width
static const int RASTER_WIDTH = 384;

/// Bytes per packed scanline
static const int RASTER_BYTES_PER_ROW = RASTER_WIDTH / 8;

/// RGBA image, 4 bytes per pixel, row-major
struct PixelBuffer {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgba;

    PixelBuffer() = default;
    PixelBuffer(int w, int h, uint8_t fill = 255)
        : width(w), height(h), rgba(static_cast<size_t>(w) * h * 4, fill) {}

    uint8_t* pixel(int x, int y) { return &rgba[(static_cast<size_t>(y) * width + x) * 4]; }
    const uint8_t* pixel(int x, int y) const { return &rgba[(static_cast<size_t>(y) * width + x) * 4]; }

    bool empty() const { return width <= 0 || height <= 0; }
};

/// One luminance sample per pixel plus the observed range of the whole image
struct GrayscaleBuffer {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> luma;
    uint8_t min_luma = 0;
    uint8_t max_luma = 0;

    uint8_t at(int x, int y) const { return luma[static_cast<size_t>(y) * width + x]; }
};

/// 1-bit-per-pixel bitmap, row-major. This is what gets previewed and printed.
struct MonoBitmap {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> ink;  // 1 = ink (black), 0 = paper

    MonoBitmap() = default;
    MonoBitmap(int w, int h) : width(w), height(h), ink(static_cast<size_t>(w) * h, 0) {}

    bool at(int x, int y) const { return ink[static_cast<size_t>(y) * width + x] != 0; }
    void set(int x, int y, bool value) { ink[static_cast<size_t>(y) * width + x] = value ? 1 : 0; }

    size_t ink_count() const {
        size_t n = 0;
        for (uint8_t v : ink) n += v;
        return n;
    }

    bool operator==(const MonoBitmap& other) const {
        return width == other.width && height == other.height && ink == other.ink;
    }
};

#pragma once

#include "raster.hpp"

#include <cstdint>
#include <string>
#include <vector>

/// RGB color
struct Color {
    int r, g, b;
};

static const Color COLOR_WHITE = {255, 255, 255};
static const Color COLOR_BLACK = {0, 0, 0};

/// Luminance at or above this value quantizes to paper, below it to ink
static const int INK_THRESHOLD = 128;

enum class DitherMethod {
    Atkinson,
    None,
};

/// Decode an encoded image (PNG, JPEG, BMP, GIF, ...) held in memory.
/// Transparent pixels are flattened onto `bg`. Throws DecodeError.
PixelBuffer decode_image(const std::vector<uint8_t>& encoded, Color bg = COLOR_WHITE);

/// Load and decode an image file. Throws DecodeError.
PixelBuffer load_image(const char* path, Color bg = COLOR_WHITE);

/// Rescale to `target_w` pixels wide, height scaled proportionally (nearest neighbour)
PixelBuffer normalize_width(const PixelBuffer& src, int target_w = RASTER_WIDTH);

/// Unweighted RGB average per pixel, with the global min/max luminance
GrayscaleBuffer to_grayscale(const PixelBuffer& pixels);

/// Contrast stretch then Atkinson error diffusion to black/white
MonoBitmap dither_atkinson(const PixelBuffer& pixels);

/// Contrast stretch then plain threshold (no error diffusion)
MonoBitmap dither_none(const PixelBuffer& pixels);

MonoBitmap dither(const PixelBuffer& pixels, DitherMethod method);

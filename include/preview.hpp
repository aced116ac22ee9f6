#pragma once

#include "raster.hpp"

#include <functional>
#include <string>

/// Receives the exact bitmap that is about to be printed
using PreviewCallback = std::function<void(const MonoBitmap&)>;

/// Expand a bitmap to RGBA for display: ink black, paper white
PixelBuffer bitmap_to_pixels(const MonoBitmap& bitmap);

/// Write the bitmap as a grayscale PNG. Throws std::runtime_error.
void write_preview_png(const MonoBitmap& bitmap, const std::string& path);

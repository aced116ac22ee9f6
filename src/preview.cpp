#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"
#include "preview.hpp"
#include <stdexcept>
#include <vector>

PixelBuffer bitmap_to_pixels(const MonoBitmap& bitmap) {
    PixelBuffer out(bitmap.width, bitmap.height, 255);
    for (int y = 0; y < bitmap.height; y++) {
        for (int x = 0; x < bitmap.width; x++) {
            if (bitmap.at(x, y)) {
                uint8_t* p = out.pixel(x, y);
                p[0] = p[1] = p[2] = 0;
            }
        }
    }
    return out;
}

void write_preview_png(const MonoBitmap& bitmap, const std::string& path) {
    std::vector<uint8_t> gray(bitmap.ink.size());
    for (size_t i = 0; i < gray.size(); i++) {
        gray[i] = bitmap.ink[i] ? 0 : 255;
    }

    if (!stbi_write_png(path.c_str(), bitmap.width, bitmap.height, 1, gray.data(), bitmap.width)) {
        throw std::runtime_error("Failed to write preview: " + path);
    }
}

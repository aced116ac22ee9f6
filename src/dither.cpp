#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
#include "dither.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

// --- Image loading ---

static PixelBuffer flatten_rgba(const unsigned char* data, int w, int h, Color bg) {
    // Composite alpha onto background color
    PixelBuffer out(w, h);
    for (int i = 0; i < w * h; i++) {
        float a = data[i * 4 + 3] / 255.0f;
        out.rgba[i * 4 + 0] = static_cast<uint8_t>(data[i * 4 + 0] * a + bg.r * (1 - a));
        out.rgba[i * 4 + 1] = static_cast<uint8_t>(data[i * 4 + 1] * a + bg.g * (1 - a));
        out.rgba[i * 4 + 2] = static_cast<uint8_t>(data[i * 4 + 2] * a + bg.b * (1 - a));
        out.rgba[i * 4 + 3] = 255;
    }
    return out;
}

PixelBuffer decode_image(const std::vector<uint8_t>& encoded, Color bg) {
    if (encoded.empty()) {
        throw DecodeError("Failed to decode image: no data");
    }

    int w, h, channels;
    unsigned char* data = stbi_load_from_memory(encoded.data(), (int)encoded.size(),
                                                &w, &h, &channels, 4);  // Force RGBA
    if (!data) {
        throw DecodeError(std::string("Failed to decode image (") + stbi_failure_reason() + ")");
    }

    PixelBuffer out = flatten_rgba(data, w, h, bg);
    stbi_image_free(data);
    return out;
}

PixelBuffer load_image(const char* path, Color bg) {
    int w, h, channels;
    unsigned char* data = stbi_load(path, &w, &h, &channels, 4);  // Force RGBA
    if (!data) {
        throw DecodeError(std::string("Failed to load image: ") + path +
                          " (" + stbi_failure_reason() + ")");
    }

    PixelBuffer out = flatten_rgba(data, w, h, bg);
    stbi_image_free(data);
    return out;
}

// --- Resizing ---

PixelBuffer normalize_width(const PixelBuffer& src, int target_w) {
    if (src.empty()) {
        throw DecodeError("Image has no pixels");
    }

    int w = src.width;
    int h = src.height;
    int new_h = std::max(1, (int)std::lround((double)h * target_w / w));

    PixelBuffer out(target_w, new_h);
    for (int y = 0; y < new_h; y++) {
        int sy = std::min((int)((double)y * h / new_h), h - 1);
        for (int x = 0; x < target_w; x++) {
            int sx = std::min((int)((double)x * w / target_w), w - 1);
            std::copy_n(src.pixel(sx, sy), 4, out.pixel(x, y));
        }
    }
    return out;
}

// --- Grayscale ---

GrayscaleBuffer to_grayscale(const PixelBuffer& pixels) {
    GrayscaleBuffer gray;
    gray.width = pixels.width;
    gray.height = pixels.height;
    gray.luma.resize(static_cast<size_t>(pixels.width) * pixels.height);

    uint8_t lo = 255;
    uint8_t hi = 0;
    for (size_t i = 0; i < gray.luma.size(); i++) {
        const uint8_t* p = &pixels.rgba[i * 4];
        uint8_t v = static_cast<uint8_t>((p[0] + p[1] + p[2]) / 3);
        gray.luma[i] = v;
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }

    if (!gray.luma.empty()) {
        gray.min_luma = lo;
        gray.max_luma = hi;
    }
    return gray;
}

/// Stretch min..max to 0..255 into a float working grid.
/// A flat image (min == max) is left as is.
static std::vector<float> stretched_samples(const GrayscaleBuffer& gray) {
    std::vector<float> work(gray.luma.begin(), gray.luma.end());
    if (gray.max_luma == gray.min_luma) {
        return work;
    }
    float lo = gray.min_luma;
    float scale = 255.0f / (gray.max_luma - gray.min_luma);
    for (float& v : work) {
        v = (v - lo) * scale;
    }
    return work;
}

// --- Atkinson dithering ---

MonoBitmap dither_atkinson(const PixelBuffer& pixels) {
    GrayscaleBuffer gray = to_grayscale(pixels);
    int width = gray.width;
    int height = gray.height;

    // Owned solely by this pass; later samples see error diffused from earlier ones
    std::vector<float> work = stretched_samples(gray);

    MonoBitmap result(width, height);

    // Atkinson distributes 6/8 of the error (1/8 each to 6 neighbors)
    // Neighbors: (x+1,y), (x+2,y), (x-1,y+1), (x,y+1), (x+1,y+1), (x,y+2)
    auto distribute = [&](int x, int y, float err) {
        const float coeff = 1.0f / 8.0f;
        const int offsets[][2] = {
            {1, 0}, {2, 0},
            {-1, 1}, {0, 1}, {1, 1},
            {0, 2}
        };
        for (auto& off : offsets) {
            int nx = x + off[0];
            int ny = y + off[1];
            if (nx >= 0 && nx < width && ny >= 0 && ny < height) {
                work[static_cast<size_t>(ny) * width + nx] += err * coeff;
            }
        }
    };

    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            float old_value = work[static_cast<size_t>(y) * width + x];
            float new_value = old_value < INK_THRESHOLD ? 0.0f : 255.0f;
            result.set(x, y, new_value == 0.0f);
            distribute(x, y, old_value - new_value);
        }
    }

    return result;
}

MonoBitmap dither_none(const PixelBuffer& pixels) {
    GrayscaleBuffer gray = to_grayscale(pixels);
    std::vector<float> work = stretched_samples(gray);

    MonoBitmap result(gray.width, gray.height);
    for (size_t i = 0; i < work.size(); i++) {
        result.ink[i] = work[i] < INK_THRESHOLD ? 1 : 0;
    }
    return result;
}

MonoBitmap dither(const PixelBuffer& pixels, DitherMethod method) {
    if (method == DitherMethod::None) {
        return dither_none(pixels);
    }
    return dither_atkinson(pixels);
}

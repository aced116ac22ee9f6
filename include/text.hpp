#pragma once

#include "raster.hpp"

#include <memory>
#include <string>
#include <vector>

struct stbtt_fontinfo;

/// Text mode layout parameters
struct TextConfig {
    std::string font_path;     // empty: first installed font from DEFAULT_FONT_PATHS
    float font_size = 16.0f;   // pixel height
    float line_height = 1.15f; // multiple of font_size
    int min_height = 32;       // canvas never shorter than this

    float line_height_px() const { return font_size * line_height; }
};

/// Monospace fonts tried in order when no font is configured
extern const char* const DEFAULT_FONT_PATHS[];

/// TrueType font loaded from a file
class FontFace {
public:
    explicit FontFace(const std::string& path);
    ~FontFace();

    FontFace(const FontFace&) = delete;
    FontFace& operator=(const FontFace&) = delete;

    /// Ascent above the baseline, in pixels
    int ascent_px(float pixel_height) const;

    /// Horizontal advance of one cell ('M'), in pixels
    float advance_px(float pixel_height) const;

    /// Draw a glyph in black onto `canvas`, pen at (x, baseline)
    void draw_glyph(PixelBuffer& canvas, char32_t codepoint, float x, int baseline,
                    float pixel_height) const;

private:
    std::vector<unsigned char> data_;
    std::unique_ptr<stbtt_fontinfo> info_;
};

/// Path of the first default font present on this machine. Throws std::runtime_error.
std::string find_default_font();

/// Decode UTF-8; malformed sequences become U+FFFD
std::u32string decode_utf8(const std::string& text);

/// Greedy wrap to `columns` characters per line.
/// Breaks at the last space (dropped) or after the last hyphen that fits,
/// otherwise hard-breaks. Every '\n' starts a new line.
std::vector<std::u32string> wrap_text(const std::u32string& text, int columns);

/// Columns of monospace cells that fit in `width` pixels
int columns_for_width(const FontFace& face, const TextConfig& config, int width = RASTER_WIDTH);

/// Canvas height for `line_count` lines, at least config.min_height
int text_canvas_height(size_t line_count, const TextConfig& config);

/// Lay out and rasterize text: black on white, left aligned, top aligned, RASTER_WIDTH wide
PixelBuffer render_text(const std::string& utf8, const TextConfig& config);

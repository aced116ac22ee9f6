#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"
#include "text.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>

const char* const DEFAULT_FONT_PATHS[] = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
    "/usr/share/fonts/dejavu/DejaVuSansMono.ttf",
    "/usr/share/fonts/TTF/DejaVuSansMono.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationMono-Regular.ttf",
    "/usr/share/fonts/truetype/freefont/FreeMono.ttf",
    nullptr,
};

// --- Font ---

FontFace::FontFace(const std::string& path)
    : info_(std::make_unique<stbtt_fontinfo>()) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open font: " + path);
    }
    data_.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());

    int offset = stbtt_GetFontOffsetForIndex(data_.data(), 0);
    if (data_.empty() || offset < 0 || !stbtt_InitFont(info_.get(), data_.data(), offset)) {
        throw std::runtime_error("Failed to parse font: " + path);
    }
}

FontFace::~FontFace() = default;

int FontFace::ascent_px(float pixel_height) const {
    int ascent, descent, line_gap;
    stbtt_GetFontVMetrics(info_.get(), &ascent, &descent, &line_gap);
    return (int)std::lround(ascent * stbtt_ScaleForPixelHeight(info_.get(), pixel_height));
}

float FontFace::advance_px(float pixel_height) const {
    int advance, lsb;
    stbtt_GetCodepointHMetrics(info_.get(), 'M', &advance, &lsb);
    return advance * stbtt_ScaleForPixelHeight(info_.get(), pixel_height);
}

void FontFace::draw_glyph(PixelBuffer& canvas, char32_t codepoint, float x, int baseline,
                          float pixel_height) const {
    float scale = stbtt_ScaleForPixelHeight(info_.get(), pixel_height);
    int cp = (int)codepoint;

    int x0, y0, x1, y1;
    stbtt_GetCodepointBitmapBox(info_.get(), cp, scale, scale, &x0, &y0, &x1, &y1);
    int gw = x1 - x0;
    int gh = y1 - y0;
    if (gw <= 0 || gh <= 0) return;  // blank glyph (space)

    std::vector<unsigned char> glyph(static_cast<size_t>(gw) * gh);
    stbtt_MakeCodepointBitmap(info_.get(), glyph.data(), gw, gh, gw, scale, scale, cp);

    int origin_x = (int)std::floor(x) + x0;
    int origin_y = baseline + y0;
    for (int gy = 0; gy < gh; gy++) {
        int py = origin_y + gy;
        if (py < 0 || py >= canvas.height) continue;
        for (int gx = 0; gx < gw; gx++) {
            int px = origin_x + gx;
            if (px < 0 || px >= canvas.width) continue;
            uint8_t value = (uint8_t)(255 - glyph[static_cast<size_t>(gy) * gw + gx]);
            uint8_t* p = canvas.pixel(px, py);
            p[0] = std::min(p[0], value);
            p[1] = std::min(p[1], value);
            p[2] = std::min(p[2], value);
        }
    }
}

std::string find_default_font() {
    for (int i = 0; DEFAULT_FONT_PATHS[i]; i++) {
        std::ifstream font(DEFAULT_FONT_PATHS[i], std::ios::binary);
        if (font) return DEFAULT_FONT_PATHS[i];
    }
    throw std::runtime_error("No monospace font found; pass one with --font");
}

// --- UTF-8 ---

// Smallest code point each sequence length may encode
static const char32_t MIN_CODEPOINT[] = {0x0, 0x80, 0x800, 0x10000};

std::u32string decode_utf8(const std::string& text) {
    std::u32string out;
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = text[i];
        int extra;
        char32_t cp;
        if (c < 0x80) { cp = c; extra = 0; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
        else { out.push_back(0xFFFD); i++; continue; }

        // Truncated or interrupted sequence: replace the lead byte, resync on the next
        bool ok = true;
        for (int k = 1; k <= extra; k++) {
            if (i + k >= text.size()) { ok = false; break; }
            unsigned char cc = text[i + k];
            if ((cc & 0xC0) != 0x80) { ok = false; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!ok) {
            out.push_back(0xFFFD);
            i++;
            continue;
        }

        // Overlong forms, surrogates and values past U+10FFFF
        if (cp < MIN_CODEPOINT[extra] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            cp = 0xFFFD;
        }

        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

// --- Wrapping ---

static void wrap_paragraph(std::u32string rest, size_t columns, std::vector<std::u32string>& lines) {
    while (rest.size() > columns) {
        size_t space_at = std::u32string::npos;
        for (size_t i = 1; i <= columns; i++) {
            if (rest[i] == U' ') space_at = i;
        }
        size_t hyphen_at = std::u32string::npos;
        for (size_t i = 0; i < columns; i++) {
            if (rest[i] == U'-') hyphen_at = i;
        }

        size_t space_end = space_at == std::u32string::npos ? 0 : space_at;
        size_t hyphen_end = hyphen_at == std::u32string::npos ? 0 : hyphen_at + 1;

        size_t cut;
        size_t resume;
        if (space_end > 0 && space_end >= hyphen_end) {
            cut = space_end;
            resume = space_end + 1;
        } else if (hyphen_end > 0) {
            cut = hyphen_end;
            resume = hyphen_end;
        } else {
            cut = columns;
            resume = columns;
        }

        lines.push_back(rest.substr(0, cut));

        // Continuation lines start at the next non-space character
        while (resume < rest.size() && rest[resume] == U' ') resume++;
        rest.erase(0, resume);
        if (rest.empty()) return;
    }
    lines.push_back(rest);
}

std::vector<std::u32string> wrap_text(const std::u32string& text, int columns) {
    if (columns < 1) {
        throw std::invalid_argument("Line must hold at least one column");
    }

    std::vector<std::u32string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find(U'\n', start);
        std::u32string para = text.substr(start, nl == std::u32string::npos ? std::u32string::npos : nl - start);
        para.erase(std::remove(para.begin(), para.end(), U'\r'), para.end());
        wrap_paragraph(para, (size_t)columns, lines);
        if (nl == std::u32string::npos) break;
        start = nl + 1;
    }
    return lines;
}

// --- Layout ---

int columns_for_width(const FontFace& face, const TextConfig& config, int width) {
    float advance = face.advance_px(config.font_size);
    if (advance <= 0) {
        throw std::runtime_error("Font has no advance width");
    }
    return std::max(1, (int)std::floor(width / advance));
}

int text_canvas_height(size_t line_count, const TextConfig& config) {
    int needed = (int)std::ceil(line_count * config.line_height_px());
    return std::max(config.min_height, needed);
}

PixelBuffer render_text(const std::string& utf8, const TextConfig& config) {
    FontFace face(config.font_path.empty() ? find_default_font() : config.font_path);

    int columns = columns_for_width(face, config);
    auto lines = wrap_text(decode_utf8(utf8), columns);
    int height = text_canvas_height(lines.size(), config);

    PixelBuffer canvas(RASTER_WIDTH, height, 255);
    float advance = face.advance_px(config.font_size);
    int ascent = face.ascent_px(config.font_size);

    for (size_t i = 0; i < lines.size(); i++) {
        int baseline = (int)std::lround(i * config.line_height_px()) + ascent;
        for (size_t c = 0; c < lines[i].size(); c++) {
            face.draw_glyph(canvas, lines[i][c], c * advance, baseline, config.font_size);
        }
    }

    return canvas;
}

// text_fitter.cpp
// MIT License (c) 2026 Pedro

#include "text_fitter.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <sstream>

#include <ft2build.h>
#include FT_FREETYPE_H
#include <hb.h>
#include <hb-ft.h>

#include "cli_parse.h"

namespace mockforge::core {

namespace {

constexpr long k_fixed_one = 64; // 26.6 fixed point

long round_pixels(long v) {
    const long shifted = v + (k_fixed_one / 2);
    return shifted >= 0 ? shifted / k_fixed_one : -((-shifted + k_fixed_one - 1) / k_fixed_one);
}

// Pixel bounds of a rendered glyph bitmap, y growing downwards from the baseline.
struct GlyphBounds {
    long x0 = 0;
    long top = 0;
    long width = 0;
    long rows = 0;
};

} // namespace

std::unique_ptr<FontFace> FontFace::load(const std::filesystem::path& path, std::string& error) {
    FT_Library library = nullptr;
    if (FT_Init_FreeType(&library) != 0) {
        error = "failed to initialize FreeType";
        return nullptr;
    }
    FT_Face face = nullptr;
    if (FT_New_Face(library, path.string().c_str(), 0, &face) != 0 || face == nullptr) {
        error = "failed to load font '" + path.string() + "'";
        FT_Done_FreeType(library);
        return nullptr;
    }
    hb_font_t* shaper = hb_ft_font_create_referenced(face);
    hb_buffer_t* buffer = hb_buffer_create();
    if (shaper == nullptr || !hb_buffer_allocation_successful(buffer)) {
        error = "failed to create shaper for '" + path.string() + "'";
        hb_buffer_destroy(buffer);
        hb_font_destroy(shaper);
        FT_Done_Face(face);
        FT_Done_FreeType(library);
        return nullptr;
    }
    return std::make_unique<FontFace>(ConstructTag{}, library, face, shaper, buffer);
}

FontFace::FontFace(ConstructTag, FT_LibraryRec_* library, FT_FaceRec_* face, hb_font_t* shaper, hb_buffer_t* buffer)
    : library_(library), face_(face), shaper_(shaper), buffer_(buffer) {}

FontFace::~FontFace() {
    if (buffer_ != nullptr) {
        hb_buffer_destroy(buffer_);
    }
    // The shaper holds its own reference on the face.
    if (shaper_ != nullptr) {
        hb_font_destroy(shaper_);
    }
    if (face_ != nullptr) {
        FT_Done_Face(face_);
    }
    if (library_ != nullptr) {
        FT_Done_FreeType(library_);
    }
}

bool FontFace::set_pixel_size(int size) {
    if (size <= 0) {
        return false;
    }
    if (size == pixel_size_) {
        return true;
    }
    if (FT_Set_Pixel_Sizes(face_, 0, static_cast<FT_UInt>(size)) != 0) {
        return false;
    }
    hb_ft_font_changed(shaper_);
    pixel_size_ = size;
    return true;
}

std::vector<FontFace::PlacedGlyph> FontFace::shape(const std::string& text) {
    std::vector<PlacedGlyph> out;
    if (text.empty()) {
        return out;
    }
    hb_buffer_reset(buffer_);
    hb_buffer_add_utf8(buffer_, text.data(), static_cast<int>(text.size()), 0, -1);
    hb_buffer_guess_segment_properties(buffer_);
    hb_shape(shaper_, buffer_, nullptr, 0);

    unsigned int count = 0;
    const hb_glyph_info_t* infos = hb_buffer_get_glyph_infos(buffer_, &count);
    const hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(buffer_, &count);
    if (infos == nullptr || positions == nullptr) {
        return out;
    }

    out.reserve(count);
    long pen_x = 0;
    long pen_y = 0;
    for (unsigned int i = 0; i < count; ++i) {
        out.push_back({.index = infos[i].codepoint,
                       .pen_x = pen_x + positions[i].x_offset,
                       .pen_y = pen_y + positions[i].y_offset});
        pen_x += positions[i].x_advance;
        pen_y += positions[i].y_advance;
    }
    return out;
}

TextBox FontFace::measure(const std::string& text) {
    TextBox box;
    long min_x = std::numeric_limits<long>::max();
    long max_x = std::numeric_limits<long>::min();
    long min_top = std::numeric_limits<long>::max();
    long max_bottom = std::numeric_limits<long>::min();
    bool inked = false;

    for (const PlacedGlyph& placed : shape(text)) {
        if (FT_Load_Glyph(face_, placed.index, FT_LOAD_RENDER) != 0) {
            continue;
        }
        const FT_GlyphSlot slot = face_->glyph;
        if (slot->bitmap.width == 0 || slot->bitmap.rows == 0) {
            continue;
        }
        const GlyphBounds g{.x0 = round_pixels(placed.pen_x) + slot->bitmap_left,
                            .top = -(round_pixels(placed.pen_y) + slot->bitmap_top),
                            .width = static_cast<long>(slot->bitmap.width),
                            .rows = static_cast<long>(slot->bitmap.rows)};
        min_x = std::min(min_x, g.x0);
        max_x = std::max(max_x, g.x0 + g.width);
        min_top = std::min(min_top, g.top);
        max_bottom = std::max(max_bottom, g.top + g.rows);
        inked = true;
    }

    if (!inked) {
        return box;
    }
    box.left = static_cast<int>(min_x);
    box.ascent = static_cast<int>(-min_top);
    box.width = static_cast<int>(max_x - min_x);
    box.height = static_cast<int>(max_bottom - min_top);
    return box;
}

Image FontFace::render(const std::string& text, const Color& color) {
    const TextBox box = measure(text);
    Image layer = make_canvas(box.width, box.height, {color[0], color[1], color[2], 0});
    if (layer.empty()) {
        return layer;
    }

    for (const PlacedGlyph& placed : shape(text)) {
        if (FT_Load_Glyph(face_, placed.index, FT_LOAD_RENDER) != 0) {
            continue;
        }
        const FT_GlyphSlot slot = face_->glyph;
        const FT_Bitmap& bitmap = slot->bitmap;
        if (bitmap.pixel_mode != FT_PIXEL_MODE_GRAY || bitmap.buffer == nullptr) {
            continue;
        }
        const long origin_x = round_pixels(placed.pen_x) + slot->bitmap_left - box.left;
        const long origin_y = static_cast<long>(box.ascent) - (round_pixels(placed.pen_y) + slot->bitmap_top);
        for (unsigned int row = 0; row < bitmap.rows; ++row) {
            const long y = origin_y + static_cast<long>(row);
            if (y < 0 || y >= layer.height) {
                continue;
            }
            const unsigned char* src_row = bitmap.buffer + (static_cast<long>(row) * bitmap.pitch);
            for (unsigned int col = 0; col < bitmap.width; ++col) {
                const long x = origin_x + static_cast<long>(col);
                if (x < 0 || x >= layer.width) {
                    continue;
                }
                const int coverage = (src_row[col] * color[CHANNEL_A]) / MAX_CHANNEL_VALUE;
                unsigned char* dst = layer.pixel(static_cast<int>(x), static_cast<int>(y));
                dst[CHANNEL_A] = static_cast<unsigned char>(std::max<int>(dst[CHANNEL_A], coverage));
            }
        }
    }
    return layer;
}

void FontFace::draw(Image& canvas, const std::string& text, int x, int y, const Color& color) {
    const Image layer = render(text, color);
    composite_over(canvas, layer, x, y);
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::optional<TextFit> fit_two_line_title(const std::string& title,
                                          const Rect& rect,
                                          FontFace& font,
                                          int start_size,
                                          int min_size,
                                          int step,
                                          int line_spacing) {
    const std::vector<std::string> words = split_words(title);
    if (words.size() < 2 || !rect.valid() || step <= 0 || min_size <= 0) {
        return std::nullopt;
    }

    std::vector<std::pair<std::string, std::string>> splits;
    for (size_t i = 1; i < words.size(); ++i) {
        std::string first;
        std::string second;
        for (size_t k = 0; k < words.size(); ++k) {
            std::string& target = k < i ? first : second;
            if (!target.empty()) {
                target += ' ';
            }
            target += words[k];
        }
        splits.emplace_back(std::move(first), std::move(second));
    }

    for (int size = start_size; size >= min_size; size -= step) {
        if (!font.set_pixel_size(size)) {
            continue;
        }
        for (const auto& [first, second] : splits) {
            const TextBox box1 = font.measure(first);
            const TextBox box2 = font.measure(second);
            const int block_width = std::max(box1.width, box2.width);
            const int block_height = box1.height + line_spacing + box2.height;
            if (block_width <= rect.width() && block_height <= rect.height()) {
                TextFit fit;
                fit.lines = {first, second};
                fit.font_size = size;
                fit.line_spacing = line_spacing;
                fit.boxes = {box1, box2};
                fit.block_width = block_width;
                fit.block_height = block_height;
                return fit;
            }
        }
    }
    return std::nullopt;
}

std::optional<TextFit> fit_two_line_title(const std::string& title,
                                          const Rect& rect,
                                          const std::filesystem::path& font_path,
                                          int start_size,
                                          int min_size,
                                          int step,
                                          int line_spacing) {
    std::string error;
    std::unique_ptr<FontFace> font = FontFace::load(font_path, error);
    if (!font) {
        std::cerr << "Warning: " << error << "\n";
        return std::nullopt;
    }
    return fit_two_line_title(title, rect, *font, start_size, min_size, step, line_spacing);
}

void draw_title(Image& canvas, const TextFit& fit, const Rect& rect, FontFace& font, const Color& color) {
    if (!font.set_pixel_size(fit.font_size)) {
        std::cerr << "Warning: Failed to set title font size " << fit.font_size << "\n";
        return;
    }
    const int block_top = rect.y1 + ((rect.height() - fit.block_height) / 2);
    const int first_x = rect.x1 + ((rect.width() - fit.boxes[0].width) / 2);
    const int second_x = rect.x1 + ((rect.width() - fit.boxes[1].width) / 2);
    font.draw(canvas, fit.lines[0], first_x, block_top, color);
    font.draw(canvas, fit.lines[1], second_x, block_top + fit.boxes[0].height + fit.line_spacing, color);
}

std::string title_from_folder_name(const std::string& name) {
    std::string spaced = name;
    std::replace(spaced.begin(), spaced.end(), '_', ' ');
    std::replace(spaced.begin(), spaced.end(), '-', ' ');

    std::string out;
    for (const std::string& word : split_words(spaced)) {
        if (!out.empty()) {
            out += ' ';
        }
        std::string lower = to_lower_copy(word);
        lower[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(lower[0])));
        out += lower;
    }
    return out;
}

} // namespace mockforge::core

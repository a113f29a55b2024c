// text_fitter.h
// MIT License (c) 2026 Pedro

#pragma once

#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "geometry.h"
#include "image.h"

struct FT_LibraryRec_;
struct FT_FaceRec_;
struct hb_font_t;
struct hb_buffer_t;

namespace mockforge::core {

// Tight glyph bounds of a line of text. left is the offset of the first inked
// column from the pen origin, ascent the distance from the baseline up to the
// highest inked row.
struct TextBox {
    int left = 0;
    int ascent = 0;
    int width = 0;
    int height = 0;
};

// A FreeType face shaped through HarfBuzz. Measuring and rendering share one
// glyph placement, so a rendered line always fills its measured box.
class FontFace {
    struct ConstructTag {
        explicit ConstructTag() = default;
    };

public:
    static std::unique_ptr<FontFace> load(const std::filesystem::path& path, std::string& error);

    FontFace(ConstructTag, FT_LibraryRec_* library, FT_FaceRec_* face, hb_font_t* shaper, hb_buffer_t* buffer);
    ~FontFace();
    FontFace(const FontFace&) = delete;
    FontFace& operator=(const FontFace&) = delete;

    bool set_pixel_size(int size);
    int pixel_size() const { return pixel_size_; }

    TextBox measure(const std::string& text);

    // Glyph coverage in color, cropped to the measured box. Empty for blank text.
    Image render(const std::string& text, const Color& color);

    // Draws text with the top-left of its tight box at (x, y).
    void draw(Image& canvas, const std::string& text, int x, int y, const Color& color);

private:
    struct PlacedGlyph {
        unsigned int index = 0;
        long pen_x = 0; // 26.6
        long pen_y = 0; // 26.6, up
    };

    std::vector<PlacedGlyph> shape(const std::string& text);

    FT_LibraryRec_* library_ = nullptr;
    FT_FaceRec_* face_ = nullptr;
    hb_font_t* shaper_ = nullptr;
    hb_buffer_t* buffer_ = nullptr;
    int pixel_size_ = 0;
};

struct TextFit {
    std::array<std::string, 2> lines;
    int font_size = 0;
    int line_spacing = 0;
    std::array<TextBox, 2> boxes{};
    int block_width = 0;
    int block_height = 0;
};

std::vector<std::string> split_words(const std::string& text);

// Descends from start_size to min_size by step and, at each size, tries every
// split point first to last. The first pair whose two-line block fits inside
// rect wins. Empty for titles with fewer than two words.
std::optional<TextFit> fit_two_line_title(const std::string& title,
                                          const Rect& rect,
                                          FontFace& font,
                                          int start_size,
                                          int min_size,
                                          int step,
                                          int line_spacing);

// Loads the font first; a font that fails to load yields no fit.
std::optional<TextFit> fit_two_line_title(const std::string& title,
                                          const Rect& rect,
                                          const std::filesystem::path& font_path,
                                          int start_size,
                                          int min_size,
                                          int step,
                                          int line_spacing);

// Block vertically centered in rect, each line horizontally centered.
void draw_title(Image& canvas, const TextFit& fit, const Rect& rect, FontFace& font, const Color& color);

// "red_floral-pattern" -> "Red Floral Pattern"
std::string title_from_folder_name(const std::string& name);

} // namespace mockforge::core

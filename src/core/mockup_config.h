// mockup_config.h
// MIT License (c) 2026 Pedro

#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "geometry.h"
#include "grid_layout.h"
#include "image.h"
#include "watermark.h"

#ifndef MOCKFORGE_GLOBAL_PRESET_CONFIG
#define MOCKFORGE_GLOBAL_PRESET_CONFIG "/usr/local/share/mockforge/mockforge.cfg"
#endif

namespace mockforge::core {

constexpr const char* k_preset_config_filename = "mockforge.cfg";
constexpr const char* k_user_preset_config_relpath = ".config/mockforge/mockforge.cfg";
constexpr const char* k_global_preset_config_path = MOCKFORGE_GLOBAL_PRESET_CONFIG;

enum class MainLayout { Grid, Collage, AroundText };

struct MockupPreset {
    std::string name;

    Size canvas{.width = 3000, .height = 2250};
    Color background_color{225, 213, 213, 255};

    MainLayout main_layout = MainLayout::Grid;
    int main_padding = 50;
    double collage_scale = 1.15;
    int around_text_padding = 30;

    GridShape grid_shape{.cols = 2, .rows = 2};
    Size grid_canvas{.width = 2000, .height = 2000};
    int grid_padding = 30;

    int bordered_grid_width = 3000;
    GridShape bordered_grid_shape{.cols = 4, .rows = 3};
    int bordered_grid_border = 15;
    Color border_color{255, 255, 255, 255};

    int region_threshold = 20;
    int region_padding = 35;

    int title_start_size = 250;
    int title_min_size = 40;
    int title_step = 5;
    int title_line_spacing = 15;
    Color title_color{50, 50, 50, 255};

    // Drawn above and below the title at a fixed size. "{count}" expands to
    // the number of product images.
    std::string subtitle_top;
    std::string subtitle_bottom;
    int subtitle_size = 60;
    int subtitle_spacing = 25;

    WatermarkSettings watermark;
    std::string watermark_text = "preview";
    Color watermark_text_color{150, 150, 150, 255};

    double transparency_scale = 0.7;
    int checker_size = 30;
    Color checker_color1{255, 255, 255, 255};
    Color checker_color2{200, 200, 200, 255};

    Size seamless_canvas{.width = 2000, .height = 2000};
    int seamless_tile_max = 550;
    int seamless_margin = 100;
    int seamless_gap = 100;
    Color seamless_color{255, 255, 255, 255};

    bool create_main = true;
    bool create_grids = true;
    bool create_bordered_grid = false;
    bool create_seamless = false;
    bool create_transparency = true;
    bool watermark_main = false;
    bool watermark_grids = true;
};

// Produces MockupPreset values. Presets are never edited after build().
class PresetBuilder {
public:
    PresetBuilder() = default;
    explicit PresetBuilder(MockupPreset base) : preset_(std::move(base)) {}

    static PresetBuilder clipart_defaults();
    static PresetBuilder pattern_defaults();
    static PresetBuilder border_clipart_defaults();

    PresetBuilder& name(std::string value);
    PresetBuilder& canvas(Size value);
    PresetBuilder& main_layout(MainLayout value);
    PresetBuilder& grid(GridShape shape, Size canvas, int padding);
    PresetBuilder& region(int threshold, int inner_padding);
    PresetBuilder& title(int start_size, int min_size, int step, int line_spacing);
    PresetBuilder& watermark(WatermarkSettings value);
    PresetBuilder& subtitles(std::string top, std::string bottom);
    PresetBuilder& variants(bool main, bool grids, bool bordered_grid, bool seamless, bool transparency);
    PresetBuilder& watermarks(bool main, bool grids);

    // Applies one "key = value" entry from a preset file.
    bool set(const std::string& key, const std::string& value, std::string& error);

    MockupPreset build() const;

private:
    MockupPreset preset_;
};

struct PresetSetting {
    std::string key;
    std::string value;
    size_t line = 0;
};

struct PresetSection {
    std::string name;
    std::vector<PresetSetting> settings;
};

bool parse_main_layout(const std::string& value, MainLayout& out);
const char* main_layout_name(MainLayout layout);

// "[preset NAME]" sections of "key = value" lines; '#' and ';' start comments.
bool parse_preset_config(std::istream& input, std::vector<PresetSection>& out, std::string& error);
bool load_preset_config_from_file(const std::filesystem::path& path, std::vector<PresetSection>& out, std::string& error);
std::optional<std::filesystem::path> resolve_user_preset_config_path();

// Applies every section named preset_name, in file order.
bool apply_preset_sections(PresetBuilder& builder,
                           const std::string& preset_name,
                           const std::vector<PresetSection>& sections,
                           std::string& error);

} // namespace mockforge::core

// mockup_config.cpp
// MIT License (c) 2026 Pedro

#include "mockup_config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "cli_parse.h"

namespace fs = std::filesystem;

namespace mockforge::core {

namespace {

bool parse_grid_shape(const std::string& value, GridShape& out) {
    int cols = 0;
    int rows = 0;
    if (!parse_size(value, cols, rows)) {
        return false;
    }
    out = {.cols = cols, .rows = rows};
    return true;
}

bool parse_ratio(const std::string& value, double& out) {
    double parsed = 0.0;
    if (!parse_double(value, parsed) || parsed <= 0.0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_percent(const std::string& value, int& out) {
    int parsed = 0;
    if (!parse_non_negative_int(value, parsed) || parsed > 100) {
        return false;
    }
    out = parsed;
    return true;
}

} // namespace

bool parse_main_layout(const std::string& value, MainLayout& out) {
    const std::string lower = to_lower_copy(value);
    if (lower == "grid") {
        out = MainLayout::Grid;
        return true;
    }
    if (lower == "collage") {
        out = MainLayout::Collage;
        return true;
    }
    if (lower == "around_text" || lower == "around-text") {
        out = MainLayout::AroundText;
        return true;
    }
    return false;
}

const char* main_layout_name(MainLayout layout) {
    switch (layout) {
        case MainLayout::Grid:
            return "grid";
        case MainLayout::Collage:
            return "collage";
        case MainLayout::AroundText:
            return "around_text";
    }
    return "grid";
}

PresetBuilder PresetBuilder::clipart_defaults() {
    PresetBuilder builder;
    builder.name("clipart")
        .main_layout(MainLayout::Grid)
        .grid({.cols = 2, .rows = 2}, {.width = 2000, .height = 2000}, 30)
        .subtitles("{count} clip arts \xE2\x80\xA2 Commercial Use", "300 DPI \xE2\x80\xA2 Transparent PNG")
        .variants(true, true, false, false, true);
    return builder;
}

PresetBuilder PresetBuilder::pattern_defaults() {
    PresetBuilder builder;
    builder.name("pattern")
        .main_layout(MainLayout::Collage)
        .title(250, 20, 5, 8)
        .variants(true, false, true, true, false);
    return builder;
}

PresetBuilder PresetBuilder::border_clipart_defaults() {
    PresetBuilder builder;
    builder.name("border_clipart")
        .main_layout(MainLayout::AroundText)
        .grid({.cols = 1, .rows = 4}, {.width = 3000, .height = 2250}, 30)
        .variants(true, true, false, false, true);
    return builder;
}

PresetBuilder& PresetBuilder::name(std::string value) {
    preset_.name = std::move(value);
    return *this;
}

PresetBuilder& PresetBuilder::canvas(Size value) {
    preset_.canvas = value;
    return *this;
}

PresetBuilder& PresetBuilder::main_layout(MainLayout value) {
    preset_.main_layout = value;
    return *this;
}

PresetBuilder& PresetBuilder::grid(GridShape shape, Size canvas, int padding) {
    preset_.grid_shape = shape;
    preset_.grid_canvas = canvas;
    preset_.grid_padding = padding;
    return *this;
}

PresetBuilder& PresetBuilder::region(int threshold, int inner_padding) {
    preset_.region_threshold = threshold;
    preset_.region_padding = inner_padding;
    return *this;
}

PresetBuilder& PresetBuilder::title(int start_size, int min_size, int step, int line_spacing) {
    preset_.title_start_size = start_size;
    preset_.title_min_size = min_size;
    preset_.title_step = step;
    preset_.title_line_spacing = line_spacing;
    return *this;
}

PresetBuilder& PresetBuilder::watermark(WatermarkSettings value) {
    preset_.watermark = value;
    return *this;
}

PresetBuilder& PresetBuilder::subtitles(std::string top, std::string bottom) {
    preset_.subtitle_top = std::move(top);
    preset_.subtitle_bottom = std::move(bottom);
    return *this;
}

PresetBuilder& PresetBuilder::variants(bool main, bool grids, bool bordered_grid, bool seamless, bool transparency) {
    preset_.create_main = main;
    preset_.create_grids = grids;
    preset_.create_bordered_grid = bordered_grid;
    preset_.create_seamless = seamless;
    preset_.create_transparency = transparency;
    return *this;
}

PresetBuilder& PresetBuilder::watermarks(bool main, bool grids) {
    preset_.watermark_main = main;
    preset_.watermark_grids = grids;
    return *this;
}

bool PresetBuilder::set(const std::string& key, const std::string& value, std::string& error) {
    const std::string lower_key = to_lower_copy(key);
    MockupPreset& p = preset_;
    bool ok = true;

    if (lower_key == "canvas_size") {
        ok = parse_size(value, p.canvas.width, p.canvas.height);
    } else if (lower_key == "background_color") {
        ok = parse_color(value, p.background_color);
    } else if (lower_key == "main_layout") {
        ok = parse_main_layout(value, p.main_layout);
    } else if (lower_key == "main_padding") {
        ok = parse_non_negative_int(value, p.main_padding);
    } else if (lower_key == "collage_scale") {
        ok = parse_ratio(value, p.collage_scale);
    } else if (lower_key == "around_text_padding") {
        ok = parse_non_negative_int(value, p.around_text_padding);
    } else if (lower_key == "grid_shape") {
        ok = parse_grid_shape(value, p.grid_shape);
    } else if (lower_key == "grid_size") {
        ok = parse_size(value, p.grid_canvas.width, p.grid_canvas.height);
    } else if (lower_key == "grid_padding") {
        ok = parse_non_negative_int(value, p.grid_padding);
    } else if (lower_key == "bordered_grid_width") {
        ok = parse_positive_int(value, p.bordered_grid_width);
    } else if (lower_key == "bordered_grid_shape") {
        ok = parse_grid_shape(value, p.bordered_grid_shape);
    } else if (lower_key == "bordered_grid_border") {
        ok = parse_non_negative_int(value, p.bordered_grid_border);
    } else if (lower_key == "border_color") {
        ok = parse_color(value, p.border_color);
    } else if (lower_key == "region_threshold") {
        ok = parse_non_negative_int(value, p.region_threshold) && p.region_threshold <= MAX_CHANNEL_VALUE;
    } else if (lower_key == "region_padding") {
        ok = parse_non_negative_int(value, p.region_padding);
    } else if (lower_key == "title_start_size") {
        ok = parse_positive_int(value, p.title_start_size);
    } else if (lower_key == "title_min_size") {
        ok = parse_positive_int(value, p.title_min_size);
    } else if (lower_key == "title_step") {
        ok = parse_positive_int(value, p.title_step);
    } else if (lower_key == "title_line_spacing") {
        ok = parse_non_negative_int(value, p.title_line_spacing);
    } else if (lower_key == "title_color") {
        ok = parse_color(value, p.title_color);
    } else if (lower_key == "subtitle_top") {
        p.subtitle_top = value == "none" ? std::string() : value;
    } else if (lower_key == "subtitle_bottom") {
        p.subtitle_bottom = value == "none" ? std::string() : value;
    } else if (lower_key == "subtitle_size") {
        ok = parse_positive_int(value, p.subtitle_size);
    } else if (lower_key == "subtitle_spacing") {
        ok = parse_non_negative_int(value, p.subtitle_spacing);
    } else if (lower_key == "watermark_opacity") {
        ok = parse_percent(value, p.watermark.opacity_pct);
    } else if (lower_key == "watermark_spacing") {
        ok = parse_ratio(value, p.watermark.spacing_multiplier);
    } else if (lower_key == "watermark_size_ratio") {
        ok = parse_ratio(value, p.watermark.size_ratio);
    } else if (lower_key == "watermark_text") {
        p.watermark_text = value;
    } else if (lower_key == "watermark_text_color") {
        ok = parse_color(value, p.watermark_text_color);
    } else if (lower_key == "transparency_scale") {
        ok = parse_ratio(value, p.transparency_scale);
    } else if (lower_key == "checker_size") {
        ok = parse_positive_int(value, p.checker_size);
    } else if (lower_key == "checker_color1") {
        ok = parse_color(value, p.checker_color1);
    } else if (lower_key == "checker_color2") {
        ok = parse_color(value, p.checker_color2);
    } else if (lower_key == "seamless_size") {
        ok = parse_size(value, p.seamless_canvas.width, p.seamless_canvas.height);
    } else if (lower_key == "seamless_tile_max") {
        ok = parse_positive_int(value, p.seamless_tile_max);
    } else if (lower_key == "seamless_margin") {
        ok = parse_non_negative_int(value, p.seamless_margin);
    } else if (lower_key == "seamless_gap") {
        ok = parse_non_negative_int(value, p.seamless_gap);
    } else if (lower_key == "seamless_color") {
        ok = parse_color(value, p.seamless_color);
    } else if (lower_key == "create_main") {
        ok = parse_bool_value(value, p.create_main);
    } else if (lower_key == "create_grids") {
        ok = parse_bool_value(value, p.create_grids);
    } else if (lower_key == "create_bordered_grid") {
        ok = parse_bool_value(value, p.create_bordered_grid);
    } else if (lower_key == "create_seamless") {
        ok = parse_bool_value(value, p.create_seamless);
    } else if (lower_key == "create_transparency") {
        ok = parse_bool_value(value, p.create_transparency);
    } else if (lower_key == "watermark_main") {
        ok = parse_bool_value(value, p.watermark_main);
    } else if (lower_key == "watermark_grids") {
        ok = parse_bool_value(value, p.watermark_grids);
    } else {
        error = "unknown key '" + key + "'";
        return false;
    }

    if (!ok) {
        error = "invalid " + lower_key + " '" + value + "'";
        return false;
    }
    return true;
}

MockupPreset PresetBuilder::build() const {
    return preset_;
}

bool parse_preset_config(std::istream& input, std::vector<PresetSection>& out, std::string& error) {
    out.clear();
    std::unordered_set<std::string> seen_names;
    std::optional<PresetSection> current;
    PresetBuilder validator;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            if (current) {
                out.push_back(*current);
                current.reset();
            }
            std::string header = trimmed.substr(1, trimmed.size() - 2);
            std::istringstream iss(header);
            std::string section_type;
            if (!(iss >> section_type)) {
                error = "empty section header at line " + std::to_string(line_number);
                return false;
            }
            section_type = to_lower_copy(section_type);
            if (section_type != "preset") {
                error = "unsupported section '" + section_type + "' at line " + std::to_string(line_number);
                return false;
            }
            std::string name;
            if (!(iss >> name)) {
                error = "missing preset name at line " + std::to_string(line_number);
                return false;
            }
            std::string extra;
            if (iss >> extra) {
                error = "unexpected token '" + extra + "' in preset header at line " +
                        std::to_string(line_number);
                return false;
            }
            if (seen_names.find(name) != seen_names.end()) {
                error = "duplicate preset '" + name + "' at line " + std::to_string(line_number);
                return false;
            }
            seen_names.insert(name);
            current = PresetSection{.name = name, .settings = {}};
            continue;
        }

        if (!current) {
            error = "entry outside of preset section at line " + std::to_string(line_number);
            return false;
        }

        size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            error = "invalid line '" + trimmed + "' at line " + std::to_string(line_number);
            return false;
        }
        std::string key = trim_copy(trimmed.substr(0, equals));
        std::string value = trim_copy(trimmed.substr(equals + 1));
        if (key.empty()) {
            error = "empty key at line " + std::to_string(line_number);
            return false;
        }
        if (value.empty()) {
            error = "empty value for key '" + key + "' at line " + std::to_string(line_number);
            return false;
        }
        if (!validator.set(key, value, error)) {
            error += " at line " + std::to_string(line_number);
            return false;
        }
        current->settings.push_back({.key = key, .value = value, .line = line_number});
    }

    if (current) {
        out.push_back(*current);
    }

    if (out.empty()) {
        error = "no presets defined";
        return false;
    }
    return true;
}

bool load_preset_config_from_file(const fs::path& path, std::vector<PresetSection>& out, std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    return parse_preset_config(input, out, error);
}

std::optional<fs::path> resolve_user_preset_config_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return fs::path(home) / k_user_preset_config_relpath;
}

bool apply_preset_sections(PresetBuilder& builder,
                           const std::string& preset_name,
                           const std::vector<PresetSection>& sections,
                           std::string& error) {
    for (const PresetSection& section : sections) {
        if (section.name != preset_name) {
            continue;
        }
        for (const PresetSetting& setting : section.settings) {
            if (!builder.set(setting.key, setting.value, error)) {
                error += " at line " + std::to_string(setting.line);
                return false;
            }
        }
    }
    return true;
}

} // namespace mockforge::core

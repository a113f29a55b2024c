// mockup_composer.cpp
// MIT License (c) 2026 Pedro

#include "mockup_composer.h"

#include <algorithm>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

#include "cli_parse.h"
#include "grid_layout.h"
#include "region_detector.h"
#include "watermark.h"

namespace fs = std::filesystem;

namespace mockforge::core {

namespace {

constexpr double k_around_text_default_width = 0.55;
constexpr double k_around_text_default_height = 0.20;
constexpr double k_transparency_width_share = 0.5;
constexpr double k_transparency_enlarge = 1.15;
constexpr int k_transparency_center_gap = 60;
constexpr int k_subtitle_lighten = 30;
constexpr const char* k_count_placeholder = "{count}";

std::string expand_subtitle(std::string text, size_t image_count) {
    const size_t pos = text.find(k_count_placeholder);
    if (pos != std::string::npos) {
        text.replace(pos, std::char_traits<char>::length(k_count_placeholder), std::to_string(image_count));
    }
    return text;
}

Color lighten(const Color& color, int amount) {
    Color out = color;
    for (size_t c = 0; c < CHANNEL_A; ++c) {
        out[c] = static_cast<unsigned char>(std::min(MAX_CHANNEL_VALUE, color[c] + amount));
    }
    return out;
}

struct Subtitle {
    std::string text;
    TextBox box;
};

std::string folder_title(const fs::path& folder) {
    std::error_code ec;
    fs::path absolute = fs::absolute(folder, ec);
    if (ec) {
        absolute = folder;
    }
    absolute = absolute.lexically_normal();
    std::string title = title_from_folder_name(absolute.filename().string());
    if (title.empty()) {
        title = title_from_folder_name(absolute.parent_path().filename().string());
    }
    return title;
}

Image fit_to_canvas(const Image& image, const Size& canvas) {
    if (image.size() == canvas) {
        return image;
    }
    return resize_image(image, canvas.width, canvas.height);
}

Rect default_text_bounds(const Size& canvas) {
    const int w = static_cast<int>(canvas.width * k_around_text_default_width);
    const int h = static_cast<int>(canvas.height * k_around_text_default_height);
    return rect_from_xywh((canvas.width - w) / 2, (canvas.height - h) / 2, w, h);
}

std::string grid_file_stem(size_t index) {
    if (index == 0) {
        return "grid";
    }
    return "grid_" + std::to_string(index + 1);
}

} // namespace

size_t FolderReport::created() const {
    return static_cast<size_t>(std::count_if(variants.begin(), variants.end(),
        [](const VariantOutcome& v) { return v.success; }));
}

MockupComposer::MockupComposer(MockupPreset preset, const MockupAssets& assets, bool verbose)
    : preset_(std::move(preset)), verbose_(verbose) {
    background_ = load_optional_asset(assets.background, "background");
    overlay_ = load_optional_asset(assets.overlay, "overlay");
    logo_ = load_optional_asset(assets.logo, "logo");
    transparency_backdrop_ = load_optional_asset(assets.transparency_backdrop, "transparency backdrop");

    if (!assets.font.empty()) {
        std::string error;
        font_ = FontFace::load(assets.font, error);
        if (!font_) {
            std::cerr << "Warning: Failed to load font " << to_quoted(assets.font.string())
                      << ": " << error << "; titles are skipped\n";
        }
    }
}

std::optional<Image> MockupComposer::load_optional_asset(const fs::path& path, const char* label) {
    if (path.empty()) {
        return std::nullopt;
    }
    LoadResult result = load_image(path);
    if (const auto* failure = std::get_if<LoadFailure>(&result)) {
        std::cerr << "Warning: Failed to load " << label << ' ' << to_quoted(failure->path)
                  << ": " << failure->reason << "\n";
        return std::nullopt;
    }
    return std::get<Image>(std::move(result));
}

Image MockupComposer::make_background(const Size& size) const {
    if (background_) {
        Image resized = fit_to_canvas(*background_, size);
        if (!resized.empty()) {
            return resized;
        }
    }
    return make_canvas(size.width, size.height, preset_.background_color);
}

Image MockupComposer::apply_configured_watermark(const Image& canvas) {
    if (logo_) {
        return apply_watermark(canvas, *logo_, preset_.watermark);
    }
    if (font_ && !preset_.watermark_text.empty()) {
        return apply_text_watermark(canvas, preset_.watermark_text, *font_,
                                    preset_.watermark_text_color, preset_.watermark);
    }
    return canvas;
}

std::optional<Image> MockupComposer::layout_main(const std::vector<Image>& images,
                                                 const Image& canvas,
                                                 const std::optional<Image>& overlay) {
    const std::vector<Size> sizes = image_sizes(images);
    switch (preset_.main_layout) {
        case MainLayout::Grid: {
            const GridShape shape = select_main_grid(sizes);
            return layout_grid(images, canvas, shape.rows, shape.cols, preset_.main_padding);
        }
        case MainLayout::Collage: {
            const GridShape shape = select_main_grid(sizes);
            return layout_collage(images, canvas, shape.cols, shape.rows, preset_.collage_scale);
        }
        case MainLayout::AroundText: {
            std::optional<Rect> bounds;
            if (overlay) {
                bounds = compute_foreground_bounds(*overlay, preset_.region_threshold);
            }
            const Rect text_bounds = bounds ? *bounds : default_text_bounds(canvas.size());
            auto plan = plan_around_text(sizes, canvas.size(), text_bounds, preset_.around_text_padding);
            if (!plan) {
                std::cerr << "Warning: Text bounds leave no room for images\n";
                return std::nullopt;
            }
            Image out = canvas;
            composite_plan(out, *plan, images);
            return out;
        }
    }
    return std::nullopt;
}

void MockupComposer::render_title(Image& canvas, const Image& overlay, const std::string& title, size_t image_count) {
    if (!font_) {
        return;
    }
    auto region = detect_text_region(overlay, preset_.region_threshold, preset_.region_padding);
    if (!region) {
        std::cerr << "Warning: No text region found in overlay; title skipped\n";
        return;
    }

    // Subtitles keep their size; the title is fitted into what they leave.
    std::optional<Subtitle> top;
    std::optional<Subtitle> bottom;
    int reserved = 0;
    if (!preset_.subtitle_top.empty() || !preset_.subtitle_bottom.empty()) {
        if (!font_->set_pixel_size(preset_.subtitle_size)) {
            std::cerr << "Warning: Failed to set subtitle font size " << preset_.subtitle_size << "\n";
        } else {
            auto measure_subtitle = [&](const std::string& pattern) -> std::optional<Subtitle> {
                if (pattern.empty()) {
                    return std::nullopt;
                }
                Subtitle subtitle{.text = expand_subtitle(pattern, image_count), .box = {}};
                subtitle.box = font_->measure(subtitle.text);
                if (subtitle.box.width <= 0 || subtitle.box.width > region->width()) {
                    std::cerr << "Warning: Subtitle " << to_quoted(subtitle.text) << " does not fit; skipped\n";
                    return std::nullopt;
                }
                return subtitle;
            };
            top = measure_subtitle(preset_.subtitle_top);
            bottom = measure_subtitle(preset_.subtitle_bottom);
            if (top) {
                reserved += top->box.height + preset_.subtitle_spacing;
            }
            if (bottom) {
                reserved += bottom->box.height + preset_.subtitle_spacing;
            }
            if (reserved >= region->height()) {
                std::cerr << "Warning: Subtitles leave no room for the title; subtitles skipped\n";
                top.reset();
                bottom.reset();
                reserved = 0;
            }
        }
    }

    const Rect title_space{.x1 = region->x1, .y1 = region->y1, .x2 = region->x2, .y2 = region->y2 - reserved};
    auto fit = fit_two_line_title(title, title_space, *font_,
                                  preset_.title_start_size, preset_.title_min_size,
                                  preset_.title_step, preset_.title_line_spacing);
    if (!fit) {
        std::cerr << "Warning: Title " << to_quoted(title) << " does not fit in "
                  << title_space.width() << "x" << title_space.height() << " region; title skipped\n";
        return;
    }

    const int block_height = fit->block_height + reserved;
    int y = region->y1 + ((region->height() - block_height) / 2);
    if (top) {
        y += top->box.height + preset_.subtitle_spacing;
    }
    const Rect title_rect{.x1 = region->x1, .y1 = y, .x2 = region->x2, .y2 = y + fit->block_height};
    draw_title(canvas, *fit, title_rect, *font_, preset_.title_color);
    if (!top && !bottom) {
        return;
    }

    if (!font_->set_pixel_size(preset_.subtitle_size)) {
        std::cerr << "Warning: Failed to set subtitle font size " << preset_.subtitle_size << "\n";
        return;
    }
    const Color subtitle_color = lighten(preset_.title_color, k_subtitle_lighten);
    if (top) {
        const int top_y = title_rect.y1 - preset_.subtitle_spacing - top->box.height;
        font_->draw(canvas, top->text, region->x1 + ((region->width() - top->box.width) / 2), top_y, subtitle_color);
    }
    if (bottom) {
        const int bottom_y = title_rect.y2 + preset_.subtitle_spacing;
        font_->draw(canvas, bottom->text, region->x1 + ((region->width() - bottom->box.width) / 2), bottom_y, subtitle_color);
    }
}

std::optional<Image> MockupComposer::compose_main(const std::vector<Image>& images, const std::string& title) {
    if (images.empty()) {
        return std::nullopt;
    }
    const Image background = make_background(preset_.canvas);

    std::optional<Image> overlay;
    if (overlay_) {
        Image resized = fit_to_canvas(*overlay_, preset_.canvas);
        if (!resized.empty()) {
            overlay = std::move(resized);
        }
    }

    auto canvas = layout_main(images, background, overlay);
    if (!canvas) {
        return std::nullopt;
    }

    if (overlay) {
        composite_over(*canvas, *overlay, 0, 0);
        render_title(*canvas, *overlay, title, images.size());
    }

    if (preset_.watermark_main) {
        return apply_configured_watermark(*canvas);
    }
    return canvas;
}

std::vector<Image> MockupComposer::compose_grids(const std::vector<Image>& images) {
    std::vector<Image> out;
    const int rows = preset_.grid_shape.rows;
    const int cols = preset_.grid_shape.cols;
    if (images.empty() || rows <= 0 || cols <= 0) {
        return out;
    }
    const size_t per_grid = static_cast<size_t>(rows) * static_cast<size_t>(cols);
    const Image background = make_background(preset_.grid_canvas);
    for (size_t start = 0; start < images.size(); start += per_grid) {
        const size_t end = std::min(images.size(), start + per_grid);
        const std::vector<Image> group(images.begin() + static_cast<std::ptrdiff_t>(start),
                                       images.begin() + static_cast<std::ptrdiff_t>(end));
        auto grid = layout_grid(group, background, rows, cols, preset_.grid_padding);
        if (!grid) {
            continue;
        }
        if (preset_.watermark_grids) {
            out.push_back(apply_configured_watermark(*grid));
        } else {
            out.push_back(std::move(*grid));
        }
    }
    return out;
}

std::optional<Image> MockupComposer::compose_bordered_grid(const std::vector<Image>& images) {
    const int rows = preset_.bordered_grid_shape.rows;
    const int cols = preset_.bordered_grid_shape.cols;
    if (images.empty() || rows <= 0 || cols <= 0) {
        return std::nullopt;
    }
    auto plan = plan_bordered_grid(image_sizes(images), preset_.bordered_grid_width,
                                   rows, cols, preset_.bordered_grid_border);
    if (!plan) {
        std::cerr << "Warning: Bordered grid geometry is degenerate\n";
        return std::nullopt;
    }
    Image canvas = make_canvas(plan->canvas.width, plan->canvas.height, preset_.border_color);
    composite_plan(canvas, *plan, images);
    if (preset_.watermark_grids) {
        return apply_configured_watermark(canvas);
    }
    return canvas;
}

std::optional<Image> MockupComposer::compose_seamless(const Image& tile) {
    if (tile.empty()) {
        return std::nullopt;
    }
    auto plan = plan_seamless(tile.size(), preset_.seamless_canvas, preset_.seamless_tile_max,
                              preset_.seamless_margin, preset_.seamless_gap);
    if (!plan) {
        std::cerr << "Warning: Seamless tile geometry is degenerate\n";
        return std::nullopt;
    }
    Image canvas = make_canvas(plan->canvas.width, plan->canvas.height, preset_.seamless_color);
    if (canvas.empty()) {
        return std::nullopt;
    }
    composite_plan(canvas, *plan, {tile});
    return canvas;
}

std::optional<Image> MockupComposer::compose_transparency_demo(const Image& image) {
    if (image.empty()) {
        return std::nullopt;
    }
    const Size canvas_size = preset_.canvas;
    Image canvas;
    if (transparency_backdrop_) {
        canvas = fit_to_canvas(*transparency_backdrop_, canvas_size);
    }
    if (canvas.empty()) {
        canvas = make_checkerboard(canvas_size.width, canvas_size.height, preset_.checker_size,
                                   preset_.checker_color1, preset_.checker_color2);
    }

    const double scale = preset_.transparency_scale * k_transparency_enlarge;
    const int max_w = static_cast<int>(canvas_size.width * k_transparency_width_share * scale);
    const int max_h = static_cast<int>(canvas_size.height * scale);

    Image thumb = image;
    if (image.width > max_w || image.height > max_h) {
        auto fitted = fit_within(image.size(), max_w, max_h);
        if (!fitted) {
            return std::nullopt;
        }
        thumb = resize_image(image, fitted->width, fitted->height);
        if (thumb.empty()) {
            return std::nullopt;
        }
    }

    // Flattened onto white, then masked by the image's own alpha.
    Image flattened = make_canvas(thumb.width, thumb.height, {255, 255, 255, 255});
    composite_over(flattened, thumb, 0, 0);
    for (size_t i = 0; i < flattened.pixels.size(); i += NUM_CHANNELS) {
        flattened.pixels[i + CHANNEL_A] = thumb.pixels[i + CHANNEL_A];
    }

    const int center_x = canvas_size.width / 2;
    const int center_y = canvas_size.height / 2;
    const int x = std::max(0, center_x - thumb.width - k_transparency_center_gap);
    const int y = std::max(0, center_y - thumb.height / 2);
    composite_over(canvas, flattened, x, y);
    return canvas;
}

VariantOutcome MockupComposer::save_variant(const std::string& name, const Image& image, const fs::path& path) const {
    VariantOutcome outcome{.name = name, .success = false, .message = {}, .output = path};
    std::string error;
    if (!save_image(image, path, error)) {
        outcome.message = error;
        std::cerr << "Error: Failed to save " << to_quoted(path.string()) << ": " << error << "\n";
        return outcome;
    }
    outcome.success = true;
    outcome.message = "created";
    if (verbose_) {
        std::cout << "Created " << to_quoted(path.string()) << "\n";
    }
    return outcome;
}

FolderReport MockupComposer::run(const fs::path& folder, const std::string& title_override) {
    FolderReport report;
    report.folder = folder;

    const std::vector<fs::path> paths = list_product_images(folder);
    std::vector<Image> images;
    images.reserve(paths.size());
    for (const fs::path& path : paths) {
        LoadResult result = load_image(path);
        if (const auto* failure = std::get_if<LoadFailure>(&result)) {
            std::cerr << "Warning: Skipping " << to_quoted(failure->path) << ": " << failure->reason << "\n";
            continue;
        }
        images.push_back(std::get<Image>(std::move(result)));
    }

    if (images.empty()) {
        std::cerr << "Error: No usable product images in " << to_quoted(folder.string()) << "\n";
        report.variants.push_back({.name = "main", .success = false,
                                   .message = "no usable product images", .output = {}});
        return report;
    }

    const std::string title = title_override.empty() ? folder_title(folder) : title_override;

    const fs::path out_dir = folder / k_mockup_dir_name;
    if (verbose_) {
        std::cout << "Composing " << images.size() << " images from " << to_quoted(folder.string())
                  << " (" << preset_.name << ")...\n";
    }

    if (preset_.create_main) {
        auto main = compose_main(images, title);
        if (main) {
            report.variants.push_back(save_variant("main", *main, out_dir / "main.png"));
        } else {
            report.variants.push_back({.name = "main", .success = false,
                                       .message = "layout geometry is degenerate", .output = {}});
        }
    }

    if (preset_.create_grids) {
        std::vector<Image> grids = compose_grids(images);
        if (grids.empty()) {
            report.variants.push_back({.name = "grid", .success = false,
                                       .message = "layout geometry is degenerate", .output = {}});
        }
        for (size_t i = 0; i < grids.size(); ++i) {
            const std::string stem = grid_file_stem(i);
            report.variants.push_back(save_variant(stem, grids[i], out_dir / (stem + ".png")));
        }
    }

    if (preset_.create_bordered_grid) {
        auto bordered = compose_bordered_grid(images);
        if (bordered) {
            report.variants.push_back(save_variant("bordered_grid", *bordered, out_dir / "bordered_grid.png"));
        } else {
            report.variants.push_back({.name = "bordered_grid", .success = false,
                                       .message = "layout geometry is degenerate", .output = {}});
        }
    }

    if (preset_.create_seamless) {
        auto seamless = compose_seamless(images.front());
        if (seamless) {
            report.variants.push_back(save_variant("seamless", *seamless, out_dir / "seamless.png"));
        } else {
            report.variants.push_back({.name = "seamless", .success = false,
                                       .message = "first image could not be scaled", .output = {}});
        }
    }

    if (preset_.create_transparency) {
        auto demo = compose_transparency_demo(images.front());
        if (demo) {
            report.variants.push_back(save_variant("transparency", *demo, out_dir / "transparency.png"));
        } else {
            report.variants.push_back({.name = "transparency", .success = false,
                                       .message = "first image could not be scaled", .output = {}});
        }
    }

    return report;
}

} // namespace mockforge::core

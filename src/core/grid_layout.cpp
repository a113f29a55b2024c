// grid_layout.cpp
// MIT License (c) 2026 Pedro

#include "grid_layout.h"

#include <algorithm>
#include <array>
#include <iostream>
#include <limits>
#include <map>
#include <utility>

namespace mockforge::core {

namespace {

constexpr double k_corner_scale = 1.35;
constexpr size_t k_around_text_slots = 8;
constexpr size_t k_bordered_aspect_samples = 3;

int floor_div(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// (extent - (count + 1) * padding) / count without int overflow.
long long padded_cell_extent(int extent, int count, int padding) {
    const long long gaps = (static_cast<long long>(count) + 1) * padding;
    return (static_cast<long long>(extent) - gaps) / count;
}

bool size_is_degenerate(const Size& size) {
    return size.width <= 0 || size.height <= 0;
}

Placement center_in(size_t image_index, const Rect& cell, const Size& fitted) {
    Placement p;
    p.image_index = image_index;
    p.cell = cell;
    p.width = fitted.width;
    p.height = fitted.height;
    p.x = cell.x1 + floor_div(cell.width() - fitted.width, 2);
    p.y = cell.y1 + floor_div(cell.height() - fitted.height, 2);
    return p;
}

// Scales the image so it spans the slot along its limiting axis, then by scale.
std::optional<Size> cover_slot(const Size& image, const Rect& slot, double scale) {
    if (size_is_degenerate(image) || !slot.valid()) {
        return std::nullopt;
    }
    const double aspect = static_cast<double>(image.width) / image.height;
    const double slot_aspect = static_cast<double>(slot.width()) / slot.height();
    Size out;
    if (slot_aspect > aspect) {
        out.width = static_cast<int>(slot.width() * scale);
        out.height = static_cast<int>(out.width / aspect);
    } else {
        out.height = static_cast<int>(slot.height() * scale);
        out.width = static_cast<int>(out.height * aspect);
    }
    if (size_is_degenerate(out)) {
        return std::nullopt;
    }
    return out;
}

} // namespace

std::optional<Size> fit_within(const Size& image, int max_w, int max_h) {
    if (size_is_degenerate(image) || max_w <= 0 || max_h <= 0) {
        return std::nullopt;
    }
    const double aspect = static_cast<double>(image.width) / image.height;
    Size out;
    if (aspect >= 1.0) {
        out.width = max_w;
        out.height = static_cast<int>(max_w / aspect);
        if (out.height > max_h) {
            out.height = max_h;
            out.width = static_cast<int>(max_h * aspect);
        }
    } else {
        out.height = max_h;
        out.width = static_cast<int>(max_h * aspect);
        if (out.width > max_w) {
            out.width = max_w;
            out.height = static_cast<int>(max_w / aspect);
        }
    }
    if (size_is_degenerate(out)) {
        return std::nullopt;
    }
    return out;
}

std::optional<GridPlan> plan_grid(const std::vector<Size>& images, const Size& canvas, int rows, int cols, int padding) {
    if (rows <= 0 || cols <= 0 || padding < 0) {
        return std::nullopt;
    }
    const long long wide_w = padded_cell_extent(canvas.width, cols, padding);
    const long long wide_h = padded_cell_extent(canvas.height, rows, padding);
    if (wide_w <= 0 || wide_h <= 0) {
        return std::nullopt;
    }
    const int cell_w = static_cast<int>(wide_w);
    const int cell_h = static_cast<int>(wide_h);

    GridPlan plan;
    plan.canvas = canvas;
    if (images.empty()) {
        return plan;
    }
    const size_t cells = static_cast<size_t>(rows) * static_cast<size_t>(cols);
    for (size_t i = 0; i < cells; ++i) {
        const size_t image_index = i % images.size();
        const int row = static_cast<int>(i) / cols;
        const int col = static_cast<int>(i) % cols;
        const Rect cell = rect_from_xywh(padding + (col * (cell_w + padding)),
                                         padding + (row * (cell_h + padding)),
                                         cell_w,
                                         cell_h);
        const std::optional<Size> fitted = fit_within(images[image_index], cell_w, cell_h);
        if (!fitted) {
            plan.skipped.push_back(i);
            continue;
        }
        plan.placements.push_back(center_in(image_index, cell, *fitted));
    }
    return plan;
}

std::optional<GridPlan> plan_collage(const std::vector<Size>& images, const Size& canvas, int cols, int rows, double scale_factor) {
    if (rows <= 0 || cols <= 0 || scale_factor <= 0.0) {
        return std::nullopt;
    }
    const int cell_w = canvas.width / cols;
    const int cell_h = canvas.height / rows;
    const int scaled_w = static_cast<int>(cell_w * scale_factor);
    const int scaled_h = static_cast<int>(cell_h * scale_factor);
    if (cell_w <= 0 || cell_h <= 0 || scaled_w <= 0 || scaled_h <= 0) {
        return std::nullopt;
    }

    GridPlan plan;
    plan.canvas = canvas;
    if (images.empty()) {
        return plan;
    }
    const size_t cells = static_cast<size_t>(rows) * static_cast<size_t>(cols);
    for (size_t i = 0; i < cells; ++i) {
        const size_t image_index = i % images.size();
        const int row = static_cast<int>(i) / cols;
        const int col = static_cast<int>(i) % cols;
        const int center_x = (col * cell_w) + (cell_w / 2);
        const int center_y = (row * cell_h) + (cell_h / 2);
        const Rect cell = rect_from_xywh(center_x - (scaled_w / 2), center_y - (scaled_h / 2), scaled_w, scaled_h);
        const std::optional<Size> fitted = fit_within(images[image_index], scaled_w, scaled_h);
        if (!fitted) {
            plan.skipped.push_back(i);
            continue;
        }
        plan.placements.push_back(center_in(image_index, cell, *fitted));
    }
    return plan;
}

std::optional<GridPlan> plan_around_text(const std::vector<Size>& images, const Size& canvas, const Rect& text_bounds, int padding) {
    if (!text_bounds.valid() || padding < 0) {
        return std::nullopt;
    }
    const int w = canvas.width;
    const int h = canvas.height;
    const int p = padding;
    const long long wide_col = padded_cell_extent(w, 3, p);
    if (wide_col <= 0) {
        return std::nullopt;
    }
    const int col_width = static_cast<int>(wide_col);
    const int tx1 = text_bounds.x1;
    const int ty1 = text_bounds.y1;
    const int tx2 = text_bounds.x2;
    const int ty2 = text_bounds.y2;
    const int top_row_height = ty1 - (2 * p);
    const int bottom_row_height = h - ty2 - (2 * p);

    std::array<Rect, k_around_text_slots> slots = {{
        {.x1 = p, .y1 = p, .x2 = p + col_width, .y2 = ty1 - p},
        {.x1 = (p * 2) + col_width, .y1 = p, .x2 = (p * 2) + (col_width * 2), .y2 = ty1 - p},
        {.x1 = (p * 3) + (col_width * 2), .y1 = p, .x2 = w - p, .y2 = ty1 - p},
        {.x1 = p, .y1 = ty1, .x2 = tx1 - p, .y2 = ty2},
        {.x1 = tx2 + p, .y1 = ty1, .x2 = w - p, .y2 = ty2},
        {.x1 = p, .y1 = ty2 + p, .x2 = p + col_width, .y2 = h - p},
        {.x1 = (p * 2) + col_width, .y1 = ty2 + p, .x2 = (p * 2) + (col_width * 2), .y2 = h - p},
        {.x1 = (p * 3) + (col_width * 2), .y1 = ty2 + p, .x2 = w - p, .y2 = h - p},
    }};

    // Slots squeezed by a large text block are widened or heightened to a
    // minimum size, anchored on the side away from the text.
    for (size_t i = 0; i < slots.size(); ++i) {
        Rect& s = slots[i];
        int min_width = w / 8;
        int min_height = 0;
        if (i < 3) {
            min_height = top_row_height / 2;
        } else if (i < 5) {
            min_height = (ty2 - ty1) / 2;
            min_width = std::min(tx1 - (2 * p), w - tx2 - (2 * p)) / 2;
        } else {
            min_height = bottom_row_height / 2;
        }

        if (s.width() < min_width) {
            const size_t column = i < 3 ? i : (i >= 5 ? i - 5 : 0);
            if (i == 3 || (i != 4 && column == 0)) {
                s.x2 = s.x1 + min_width;
            } else if (i == 4 || column == 2) {
                s.x1 = s.x2 - min_width;
            } else {
                s.x1 = floor_div(s.x1 + s.x2 - min_width, 2);
                s.x2 = s.x1 + min_width;
            }
        }

        if (s.height() < min_height) {
            if (i < 3) {
                s.y2 = s.y1 + min_height;
            } else if (i < 5) {
                const int center_y = floor_div(ty1 + ty2, 2);
                const int half_height = min_height / 2;
                s.y1 = center_y - half_height;
                s.y2 = center_y + half_height;
            } else {
                s.y1 = s.y2 - min_height;
            }
        }
    }

    GridPlan plan;
    plan.canvas = canvas;
    if (images.empty()) {
        return plan;
    }
    for (size_t i = 0; i < slots.size(); ++i) {
        const size_t image_index = i % images.size();
        const bool is_corner = i == 0 || i == 2 || i == 5 || i == 7;
        const std::optional<Size> covered = cover_slot(images[image_index], slots[i], is_corner ? k_corner_scale : 1.0);
        if (!covered) {
            plan.skipped.push_back(i);
            continue;
        }
        plan.placements.push_back(center_in(image_index, slots[i], *covered));
    }
    return plan;
}

std::optional<GridPlan> plan_bordered_grid(const std::vector<Size>& images, int width, int rows, int cols, int border) {
    if (rows <= 0 || cols <= 0 || border < 0) {
        return std::nullopt;
    }
    const long long wide_w = padded_cell_extent(width, cols, border);
    if (wide_w <= 0) {
        return std::nullopt;
    }
    const int cell_w = static_cast<int>(wide_w);

    double aspect_sum = 0.0;
    size_t aspect_count = 0;
    for (size_t i = 0; i < images.size() && i < k_bordered_aspect_samples; ++i) {
        if (size_is_degenerate(images[i])) {
            continue;
        }
        aspect_sum += static_cast<double>(images[i].width) / images[i].height;
        ++aspect_count;
    }
    const double avg_aspect = aspect_count > 0 ? aspect_sum / static_cast<double>(aspect_count) : 1.0;
    const int cell_h = static_cast<int>(cell_w / avg_aspect);
    if (cell_h <= 0) {
        return std::nullopt;
    }

    GridPlan plan;
    const long long canvas_h = (static_cast<long long>(cell_h) * rows) + ((static_cast<long long>(rows) + 1) * border);
    if (canvas_h > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    plan.canvas = {.width = width, .height = static_cast<int>(canvas_h)};
    const size_t cells = std::min(images.size(), static_cast<size_t>(rows) * static_cast<size_t>(cols));
    for (size_t i = 0; i < cells; ++i) {
        const int row = static_cast<int>(i) / cols;
        const int col = static_cast<int>(i) % cols;
        const Rect cell = rect_from_xywh(border + (col * (cell_w + border)),
                                         border + (row * (cell_h + border)),
                                         cell_w,
                                         cell_h);
        if (size_is_degenerate(images[i])) {
            plan.skipped.push_back(i);
            continue;
        }
        plan.placements.push_back(center_in(i, cell, {.width = cell_w, .height = cell_h}));
    }
    return plan;
}

std::optional<GridPlan> plan_seamless(const Size& tile, const Size& canvas, int tile_max, int margin, int gap) {
    if (size_is_degenerate(tile) || size_is_degenerate(canvas) || tile_max <= 0 || margin < 0 || gap < 0) {
        return std::nullopt;
    }
    Size fitted = tile;
    if (tile.width > tile_max || tile.height > tile_max) {
        const std::optional<Size> shrunk = fit_within(tile, tile_max, tile_max);
        if (!shrunk) {
            return std::nullopt;
        }
        fitted = *shrunk;
    }

    GridPlan plan;
    plan.canvas = canvas;
    const int single_y = floor_div(canvas.height - fitted.height, 2);
    plan.placements.push_back(center_in(0, rect_from_xywh(margin, single_y, fitted.width, fitted.height), fitted));

    const int repeat_x = margin + fitted.width + gap;
    const int repeat_y = floor_div(canvas.height - (2 * fitted.height), 2);
    for (int row = 0; row < 2; ++row) {
        for (int col = 0; col < 2; ++col) {
            const Rect cell = rect_from_xywh(repeat_x + (col * fitted.width),
                                             repeat_y + (row * fitted.height),
                                             fitted.width,
                                             fitted.height);
            plan.placements.push_back(center_in(0, cell, fitted));
        }
    }
    return plan;
}

GridShape select_main_grid(const std::vector<Size>& images) {
    double aspect_sum = 0.0;
    size_t count = 0;
    for (const Size& size : images) {
        if (size_is_degenerate(size)) {
            continue;
        }
        aspect_sum += static_cast<double>(size.width) / size.height;
        ++count;
    }
    const double average = count > 0 ? aspect_sum / static_cast<double>(count) : 1.0;
    if (average <= 1.0) {
        return {.cols = 3, .rows = 2};
    }
    return {.cols = 2, .rows = 3};
}

std::vector<Size> image_sizes(const std::vector<Image>& images) {
    std::vector<Size> sizes;
    sizes.reserve(images.size());
    for (const Image& image : images) {
        sizes.push_back(image.empty() ? Size{} : image.size());
    }
    return sizes;
}

void composite_plan(Image& canvas, const GridPlan& plan, const std::vector<Image>& images) {
    std::map<std::pair<size_t, std::pair<int, int>>, Image> resized_cache;
    for (const Placement& placement : plan.placements) {
        if (placement.image_index >= images.size()) {
            continue;
        }
        const auto key = std::make_pair(placement.image_index, std::make_pair(placement.width, placement.height));
        auto it = resized_cache.find(key);
        if (it == resized_cache.end()) {
            Image resized = resize_image(images[placement.image_index], placement.width, placement.height);
            it = resized_cache.emplace(key, std::move(resized)).first;
        }
        if (it->second.empty()) {
            std::cerr << "Warning: Failed to resize image " << placement.image_index << " to "
                      << placement.width << "x" << placement.height << "\n";
            continue;
        }
        composite_over(canvas, it->second, placement.x, placement.y);
    }
}

std::optional<Image> layout_grid(const std::vector<Image>& images, const Image& background, int rows, int cols, int padding) {
    std::optional<GridPlan> plan = plan_grid(image_sizes(images), background.size(), rows, cols, padding);
    if (!plan) {
        std::cerr << "Warning: Grid " << cols << "x" << rows << " with padding " << padding
                  << " does not fit a " << background.width << "x" << background.height << " canvas\n";
        return std::nullopt;
    }
    for (size_t cell : plan->skipped) {
        std::cerr << "Warning: Skipping degenerate image in grid cell " << cell << "\n";
    }
    Image canvas = background;
    composite_plan(canvas, *plan, images);
    return canvas;
}

std::optional<Image> layout_collage(const std::vector<Image>& images, const Image& background, int cols, int rows, double scale_factor) {
    std::optional<GridPlan> plan = plan_collage(image_sizes(images), background.size(), cols, rows, scale_factor);
    if (!plan) {
        std::cerr << "Warning: Collage " << cols << "x" << rows << " does not fit a "
                  << background.width << "x" << background.height << " canvas\n";
        return std::nullopt;
    }
    for (size_t cell : plan->skipped) {
        std::cerr << "Warning: Skipping degenerate image in collage cell " << cell << "\n";
    }
    Image canvas = background;
    composite_plan(canvas, *plan, images);
    return canvas;
}

} // namespace mockforge::core

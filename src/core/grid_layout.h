// grid_layout.h
// MIT License (c) 2026 Pedro

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "geometry.h"
#include "image.h"

namespace mockforge::core {

struct Placement {
    size_t image_index = 0;
    Rect cell;
    int width = 0;
    int height = 0;
    int x = 0;
    int y = 0;
};

struct GridPlan {
    Size canvas;
    std::vector<Placement> placements;
    // Cell indices left empty because their image had a degenerate size.
    std::vector<size_t> skipped;
};

struct GridShape {
    int cols = 0;
    int rows = 0;

    bool operator==(const GridShape& other) const = default;
};

// Largest size inside max_w x max_h with the image's aspect ratio.
// Empty when the image or the box is degenerate.
std::optional<Size> fit_within(const Size& image, int max_w, int max_h);

// Cells of ((W - (cols+1)*padding) / cols) x ((H - (rows+1)*padding) / rows).
// Images beyond rows*cols are dropped; a short list is repeated from the start.
// Empty when the cells would have no area.
std::optional<GridPlan> plan_grid(const std::vector<Size>& images, const Size& canvas, int rows, int cols, int padding);

// Unpadded cells enlarged by scale_factor around their own centers, so
// neighbouring images overlap.
std::optional<GridPlan> plan_collage(const std::vector<Size>& images, const Size& canvas, int cols, int rows, double scale_factor);

// Eight slots around text_bounds: three above, one each side, three below.
// Corner slots are enlarged by 1.35 and every image covers its slot.
std::optional<GridPlan> plan_around_text(const std::vector<Size>& images, const Size& canvas, const Rect& text_bounds, int padding);

// Fixed width; cell height follows the average aspect ratio of the first
// three images. Each image is stretched to its cell.
std::optional<GridPlan> plan_bordered_grid(const std::vector<Size>& images, int width, int rows, int cols, int border);

// A single tile beside a 2x2 repetition of itself, showing how it repeats.
// The tile is shrunk to fit tile_max x tile_max, never enlarged. It sits
// margin from the left edge with the repetition gap after it; both are
// vertically centered. Empty when the tile is degenerate.
std::optional<GridPlan> plan_seamless(const Size& tile, const Size& canvas, int tile_max, int margin, int gap);

// 3 cols x 2 rows when the average aspect ratio is <= 1, otherwise 2 x 3.
GridShape select_main_grid(const std::vector<Size>& images);

std::vector<Size> image_sizes(const std::vector<Image>& images);

// Resizes each placed image and composites it with its own alpha as mask.
void composite_plan(Image& canvas, const GridPlan& plan, const std::vector<Image>& images);

std::optional<Image> layout_grid(const std::vector<Image>& images, const Image& background, int rows, int cols, int padding);
std::optional<Image> layout_collage(const std::vector<Image>& images, const Image& background, int cols, int rows, double scale_factor);

} // namespace mockforge::core

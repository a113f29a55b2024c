// watermark.h
// MIT License (c) 2026 Pedro

#pragma once

#include <filesystem>
#include <string>

#include "image.h"
#include "text_fitter.h"

namespace mockforge::core {

struct WatermarkSettings {
    int opacity_pct = 40;
    double spacing_multiplier = 8.0;
    double size_ratio = 0.125;
};

// Tiles unit across the canvas in a staggered grid. The unit is resized to
// size_ratio * canvas width (aspect preserved) and its alpha scaled to
// opacity_pct / 100. Tiling starts 1.5 units before the canvas and ends 1.5
// units past it; odd rows shift right by half the horizontal spacing.
// A zero opacity or an unusable unit returns the canvas unchanged.
Image apply_watermark(const Image& canvas, const Image& unit, const WatermarkSettings& settings);

// Logo watermark; a logo that fails to load returns the canvas unchanged.
Image apply_watermark(const Image& canvas, const std::filesystem::path& logo_path, const WatermarkSettings& settings);

// Text watermark rendered with font at a size matched to the unit width.
Image apply_text_watermark(const Image& canvas,
                           const std::string& text,
                           FontFace& font,
                           const Color& color,
                           const WatermarkSettings& settings);

} // namespace mockforge::core

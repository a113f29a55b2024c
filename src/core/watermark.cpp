// watermark.cpp
// MIT License (c) 2026 Pedro

#include "watermark.h"

#include <algorithm>
#include <iostream>
#include <variant>

#include "cli_parse.h"

namespace mockforge::core {

namespace {

constexpr double k_overscan_units = 1.5;
constexpr int k_reference_font_size = 96;

} // namespace

Image apply_watermark(const Image& canvas, const Image& unit, const WatermarkSettings& settings) {
    if (canvas.empty() || settings.opacity_pct <= 0) {
        return canvas;
    }
    if (unit.empty()) {
        std::cerr << "Warning: Watermark unit is empty, skipping watermark\n";
        return canvas;
    }
    if (settings.size_ratio <= 0.0 || settings.spacing_multiplier <= 0.0) {
        std::cerr << "Warning: Invalid watermark size ratio or spacing, skipping watermark\n";
        return canvas;
    }

    const int unit_w = static_cast<int>(settings.size_ratio * canvas.width);
    const int unit_h = unit_w > 0 ? static_cast<int>((static_cast<double>(unit_w) * unit.height) / unit.width) : 0;
    if (unit_w <= 0 || unit_h <= 0) {
        std::cerr << "Warning: Watermark unit collapses to " << unit_w << "x" << unit_h << ", skipping watermark\n";
        return canvas;
    }
    const Image resized = resize_image(unit, unit_w, unit_h);
    if (resized.empty()) {
        std::cerr << "Warning: Failed to resize watermark unit, skipping watermark\n";
        return canvas;
    }
    const Image prepared = scale_alpha(resized, settings.opacity_pct);

    const int spacing_x = std::max(1, static_cast<int>(unit_w * settings.spacing_multiplier));
    const int spacing_y = std::max(1, static_cast<int>(unit_h * settings.spacing_multiplier));
    const int overscan_x = static_cast<int>(k_overscan_units * unit_w);
    const int overscan_y = static_cast<int>(k_overscan_units * unit_h);

    Image out = canvas;
    int row = 0;
    for (int y = -overscan_y; y < canvas.height + overscan_y; y += spacing_y, ++row) {
        const int offset = (row % 2 == 1) ? spacing_x / 2 : 0;
        for (int x = -overscan_x + offset; x < canvas.width + overscan_x; x += spacing_x) {
            composite_over(out, prepared, x, y);
        }
    }
    return out;
}

Image apply_watermark(const Image& canvas, const std::filesystem::path& logo_path, const WatermarkSettings& settings) {
    if (settings.opacity_pct <= 0) {
        return canvas;
    }
    LoadResult loaded = load_image(logo_path);
    if (const auto* failure = std::get_if<LoadFailure>(&loaded)) {
        std::cerr << "Warning: Failed to load watermark logo " << to_quoted(failure->path)
                  << ": " << failure->reason << "\n";
        return canvas;
    }
    return apply_watermark(canvas, std::get<Image>(loaded), settings);
}

Image apply_text_watermark(const Image& canvas,
                           const std::string& text,
                           FontFace& font,
                           const Color& color,
                           const WatermarkSettings& settings) {
    if (canvas.empty() || settings.opacity_pct <= 0) {
        return canvas;
    }
    if (!font.set_pixel_size(k_reference_font_size)) {
        std::cerr << "Warning: Failed to size watermark font, skipping watermark\n";
        return canvas;
    }
    const TextBox reference = font.measure(text);
    if (reference.width <= 0 || reference.height <= 0) {
        std::cerr << "Warning: Watermark text " << to_quoted(text) << " renders empty, skipping watermark\n";
        return canvas;
    }

    const double target_width = settings.size_ratio * canvas.width;
    const int matched_size = std::max(1, static_cast<int>((k_reference_font_size * target_width) / reference.width));
    if (!font.set_pixel_size(matched_size)) {
        std::cerr << "Warning: Failed to size watermark font, skipping watermark\n";
        return canvas;
    }
    return apply_watermark(canvas, font.render(text, color), settings);
}

} // namespace mockforge::core

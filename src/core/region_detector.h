// region_detector.h
// MIT License (c) 2026 Pedro

#pragma once

#include <optional>

#include "geometry.h"
#include "image.h"

namespace mockforge::core {

// Bounding box of every pixel with any channel (R, G, B or A) above threshold,
// shrunk by inner_padding on each side. Empty when the overlay has no alpha
// channel, nothing is above the threshold, or the padding collapses the box.
std::optional<Rect> detect_text_region(const Image& overlay, int threshold, int inner_padding);

// Same scan without padding; empty when no pixel is above the threshold.
std::optional<Rect> compute_foreground_bounds(const Image& image, int threshold);

} // namespace mockforge::core

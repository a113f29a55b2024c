// mockup_composer.h
// MIT License (c) 2026 Pedro

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "image.h"
#include "mockup_config.h"
#include "text_fitter.h"

namespace mockforge::core {

constexpr const char* k_mockup_dir_name = "mocks";

// Template assets. Every path is optional; an empty or unreadable path
// disables the step that needs it.
struct MockupAssets {
    std::filesystem::path background;
    std::filesystem::path overlay;
    std::filesystem::path logo;
    std::filesystem::path font;
    std::filesystem::path transparency_backdrop;
};

struct VariantOutcome {
    std::string name;
    bool success = false;
    std::string message;
    std::filesystem::path output;
};

struct FolderReport {
    std::filesystem::path folder;
    std::vector<VariantOutcome> variants;

    size_t created() const;
    size_t attempted() const { return variants.size(); }
};

// Produces the mockup variants of one product folder at a time. Template
// assets are loaded once and reused for every folder.
class MockupComposer {
public:
    MockupComposer(MockupPreset preset, const MockupAssets& assets, bool verbose = true);

    FolderReport run(const std::filesystem::path& folder, const std::string& title_override = "");

    // Background -> main layout -> overlay -> title and subtitles -> optional watermark.
    std::optional<Image> compose_main(const std::vector<Image>& images, const std::string& title);
    std::vector<Image> compose_grids(const std::vector<Image>& images);
    std::optional<Image> compose_bordered_grid(const std::vector<Image>& images);
    std::optional<Image> compose_seamless(const Image& tile);
    std::optional<Image> compose_transparency_demo(const Image& image);

    const MockupPreset& preset() const { return preset_; }
    bool has_overlay() const { return overlay_.has_value(); }
    bool has_font() const { return font_ != nullptr; }

private:
    const MockupPreset preset_;
    bool verbose_ = true;
    std::optional<Image> background_;
    std::optional<Image> overlay_;
    std::optional<Image> logo_;
    std::optional<Image> transparency_backdrop_;
    std::unique_ptr<FontFace> font_;

    std::optional<Image> load_optional_asset(const std::filesystem::path& path, const char* label);
    Image make_background(const Size& size) const;
    Image apply_configured_watermark(const Image& canvas);
    void render_title(Image& canvas, const Image& overlay, const std::string& title, size_t image_count);
    std::optional<Image> layout_main(const std::vector<Image>& images, const Image& canvas, const std::optional<Image>& overlay);
    VariantOutcome save_variant(const std::string& name, const Image& image, const std::filesystem::path& path) const;
};

} // namespace mockforge::core

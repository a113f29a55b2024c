// mockup_composer_test.cpp
// MIT License (c) 2026 Pedro

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <utility>
#include <variant>

#include "core/mockup_composer.h"
#include "core/region_detector.h"
#include "test_support.h"

using namespace mockforge::core;
using mockforge::test::TempDir;
using mockforge::test::fill_rect;
using mockforge::test::write_png;

namespace {

const Color k_red{220, 30, 30, 255};

MockupPreset small_preset(PresetBuilder builder) {
    return builder.canvas({.width = 600, .height = 450})
        .grid({.cols = 2, .rows = 2}, {.width = 400, .height = 400}, 10)
        .title(60, 8, 2, 4)
        .build();
}

Image overlay_with_box(int width, int height) {
    Image overlay = make_canvas(width, height, {0, 0, 0, 0});
    fill_rect(overlay, rect_from_xywh(150, 165, 300, 120), {255, 255, 255, 255});
    return overlay;
}

MockupPreset without_subtitles(PresetBuilder builder) {
    std::string error;
    EXPECT_TRUE(builder.set("subtitle_top", "none", error)) << error;
    EXPECT_TRUE(builder.set("subtitle_bottom", "none", error)) << error;
    return small_preset(builder);
}

bool is_inked(const Image& image, int x, int y) {
    return image.pixel(x, y)[CHANNEL_R] < 200;
}

// First and last rows of rect holding a dark pixel; {-1, -1} when none.
std::pair<int, int> inked_rows(const Image& image, const Rect& rect) {
    std::pair<int, int> out{-1, -1};
    for (int y = rect.y1; y < rect.y2; ++y) {
        for (int x = rect.x1; x < rect.x2; ++x) {
            if (is_inked(image, x, y)) {
                if (out.first < 0) {
                    out.first = y;
                }
                out.second = y;
                break;
            }
        }
    }
    return out;
}

Image load_output(const std::filesystem::path& path) {
    LoadResult result = load_image(path);
    if (std::holds_alternative<LoadFailure>(result)) {
        return {};
    }
    return std::get<Image>(result);
}

} // namespace

class MockupComposerTest : public ::testing::Test {
protected:
    TempDir root{"mockforge_composer"};
    std::filesystem::path product;

    void SetUp() override {
        product = root.path() / "red_floral";
        std::filesystem::create_directories(product);
    }

    void add_products(size_t count) {
        for (size_t i = 0; i < count; ++i) {
            const int w = (i % 2 == 0) ? 120 : 80;
            write_png(make_canvas(w, 100, k_red), product / ("item_" + std::to_string(i) + ".png"));
        }
    }
};

TEST_F(MockupComposerTest, ProducesDefaultVariantsForClipart) {
    add_products(3);
    const auto overlay_path = root.path() / "overlay.png";
    write_png(overlay_with_box(600, 450), overlay_path);

    MockupAssets assets;
    assets.overlay = overlay_path;
    assets.font = mockforge::test::find_test_font();
    MockupComposer composer(small_preset(PresetBuilder::clipart_defaults()), assets, false);
    EXPECT_TRUE(composer.has_overlay());

    const FolderReport report = composer.run(product);
    ASSERT_EQ(report.attempted(), 3u);
    EXPECT_EQ(report.created(), 3u);
    EXPECT_EQ(report.variants[0].name, "main");
    EXPECT_EQ(report.variants[1].name, "grid");
    EXPECT_EQ(report.variants[2].name, "transparency");

    const auto mocks = product / k_mockup_dir_name;
    const Image main = load_output(mocks / "main.png");
    EXPECT_EQ(main.size(), (Size{.width = 600, .height = 450}));
    const Image grid = load_output(mocks / "grid.png");
    EXPECT_EQ(grid.size(), (Size{.width = 400, .height = 400}));
    EXPECT_TRUE(std::filesystem::exists(mocks / "transparency.png"));
    EXPECT_FALSE(std::filesystem::exists(mocks / "bordered_grid.png"));
    EXPECT_FALSE(std::filesystem::exists(mocks / "main.png.tmp"));
}

TEST_F(MockupComposerTest, OverlayIsCompositedOnMain) {
    add_products(2);
    const auto overlay_path = root.path() / "overlay.png";
    write_png(overlay_with_box(600, 450), overlay_path);

    MockupAssets assets;
    assets.overlay = overlay_path;
    MockupComposer composer(small_preset(PresetBuilder::clipart_defaults()), assets, false);
    const auto main = composer.compose_main({make_canvas(100, 100, k_red)}, "Red Floral");
    ASSERT_TRUE(main.has_value());
    // Without a font the overlay box stays blank white.
    const unsigned char* center = main->pixel(300, 225);
    EXPECT_EQ(center[CHANNEL_R], 255);
    EXPECT_EQ(center[CHANNEL_G], 255);
}

TEST_F(MockupComposerTest, ExtraImagesSpillIntoNumberedGrids) {
    add_products(5);
    MockupComposer composer(small_preset(PresetBuilder::clipart_defaults()), MockupAssets{}, false);
    const FolderReport report = composer.run(product);
    EXPECT_EQ(report.created(), report.attempted());
    EXPECT_TRUE(std::filesystem::exists(product / k_mockup_dir_name / "grid.png"));
    EXPECT_TRUE(std::filesystem::exists(product / k_mockup_dir_name / "grid_2.png"));
    EXPECT_FALSE(std::filesystem::exists(product / k_mockup_dir_name / "grid_3.png"));
}

TEST_F(MockupComposerTest, FolderWithoutImagesFails) {
    MockupComposer composer(small_preset(PresetBuilder::clipart_defaults()), MockupAssets{}, false);
    const FolderReport report = composer.run(product);
    EXPECT_EQ(report.created(), 0u);
    ASSERT_EQ(report.attempted(), 1u);
    EXPECT_FALSE(report.variants[0].success);
    EXPECT_FALSE(std::filesystem::exists(product / k_mockup_dir_name));
}

TEST_F(MockupComposerTest, UnreadableImagesAreSkipped) {
    add_products(1);
    {
        std::ofstream broken(product / "broken.png", std::ios::binary);
        broken << "not an image";
    }
    MockupComposer composer(small_preset(PresetBuilder::clipart_defaults()), MockupAssets{}, false);
    const FolderReport report = composer.run(product);
    EXPECT_EQ(report.created(), report.attempted());
    EXPECT_GT(report.created(), 0u);
}

TEST_F(MockupComposerTest, DegenerateMainLayoutFailsOnlyThatVariant) {
    add_products(2);
    PresetBuilder builder = PresetBuilder::clipart_defaults();
    std::string error;
    ASSERT_TRUE(builder.set("main_padding", "500", error)) << error;
    MockupComposer composer(small_preset(builder), MockupAssets{}, false);

    const FolderReport report = composer.run(product);
    ASSERT_EQ(report.attempted(), 3u);
    EXPECT_FALSE(report.variants[0].success);
    EXPECT_EQ(report.created(), 2u);
    EXPECT_FALSE(std::filesystem::exists(product / k_mockup_dir_name / "main.png"));
}

TEST_F(MockupComposerTest, PatternProducesBorderedGrid) {
    add_products(3);
    PresetBuilder builder = PresetBuilder::pattern_defaults();
    std::string error;
    ASSERT_TRUE(builder.set("bordered_grid_width", "400", error)) << error;
    ASSERT_TRUE(builder.set("bordered_grid_shape", "2x2", error)) << error;
    ASSERT_TRUE(builder.set("bordered_grid_border", "10", error)) << error;
    ASSERT_TRUE(builder.set("seamless_size", "500x500", error)) << error;
    MockupComposer composer(small_preset(builder), MockupAssets{}, false);

    const FolderReport report = composer.run(product);
    ASSERT_EQ(report.attempted(), 3u);
    EXPECT_EQ(report.created(), 3u);
    EXPECT_EQ(report.variants[1].name, "bordered_grid");
    EXPECT_EQ(report.variants[2].name, "seamless");
    EXPECT_TRUE(std::filesystem::exists(product / k_mockup_dir_name / "seamless.png"));
    const Image bordered = load_output(product / k_mockup_dir_name / "bordered_grid.png");
    EXPECT_EQ(bordered.width, 400);
    EXPECT_GT(bordered.height, 0);
    // Border pixels keep the border color.
    EXPECT_EQ(bordered.pixel(2, 2)[CHANNEL_R], 255);
    EXPECT_EQ(bordered.pixel(2, 2)[CHANNEL_G], 255);
}

TEST_F(MockupComposerTest, TransparencyDemoPlacesImageLeftOfCenter) {
    MockupComposer composer(small_preset(PresetBuilder::clipart_defaults()), MockupAssets{}, false);
    const auto demo = composer.compose_transparency_demo(make_canvas(1000, 1000, k_red));
    ASSERT_TRUE(demo.has_value());
    EXPECT_EQ(demo->size(), (Size{.width = 600, .height = 450}));
    EXPECT_EQ(demo->pixel(10, 225)[CHANNEL_R], k_red[CHANNEL_R]);
    EXPECT_EQ(demo->pixel(10, 225)[CHANNEL_G], k_red[CHANNEL_G]);
    // Right half shows the generated checkerboard.
    const unsigned char backdrop = demo->pixel(590, 10)[CHANNEL_R];
    EXPECT_TRUE(backdrop == 255 || backdrop == 200);
}

TEST_F(MockupComposerTest, SmallImageIsNotEnlargedInTransparencyDemo) {
    MockupComposer composer(small_preset(PresetBuilder::clipart_defaults()), MockupAssets{}, false);
    const auto demo = composer.compose_transparency_demo(make_canvas(20, 20, k_red));
    ASSERT_TRUE(demo.has_value());
    // x = 300 - 20 - 60, y = 225 - 10
    EXPECT_EQ(demo->pixel(220, 215)[CHANNEL_G], k_red[CHANNEL_G]);
    EXPECT_NE(demo->pixel(219, 215)[CHANNEL_G], k_red[CHANNEL_G]);
    EXPECT_NE(demo->pixel(240, 215)[CHANNEL_G], k_red[CHANNEL_G]);
}

TEST_F(MockupComposerTest, MissingAssetsFallBackToPlainCanvas) {
    MockupAssets assets;
    assets.background = root.path() / "missing_background.png";
    assets.overlay = root.path() / "missing_overlay.png";
    assets.font = root.path() / "missing.ttf";
    MockupComposer composer(small_preset(PresetBuilder::clipart_defaults()), assets, false);
    EXPECT_FALSE(composer.has_overlay());
    EXPECT_FALSE(composer.has_font());

    const auto main = composer.compose_main({make_canvas(100, 100, k_red)}, "Red Floral");
    ASSERT_TRUE(main.has_value());
    const Color expected = composer.preset().background_color;
    EXPECT_EQ(main->pixel(1, 1)[CHANNEL_R], expected[CHANNEL_R]);
}

TEST_F(MockupComposerTest, TitleIsDrawnOnlyInsideDetectedRegion) {
    const auto font_path = mockforge::test::find_test_font();
    if (font_path.empty()) GTEST_SKIP() << "Font not found";

    const Image overlay = overlay_with_box(600, 450);
    const auto overlay_path = root.path() / "overlay.png";
    write_png(overlay, overlay_path);

    MockupAssets plain_assets;
    plain_assets.overlay = overlay_path;
    MockupAssets titled_assets = plain_assets;
    titled_assets.font = font_path;

    MockupComposer plain(without_subtitles(PresetBuilder::clipart_defaults()), plain_assets, false);
    MockupComposer titled(without_subtitles(PresetBuilder::clipart_defaults()), titled_assets, false);
    ASSERT_TRUE(titled.has_font());

    const std::vector<Image> images = {make_canvas(100, 100, k_red)};
    const auto without_title = plain.compose_main(images, "Red Floral");
    const auto with_title = titled.compose_main(images, "Red Floral");
    ASSERT_TRUE(without_title.has_value());
    ASSERT_TRUE(with_title.has_value());
    ASSERT_EQ(with_title->size(), without_title->size());

    const auto region = detect_text_region(overlay, 20, 35);
    ASSERT_TRUE(region.has_value());

    bool found_title_color = false;
    for (int y = 0; y < with_title->height; ++y) {
        for (int x = 0; x < with_title->width; ++x) {
            const unsigned char* a = with_title->pixel(x, y);
            const unsigned char* b = without_title->pixel(x, y);
            const bool inside = x >= region->x1 && x < region->x2 && y >= region->y1 && y < region->y2;
            if (!inside) {
                ASSERT_TRUE(std::equal(a, a + NUM_CHANNELS, b)) << "changed pixel at " << x << "," << y;
            } else if (a[CHANNEL_R] == 50 && a[CHANNEL_G] == 50 && a[CHANNEL_B] == 50) {
                found_title_color = true;
            }
        }
    }
    EXPECT_TRUE(found_title_color);
}

TEST_F(MockupComposerTest, SubtitlesFrameTheTitleInLighterColor) {
    const auto font_path = mockforge::test::find_test_font();
    if (font_path.empty()) GTEST_SKIP() << "Font not found";

    Image overlay = make_canvas(600, 450, {0, 0, 0, 0});
    fill_rect(overlay, rect_from_xywh(60, 45, 480, 360), {255, 255, 255, 255});
    const auto overlay_path = root.path() / "overlay.png";
    write_png(overlay, overlay_path);

    MockupAssets assets;
    assets.overlay = overlay_path;
    assets.font = font_path;

    PresetBuilder framed = PresetBuilder::clipart_defaults();
    std::string error;
    ASSERT_TRUE(framed.set("subtitle_top", "{count} clip arts", error)) << error;
    ASSERT_TRUE(framed.set("subtitle_bottom", "Commercial Use", error)) << error;
    ASSERT_TRUE(framed.set("subtitle_size", "20", error)) << error;
    ASSERT_TRUE(framed.set("subtitle_spacing", "6", error)) << error;
    MockupComposer with_subtitles(small_preset(framed), assets, false);
    MockupComposer title_only(without_subtitles(PresetBuilder::clipart_defaults()), assets, false);

    const std::vector<Image> images = {make_canvas(100, 100, k_red), make_canvas(80, 100, k_red)};
    const auto framed_main = with_subtitles.compose_main(images, "Red Floral");
    const auto plain_main = title_only.compose_main(images, "Red Floral");
    ASSERT_TRUE(framed_main.has_value());
    ASSERT_TRUE(plain_main.has_value());

    const auto region = detect_text_region(overlay, 20, 35);
    ASSERT_TRUE(region.has_value());
    const auto [title_top, title_bottom] = inked_rows(*plain_main, *region);
    ASSERT_GE(title_top, 0);
    const auto [block_top, block_bottom] = inked_rows(*framed_main, *region);
    EXPECT_LT(block_top, title_top);
    EXPECT_GT(block_bottom, title_bottom);

    // The top subtitle uses the title color lightened by 30 per channel.
    int darkest = 255;
    for (int y = region->y1; y < title_top; ++y) {
        for (int x = region->x1; x < region->x2; ++x) {
            darkest = std::min<int>(darkest, framed_main->pixel(x, y)[CHANNEL_R]);
        }
    }
    EXPECT_LT(darkest, 255);
    EXPECT_GE(darkest, 80);
}

TEST_F(MockupComposerTest, SeamlessShowsTileAndRepeat) {
    PresetBuilder builder = PresetBuilder::pattern_defaults();
    std::string error;
    ASSERT_TRUE(builder.set("seamless_size", "500x500", error)) << error;
    ASSERT_TRUE(builder.set("seamless_tile_max", "100", error)) << error;
    ASSERT_TRUE(builder.set("seamless_margin", "20", error)) << error;
    ASSERT_TRUE(builder.set("seamless_gap", "20", error)) << error;
    MockupComposer composer(small_preset(builder), MockupAssets{}, false);

    const auto seamless = composer.compose_seamless(make_canvas(200, 100, k_red));
    ASSERT_TRUE(seamless.has_value());
    EXPECT_EQ(seamless->size(), (Size{.width = 500, .height = 500}));
    // Tile 100x50 at (20, 225); 2x2 repeat from (140, 200).
    EXPECT_EQ(seamless->pixel(25, 230)[CHANNEL_G], k_red[CHANNEL_G]);
    EXPECT_EQ(seamless->pixel(130, 230)[CHANNEL_G], 255);
    EXPECT_EQ(seamless->pixel(145, 205)[CHANNEL_G], k_red[CHANNEL_G]);
    EXPECT_EQ(seamless->pixel(335, 295)[CHANNEL_G], k_red[CHANNEL_G]);
    EXPECT_EQ(seamless->pixel(345, 295)[CHANNEL_G], 255);
}

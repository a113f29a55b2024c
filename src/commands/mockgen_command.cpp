// mockgen_command.cpp
// MIT License (c) 2026 Pedro

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
namespace fs = std::filesystem;

#include "commands.h"
#include "core/cli_parse.h"
#include "core/image.h"
#include "core/mockup_composer.h"
#include "core/mockup_config.h"
#include "core/product_registry.h"

using mockforge::core::FolderReport;
using mockforge::core::MockupAssets;
using mockforge::core::MockupComposer;
using mockforge::core::PresetBuilder;
using mockforge::core::PresetSection;
using mockforge::core::ProductRegistry;
using mockforge::core::to_quoted;

namespace {

constexpr const char* k_default_product_type = "clipart";
constexpr const char* k_default_assets_dir = "assets";

struct GenerateConfig {
    std::vector<fs::path> folders;
    std::string product_type = k_default_product_type;
    bool batch = false;
    fs::path preset_config_path;
    fs::path assets_dir = k_default_assets_dir;
    fs::path background_path;
    fs::path overlay_path;
    fs::path logo_path;
    fs::path font_path;
    std::string title;
    bool no_watermark = false;
    bool quiet = false;
};

fs::path resolve_asset(const fs::path& explicit_path, const fs::path& assets_dir, const char* file_name) {
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    const fs::path candidate = assets_dir / file_name;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
        return candidate;
    }
    return {};
}

// Explicit path first, then ./mockforge.cfg, the user file and the global file.
bool load_preset_overrides(const GenerateConfig& config, std::vector<PresetSection>& sections) {
    std::vector<fs::path> candidates;
    if (!config.preset_config_path.empty()) {
        std::string error;
        if (!mockforge::core::load_preset_config_from_file(config.preset_config_path, sections, error)) {
            std::cerr << "Error: Failed to load preset config " << to_quoted(config.preset_config_path.string())
                      << ": " << error << "\n";
            return false;
        }
        return true;
    }

    candidates.emplace_back(mockforge::core::k_preset_config_filename);
    if (std::optional<fs::path> user_config = mockforge::core::resolve_user_preset_config_path()) {
        candidates.push_back(*user_config);
    }
    candidates.emplace_back(mockforge::core::k_global_preset_config_path);

    for (const fs::path& candidate : candidates) {
        std::error_code ec;
        const bool exists = fs::exists(candidate, ec);
        if (ec || !exists) {
            continue;
        }
        std::string error;
        if (!mockforge::core::load_preset_config_from_file(candidate, sections, error)) {
            std::cerr << "Error: Failed to load preset config " << to_quoted(candidate.string())
                      << ": " << error << "\n";
            return false;
        }
        return true;
    }
    sections.clear();
    return true;
}

std::vector<fs::path> collect_batch_folders(const fs::path& parent) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (fs::directory_iterator it(parent, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_directory(type_ec) || it->path().filename() == mockforge::core::k_mockup_dir_name) {
            continue;
        }
        out.push_back(it->path());
    }
    if (ec) {
        std::cerr << "Warning: Failed to list " << to_quoted(parent.string()) << ": " << ec.message() << "\n";
    }
    std::sort(out.begin(), out.end());
    return out;
}

void print_usage() {
    std::cout << "Usage: mockgen <folder>... [OPTIONS]\n"
              << "\n"
              << "Compose marketplace mockup images from the product images of each folder.\n"
              << "Results are written to <folder>/" << mockforge::core::k_mockup_dir_name << "/.\n"
              << "\n"
              << "Options:\n"
              << "  --product TYPE             Product type (default: " << k_default_product_type << ")\n"
              << "  --batch                    Treat each folder as a parent of product folders\n"
              << "  --preset-config PATH       Preset override file\n"
              << "  --assets DIR               Template asset directory (default: " << k_default_assets_dir << ")\n"
              << "  --background PATH          Background image\n"
              << "  --overlay PATH             Overlay image with a transparent title area\n"
              << "  --logo PATH                Watermark logo\n"
              << "  --font PATH                Title font (TrueType/OpenType)\n"
              << "  --title TEXT               Title text (default: derived from folder name)\n"
              << "  --no-watermark             Disable watermarks\n"
              << "  --quiet                    Only print warnings and errors\n"
              << "  -h, --help                 Show this help message\n";
}

} // namespace

int run_mockgen(int argc, char** argv) {
    GenerateConfig config;
    bool show_help = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& option) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: Missing value for " << option << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if (arg == "--batch") {
            config.batch = true;
        } else if (arg == "--no-watermark") {
            config.no_watermark = true;
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "--product" || arg == "--preset-config" || arg == "--assets" ||
                   arg == "--background" || arg == "--overlay" || arg == "--logo" ||
                   arg == "--font" || arg == "--title") {
            const char* value = require_value(arg);
            if (value == nullptr) {
                return 1;
            }
            if (arg == "--product") {
                config.product_type = mockforge::core::to_lower_copy(value);
            } else if (arg == "--preset-config") {
                config.preset_config_path = value;
            } else if (arg == "--assets") {
                config.assets_dir = value;
            } else if (arg == "--background") {
                config.background_path = value;
            } else if (arg == "--overlay") {
                config.overlay_path = value;
            } else if (arg == "--logo") {
                config.logo_path = value;
            } else if (arg == "--font") {
                config.font_path = value;
            } else {
                config.title = value;
            }
        } else if (arg.empty() || arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        } else {
            config.folders.emplace_back(arg);
        }
    }

    if (show_help) {
        print_usage();
        return 0;
    }

    if (config.folders.empty()) {
        std::cerr << "Error: At least one product folder is required\n";
        print_usage();
        return 1;
    }

    const ProductRegistry registry = ProductRegistry::with_builtin_types();
    std::optional<PresetBuilder> builder = registry.create(config.product_type);
    if (!builder) {
        std::string available;
        for (const std::string& tag : registry.tags()) {
            if (!available.empty()) {
                available += ", ";
            }
            available += tag;
        }
        std::cerr << "Error: Unknown product type '" << config.product_type
                  << "'. Available types: " << available << "\n";
        return 1;
    }

    std::vector<PresetSection> sections;
    if (!load_preset_overrides(config, sections)) {
        return 1;
    }
    std::string preset_error;
    if (!mockforge::core::apply_preset_sections(*builder, config.product_type, sections, preset_error)) {
        std::cerr << "Error: Invalid preset '" << config.product_type << "': " << preset_error << "\n";
        return 1;
    }
    if (config.no_watermark) {
        builder->watermarks(false, false);
    }

    MockupAssets assets;
    assets.background = resolve_asset(config.background_path, config.assets_dir, "background.png");
    assets.overlay = resolve_asset(config.overlay_path, config.assets_dir, "overlay.png");
    assets.logo = resolve_asset(config.logo_path, config.assets_dir, "logo.png");
    assets.font = resolve_asset(config.font_path, config.assets_dir, "title.ttf");
    assets.transparency_backdrop = resolve_asset(fs::path(), config.assets_dir, "transparency.png");

    MockupComposer composer(builder->build(), assets, !config.quiet);

    std::vector<fs::path> targets;
    for (const fs::path& folder : config.folders) {
        std::error_code ec;
        if (!fs::is_directory(folder, ec)) {
            std::cerr << "Error: Not a directory: " << to_quoted(folder.string()) << "\n";
            return 1;
        }
        if (config.batch) {
            for (fs::path& child : collect_batch_folders(folder)) {
                if (mockforge::core::list_product_images(child).empty()) {
                    std::cerr << "Warning: Skipping " << to_quoted(child.string()) << ": no product images\n";
                    continue;
                }
                targets.push_back(std::move(child));
            }
        } else {
            targets.push_back(folder);
        }
    }

    if (targets.empty()) {
        std::cerr << "Error: No product folders to process\n";
        return 1;
    }

    bool all_ok = true;
    for (const fs::path& folder : targets) {
        const FolderReport report = composer.run(folder, config.title);
        for (const auto& variant : report.variants) {
            if (!variant.success) {
                std::cerr << "Warning: " << variant.name << " not created: " << variant.message << "\n";
            }
        }
        if (!config.quiet) {
            std::cout << "Created " << report.created() << " of " << report.attempted()
                      << " mockups for " << to_quoted(folder.string()) << "\n";
        }
        if (report.created() == 0) {
            all_ok = false;
        }
    }

    return all_ok ? 0 : 1;
}

// mockzip_command.cpp
// MIT License (c) 2026 Pedro

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>
namespace fs = std::filesystem;

#include "commands.h"
#include "core/archive_packager.h"
#include "core/cli_parse.h"

using mockforge::core::PackageOptions;
using mockforge::core::to_quoted;

namespace {

struct ZipConfig {
    std::vector<fs::path> folders;
    PackageOptions options;
    bool quiet = false;
};

void print_usage() {
    std::cout << "Usage: mockzip <folder>... [OPTIONS]\n"
              << "\n"
              << "Package the product images of each folder into ZIP archives,\n"
              << "split into parts when they exceed the size limit.\n"
              << "\n"
              << "Options:\n"
              << "  --output DIR               Output directory (default: the product folder)\n"
              << "  --max-size-mb N            Maximum archive size before splitting (default: "
              << mockforge::core::k_default_zip_max_size_mb << ")\n"
              << "  --name NAME                Archive base name (default: folder name)\n"
              << "  --quiet                    Only print errors\n"
              << "  -h, --help                 Show this help message\n";
}

} // namespace

int run_mockzip(int argc, char** argv) {
    ZipConfig config;
    bool show_help = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Error: Missing value for " << arg << "\n";
                return 1;
            }
            config.options.output_dir = argv[++i];
        } else if (arg == "--name") {
            if (i + 1 >= argc) {
                std::cerr << "Error: Missing value for " << arg << "\n";
                return 1;
            }
            config.options.name = argv[++i];
        } else if (arg == "--max-size-mb") {
            if (i + 1 >= argc) {
                std::cerr << "Error: Missing value for " << arg << "\n";
                return 1;
            }
            if (!mockforge::core::parse_positive_int(argv[++i], config.options.max_size_mb)) {
                std::cerr << "Error: Invalid max size value: " << argv[i] << "\n";
                return 1;
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

    if (!config.options.name.empty() && config.folders.size() > 1) {
        std::cerr << "Error: --name can only be used with a single folder\n";
        return 1;
    }

    bool all_ok = true;
    for (const fs::path& folder : config.folders) {
        std::error_code ec;
        if (!fs::is_directory(folder, ec)) {
            std::cerr << "Error: Not a directory: " << to_quoted(folder.string()) << "\n";
            all_ok = false;
            continue;
        }
        std::vector<fs::path> archives;
        std::string error;
        if (!mockforge::core::package_folder(folder, config.options, archives, error)) {
            std::cerr << "Error: Failed to package " << to_quoted(folder.string()) << ": " << error << "\n";
            all_ok = false;
            continue;
        }
        if (!config.quiet) {
            for (const fs::path& archive : archives) {
                std::cout << "Created " << to_quoted(archive.string()) << "\n";
            }
        }
    }

    return all_ok ? 0 : 1;
}

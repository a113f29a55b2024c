// archive_packager.h
// MIT License (c) 2026 Pedro

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mockforge::core {

constexpr int k_default_zip_max_size_mb = 20;
constexpr std::uintmax_t k_bytes_per_mb = 1024ULL * 1024ULL;

struct PackageOptions {
    std::filesystem::path output_dir;
    std::string name;
    int max_size_mb = k_default_zip_max_size_mb;
};

// Folder name with spaces replaced by '_'.
std::string default_archive_name(const std::filesystem::path& folder);

// 1 when total fits in max. Otherwise ceil(1.1 * total / max), at least 2,
// leaving room for archive overhead.
size_t required_part_count(std::uintmax_t total_bytes, std::uintmax_t max_bytes);

// Consecutive groups of roughly equal count; the first groups take the remainder.
std::vector<std::vector<std::filesystem::path>> split_into_groups(const std::vector<std::filesystem::path>& files,
                                                                  size_t group_count);

// "<name>.zip" for a single part, "<name>_part<i>of<n>.zip" otherwise (i is 1-based).
std::string archive_file_name(const std::string& name, size_t index, size_t count);

// ZIP of files stored by file name. Written to a temporary sibling and renamed.
bool write_zip_archive(const std::filesystem::path& path,
                       const std::vector<std::filesystem::path>& files,
                       std::string& error);

// Packages the product images of folder, splitting by total size. When a
// written part still exceeds the limit the split is retried with one more
// part, down to one file per part.
bool package_folder(const std::filesystem::path& folder,
                    const PackageOptions& options,
                    std::vector<std::filesystem::path>& archives,
                    std::string& error);

} // namespace mockforge::core

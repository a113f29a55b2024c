// archive_packager.cpp
// MIT License (c) 2026 Pedro

#include "archive_packager.h"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

#include <archive.h>
#include <archive_entry.h>

#include "cli_parse.h"
#include "image.h"

namespace fs = std::filesystem;

namespace mockforge::core {

namespace {

constexpr int DEFAULT_FILE_PERMISSIONS = 0644;
constexpr long double k_split_size_buffer = 1.1L;

void remove_archives(const std::vector<fs::path>& paths) {
    for (const fs::path& path : paths) {
        std::error_code ignore;
        fs::remove(path, ignore);
    }
}

bool read_file_bytes(const fs::path& path, std::vector<char>& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "failed to read '" + path.string() + "'";
        return false;
    }
    return true;
}

bool add_file_entry(struct archive* a, const fs::path& file, std::string& error) {
    std::vector<char> data;
    if (!read_file_bytes(file, data, error)) {
        return false;
    }

    struct archive_entry* entry = archive_entry_new();
    if (entry == nullptr) {
        error = "failed to allocate archive entry";
        return false;
    }

    const std::string name = file.filename().string();
    archive_entry_set_pathname(entry, name.c_str());
    archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, DEFAULT_FILE_PERMISSIONS);
    archive_entry_set_mtime(entry, time(nullptr), 0);

    if (archive_write_header(a, entry) != ARCHIVE_OK) {
        error = std::string("failed to write archive header: ") + archive_error_string(a);
        archive_entry_free(entry);
        return false;
    }

    if (!data.empty() &&
        archive_write_data(a, data.data(), data.size()) != static_cast<la_ssize_t>(data.size())) {
        error = std::string("failed to write archive data: ") + archive_error_string(a);
        archive_entry_free(entry);
        return false;
    }

    archive_entry_free(entry);
    return true;
}

} // namespace

std::string default_archive_name(const fs::path& folder) {
    std::error_code ec;
    fs::path absolute = fs::absolute(folder, ec);
    if (ec) {
        absolute = folder;
    }
    absolute = absolute.lexically_normal();
    std::string name = absolute.filename().string();
    if (name.empty()) {
        name = absolute.parent_path().filename().string();
    }
    std::replace(name.begin(), name.end(), ' ', '_');
    return name;
}

size_t required_part_count(std::uintmax_t total_bytes, std::uintmax_t max_bytes) {
    if (max_bytes == 0 || total_bytes <= max_bytes) {
        return 1;
    }
    const long double buffered = static_cast<long double>(total_bytes) * k_split_size_buffer;
    const auto parts = static_cast<size_t>(std::ceil(buffered / static_cast<long double>(max_bytes)));
    return std::max<size_t>(2, parts);
}

std::vector<std::vector<fs::path>> split_into_groups(const std::vector<fs::path>& files, size_t group_count) {
    std::vector<std::vector<fs::path>> groups;
    if (files.empty() || group_count == 0) {
        return groups;
    }
    group_count = std::min(group_count, files.size());
    const size_t base = files.size() / group_count;
    const size_t remainder = files.size() % group_count;
    size_t next = 0;
    for (size_t g = 0; g < group_count; ++g) {
        const size_t count = base + (g < remainder ? 1 : 0);
        groups.emplace_back(files.begin() + static_cast<std::ptrdiff_t>(next),
                            files.begin() + static_cast<std::ptrdiff_t>(next + count));
        next += count;
    }
    return groups;
}

std::string archive_file_name(const std::string& name, size_t index, size_t count) {
    if (count <= 1) {
        return name + ".zip";
    }
    return name + "_part" + std::to_string(index + 1) + "of" + std::to_string(count) + ".zip";
}

bool write_zip_archive(const fs::path& path, const std::vector<fs::path>& files, std::string& error) {
    fs::path tmp_path = path;
    tmp_path += ".tmp";

    struct archive* a = archive_write_new();
    if (a == nullptr) {
        error = "failed to create archive writer";
        return false;
    }

    auto fail = [&](const std::string& message) {
        error = message;
        archive_write_free(a);
        std::error_code ignore;
        fs::remove(tmp_path, ignore);
        return false;
    };

    if (archive_write_set_format_zip(a) != ARCHIVE_OK) {
        return fail(std::string("failed to set archive format: ") + archive_error_string(a));
    }
    if (archive_write_open_filename(a, tmp_path.string().c_str()) != ARCHIVE_OK) {
        return fail("failed to open '" + tmp_path.string() + "': " + archive_error_string(a));
    }

    for (const fs::path& file : files) {
        std::string entry_error;
        if (!add_file_entry(a, file, entry_error)) {
            return fail(entry_error);
        }
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        return fail(std::string("failed to close archive: ") + archive_error_string(a));
    }
    archive_write_free(a);

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        error = "failed to move '" + tmp_path.string() + "' into place: " + ec.message();
        std::error_code ignore;
        fs::remove(tmp_path, ignore);
        return false;
    }
    return true;
}

bool package_folder(const fs::path& folder,
                    const PackageOptions& options,
                    std::vector<fs::path>& archives,
                    std::string& error) {
    archives.clear();
    const std::vector<fs::path> files = list_product_images(folder);
    if (files.empty()) {
        error = "no product images in '" + folder.string() + "'";
        return false;
    }
    if (options.max_size_mb <= 0) {
        error = "invalid max size " + std::to_string(options.max_size_mb);
        return false;
    }

    std::uintmax_t total_bytes = 0;
    for (const fs::path& file : files) {
        std::error_code ec;
        const std::uintmax_t size = fs::file_size(file, ec);
        if (ec) {
            error = "failed to stat '" + file.string() + "': " + ec.message();
            return false;
        }
        total_bytes += size;
    }

    const std::string name = options.name.empty() ? default_archive_name(folder) : options.name;
    const fs::path output_dir = options.output_dir.empty() ? folder : options.output_dir;
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        error = "failed to create output directory '" + output_dir.string() + "': " + ec.message();
        return false;
    }

    const std::uintmax_t max_bytes = static_cast<std::uintmax_t>(options.max_size_mb) * k_bytes_per_mb;
    size_t part_count = std::min(required_part_count(total_bytes, max_bytes), files.size());
    while (true) {
        const auto groups = split_into_groups(files, part_count);
        bool oversized = false;
        for (size_t i = 0; i < groups.size(); ++i) {
            const fs::path archive_path = output_dir / archive_file_name(name, i, groups.size());
            if (!write_zip_archive(archive_path, groups[i], error)) {
                remove_archives(archives);
                archives.clear();
                return false;
            }
            archives.push_back(archive_path);
            std::error_code size_ec;
            const std::uintmax_t written = fs::file_size(archive_path, size_ec);
            if (!size_ec && written > max_bytes) {
                oversized = true;
            }
        }
        if (!oversized) {
            return true;
        }
        if (part_count >= files.size()) {
            std::cerr << "Warning: Some archives of " << to_quoted(folder.string()) << " exceed "
                      << options.max_size_mb << " MB even with one file per part\n";
            return true;
        }
        remove_archives(archives);
        archives.clear();
        ++part_count;
    }
}

} // namespace mockforge::core

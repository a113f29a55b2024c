// archive_packager_test.cpp
// MIT License (c) 2026 Pedro

#include <gtest/gtest.h>

#include <fstream>
#include <random>

#include <archive.h>
#include <archive_entry.h>

#include "core/archive_packager.h"
#include "test_support.h"

using namespace mockforge::core;
using mockforge::test::TempDir;

namespace {

void write_bytes(const std::filesystem::path& path, size_t size) {
    std::ofstream out(path, std::ios::binary);
    for (size_t i = 0; i < size; ++i) {
        out.put(static_cast<char>(i * 31U));
    }
}

// Noise does not deflate, so archive sizes track input sizes.
void write_noise(const std::filesystem::path& path, size_t size, unsigned int seed) {
    std::mt19937 rng(seed);
    std::ofstream out(path, std::ios::binary);
    for (size_t i = 0; i < size; ++i) {
        out.put(static_cast<char>(rng() & 0xFFU));
    }
}

constexpr size_t k_kib = 1024;

std::vector<std::string> list_entries(const std::filesystem::path& zip) {
    std::vector<std::string> names;
    struct archive* a = archive_read_new();
    archive_read_support_format_zip(a);
    if (archive_read_open_filename(a, zip.string().c_str(), 10240) != ARCHIVE_OK) {
        archive_read_free(a);
        return names;
    }
    struct archive_entry* entry = nullptr;
    while (archive_read_next_header(a, &entry) == ARCHIVE_OK) {
        names.emplace_back(archive_entry_pathname(entry));
        archive_read_data_skip(a);
    }
    archive_read_free(a);
    return names;
}

std::vector<std::filesystem::path> paths(std::initializer_list<const char*> names) {
    std::vector<std::filesystem::path> out;
    for (const char* name : names) {
        out.emplace_back(name);
    }
    return out;
}

} // namespace

TEST(ArchivePackagerTest, GroupsAreRoughlyEqualWithRemainderFirst) {
    const auto groups = split_into_groups(paths({"a", "b", "c", "d", "e", "f", "g"}), 3);
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].size(), 3u);
    EXPECT_EQ(groups[1].size(), 2u);
    EXPECT_EQ(groups[2].size(), 2u);
    EXPECT_EQ(groups[1][0].string(), "d");
    EXPECT_EQ(groups[2][1].string(), "g");

    EXPECT_EQ(split_into_groups(paths({"a", "b"}), 5).size(), 2u);
    EXPECT_TRUE(split_into_groups({}, 2).empty());
}

TEST(ArchivePackagerTest, PartCountRoundsUp) {
    EXPECT_EQ(required_part_count(10, 20), 1u);
    EXPECT_EQ(required_part_count(20, 20), 1u);
    EXPECT_EQ(required_part_count(21, 20), 2u);
    EXPECT_EQ(required_part_count(38, 20), 3u);
    EXPECT_EQ(required_part_count(61, 20), 4u);
}

TEST(ArchivePackagerTest, ArchiveNames) {
    EXPECT_EQ(archive_file_name("Red_Floral", 0, 1), "Red_Floral.zip");
    EXPECT_EQ(archive_file_name("Red_Floral", 1, 3), "Red_Floral_part2of3.zip");
    EXPECT_EQ(default_archive_name("/tmp/My Shop Set"), "My_Shop_Set");
    EXPECT_EQ(default_archive_name("/tmp/prints/"), "prints");
}

TEST(ArchivePackagerTest, SmallFolderBecomesOneZip) {
    TempDir dir("mockforge_zip");
    const auto folder = dir.path() / "Red Floral";
    std::filesystem::create_directories(folder / "mocks");
    write_bytes(folder / "b.png", 1000);
    write_bytes(folder / "a.jpg", 2000);
    write_bytes(folder / "notes.txt", 10);
    write_bytes(folder / "mocks" / "main.png", 10);

    std::vector<std::filesystem::path> archives;
    std::string error;
    ASSERT_TRUE(package_folder(folder, PackageOptions{}, archives, error)) << error;
    ASSERT_EQ(archives.size(), 1u);
    EXPECT_EQ(archives[0].string(), (folder / "Red_Floral.zip").string());
    EXPECT_FALSE(std::filesystem::exists(folder / "Red_Floral.zip.tmp"));
    EXPECT_EQ(list_entries(archives[0]), (std::vector<std::string>{"a.jpg", "b.png"}));
}

TEST(ArchivePackagerTest, LargeFolderIsSplitIntoParts) {
    TempDir dir("mockforge_zip");
    const auto folder = dir.path() / "prints";
    std::filesystem::create_directories(folder);
    unsigned int seed = 1;
    for (const char* name : {"1.png", "2.png", "3.png", "4.png", "5.png"}) {
        write_noise(folder / name, 300 * k_kib, seed++);
    }

    PackageOptions options;
    options.output_dir = dir.path() / "out";
    options.name = "bundle";
    options.max_size_mb = 1;

    std::vector<std::filesystem::path> archives;
    std::string error;
    ASSERT_TRUE(package_folder(folder, options, archives, error)) << error;
    ASSERT_EQ(archives.size(), 2u);
    EXPECT_EQ(archives[0].filename().string(), "bundle_part1of2.zip");
    EXPECT_EQ(archives[1].filename().string(), "bundle_part2of2.zip");
    EXPECT_EQ(list_entries(archives[0]), (std::vector<std::string>{"1.png", "2.png", "3.png"}));
    EXPECT_EQ(list_entries(archives[1]), (std::vector<std::string>{"4.png", "5.png"}));
}

TEST(ArchivePackagerTest, OversizedPartTriggersFinerSplit) {
    TempDir dir("mockforge_zip");
    const auto folder = dir.path() / "prints";
    std::filesystem::create_directories(folder);
    write_noise(folder / "1.png", 900 * k_kib, 11);
    write_noise(folder / "2.png", 900 * k_kib, 12);
    write_noise(folder / "3.png", 50 * k_kib, 13);
    write_noise(folder / "4.png", 50 * k_kib, 14);

    PackageOptions options;
    options.output_dir = dir.path() / "out";
    options.name = "bundle";
    options.max_size_mb = 1;

    // Three count-balanced parts would pair 1.png with 2.png.
    std::vector<std::filesystem::path> archives;
    std::string error;
    ASSERT_TRUE(package_folder(folder, options, archives, error)) << error;
    ASSERT_EQ(archives.size(), 4u);
    for (const auto& archive : archives) {
        EXPECT_LE(std::filesystem::file_size(archive), k_bytes_per_mb);
        EXPECT_EQ(list_entries(archive).size(), 1u);
    }
    EXPECT_FALSE(std::filesystem::exists(options.output_dir / "bundle_part1of3.zip"));
    EXPECT_FALSE(std::filesystem::exists(options.output_dir / "bundle_part3of3.zip"));
}

TEST(ArchivePackagerTest, SingleFileAboveLimitIsStillPackaged) {
    TempDir dir("mockforge_zip");
    const auto folder = dir.path() / "prints";
    std::filesystem::create_directories(folder);
    write_noise(folder / "huge.png", 1536 * k_kib, 21);

    PackageOptions options;
    options.max_size_mb = 1;
    std::vector<std::filesystem::path> archives;
    std::string error;
    ASSERT_TRUE(package_folder(folder, options, archives, error)) << error;
    ASSERT_EQ(archives.size(), 1u);
    EXPECT_EQ(archives[0].filename().string(), "prints.zip");
}

TEST(ArchivePackagerTest, RelativeFolderNameIsResolved) {
    EXPECT_EQ(default_archive_name("Summer Prints"), "Summer_Prints");
    EXPECT_EQ(default_archive_name("Summer Prints/."), "Summer_Prints");
}

TEST(ArchivePackagerTest, EmptyFolderFails) {
    TempDir dir("mockforge_zip");
    std::vector<std::filesystem::path> archives;
    std::string error;
    EXPECT_FALSE(package_folder(dir.path(), PackageOptions{}, archives, error));
    EXPECT_NE(error.find("no product images"), std::string::npos);
    EXPECT_TRUE(archives.empty());
}

TEST(ArchivePackagerTest, MissingInputFileFailsWithoutLeavingArchive) {
    TempDir dir("mockforge_zip");
    const auto zip = dir.path() / "out.zip";
    std::string error;
    EXPECT_FALSE(write_zip_archive(zip, {dir.path() / "missing.png"}, error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(std::filesystem::exists(zip));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "out.zip.tmp"));
}

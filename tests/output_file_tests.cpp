// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splitdl/disk/output_file.hpp>
#include "support/temp_dir.hpp"
#include <cerrno>
#include <filesystem>
#include <thread>
#include <vector>

using namespace splitdl::disk;
using splitdl::test::TempDir;
using splitdl::test::read_file;

TEST_CASE("OutputFile::create preallocates", "[disk]") {
    TempDir dir;
    auto path = dir.file("out.bin");

    SECTION("New file gets the requested length") {
        auto file = OutputFile::create(path, 4096);
        REQUIRE(file.has_value());
        CHECK(file->is_open());
        CHECK(file->length() == 4096);
        CHECK(file->path() == path);
        CHECK(std::filesystem::file_size(path) == 4096);
    }

    SECTION("Existing file is truncated and resized") {
        {
            std::ofstream(path) << std::string(10000, 'x');
        }
        auto file = OutputFile::create(path, 10);
        REQUIRE(file.has_value());
        file->close();
        CHECK(read_file(path) == std::string(10, '\0'));
    }

    SECTION("Zero length") {
        auto file = OutputFile::create(path, 0);
        REQUIRE(file.has_value());
        CHECK(std::filesystem::file_size(path) == 0);
    }
}

TEST_CASE("OutputFile::create errors", "[disk]") {
    TempDir dir;

    SECTION("Missing directory") {
        auto file = OutputFile::create(dir.file("no/such/dir/out.bin"), 10);
        REQUIRE(!file.has_value());
        CHECK(file.error() == DiskErrc::file_not_found);
    }

    SECTION("Path is a directory") {
        auto file = OutputFile::create(dir.path().string(), 10);
        REQUIRE(!file.has_value());
        CHECK(file.error() == DiskErrc::invalid_path);
    }
}

TEST_CASE("OutputFile::write_at", "[disk]") {
    TempDir dir;
    auto path = dir.file("out.bin");
    auto file = OutputFile::create(path, 10);
    REQUIRE(file.has_value());

    SECTION("Writes land at their offsets in any order") {
        CHECK(!file->write_at(6, "ghij", 4));
        CHECK(!file->write_at(0, "abc", 3));
        CHECK(!file->write_at(3, "def", 3));
        file->close();
        CHECK(read_file(path) == "abcdefghij");
    }

    SECTION("Past the preallocated length is rejected") {
        CHECK(file->write_at(8, "xyz", 3) == DiskErrc::out_of_bounds);
        CHECK(file->write_at(11, "x", 1) == DiskErrc::out_of_bounds);
        CHECK(!file->write_at(9, "x", 1));
        CHECK(std::filesystem::file_size(path) == 10);
    }

    SECTION("Closed file") {
        file->close();
        CHECK(!file->is_open());
        CHECK(file->write_at(0, "a", 1) == DiskErrc::handle_invalid);
        CHECK(file->flush() == DiskErrc::handle_invalid);
    }

    SECTION("Moved-from file is closed") {
        OutputFile other = std::move(*file);
        CHECK(other.is_open());
        CHECK(!file->is_open());
        CHECK(!other.write_at(0, "z", 1));
        CHECK(!other.flush());
    }
}

TEST_CASE("OutputFile concurrent disjoint writes", "[disk][stress]") {
    TempDir dir;
    auto path = dir.file("stress.bin");

    constexpr std::size_t WRITERS = 16;
    constexpr std::size_t SLICE = 3 * 1024 + 7;   // Odd size so slices straddle pages
    constexpr std::size_t PIECE = 512;
    constexpr std::size_t TOTAL = WRITERS * SLICE;

    auto file = OutputFile::create(path, TOTAL);
    REQUIRE(file.has_value());

    std::string expected(TOTAL, '\0');
    for (std::size_t i = 0; i < TOTAL; ++i) {
        expected[i] = static_cast<char>('A' + (i / SLICE) % 26);
    }

    std::vector<std::thread> writers;
    std::vector<std::error_code> errors(WRITERS);
    for (std::size_t w = 0; w < WRITERS; ++w) {
        writers.emplace_back([&, w] {
            for (std::size_t off = 0; off < SLICE; off += PIECE) {
                auto n = std::min(PIECE, SLICE - off);
                auto pos = w * SLICE + off;
                if (auto ec = file->write_at(pos, expected.data() + pos, n)) {
                    errors[w] = ec;
                    return;
                }
            }
        });
    }
    for (auto& t : writers) t.join();

    for (const auto& ec : errors) {
        CHECK(!ec);
    }
    file->close();
    CHECK(read_file(path) == expected);
}

TEST_CASE("errno_to_error_code", "[disk]") {
    CHECK(errno_to_error_code(ENOENT) == DiskErrc::file_not_found);
    CHECK(errno_to_error_code(EACCES) == DiskErrc::access_denied);
    CHECK(errno_to_error_code(ENOSPC) == DiskErrc::disk_full);
    CHECK(errno_to_error_code(EFBIG) == DiskErrc::allocation_failed);
    CHECK(errno_to_error_code(EIO) == DiskErrc::write_error);
    CHECK(errno_to_error_code(EIO).category().name() == std::string("splitdl::disk"));
}

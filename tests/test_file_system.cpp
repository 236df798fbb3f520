/**
 * @file test_file_system.cpp
 * @brief Tests for POSIX file access, atomic writes and change watching (Catch2)
 */

#include <catch2/catch_all.hpp>
#include "jpatch/FileSystem.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace jpatch;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> entries(const std::string& dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

} // anonymous namespace

// ============================================================================
// Temporary directories
// ============================================================================

TEST_CASE("TempDirectory - lifetime", "[fs][temp]") {
    std::string path;
    {
        TempDirectory dir("jpatch_test");
        path = dir.path();
        CHECK(fs::is_directory(path));
        CHECK(fs::path(path).filename().string().rfind("jpatch_test.", 0) == 0);
        CHECK(dir.file("patched.json") == (fs::path(path) / "patched.json").string());

        std::ofstream out(dir.file("patched.json"));
        out << "{}";
    }
    CHECK_FALSE(fs::exists(path));
}

TEST_CASE("TempDirectory - unique", "[fs][temp]") {
    TempDirectory a;
    TempDirectory b;
    CHECK(a.path() != b.path());
}

// ============================================================================
// Reading and writing
// ============================================================================

TEST_CASE("PosixFileSystem - read and write", "[fs]") {
    TempDirectory dir;
    PosixFileSystem files;
    const std::string path = dir.file("doc.json");

    SECTION("Missing file") {
        CHECK_FALSE(files.exists(path));
        CHECK_THROWS_AS(files.read_file(path), IoError);
    }

    SECTION("Write creates the file") {
        files.write_atomic(path, "{\"a\": 1}\n");
        CHECK(files.exists(path));
        CHECK(files.read_file(path) == "{\"a\": 1}\n");
    }

    SECTION("Write replaces the contents") {
        files.write_atomic(path, "first version, rather long\n");
        files.write_atomic(path, "second\n");
        CHECK(files.read_file(path) == "second\n");
    }

    SECTION("No temporary file left behind") {
        files.write_atomic(path, "[]\n");
        CHECK(entries(dir.path()) == std::vector<std::string>{"doc.json"});
    }

    SECTION("Missing directory throws IoError") {
        CHECK_THROWS_AS(files.write_atomic(dir.file("sub/doc.json"), "x"), IoError);
    }

    SECTION("Directories are not readable files") {
        CHECK_THROWS_AS(files.read_file(dir.path()), IoError);
    }
}

// ============================================================================
// Watching
// ============================================================================

TEST_CASE("PosixFileSystem - watch", "[fs][watch]") {
    TempDirectory dir;
    PosixFileSystem files(20ms);
    const std::string path = dir.file("patched.json");
    files.write_atomic(path, "{}\n");

    auto watcher = files.watch(path);

    SECTION("Timeout when nothing happens") {
        CHECK(watcher->wait(50ms) == WatchEvent::Timeout);
    }

    SECTION("Atomic replace is reported") {
        files.write_atomic(path, "{\"a\": 1}\n");
        CHECK(watcher->wait(2000ms) == WatchEvent::Changed);
    }

    SECTION("In-place write is reported") {
        {
            std::ofstream out(path);
            out << "{\"b\": 2}\n";
        }
        CHECK(watcher->wait(2000ms) == WatchEvent::Changed);
    }

    SECTION("Burst of writes is one event") {
        for (int i = 0; i < 5; ++i) {
            files.write_atomic(path, "{\"n\": " + std::to_string(i) + "}\n");
        }
        CHECK(watcher->wait(2000ms) == WatchEvent::Changed);
        CHECK(watcher->wait(50ms) == WatchEvent::Timeout);
    }

    SECTION("Other files in the directory are ignored") {
        files.write_atomic(dir.file("other.json"), "{}\n");
        CHECK(watcher->wait(50ms) == WatchEvent::Timeout);
    }

    SECTION("Removal is reported") {
        fs::remove(path);
        CHECK(watcher->wait(2000ms) == WatchEvent::Removed);
    }
}

TEST_CASE("PosixFileSystem - watch missing directory", "[fs][watch]") {
    TempDirectory dir;
    PosixFileSystem files;
    CHECK_THROWS_AS(files.watch(dir.file("nope/patched.json")), IoError);
}

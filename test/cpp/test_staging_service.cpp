#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include "staging_service.hpp"
#include "test_utils.hpp"

using namespace stagegate;
using namespace stagegate::test;

namespace fs = std::filesystem;

namespace {

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("StagingService: decodeContent", "[staging][encoding]") {
    SECTION("utf-8 passes through") {
        auto data = StagingService::decodeContent("print('hi')\n", ContentEncoding::Utf8);
        REQUIRE(data);
        REQUIRE(*data == "print('hi')\n");
    }

    SECTION("Valid base64") {
        REQUIRE(*StagingService::decodeContent("aGVsbG8=", ContentEncoding::Base64) == "hello");
        REQUIRE(*StagingService::decodeContent("aGVs\nbG8h", ContentEncoding::Base64) == "hello!");
        REQUIRE(StagingService::decodeContent("", ContentEncoding::Base64)->empty());
    }

    SECTION("Invalid base64 is a format error") {
        for (const std::string bad : {"aGVsbG8", "aG=Vs", "aGVs*G8=", "a===", "aGVsbG8=aGVs"}) {
            INFO("input: " << bad);
            auto data = StagingService::decodeContent(bad, ContentEncoding::Base64);
            REQUIRE_FALSE(data);
            REQUIRE(data.error().isFormat());
            REQUIRE(data.error().message.find("Invalid base64") != std::string::npos);
        }
    }
}

TEST_CASE("StagingService: upload", "[staging][upload]") {
    TempStaging staging;
    StagingService service(staging.makeGuard(), staging.config().max_file_bytes);

    SECTION("Writes text content into the project directory") {
        auto receipt = service.upload("proj1", "src/main.py", "print('hi')\n");
        REQUIRE(receipt);
        REQUIRE(receipt->project_id == "proj1");
        REQUIRE(receipt->filename == "src/main.py");
        REQUIRE(receipt->path == "staging/proj1/src/main.py");
        REQUIRE(receipt->size == 12);
        REQUIRE(readFile(staging.root() / "proj1" / "src" / "main.py") == "print('hi')\n");

        auto json = receipt->toJson().dump();
        REQUIRE(json.find("\"uploaded\"") != std::string::npos);
    }

    SECTION("Staged files get the umask-derived mode") {
        mode_t previous = ::umask(022);
        auto receipt = service.upload("proj1", "shared.txt", "data");
        ::umask(previous);
        REQUIRE(receipt);

        auto perms = fs::status(staging.root() / "proj1" / "shared.txt").permissions();
        REQUIRE((perms & fs::perms::all) ==
                (fs::perms::owner_read | fs::perms::owner_write |
                 fs::perms::group_read | fs::perms::others_read));
    }

    SECTION("Invalid encoding is rejected before anything is written") {
        auto receipt = service.upload("proj1", "a.txt", "x", "utf-8\nINFO forged entry");
        REQUIRE_FALSE(receipt);
        REQUIRE(receipt.error().isFormat());
        REQUIRE_FALSE(fs::exists(staging.root() / "proj1" / "a.txt"));
    }

    SECTION("Decodes base64 content") {
        auto receipt = service.upload("proj1", "bin/data.bin", "AAEC/w==", "base64");
        REQUIRE(receipt);
        REQUIRE(receipt->size == 4);
        REQUIRE(readFile(staging.root() / "proj1" / "bin" / "data.bin") == std::string("\x00\x01\x02\xff", 4));
    }

    SECTION("Overwrites an existing file atomically") {
        REQUIRE(service.upload("proj1", "a.txt", "first"));
        REQUIRE(service.upload("proj1", "a.txt", "second"));
        REQUIRE(readFile(staging.root() / "proj1" / "a.txt") == "second");

        // No temporary files left behind
        size_t entries = std::distance(fs::directory_iterator(staging.root() / "proj1"),
                                       fs::directory_iterator());
        REQUIRE(entries == 1);
    }

    SECTION("Normalizes the filename") {
        auto receipt = service.upload("proj1", "\\docs\\readme.md", "# hi");
        REQUIRE(receipt);
        REQUIRE(receipt->filename == "docs/readme.md");
    }

    SECTION("Rejects unknown encodings") {
        auto receipt = service.upload("proj1", "a.txt", "x", "utf-16");
        REQUIRE_FALSE(receipt);
        REQUIRE(receipt.error().isFormat());
    }

    SECTION("Rejects traversal without touching the filesystem") {
        auto receipt = service.upload("proj1", "../proj2/evil.py", "x");
        REQUIRE_FALSE(receipt);
        REQUIRE(receipt.error().isSecurity());
        REQUIRE_FALSE(fs::exists(staging.root() / "proj2"));
        REQUIRE_FALSE(fs::exists(staging.root() / "proj1"));
    }

    SECTION("Rejects secret files") {
        auto receipt = service.upload("proj1", "keys/id_rsa", "-----BEGIN");
        REQUIRE_FALSE(receipt);
        REQUIRE(receipt.error().isFormat());
    }

    SECTION("Rejects writes through a symlinked directory") {
        TempDirectory outside("stagegate_outside");
        fs::create_directories(staging.root() / "proj1");
        fs::create_directory_symlink(outside.fsPath(), staging.root() / "proj1" / "src");

        auto receipt = service.upload("proj1", "src/main.py", "x");
        REQUIRE_FALSE(receipt);
        REQUIRE(receipt.error().isSecurity());
        REQUIRE_FALSE(fs::exists(outside.fsPath() / "main.py"));
    }

    SECTION("Writing onto a directory is an I/O error") {
        fs::create_directories(staging.root() / "proj1" / "dir.txt");
        auto receipt = service.upload("proj1", "dir.txt", "x");
        REQUIRE_FALSE(receipt);
        REQUIRE(receipt.error().category == ErrorCategory::Io);
    }
}

TEST_CASE("StagingService: size limit", "[staging][upload]") {
    TempStaging staging;
    StagingService service(staging.makeGuard(), 8);

    REQUIRE(service.upload("proj1", "ok.txt", "12345678"));

    auto receipt = service.upload("proj1", "big.txt", "123456789");
    REQUIRE_FALSE(receipt);
    REQUIRE(receipt.error().isFormat());
    REQUIRE(receipt.error().message.find("File too large") != std::string::npos);
    REQUIRE_FALSE(fs::exists(staging.root() / "proj1" / "big.txt"));
}

TEST_CASE("StagingService: staging info", "[staging][info]") {
    TempStaging staging;
    StagingService service(staging.makeGuard(), staging.config().max_file_bytes);

    SECTION("Missing directory yields an empty listing") {
        auto info = service.stagingInfo("proj1");
        REQUIRE(info);
        REQUIRE(info->files.empty());
        REQUIRE(info->total_size_bytes == 0);
        REQUIRE(info->staging_path == "staging/proj1");
        REQUIRE_FALSE(*service.hasStagedFiles("proj1"));
    }

    SECTION("Lists uploaded files recursively") {
        REQUIRE(service.upload("proj1", "main.py", "12345"));
        REQUIRE(service.upload("proj1", "src/utils.py", "123"));
        REQUIRE(service.upload("proj2", "other.py", "1"));

        auto info = service.stagingInfo("proj1");
        REQUIRE(info);
        REQUIRE(info->files.size() == 2);
        REQUIRE(info->total_size_bytes == 8);

        std::vector<std::string> names;
        for (const auto& file : info->files) {
            names.push_back(file.name);
            REQUIRE_FALSE(file.modified_at.empty());
        }
        std::sort(names.begin(), names.end());
        REQUIRE(names == std::vector<std::string>{"main.py", "src/utils.py"});
        REQUIRE(*service.hasStagedFiles("proj1"));

        auto json = info->toJson().dump();
        REQUIRE(json.find("\"file_count\":2") != std::string::npos);
    }

    SECTION("Symlinks are not listed") {
        TempDirectory outside("stagegate_outside");
        outside.writeFile("secret.txt", "x");
        REQUIRE(service.upload("proj1", "main.py", "x"));
        fs::create_symlink(outside.fsPath() / "secret.txt", staging.root() / "proj1" / "link.txt");
        fs::create_directory_symlink(outside.fsPath(), staging.root() / "proj1" / "linkdir");

        auto info = service.stagingInfo("proj1");
        REQUIRE(info);
        REQUIRE(info->files.size() == 1);
        REQUIRE(info->files.front().name == "main.py");
    }

    SECTION("Invalid project id") {
        auto info = service.stagingInfo("a");
        REQUIRE_FALSE(info);
        REQUIRE(info.error().isFormat());
    }
}

TEST_CASE("StagingService: clear and delete", "[staging][clear]") {
    TempStaging staging;
    StagingService service(staging.makeGuard(), staging.config().max_file_bytes);

    REQUIRE(service.upload("proj1", "main.py", "x"));
    REQUIRE(service.upload("proj1", "src/a.py", "x"));
    REQUIRE(service.upload("proj2", "keep.py", "x"));

    SECTION("Clear counts every file of a deep tree") {
        for (int i = 0; i < 20; ++i) {
            std::string dir = "d" + std::to_string(i % 4) + "/n" + std::to_string(i % 3);
            REQUIRE(service.upload("proj1", dir + "/f" + std::to_string(i) + ".txt", "x"));
        }
        auto info = service.stagingInfo("proj1");
        REQUIRE(info);
        REQUIRE(info->files.size() == 20);

        auto receipt = service.clear("proj1");
        REQUIRE(receipt);
        REQUIRE(receipt->files_deleted == 20);
    }

    SECTION("Clear counts and removes files") {
        auto receipt = service.clear("proj1");
        REQUIRE(receipt);
        REQUIRE(receipt->files_deleted == 2);
        REQUIRE_FALSE(fs::exists(staging.root() / "proj1"));
        REQUIRE(fs::exists(staging.root() / "proj2" / "keep.py"));
        REQUIRE(receipt->toJson().dump().find("\"cleared\"") != std::string::npos);
    }

    SECTION("Clearing an empty project succeeds") {
        auto receipt = service.clear("proj3");
        REQUIRE(receipt);
        REQUIRE(receipt->files_deleted == 0);
    }

    SECTION("Delete removes the project directory only") {
        auto receipt = service.deleteProject("proj1");
        REQUIRE(receipt);
        REQUIRE(receipt->project_id == "proj1");
        REQUIRE_FALSE(fs::exists(staging.root() / "proj1"));
        REQUIRE(fs::exists(staging.root() / "proj2" / "keep.py"));
    }

    SECTION("Clear refuses a symlinked project directory") {
        TempDirectory outside("stagegate_outside");
        outside.writeFile("precious.txt", "x");
        fs::create_directory_symlink(outside.fsPath(), staging.root() / "proj4");

        auto receipt = service.clear("proj4");
        REQUIRE_FALSE(receipt);
        REQUIRE(receipt.error().isSecurity());
        REQUIRE(fs::exists(outside.fsPath() / "precious.txt"));
    }
}

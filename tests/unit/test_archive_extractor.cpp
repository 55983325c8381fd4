#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <string>

#include "AppException.hpp"
#include "ArchiveExtractor.hpp"
#include "TestHelpers.hpp"

namespace {

ArchiveExtractor server_extractor()
{
    return ArchiveExtractor("llama-server", {"libllama.", "libggml"});
}

bool contains_path(const std::vector<std::filesystem::path>& paths, const std::filesystem::path& wanted)
{
    return std::find(paths.begin(), paths.end(), wanted) != paths.end();
}

} // namespace

TEST_CASE("ArchiveExtractor matches the executable and library prefixes") {
    const ArchiveExtractor extractor = server_extractor();

    CHECK(extractor.is_wanted("llama-server"));
    CHECK(extractor.is_wanted("libllama.so"));
    CHECK(extractor.is_wanted("libggml.so"));
    CHECK(extractor.is_wanted("libggml-base.so"));
    CHECK(extractor.is_wanted("libggml-cpu.dylib"));
    CHECK_FALSE(extractor.is_wanted("llama-cli"));
    CHECK_FALSE(extractor.is_wanted("libllava.so"));
    CHECK_FALSE(extractor.is_wanted("LICENSE"));
}

TEST_CASE("ArchiveExtractor flattens wanted entries and skips the rest") {
    TempDir tmp;
    const auto archive = tmp.path() / "release.zip";
    REQUIRE(write_zip(archive, {
        {"build/bin/llama-server", "#!/bin/sh\necho server\n", ""},
        {"build/bin/libllama.so", "llama-lib", ""},
        {"build/bin/libggml-base.so", "ggml-base", ""},
        {"build/bin/llama-cli", "cli", ""},
        {"README.md", "readme", ""},
    }));

    const auto dest = tmp.path() / "out";
    const auto written = server_extractor().extract(archive, dest);

    REQUIRE(written.size() == 3);
    REQUIRE(contains_path(written, dest / "llama-server"));
    REQUIRE(contains_path(written, dest / "libllama.so"));
    REQUIRE(contains_path(written, dest / "libggml-base.so"));
    REQUIRE(read_text_file(dest / "libggml-base.so") == "ggml-base");
    REQUIRE_FALSE(std::filesystem::exists(dest / "llama-cli"));
    REQUIRE_FALSE(std::filesystem::exists(dest / "README.md"));
    REQUIRE_FALSE(std::filesystem::exists(dest / "build"));

    const auto perms = std::filesystem::status(dest / "llama-server").permissions();
    REQUIRE((perms & std::filesystem::perms::owner_exec) != std::filesystem::perms::none);
}

TEST_CASE("ArchiveExtractor recreates library symlinks with flat targets") {
    TempDir tmp;
    const auto archive = tmp.path() / "release.zip";
    REQUIRE(write_zip(archive, {
        {"bin/llama-server", "server", ""},
        {"bin/libllama.so.1", "llama-lib", ""},
        {"bin/libllama.so", "", "../bin/libllama.so.1"},
    }));

    const auto dest = tmp.path() / "out";
    server_extractor().extract(archive, dest);

    REQUIRE(std::filesystem::is_symlink(dest / "libllama.so"));
    REQUIRE(std::filesystem::read_symlink(dest / "libllama.so") == std::filesystem::path("libllama.so.1"));
    REQUIRE(read_text_file(dest / "libllama.so") == "llama-lib");
}

TEST_CASE("ArchiveExtractor reports the files found when the executable is missing") {
    TempDir tmp;
    const auto archive = tmp.path() / "release.zip";
    REQUIRE(write_zip(archive, {
        {"bin/llama-cli", "cli", ""},
        {"bin/libllama.so", "lib", ""},
    }));

    try {
        server_extractor().extract(archive, tmp.path() / "out");
        FAIL("expected extraction to fail");
    } catch (const ErrorCodes::AppException& ex) {
        REQUIRE(ex.get_error_code() == ErrorCodes::Code::DOWNLOAD_EXTRACTION_FAILED);
        const std::string details = ex.get_error_info().technical_details;
        REQUIRE(details.find("llama-cli") != std::string::npos);
        REQUIRE(details.find("libllama.so") != std::string::npos);
    }
}

TEST_CASE("ArchiveExtractor rejects files that are not archives") {
    TempDir tmp;
    const auto bogus = tmp.path() / "not-a.zip";
    write_text_file(bogus, "this is plain text, not a zip file");

    try {
        server_extractor().extract(bogus, tmp.path() / "out");
        FAIL("expected extraction to fail");
    } catch (const ErrorCodes::AppException& ex) {
        REQUIRE(ex.get_error_code() == ErrorCodes::Code::DOWNLOAD_EXTRACTION_FAILED);
    }
}

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <string>
#include <thread>

#include "AppException.hpp"
#include "AssetDownloader.hpp"
#include "TestHelpers.hpp"
#include "TestHooks.hpp"

namespace {

AssetDescriptor small_asset(const std::string& id = "tiny-model")
{
    AssetDescriptor asset;
    asset.id = id;
    asset.name = "Tiny Model";
    asset.description = "Test asset";
    asset.expected_size_bytes = 64;
    asset.url = "https://example.invalid/" + id + ".gguf";
    asset.filename = id + ".gguf";
    return asset;
}

class DiskSpaceOverride {
public:
    explicit DiskSpaceOverride(std::optional<std::uint64_t> bytes)
    {
        TestHooks::set_disk_space_probe([bytes](const std::filesystem::path&) { return bytes; });
    }
    ~DiskSpaceOverride() { TestHooks::reset_disk_space_probe(); }
};

ErrorCodes::Code code_of(const std::function<void()>& action)
{
    try {
        action();
    } catch (const ErrorCodes::AppException& ex) {
        return ex.get_error_code();
    }
    return ErrorCodes::Code::UNKNOWN_ERROR;
}

bool has_leftovers(const std::filesystem::path& dir)
{
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        const std::string name = entry.path().filename().string();
        if (name.find(".download") != std::string::npos || name.rfind(".staging-", 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST_CASE("AssetDownloader writes the asset and reports progress") {
    TempDir tmp;
    DiskSpaceOverride space(std::uint64_t{1} << 30);
    const std::string body(100, 'x');
    AssetDownloader downloader(make_streaming_body(200, body, 30));

    std::vector<std::pair<long long, long long>> progress;
    const auto path = downloader.download(small_asset(), tmp.path(),
                                          [&](long long done, long long total) {
                                              progress.emplace_back(done, total);
                                          });

    REQUIRE(path == tmp.path() / "tiny-model.gguf");
    REQUIRE(read_text_file(path) == body);
    REQUIRE_FALSE(has_leftovers(tmp.path()));
    REQUIRE(progress.size() == 4);
    REQUIRE(progress.back() == std::make_pair(100LL, 100LL));
    REQUIRE_FALSE(downloader.is_downloading("tiny-model"));
}

TEST_CASE("AssetDownloader refuses to start without enough disk space") {
    TempDir tmp;
    DiskSpaceOverride space(std::uint64_t{10});
    std::atomic<int> requests{0};
    AssetDownloader downloader([&](const HttpRequest&, const StreamHandlers&) {
        ++requests;
        return make_response(200, "");
    });

    REQUIRE(code_of([&] { downloader.download(small_asset(), tmp.path()); })
            == ErrorCodes::Code::DOWNLOAD_INSUFFICIENT_DISK_SPACE);
    REQUIRE(requests == 0);
    REQUIRE_FALSE(downloader.is_downloading("tiny-model"));
}

TEST_CASE("AssetDownloader removes the partial file on HTTP errors") {
    TempDir tmp;
    DiskSpaceOverride space(std::uint64_t{1} << 30);
    AssetDownloader downloader(make_streaming_body(404, "not found"));

    try {
        downloader.download(small_asset(), tmp.path());
        FAIL("expected download to fail");
    } catch (const ErrorCodes::AppException& ex) {
        REQUIRE(ex.get_error_code() == ErrorCodes::Code::DOWNLOAD_HTTP_STATUS);
        REQUIRE(std::string(ex.what()) == "Download failed with status: 404");
    }
    REQUIRE_FALSE(std::filesystem::exists(tmp.path() / "tiny-model.gguf"));
    REQUIRE_FALSE(has_leftovers(tmp.path()));
}

TEST_CASE("AssetDownloader maps transport failures to network errors") {
    TempDir tmp;
    DiskSpaceOverride space(std::uint64_t{1} << 30);
    AssetDownloader downloader([](const HttpRequest&, const StreamHandlers& handlers) {
        handlers.on_headers(200, 64);
        handlers.on_chunk("partial", 7);
        return make_network_failure("Connection reset by peer");
    });

    REQUIRE(code_of([&] { downloader.download(small_asset(), tmp.path()); })
            == ErrorCodes::Code::NETWORK_ERROR);
    REQUIRE_FALSE(has_leftovers(tmp.path()));
    REQUIRE_FALSE(std::filesystem::exists(tmp.path() / "tiny-model.gguf"));
}

TEST_CASE("AssetDownloader rejects a second download of the same asset") {
    TempDir tmp;
    DiskSpaceOverride space(std::uint64_t{1} << 30);

    std::promise<void> entered;
    std::promise<void> release;
    std::atomic<bool> blocked_once{false};
    std::shared_future<void> release_future = release.get_future().share();
    AssetDownloader downloader([&, release_future](const HttpRequest& request, const StreamHandlers& handlers) {
        if (request.url.find("tiny-model") != std::string::npos && !blocked_once.exchange(true)) {
            entered.set_value();
            release_future.wait();
        }
        handlers.on_headers(200, 4);
        handlers.on_chunk("data", 4);
        return make_response(200, "");
    });

    auto first = std::async(std::launch::async, [&] {
        return downloader.download(small_asset(), tmp.path());
    });
    entered.get_future().wait();

    REQUIRE(downloader.is_downloading("tiny-model"));
    REQUIRE(code_of([&] { downloader.download(small_asset(), tmp.path()); })
            == ErrorCodes::Code::DOWNLOAD_IN_PROGRESS);

    // Other assets are not blocked by the one in flight.
    const auto other = downloader.download(small_asset("other-model"), tmp.path());
    REQUIRE(std::filesystem::exists(other));

    release.set_value();
    REQUIRE(first.get() == tmp.path() / "tiny-model.gguf");
    REQUIRE_FALSE(downloader.is_downloading("tiny-model"));

    // The slot frees up once the first download finished.
    const auto again = downloader.download(small_asset(), tmp.path());
    REQUIRE(std::filesystem::exists(again));
}

TEST_CASE("AssetDownloader installs the server from a release archive") {
    TempDir tmp;
    DiskSpaceOverride space(std::uint64_t{1} << 30);

    const auto zip_path = tmp.path() / "fixture.zip";
    REQUIRE(write_zip(zip_path, {
        {"build/bin/llama-server", "#!/bin/sh\n", ""},
        {"build/bin/libggml-base.so", "ggml", ""},
        {"build/bin/llama-bench", "bench", ""},
    }));
    const std::string zip_bytes = read_text_file(zip_path);

    ServerArchiveDescriptor descriptor;
    descriptor.asset = small_asset("llama-server");
    descriptor.asset.filename = "llama-b0000-bin-test.zip";
    descriptor.executable_name = "llama-server";
    descriptor.library_prefixes = {"libllama.", "libggml"};
    descriptor.release = "b0000";

    const auto bin_dir = tmp.path() / "bin";
    AssetDownloader downloader(make_streaming_body(200, zip_bytes, 512));
    const auto executable = downloader.download_server_archive(descriptor, bin_dir);

    REQUIRE(executable == bin_dir / "llama-server");
    REQUIRE(std::filesystem::exists(executable));
    REQUIRE(read_text_file(bin_dir / "libggml-base.so") == "ggml");
    REQUIRE_FALSE(std::filesystem::exists(bin_dir / "llama-bench"));
    REQUIRE_FALSE(std::filesystem::exists(bin_dir / "llama-b0000-bin-test.zip"));
    REQUIRE_FALSE(has_leftovers(bin_dir));
}

TEST_CASE("AssetDownloader cleans up after a failed server extraction") {
    TempDir tmp;
    DiskSpaceOverride space(std::uint64_t{1} << 30);

    const auto zip_path = tmp.path() / "fixture.zip";
    REQUIRE(write_zip(zip_path, {{"build/bin/llama-cli", "cli", ""}}));

    ServerArchiveDescriptor descriptor;
    descriptor.asset = small_asset("llama-server");
    descriptor.asset.filename = "llama-b0000-bin-test.zip";
    descriptor.executable_name = "llama-server";
    descriptor.library_prefixes = {"libllama.", "libggml"};
    descriptor.release = "b0000";

    const auto bin_dir = tmp.path() / "bin";
    AssetDownloader downloader(make_streaming_body(200, read_text_file(zip_path)));

    REQUIRE(code_of([&] { downloader.download_server_archive(descriptor, bin_dir); })
            == ErrorCodes::Code::DOWNLOAD_EXTRACTION_FAILED);
    REQUIRE_FALSE(has_leftovers(bin_dir));
    REQUIRE_FALSE(std::filesystem::exists(bin_dir / "llama-server"));
}

TEST_CASE("AssetDownloader deletes downloaded assets") {
    TempDir tmp;
    write_text_file(tmp.path() / "tiny-model.gguf", "weights");

    AssetDownloader::delete_asset(small_asset(), tmp.path());
    REQUIRE_FALSE(std::filesystem::exists(tmp.path() / "tiny-model.gguf"));

    // Deleting something that is not there is not an error.
    AssetDownloader::delete_asset(small_asset(), tmp.path());
}

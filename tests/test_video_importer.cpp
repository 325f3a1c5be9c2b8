// Video import from files and URLs with a fake probe
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/errors.hpp"
#include "media/video_importer.hpp"
#include "utils/logging.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <vector>

using namespace wms;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

struct FakeProber : Prober {
    MediaInfo info{12.5, Resolution{1280, 720}};
    std::vector<fs::path> probed;

    MediaInfo probe(const fs::path& media) override {
        probed.push_back(media);
        return info;
    }
};

fs::path scratch_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / "wms_tests" / "import" / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void touch(const fs::path& path) {
    std::ofstream out(path);
    out << "x";
}

std::string user_message_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const AppError& e) {
        return e.user_message();
    }
    return {};
}

}  // namespace

TEST_CASE("import_from_file probes supported files") {
    const auto dir = scratch_dir("file");
    touch(dir / "Movie.MP4");

    FakeProber prober;
    ProcessRunner runner(0s, make_null_logger());
    VideoImporter importer(prober, runner, ImportOptions{{"mp4", "mkv"}, "yt-dlp", dir}, make_null_logger());

    Video video = importer.import_from_file(dir / "Movie.MP4");
    REQUIRE(video.source_kind() == SourceKind::File);
    REQUIRE(video.source_path().is_absolute());
    REQUIRE(video.duration() == Catch::Approx(12.5));
    REQUIRE(video.resolution().width == 1280);
    REQUIRE_FALSE(video.original_url().has_value());
    REQUIRE_FALSE(is_assigned(video.id()));
    REQUIRE(video.import_timestamp().size() == 20);
    REQUIRE(prober.probed.size() == 1);
}

TEST_CASE("import_from_file rejects missing and unsupported files") {
    const auto dir = scratch_dir("reject");
    touch(dir / "notes.txt");

    FakeProber prober;
    ProcessRunner runner(0s, make_null_logger());
    VideoImporter importer(prober, runner, ImportOptions{{"mp4"}, "yt-dlp", dir}, make_null_logger());

    REQUIRE(user_message_of([&] { (void)importer.import_from_file(dir / "missing.mp4"); }) == "File not found.");
    REQUIRE(user_message_of([&] { (void)importer.import_from_file(dir / "notes.txt"); }) == "Unsupported file format.");
    REQUIRE(user_message_of([&] { (void)importer.import_from_file(dir); }) == "File not found.");
    REQUIRE(prober.probed.empty());
}

TEST_CASE("import_from_url maps downloader failures") {
    const auto dir = scratch_dir("url");
    FakeProber prober;
    ProcessRunner runner(0s, make_null_logger());

    VideoImporter failing(prober, runner, ImportOptions{{"mp4"}, "false", dir}, make_null_logger());
    REQUIRE(user_message_of([&] { (void)failing.import_from_url("https://example.com/v", dir / "a"); })
            == "Cannot download video from URL.");

    // Succeeds but leaves nothing behind
    VideoImporter silent(prober, runner, ImportOptions{{"mp4"}, "true", dir}, make_null_logger());
    REQUIRE(user_message_of([&] { (void)silent.import_from_url("https://example.com/v", dir / "b"); })
            == "Downloaded file not found or ambiguous.");

    fs::create_directories(dir / "c");
    touch(dir / "c" / "one.mp4");
    touch(dir / "c" / "two.mp4");
    REQUIRE(user_message_of([&] { (void)silent.import_from_url("https://example.com/v", dir / "c"); })
            == "Downloaded file not found or ambiguous.");
    REQUIRE(prober.probed.empty());
}

TEST_CASE("import_from_url probes the single downloaded mp4") {
    const auto dir = scratch_dir("single");
    fs::create_directories(dir / "dl");
    touch(dir / "dl" / "clip.mp4");
    touch(dir / "dl" / "clip.part");

    FakeProber prober;
    ProcessRunner runner(0s, make_null_logger());
    VideoImporter importer(prober, runner, ImportOptions{{"mp4"}, "true", dir}, make_null_logger());

    Video video = importer.import_from_url("https://example.com/v", dir / "dl");
    REQUIRE(video.source_kind() == SourceKind::Url);
    REQUIRE(video.original_url() == std::optional<std::string>("https://example.com/v"));
    REQUIRE(video.source_path().filename().string() == "clip.mp4");
    REQUIRE(prober.probed.size() == 1);
}

// In-memory repository and CSV export
#include <catch2/catch_test_macros.hpp>
#include "storage/detection_repository.hpp"
#include "test_fakes.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace wms;
using wms::test::make_video;

namespace {

struct Seeded {
    InMemoryDetectionRepository repo;
    VideoId video_id;
    ClipId clip_a;
    ClipId clip_b;

    Seeded() {
        video_id = repo.add_video(make_video(kUnassignedId));
        clip_a = repo.add_clip(Clip{kUnassignedId, video_id, 0.0, 5.0, std::nullopt});
        clip_b = repo.add_clip(Clip{kUnassignedId, video_id, 5.0, 10.0, std::nullopt});
        repo.add_detection(Detection(video_id, clip_a, 1.0, "Sample WM", 0.9, Roi{0, 0, 10, 10}));
        repo.add_detection(Detection(video_id, clip_a, 2.0, "other", 0.6, Roi{0, 0, 10, 10}));
        repo.add_detection(Detection(video_id, clip_b, 6.0, "sample wm", 0.8, Roi{5, 5, 10, 10}));
    }
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

TEST_CASE("Repository assigns increasing ids from 1") {
    InMemoryDetectionRepository repo;
    auto v1 = repo.add_video(make_video(kUnassignedId));
    auto v2 = repo.add_video(make_video(kUnassignedId));
    REQUIRE(v1 == 1);
    REQUIRE(v2 == 2);
    REQUIRE(repo.find_video(v2)->id() == 2);
    REQUIRE_FALSE(repo.find_video(3).has_value());

    auto c1 = repo.add_clip(Clip{kUnassignedId, v1, 0.0, 1.0, std::nullopt});
    REQUIRE(c1 == 1);
    REQUIRE(repo.find_clip(c1)->id == 1);
    REQUIRE(repo.find_clip(c1)->video_id == v1);
}

TEST_CASE("Repository validates references and time ranges") {
    InMemoryDetectionRepository repo;
    auto v = repo.add_video(make_video(kUnassignedId));
    auto c = repo.add_clip(Clip{kUnassignedId, v, 0.0, 1.0, std::nullopt});

    REQUIRE_THROWS_AS(repo.add_clip(Clip{kUnassignedId, 99, 0.0, 1.0, std::nullopt}), std::invalid_argument);
    REQUIRE_THROWS_AS(repo.add_clip(Clip{kUnassignedId, v, 2.0, 1.0, std::nullopt}), std::invalid_argument);
    REQUIRE_THROWS_AS(repo.add_detection(Detection(v, 42, 0.0, "X", 0.5, Roi{0, 0, 1, 1})), std::invalid_argument);
    REQUIRE_THROWS_AS(repo.add_detection(Detection(42, c, 0.0, "X", 0.5, Roi{0, 0, 1, 1})), std::invalid_argument);
    REQUIRE(repo.query({}).empty());
}

TEST_CASE("Repository query filters") {
    Seeded s;

    REQUIRE(s.repo.query({}).size() == 3);

    DetectionQuery by_text;
    by_text.text = "SAMPLE";
    auto rows = s.repo.query(by_text);
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].id == 1);
    REQUIRE(rows[1].id == 3);

    DetectionQuery by_confidence;
    by_confidence.min_confidence = 0.8;
    REQUIRE(s.repo.query(by_confidence).size() == 2);

    DetectionQuery by_clip;
    by_clip.clip_id = s.clip_b;
    rows = s.repo.query(by_clip);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].detection.text() == "sample wm");

    DetectionQuery bad;
    bad.min_confidence = 1.5;
    REQUIRE_THROWS_AS(s.repo.query(bad), std::invalid_argument);
}

TEST_CASE("Repository updates a clip in place") {
    Seeded s;

    Clip clip = *s.repo.find_clip(s.clip_b);
    clip.segment_path = std::filesystem::path("/tmp/clip_2.mp4");
    s.repo.update_clip(clip);
    REQUIRE(s.repo.find_clip(s.clip_b)->segment_path.has_value());
    REQUIRE(s.repo.find_clip(s.clip_b)->segment_path->string() == "/tmp/clip_2.mp4");

    Clip unknown = clip;
    unknown.id = 99;
    REQUIRE_THROWS_AS(s.repo.update_clip(unknown), std::invalid_argument);

    Clip moved = clip;
    moved.video_id = 7;
    REQUIRE_THROWS_AS(s.repo.update_clip(moved), std::invalid_argument);

    Clip inverted = clip;
    inverted.end_time = inverted.start_time;
    REQUIRE_THROWS_AS(s.repo.update_clip(inverted), std::invalid_argument);
}

TEST_CASE("Repository removes clips without detections only") {
    Seeded s;
    auto spare = s.repo.add_clip(Clip{kUnassignedId, s.video_id, 10.0, 12.0, std::nullopt});

    s.repo.remove_clip(spare);
    REQUIRE_FALSE(s.repo.find_clip(spare).has_value());
    REQUIRE_THROWS_AS(s.repo.remove_clip(spare), std::invalid_argument);

    REQUIRE_THROWS_AS(s.repo.remove_clip(s.clip_a), std::invalid_argument);
    REQUIRE(s.repo.find_clip(s.clip_a).has_value());

    // Ids are not reused after removal
    REQUIRE(s.repo.add_clip(Clip{kUnassignedId, s.video_id, 10.0, 11.0, std::nullopt}) == spare + 1);
}

TEST_CASE("csv_escape quotes only when needed") {
    REQUIRE(csv_escape("plain") == "plain");
    REQUIRE(csv_escape("a,b") == "\"a,b\"");
    REQUIRE(csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
}

TEST_CASE("export_csv writes a header and one row per detection") {
    InMemoryDetectionRepository repo;
    auto v = repo.add_video(make_video(kUnassignedId));
    auto c = repo.add_clip(Clip{kUnassignedId, v, 0.0, 5.0, std::nullopt});
    repo.add_detection(Detection(v, c, 1.5, "Hello, World", 0.875, Roi{10, 20, 30, 40}));

    const auto out = std::filesystem::temp_directory_path() / "wms_tests" / "csv" / "detections.csv";
    std::filesystem::remove(out);
    export_csv(repo.query({}), out);

    const std::string text = read_file(out);
    REQUIRE(text ==
        "watermark_id,video_id,clip_id,timestamp,extracted_text,confidence,"
        "roi_x,roi_y,roi_width,roi_height\n"
        "1,1,1,1.5,\"Hello, World\",0.875,10,20,30,40\n");
}

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <stitch/recovery/validator.hpp>
#include "test_support.hpp"

using namespace stitch;
using namespace stitch::recovery;

namespace {

media::SegmentManifest make_manifest(std::uint32_t n) {
    media::SegmentManifest manifest;
    manifest.source_url = "https://h/index.m3u8";
    for (std::uint32_t i = 0; i < n; ++i) {
        manifest.segments.push_back({i, "https://h/" + std::to_string(i) + ".ts", std::nullopt});
    }
    return manifest;
}

} // namespace

TEST_CASE("Validator - local diff", "[validator]") {
    test::TempDir tmp;
    auto dir = disk::AssetDir::open(tmp.path, "asset");
    REQUIRE(dir.has_value());

    SECTION("No manifest") {
        auto report = Validator::validate(*dir);
        CHECK_FALSE(report.manifest_loaded);
        CHECK(report.expected_count == 0);
        CHECK_FALSE(report.is_complete());
        CHECK(report.failed_indices().empty());
    }

    SECTION("Corrupt manifest") {
        REQUIRE_FALSE(dir->create());
        test::write_text(dir->manifest_path(), "[1, 2");
        auto report = Validator::validate(*dir);
        CHECK_FALSE(report.manifest_loaded);
        CHECK_FALSE(report.is_complete());
    }

    SECTION("Missing and empty segments") {
        REQUIRE_FALSE(dir->save_manifest(make_manifest(6)));
        test::write_text(dir->segment_path(0), "aaaa");
        test::write_text(dir->segment_path(1), "");
        test::write_text(dir->segment_path(3), "bb");
        test::write_text(dir->segment_path(5), "cccccc");

        auto report = Validator::validate(*dir);
        CHECK(report.manifest_loaded);
        CHECK(report.expected_count == 6);
        CHECK(report.present_count == 3);
        CHECK(report.missing == std::vector<std::uint32_t>{2, 4});
        CHECK(report.empty == std::vector<std::uint32_t>{1});
        CHECK(report.total_size == 12);
        CHECK(report.failed_indices() == std::vector<std::uint32_t>{1, 2, 4});
        CHECK_FALSE(report.is_complete());
    }

    SECTION("Recorded lengths catch truncated files") {
        REQUIRE_FALSE(dir->save_manifest(make_manifest(2)));
        REQUIRE_FALSE(dir->save_content_lengths({{0, 4}, {1, 100}}));
        test::write_text(dir->segment_path(0), "aaaa");
        test::write_text(dir->segment_path(1), "cut short");

        auto report = Validator::validate(*dir);
        CHECK(report.present_count == 1);
        CHECK(report.empty == std::vector<std::uint32_t>{1});
        CHECK(report.total_size == 4);
    }

    SECTION("Complete") {
        REQUIRE_FALSE(dir->save_manifest(make_manifest(3)));
        for (std::uint32_t i = 0; i < 3; ++i) {
            test::write_text(dir->segment_path(i), "data");
        }
        auto report = Validator::validate(*dir);
        CHECK(report.is_complete());
        CHECK(report.present_count == 3);
        CHECK(report.total_size == 12);

        // Temp files from interrupted writes are ignored
        test::write_text(tmp.path / "asset" / "segment_00001.ts.part", "junk");
        CHECK(Validator::validate(*dir) == report);
    }

    SECTION("Validation never writes") {
        REQUIRE_FALSE(dir->save_manifest(make_manifest(2)));
        auto before = std::distance(std::filesystem::directory_iterator(dir->path()),
                                    std::filesystem::directory_iterator());
        (void)Validator::validate(*dir);
        auto after = std::distance(std::filesystem::directory_iterator(dir->path()),
                                   std::filesystem::directory_iterator());
        CHECK(before == after);
    }
}

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <stitch/disk/asset_dir.hpp>
#include <stitch/disk/atomic_file.hpp>
#include <stitch/core/error.hpp>
#include "test_support.hpp"

using namespace stitch;
using namespace stitch::disk;
namespace fs = std::filesystem;

TEST_CASE("AtomicFile - commit and discard", "[disk][atomic]") {
    test::TempDir tmp;
    auto target = tmp.path / "out.bin";

    SECTION("Commit renames temp into place") {
        auto file = AtomicFile::create(target);
        REQUIRE(file.has_value());
        REQUIRE_FALSE(file->write("hello", 5));
        CHECK(fs::exists(file->temp_path()));
        CHECK_FALSE(fs::exists(target));
        CHECK(file->size() == 5);

        REQUIRE_FALSE(file->commit());
        CHECK(test::read_text(target) == "hello");
        CHECK_FALSE(fs::exists(tmp.path / "out.bin.part"));
    }

    SECTION("Destruction without commit leaves the old file") {
        test::write_text(target, "old");
        {
            auto file = AtomicFile::create(target);
            REQUIRE(file.has_value());
            REQUIRE_FALSE(file->write("partial", 7));
        }
        CHECK(test::read_text(target) == "old");
        CHECK_FALSE(fs::exists(tmp.path / "out.bin.part"));
    }

    SECTION("Write after commit is rejected") {
        auto file = AtomicFile::create(target);
        REQUIRE(file.has_value());
        REQUIRE_FALSE(file->commit());
        CHECK(file->write("x", 1) == DiskErrc::handle_invalid);
        CHECK(fs::file_size(target) == 0);
    }

    SECTION("Missing parent directory") {
        auto file = AtomicFile::create(tmp.path / "no" / "such" / "dir.bin");
        REQUIRE_FALSE(file.has_value());
        CHECK(file.error() == DiskErrc::file_not_found);
    }

    SECTION("Helpers") {
        REQUIRE_FALSE(write_file_atomic(target, "content"));
        auto text = read_file(target);
        REQUIRE(text.has_value());
        CHECK(*text == "content");

        auto missing = read_file(tmp.path / "missing");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error() == DiskErrc::file_not_found);
    }
}

TEST_CASE("sanitize_identifier", "[disk][identifier]") {
    CHECK(sanitize_identifier("  lecture 01  ").value() == "lecture 01");
    CHECK(sanitize_identifier("a/b\\c:d*e?f\"g<h>i|j").value() == "a_b_c_d_e_f_g_h_i_j");
    CHECK(sanitize_identifier("..hidden").value() == "..hidden");

    for (const char* bad : {"", "   ", ".", ".."}) {
        auto name = sanitize_identifier(bad);
        REQUIRE_FALSE(name.has_value());
        CHECK(name.error() == core::ConfigErrc::invalid_identifier);
    }
}

TEST_CASE("AssetDir - layout", "[disk][asset]") {
    test::TempDir tmp;
    auto dir = AssetDir::open(tmp.path, "course/unit 1");
    REQUIRE(dir.has_value());

    CHECK(dir->name() == "course_unit 1");
    CHECK(dir->path() == tmp.path / "course_unit 1");
    CHECK(dir->segment_path(42).filename() == "segment_00042.ts");
    CHECK(AssetDir::segment_filename(123456) == "segment_123456.ts");

    // Nothing is created until something is saved
    CHECK_FALSE(fs::exists(dir->path()));
    CHECK_FALSE(dir->has_metadata());
}

TEST_CASE("AssetDir - metadata files", "[disk][asset]") {
    test::TempDir tmp;
    auto dir = AssetDir::open(tmp.path, "asset");
    REQUIRE(dir.has_value());

    media::SegmentManifest manifest;
    manifest.source_url = "https://h/a/index.m3u8";
    manifest.media_sequence = 12;
    manifest.segments.push_back({0, "https://h/a/0.ts", std::nullopt});
    manifest.segments.push_back({1, "https://h/a/all.ts", media::ByteRange{100, 50}});

    SECTION("Manifest keeps segments and byte ranges") {
        REQUIRE_FALSE(dir->save_manifest(manifest));
        auto loaded = dir->load_manifest();
        REQUIRE(loaded.has_value());
        CHECK(loaded->source_url == manifest.source_url);
        CHECK(loaded->media_sequence == 12);
        CHECK(loaded->segments == manifest.segments);
        CHECK_FALSE(loaded->encryption.has_value());
    }

    SECTION("Non-contiguous indices are corrupt") {
        fs::create_directories(dir->path());
        test::write_text(dir->manifest_path(),
                         R"({"source_url":"u","media_sequence":0,"segments":[{"index":1,"uri":"x","byte_range":null}]})");
        auto loaded = dir->load_manifest();
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error() == DiskErrc::corrupt_data);
    }

    SECTION("Unparseable JSON is corrupt") {
        fs::create_directories(dir->path());
        test::write_text(dir->content_lengths_path(), "{not json");
        auto loaded = dir->load_content_lengths();
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error() == DiskErrc::corrupt_data);
    }

    SECTION("Encryption info for a clear stream") {
        REQUIRE_FALSE(dir->save_encryption_info(std::nullopt));
        auto info = dir->load_encryption_info();
        REQUIRE(info.has_value());
        CHECK_FALSE(info->has_value());

        auto doc = test::read_text(dir->encryption_info_path());
        CHECK(doc.find("\"is_encrypted\": false") != std::string::npos);
    }

    SECTION("Encryption info for AES-128") {
        media::EncryptionDescriptor desc;
        desc.method = media::EncryptionMethod::aes_128;
        desc.key_uri = "https://h/key.bin";
        desc.iv = media::parse_iv("0x0000000000000000000000000000abcd");
        desc.keyformat = "identity";

        REQUIRE_FALSE(dir->save_encryption_info(desc));
        auto info = dir->load_encryption_info();
        REQUIRE(info.has_value());
        REQUIRE(info->has_value());
        CHECK(**info == desc);

        auto doc = test::read_text(dir->encryption_info_path());
        CHECK(doc.find("\"method\": \"AES-128\"") != std::string::npos);
        CHECK(doc.find("\"key_file\": \"encryption.key\"") != std::string::npos);
        CHECK(doc.find("\"keyformatversions\": null") != std::string::npos);
    }

    SECTION("Key must be 16 bytes") {
        std::vector<std::uint8_t> key(16, 0x5A);
        REQUIRE_FALSE(dir->save_key(key));
        auto loaded = dir->load_key();
        REQUIRE(loaded.has_value());
        CHECK(*loaded == key);

        test::write_text(dir->key_path(), "short");
        auto bad = dir->load_key();
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error() == DiskErrc::corrupt_data);
    }

    SECTION("Content lengths") {
        ContentLengths lengths{{0, 1024}, {7, 99}};
        REQUIRE_FALSE(dir->save_content_lengths(lengths));
        auto loaded = dir->load_content_lengths();
        REQUIRE(loaded.has_value());
        CHECK(*loaded == lengths);
    }

    SECTION("has_metadata needs every side file") {
        REQUIRE_FALSE(dir->save_playlist("#EXTM3U\n"));
        REQUIRE_FALSE(dir->save_manifest(manifest));
        CHECK_FALSE(dir->has_metadata());

        REQUIRE_FALSE(dir->save_content_lengths({}));
        CHECK_FALSE(dir->has_metadata());

        media::EncryptionDescriptor desc;
        desc.method = media::EncryptionMethod::aes_128;
        desc.key_uri = "https://h/key.bin";
        REQUIRE_FALSE(dir->save_encryption_info(desc));
        CHECK_FALSE(dir->has_metadata());

        REQUIRE_FALSE(dir->save_key(std::vector<std::uint8_t>(16, 1)));
        CHECK(dir->has_metadata());

        auto full = dir->load_full_manifest();
        REQUIRE(full.has_value());
        REQUIRE(full->is_encrypted());
        CHECK(full->encryption->key_uri == "https://h/key.bin");
    }

    SECTION("Saving leaves no temp files behind") {
        REQUIRE_FALSE(dir->save_playlist("#EXTM3U\n"));
        REQUIRE_FALSE(dir->save_manifest(manifest));
        for (const auto& entry : fs::directory_iterator(dir->path())) {
            CHECK(entry.path().extension() != ".part");
        }
    }
}

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <stitch/media/playlist_parser.hpp>
#include <string>
#include <vector>

using namespace stitch::media;

namespace {

constexpr const char* BASE = "https://h/a/b/playlist.m3u8";

const std::vector<std::string> WELL_FORMED = {
    // Relative, parent, root-relative and absolute references
    "#EXTM3U\n"
    "#EXT-X-TARGETDURATION:10\n"
    "#EXTINF:10.0,\nseg000.ts\n"
    "#EXTINF:10.0,\n./seg001.ts\n"
    "#EXTINF:10.0,\n../seg002.ts\n"
    "#EXTINF:9.5,\n/root/seg003.ts\n"
    "#EXTINF:4.2,title\nhttps://cdn.example.com/seg004.ts?sig=1\n"
    "#EXT-X-ENDLIST\n",

    // CRLF line endings, media sequence, network-path reference
    "#EXTM3U\r\n"
    "#EXT-X-MEDIA-SEQUENCE:7\r\n"
    "#EXTINF:6,\r\n//other.example.com/x/1.ts\r\n"
    "#EXTINF:6,\r\nsub/dir/../2.ts\r\n",

    // Encrypted with explicit IV and key format attributes
    "#EXTM3U\n"
    "#EXT-X-MEDIA-SEQUENCE:100\n"
    "#EXT-X-KEY:METHOD=AES-128,URI=\"../keys/k1.bin\",IV=0x000102030405060708090A0B0C0D0E0F,"
    "KEYFORMAT=\"identity\",KEYFORMATVERSIONS=\"1\"\n"
    "#EXTINF:10,\na.ts\n"
    "#EXTINF:10,\nb.ts\n",

    // Encrypted without IV, repeated key line and a repeated URI
    "#EXTM3U\n"
    "#EXT-X-KEY:METHOD=AES-128,URI=\"https://keys.example.com/k?id=1\"\n"
    "#EXTINF:10,\nsame.ts\n"
    "#EXT-X-KEY:METHOD=AES-128,URI=\"https://keys.example.com/k?id=1\"\n"
    "#EXTINF:10,\nsame.ts\n",

    // Sub-ranges of one resource, implicit offsets continue from the previous range
    "#EXTM3U\n"
    "#EXT-X-VERSION:4\n"
    "#EXTINF:4,\n#EXT-X-BYTERANGE:1000@0\nmedia.ts\n"
    "#EXTINF:4,\n#EXT-X-BYTERANGE:500\nmedia.ts\n"
    "#EXT-X-BYTERANGE:250@4096\n#EXTINF:2,\nmedia.ts\n"
    "#EXTINF:2,\ntail.ts\n",
};

} // namespace

TEST_CASE("PlaylistParser - structured and line scan agree", "[parser][equivalence]") {
    for (const auto& playlist : WELL_FORMED) {
        CAPTURE(playlist);
        auto structured = PlaylistParser::parse_structured(playlist, BASE);
        auto lines = PlaylistParser::parse_lines(playlist, BASE);
        REQUIRE(structured.has_value());
        REQUIRE(lines.has_value());

        CHECK(structured->segments == lines->segments);
        CHECK(structured->uris() == lines->uris());
        CHECK(structured->media_sequence == lines->media_sequence);
        CHECK(structured->encryption == lines->encryption);
    }
}

TEST_CASE("PlaylistParser - reference resolution", "[parser]") {
    auto manifest = PlaylistParser::parse(WELL_FORMED[0], BASE);
    REQUIRE(manifest.has_value());
    REQUIRE(manifest->segments.size() == 5);

    CHECK(manifest->segments[0].uri == "https://h/a/b/seg000.ts");
    CHECK(manifest->segments[1].uri == "https://h/a/b/seg001.ts");
    CHECK(manifest->segments[2].uri == "https://h/a/seg002.ts");
    CHECK(manifest->segments[3].uri == "https://h/root/seg003.ts");
    CHECK(manifest->segments[4].uri == "https://cdn.example.com/seg004.ts?sig=1");

    for (std::uint32_t i = 0; i < manifest->segments.size(); ++i) {
        CHECK(manifest->segments[i].index == i);
    }
    CHECK(manifest->source_url == BASE);
    CHECK_FALSE(manifest->is_encrypted());
}

TEST_CASE("resolve_reference - manual resolver", "[parser][resolve]") {
    CHECK(resolve_reference(BASE, "../seg002.ts") == "https://h/a/seg002.ts");
    CHECK(resolve_reference(BASE, "/x/./y/../z.ts") == "https://h/x/z.ts");
    CHECK(resolve_reference(BASE, "https://o/p.ts") == "https://o/p.ts");
    CHECK(resolve_reference(BASE, "//o/p.ts") == "https://o/p.ts");
    CHECK(resolve_reference("https://h/a/", "..") == "https://h/");
    CHECK(resolve_reference("not a url", "seg.ts") == std::nullopt);
}

TEST_CASE("PlaylistParser - fallback", "[parser][fallback]") {
    SECTION("Missing header uses the line scan") {
        std::string text = "seg0.ts\nseg1.ts\n";
        CHECK(!PlaylistParser::parse_structured(text, BASE).has_value());

        auto manifest = PlaylistParser::parse(text, BASE);
        REQUIRE(manifest.has_value());
        REQUIRE(manifest->segments.size() == 2);
        CHECK(manifest->segments[1].uri == "https://h/a/b/seg1.ts");
    }

    SECTION("URI without EXTINF uses the line scan") {
        std::string text = "#EXTM3U\n#EXTINF:5,\none.ts\ntwo.ts\n";
        auto structured = PlaylistParser::parse_structured(text, BASE);
        REQUIRE(!structured.has_value());
        CHECK(structured.error() == ParseErrc::malformed);

        auto manifest = PlaylistParser::parse(text, BASE);
        REQUIRE(manifest.has_value());
        CHECK(manifest->segments.size() == 2);
    }

    SECTION("Header only is empty") {
        auto manifest = PlaylistParser::parse("#EXTM3U\n#EXT-X-ENDLIST\n", BASE);
        REQUIRE(!manifest.has_value());
        CHECK(manifest.error() == ParseErrc::empty);
    }

    SECTION("Blank input is empty") {
        auto manifest = PlaylistParser::parse("\n\n", BASE);
        REQUIRE(!manifest.has_value());
        CHECK(manifest.error() == ParseErrc::empty);
    }

    SECTION("Unresolvable base") {
        auto manifest = PlaylistParser::parse("#EXTM3U\n#EXTINF:1,\nseg.ts\n", "relative/index.m3u8");
        REQUIRE(!manifest.has_value());
        CHECK(manifest.error() == ParseErrc::unresolvable_uri);
    }
}

TEST_CASE("PlaylistParser - encryption", "[parser][encryption]") {
    SECTION("Explicit IV and attributes") {
        auto manifest = PlaylistParser::parse(WELL_FORMED[2], BASE);
        REQUIRE(manifest.has_value());
        REQUIRE(manifest->is_encrypted());
        const auto& enc = *manifest->encryption;
        CHECK(enc.method == EncryptionMethod::aes_128);
        CHECK(enc.key_uri == "https://h/a/keys/k1.bin");
        REQUIRE(enc.iv.has_value());
        CHECK((*enc.iv)[0] == 0x00);
        CHECK((*enc.iv)[15] == 0x0F);
        CHECK(enc.keyformat == "identity");
        CHECK(enc.keyformatversions == "1");
        CHECK(manifest->media_sequence == 100);
    }

    SECTION("IV derived from media sequence") {
        std::string text =
            "#EXTM3U\n#EXT-X-MEDIA-SEQUENCE:5\n"
            "#EXT-X-KEY:METHOD=AES-128,URI=\"key.bin\"\n"
            "#EXTINF:1,\n0.ts\n#EXTINF:1,\n1.ts\n#EXTINF:1,\n2.ts\n";
        auto manifest = PlaylistParser::parse(text, BASE);
        REQUIRE(manifest.has_value());
        auto iv = manifest->segment_iv(2);
        CHECK(iv[15] == 7);
        for (std::size_t i = 0; i < 15; ++i) {
            CHECK(iv[i] == 0);
        }
    }

    SECTION("Large sequence numbers are big-endian") {
        SegmentManifest manifest;
        manifest.media_sequence = 0x0102;
        auto iv = manifest.segment_iv(0);
        CHECK(iv[14] == 0x01);
        CHECK(iv[15] == 0x02);
    }

    SECTION("METHOD=NONE is ignored") {
        std::string text = "#EXTM3U\n#EXT-X-KEY:METHOD=NONE\n#EXTINF:1,\n0.ts\n";
        auto manifest = PlaylistParser::parse(text, BASE);
        REQUIRE(manifest.has_value());
        CHECK_FALSE(manifest->is_encrypted());
    }

    SECTION("Unsupported method fails in both strategies") {
        std::string text = "#EXTM3U\n#EXT-X-KEY:METHOD=SAMPLE-AES,URI=\"k\"\n#EXTINF:1,\n0.ts\n";
        CHECK(PlaylistParser::parse_structured(text, BASE).error() == ParseErrc::unsupported_encryption);
        CHECK(PlaylistParser::parse_lines(text, BASE).error() == ParseErrc::unsupported_encryption);
        CHECK(PlaylistParser::parse(text, BASE).error() == ParseErrc::unsupported_encryption);
    }

    SECTION("Key rotation is unsupported") {
        std::string text =
            "#EXTM3U\n"
            "#EXT-X-KEY:METHOD=AES-128,URI=\"k1\"\n#EXTINF:1,\n0.ts\n"
            "#EXT-X-KEY:METHOD=AES-128,URI=\"k2\"\n#EXTINF:1,\n1.ts\n";
        auto manifest = PlaylistParser::parse(text, BASE);
        REQUIRE(!manifest.has_value());
        CHECK(manifest.error() == ParseErrc::unsupported_encryption);
    }

    SECTION("Malformed IV is unsupported") {
        std::string text = "#EXTM3U\n#EXT-X-KEY:METHOD=AES-128,URI=\"k\",IV=0x1234\n#EXTINF:1,\n0.ts\n";
        CHECK(PlaylistParser::parse(text, BASE).error() == ParseErrc::unsupported_encryption);
    }

    SECTION("Quoted URI may contain commas") {
        std::string text = "#EXTM3U\n#EXT-X-KEY:METHOD=AES-128,URI=\"k?a=1,2\"\n#EXTINF:1,\n0.ts\n";
        auto manifest = PlaylistParser::parse_structured(text, BASE);
        REQUIRE(manifest.has_value());
        CHECK(manifest->encryption->key_uri == "https://h/a/b/k?a=1,2");
    }
}

TEST_CASE("PlaylistParser - byte ranges", "[parser][byterange]") {
    std::string text =
        "#EXTM3U\n"
        "#EXTINF:1,\n#EXT-X-BYTERANGE:1000@0\nall.ts\n"
        "#EXTINF:1,\n#EXT-X-BYTERANGE:500\nall.ts\n"
        "#EXTINF:1,\nother.ts\n";
    auto manifest = PlaylistParser::parse_structured(text, BASE);
    REQUIRE(manifest.has_value());
    REQUIRE(manifest->segments.size() == 3);

    REQUIRE(manifest->segments[0].byte_range.has_value());
    CHECK(manifest->segments[0].byte_range->offset == 0);
    CHECK(manifest->segments[0].byte_range->length == 1000);

    REQUIRE(manifest->segments[1].byte_range.has_value());
    CHECK(manifest->segments[1].byte_range->offset == 1000);
    CHECK(manifest->segments[1].byte_range->length == 500);

    CHECK_FALSE(manifest->segments[2].byte_range.has_value());

    // A repeated URI is still a distinct segment
    CHECK(manifest->segments[0].uri == manifest->segments[1].uri);
}

TEST_CASE("PlaylistParser - byte ranges survive the line scan", "[parser][byterange][fallback]") {
    // No header, so the structured grammar rejects it and the line scan answers
    std::string text =
        "#EXTINF:1,\n#EXT-X-BYTERANGE:1000@0\nall.ts\n"
        "#EXTINF:1,\n#EXT-X-BYTERANGE:500\nall.ts\n"
        "#EXTINF:1,\nother.ts\n";
    REQUIRE_FALSE(PlaylistParser::parse_structured(text, BASE).has_value());

    auto manifest = PlaylistParser::parse(text, BASE);
    REQUIRE(manifest.has_value());
    REQUIRE(manifest->segments.size() == 3);

    REQUIRE(manifest->segments[0].byte_range.has_value());
    CHECK(manifest->segments[0].byte_range->offset == 0);
    CHECK(manifest->segments[0].byte_range->length == 1000);

    REQUIRE(manifest->segments[1].byte_range.has_value());
    CHECK(manifest->segments[1].byte_range->offset == 1000);
    CHECK(manifest->segments[1].byte_range->length == 500);

    CHECK_FALSE(manifest->segments[2].byte_range.has_value());

    SECTION("Malformed range is dropped, not applied to the next segment") {
        auto scanned = PlaylistParser::parse_lines("#EXT-X-BYTERANGE:abc\none.ts\ntwo.ts\n", BASE);
        REQUIRE(scanned.has_value());
        REQUIRE(scanned->segments.size() == 2);
        CHECK_FALSE(scanned->segments[0].byte_range.has_value());
        CHECK_FALSE(scanned->segments[1].byte_range.has_value());
    }
}

TEST_CASE("IV text conversion", "[parser]") {
    auto iv = parse_iv("0x000102030405060708090a0b0c0d0e0f");
    REQUIRE(iv.has_value());
    CHECK(format_iv(*iv) == "0x000102030405060708090a0b0c0d0e0f");
    CHECK(!parse_iv("000102030405060708090a0b0c0d0e0f").has_value());
    CHECK(!parse_iv("0x0001020304050607080g0a0b0c0d0e0f").has_value());
}

TEST_CASE("PlaylistParser::is_hls_url", "[parser]") {
    CHECK(PlaylistParser::is_hls_url("https://x/INDEX.M3U8?x=1"));
    CHECK_FALSE(PlaylistParser::is_hls_url("https://x/video.mp4"));
}

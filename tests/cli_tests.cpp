// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <stitch/cli/commands.hpp>
#include <stitch/cli/progress_bar.hpp>
#include <stitch/core/error.hpp>
#include <stitch/disk/asset_dir.hpp>
#include "test_support.hpp"
#include <cstdlib>
#include <initializer_list>
#include <thread>
#include <vector>

using namespace stitch;
using namespace stitch::cli;

namespace {

// Owns argv storage for parse_args
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "stitch");
        for (auto& s : storage_) {
            pointers_.push_back(s.data());
        }
        pointers_.push_back(nullptr);
    }

    [[nodiscard]] int argc() const { return static_cast<int>(storage_.size()); }
    [[nodiscard]] char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

CliArgs parse(std::initializer_list<std::string> args) {
    Argv a(args);
    return parse_args(a.argc(), a.argv());
}

} // namespace

TEST_CASE("parse_args - commands", "[cli]") {
    SECTION("fetch with options") {
        auto args = parse({"fetch", "movie", "https://h/i.m3u8", "-c", "8", "--delay", "0.5",
                           "-m", "2", "--probe", "-r", "/data", "-q"});
        CHECK(args.error.empty());
        CHECK(args.command == Command::fetch);
        CHECK(args.positional == std::vector<std::string>{"movie", "https://h/i.m3u8"});
        CHECK(args.concurrency == 8u);
        CHECK(args.delay_sec == 0.5);
        CHECK(args.max_retry_rounds == 2u);
        CHECK(args.probe);
        CHECK(args.root == "/data");
        CHECK(args.quiet);
    }

    SECTION("batch with queued tasks") {
        auto args = parse({"batch", "tasks.json", "--add", "a", "https://h/a.m3u8",
                           "--add", "b", "https://h/b.m3u8", "--cooldown", "2", "--limit", "5"});
        CHECK(args.error.empty());
        CHECK(args.command == Command::batch);
        REQUIRE(args.add.size() == 2);
        CHECK(args.add[1].first == "b");
        CHECK(args.add[1].second == "https://h/b.m3u8");
        CHECK(args.cooldown_sec == 2.0);
        CHECK(args.limit == 5);
    }

    SECTION("Defaults") {
        auto args = parse({"validate", "movie"});
        CHECK(args.command == Command::validate);
        CHECK(args.root == std::string(core::DEFAULT_ROOT));
        CHECK_FALSE(args.concurrency.has_value());
        CHECK_FALSE(args.delay_sec.has_value());
        CHECK_FALSE(args.max_retry_rounds.has_value());
    }

    SECTION("Help and version stop parsing") {
        CHECK(parse({"--help", "--bogus"}).help);
        CHECK(parse({"-v"}).version);
        CHECK(parse({"-v"}).error.empty());
    }
}

TEST_CASE("parse_args - errors", "[cli]") {
    CHECK_FALSE(parse({"download", "x"}).error.empty());
    CHECK_FALSE(parse({"fetch", "--frobnicate"}).error.empty());
    CHECK_FALSE(parse({"fetch", "a", "b", "-c"}).error.empty());
    CHECK_FALSE(parse({"fetch", "a", "b", "-c", "-1"}).error.empty());
    CHECK_FALSE(parse({"fetch", "a", "b", "-m", "lots"}).error.empty());
    CHECK_FALSE(parse({"batch", "t.json", "--cooldown", "-3"}).error.empty());
    CHECK_FALSE(parse({"batch", "t.json", "--cooldown", "inf"}).error.empty());
    CHECK_FALSE(parse({"batch", "t.json", "--cooldown", "nan"}).error.empty());
    CHECK_FALSE(parse({"batch", "t.json", "--cooldown", "1e12"}).error.empty());
    CHECK(parse({"batch", "t.json", "--cooldown", "86400"}).cooldown_sec == core::MAX_COOLDOWN_SEC);
    CHECK_FALSE(parse({"batch", "t.json", "--add", "only-id"}).error.empty());
}

TEST_CASE("build_config - precedence", "[cli][config]") {
    ::unsetenv(core::ENV_CONCURRENCY);
    ::unsetenv(core::ENV_DELAY);
    ::unsetenv(core::ENV_MAX_RETRY_ROUNDS);

    SECTION("Flags override the environment") {
        ::setenv(core::ENV_CONCURRENCY, "3", 1);
        ::setenv(core::ENV_MAX_RETRY_ROUNDS, "9", 1);
        auto cfg = build_config(parse({"fetch", "a", "u", "-c", "6"}));
        ::unsetenv(core::ENV_CONCURRENCY);
        ::unsetenv(core::ENV_MAX_RETRY_ROUNDS);

        REQUIRE(cfg.has_value());
        CHECK(cfg->concurrency == 6);
        CHECK(cfg->max_retry_rounds == 9);
        CHECK_FALSE(cfg->probe_content_lengths);
    }

    SECTION("Invalid flag values are rejected") {
        auto cfg = build_config(parse({"fetch", "a", "u", "-c", "0"}));
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error() == core::ConfigErrc::invalid_concurrency);

        auto neg = build_config(parse({"fetch", "a", "u", "-d", "-1"}));
        REQUIRE_FALSE(neg.has_value());
        CHECK(neg.error() == core::ConfigErrc::invalid_delay);

        for (const char* huge : {"1e10", "inf", "nan"}) {
            CAPTURE(huge);
            auto delay = build_config(parse({"fetch", "a", "u", "-d", huge}));
            REQUIRE_FALSE(delay.has_value());
            CHECK(delay.error() == core::ConfigErrc::invalid_delay);
        }
    }
}

TEST_CASE("validate command works offline", "[cli]") {
    test::TempDir tmp;
    auto dir = disk::AssetDir::open(tmp.path, "movie");
    REQUIRE(dir.has_value());

    media::SegmentManifest manifest;
    manifest.source_url = "https://h/i.m3u8";
    manifest.segments.push_back({0, "https://h/0.ts", std::nullopt});
    manifest.segments.push_back({1, "https://h/1.ts", std::nullopt});
    REQUIRE_FALSE(dir->save_manifest(manifest));
    test::write_text(dir->segment_path(0), "data");

    auto args = parse({"validate", "movie", "-r", tmp.path.string()});
    auto incomplete = validate(args);
    REQUIRE(incomplete.has_value());
    CHECK(*incomplete == 1);

    test::write_text(dir->segment_path(1), "more");
    auto complete = validate(args);
    REQUIRE(complete.has_value());
    CHECK(*complete == 0);

    auto usage = validate(parse({"validate"}));
    REQUIRE(usage.has_value());
    CHECK(*usage == 2);
}

TEST_CASE("ProgressBar::format_bytes", "[cli]") {
    CHECK(ProgressBar::format_bytes(512) == "512 B");
    CHECK(ProgressBar::format_bytes(2048) == "2 KB");
    CHECK(ProgressBar::format_bytes(5ULL * 1024 * 1024) == "5.0 MB");
}

TEST_CASE("PassProgress - counts restart with each pass", "[cli][progress]") {
    using recovery::FetchOutcome;
    using recovery::FetchStatus;
    PassProgress progress("Test");

    FetchOutcome ok{0, FetchStatus::fetched, 10, {}};
    FetchOutcome bad{1, FetchStatus::failed, 0, make_error_code(core::FetchErrc::not_found)};

    progress.start(3);
    progress.on_outcome(bad);
    progress.on_outcome(ok);
    progress.on_outcome(bad);
    CHECK(progress.done() == 3);
    CHECK(progress.failed() == 2);

    SECTION("A new pass clears failures from the last one") {
        progress.start(2);
        CHECK(progress.done() == 0);
        CHECK(progress.failed() == 0);
        progress.on_outcome(ok);
        CHECK(progress.failed() == 0);
    }

    SECTION("Concurrent outcomes are all counted") {
        constexpr std::size_t per_thread = 50;
        progress.start(4 * per_thread);
        {
            std::vector<std::jthread> workers;
            for (int t = 0; t < 4; ++t) {
                workers.emplace_back([&, t] {
                    for (std::size_t i = 0; i < per_thread; ++i) {
                        progress.on_outcome(t % 2 == 0 ? bad : ok);
                    }
                });
            }
        }
        CHECK(progress.done() == 4 * per_thread);
        CHECK(progress.failed() == 2 * per_thread);
    }

    SECTION("Outcomes past the total are ignored") {
        progress.on_outcome(bad);
        CHECK(progress.done() == 3);
        CHECK(progress.failed() == 2);
    }
}

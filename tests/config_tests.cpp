// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <stitch/core/config.hpp>
#include <stitch/core/error.hpp>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <limits>

using namespace stitch::core;

namespace {

// Sets an environment variable for the lifetime of the guard
struct EnvGuard {
    const char* name;

    EnvGuard(const char* n, const char* value) : name(n) { ::setenv(name, value, 1); }
    ~EnvGuard() { ::unsetenv(name); }
};

void clear_env() {
    ::unsetenv(ENV_CONCURRENCY);
    ::unsetenv(ENV_DELAY);
    ::unsetenv(ENV_MAX_RETRY_ROUNDS);
}

} // namespace

TEST_CASE("DownloadConfig - validate", "[config]") {
    DownloadConfig cfg;
    CHECK_FALSE(cfg.validate());
    CHECK(cfg.concurrency == DEFAULT_CONCURRENCY);
    CHECK(cfg.max_retry_rounds == DEFAULT_MAX_RETRY_ROUNDS);

    SECTION("Zero concurrency") {
        cfg.concurrency = 0;
        CHECK(cfg.validate() == ConfigErrc::invalid_concurrency);
    }

    SECTION("Negative or non-finite delay") {
        cfg.delay_sec = -0.5;
        CHECK(cfg.validate() == ConfigErrc::invalid_delay);
        cfg.delay_sec = std::numeric_limits<double>::quiet_NaN();
        CHECK(cfg.validate() == ConfigErrc::invalid_delay);
        cfg.delay_sec = std::numeric_limits<double>::infinity();
        CHECK(cfg.validate() == ConfigErrc::invalid_delay);
    }

    SECTION("Oversized delay") {
        cfg.delay_sec = MAX_DELAY_SEC;
        CHECK_FALSE(cfg.validate());
        cfg.delay_sec = 1e10;
        CHECK(cfg.validate() == ConfigErrc::invalid_delay);
        cfg.delay_sec = 1e300;
        CHECK(cfg.validate() == ConfigErrc::invalid_delay);
    }

    SECTION("Zero retry rounds is allowed") {
        cfg.max_retry_rounds = 0;
        CHECK_FALSE(cfg.validate());
    }

    SECTION("Delay conversion") {
        cfg.delay_sec = 0.25;
        CHECK(cfg.delay() == std::chrono::milliseconds(250));
        cfg.delay_sec = 0.0;
        CHECK(cfg.delay().count() == 0);
        cfg.delay_sec = std::numeric_limits<double>::quiet_NaN();
        CHECK(cfg.delay().count() == 0);
    }

    SECTION("Delay conversion is clamped for unvalidated values") {
        auto ceiling = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::duration<double>(MAX_DELAY_SEC));
        cfg.delay_sec = 1e10;
        CHECK(cfg.delay() == ceiling);
        cfg.delay_sec = std::numeric_limits<double>::infinity();
        CHECK(cfg.delay() == ceiling);
    }
}

TEST_CASE("DownloadConfig - environment", "[config]") {
    clear_env();

    SECTION("No variables keeps the base") {
        DownloadConfig base;
        base.concurrency = 7;
        auto cfg = DownloadConfig::from_env(base);
        REQUIRE(cfg.has_value());
        CHECK(cfg->concurrency == 7);
    }

    SECTION("Overrides") {
        EnvGuard c(ENV_CONCURRENCY, "5");
        EnvGuard d(ENV_DELAY, "1.5");
        EnvGuard m(ENV_MAX_RETRY_ROUNDS, "0");
        auto cfg = DownloadConfig::from_env();
        REQUIRE(cfg.has_value());
        CHECK(cfg->concurrency == 5);
        CHECK(cfg->delay_sec == Catch::Approx(1.5));
        CHECK(cfg->max_retry_rounds == 0);
    }

    SECTION("Malformed values") {
        {
            EnvGuard c(ENV_CONCURRENCY, "four");
            CHECK(DownloadConfig::from_env().error() == ConfigErrc::invalid_concurrency);
        }
        {
            EnvGuard c(ENV_CONCURRENCY, "0");
            CHECK(DownloadConfig::from_env().error() == ConfigErrc::invalid_concurrency);
        }
        {
            EnvGuard d(ENV_DELAY, "-1");
            CHECK(DownloadConfig::from_env().error() == ConfigErrc::invalid_delay);
        }
        {
            EnvGuard d(ENV_DELAY, "1e10");
            CHECK(DownloadConfig::from_env().error() == ConfigErrc::invalid_delay);
        }
        {
            EnvGuard d(ENV_DELAY, "inf");
            CHECK(DownloadConfig::from_env().error() == ConfigErrc::invalid_delay);
        }
        {
            EnvGuard d(ENV_DELAY, "nan");
            CHECK(DownloadConfig::from_env().error() == ConfigErrc::invalid_delay);
        }
        {
            EnvGuard m(ENV_MAX_RETRY_ROUNDS, "-2");
            CHECK(DownloadConfig::from_env().error() == ConfigErrc::invalid_retry_rounds);
        }
    }
}

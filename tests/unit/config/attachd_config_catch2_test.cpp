#include <catch2/catch_test_macros.hpp>

#include <attachd/config/attachd_config.h>
#include <attachd/config/config_helpers.h>

#include "../../common/test_helpers_catch2.h"

using attachd::config::get_config_path;
using attachd::config::loadConfig;
using attachd::config::parse_config_value;
using attachd::config::parse_u64;
using attachd::test::ScopedEnvVar;
using attachd::test::TempDir;
using attachd::test::write_file;

namespace {

const char* kConfig = R"(# attachd config
[cache]
dir = "/srv/attachments"
max_total_bytes = 1_000_000   # one MB

[extract]
max_entries = 500
timeout_ms = 5000

[zendesk]
subdomain = "acme"
email = 'support@acme.test'
api_token = "file-token"
)";

// Clears every variable loadConfig consults so the host environment cannot leak in.
struct CleanEnv {
    ScopedEnvVar cacheDir{"ZENDESK_ATTACHMENT_CACHE_DIR", std::nullopt};
    ScopedEnvVar maxBytes{"ATTACHD_CACHE_MAX_BYTES", std::nullopt};
    ScopedEnvVar maxAge{"ATTACHD_CACHE_MAX_AGE_HOURS", std::nullopt};
    ScopedEnvVar domain{"ZENDESK_DOMAIN", std::nullopt};
    ScopedEnvVar subdomain{"ZENDESK_SUBDOMAIN", std::nullopt};
    ScopedEnvVar email{"ZENDESK_EMAIL", std::nullopt};
    ScopedEnvVar token{"ZENDESK_API_TOKEN", std::nullopt};
    ScopedEnvVar password{"ZENDESK_PASSWORD", std::nullopt};
    ScopedEnvVar configEnv{"ATTACHD_CONFIG", std::nullopt};
};

} // namespace

TEST_CASE("parse_u64 accepts TOML integers", "[config][catch2]") {
    CHECK(parse_u64("42") == 42u);
    CHECK(parse_u64(" 1_000 ") == 1000u);
    CHECK(parse_u64("\"7\"") == 7u);
    CHECK_FALSE(parse_u64("").has_value());
    CHECK_FALSE(parse_u64("-1").has_value());
    CHECK_FALSE(parse_u64("12abc").has_value());
}

TEST_CASE("parse_config_value reads sectioned and dotted keys", "[config][catch2]") {
    TempDir dir;
    auto file = write_file(dir.path() / "config.toml", std::string(kConfig) +
                                                           "reader.max_inline_binary_bytes = 99\n");

    CHECK(parse_config_value(file, "cache", "dir") == "/srv/attachments");
    CHECK(parse_config_value(file, "cache", "max_total_bytes") == "1_000_000");
    CHECK(parse_config_value(file, "zendesk", "email") == "support@acme.test");
    CHECK(parse_config_value(file, "reader", "max_inline_binary_bytes") == "99");
    CHECK(parse_config_value(file, "zendesk", "missing").empty());
    // Same key name in another section does not match
    CHECK(parse_config_value(file, "cache", "timeout_ms").empty());
}

TEST_CASE("get_config_path resolution order", "[config][catch2]") {
    CleanEnv env;
    ScopedEnvVar xdg("XDG_CONFIG_HOME", std::string("/xdg"));

    CHECK(get_config_path("/explicit.toml") == std::filesystem::path("/explicit.toml"));
    CHECK(get_config_path() == std::filesystem::path("/xdg/attachd/config.toml"));

    ScopedEnvVar cfg("ATTACHD_CONFIG", std::string("/from/env.toml"));
    CHECK(get_config_path() == std::filesystem::path("/from/env.toml"));
    CHECK(get_config_path("/explicit.toml") == std::filesystem::path("/explicit.toml"));
}

TEST_CASE("loadConfig uses defaults without file or environment", "[config][catch2]") {
    CleanEnv env;
    TempDir dir;
    auto cfg = loadConfig((dir.path() / "absent.toml").string());

    CHECK(cfg.cacheDir.empty());
    CHECK(cfg.evictionMaxTotalBytes == 0);
    CHECK(cfg.evictionMaxAgeHours == 0);
    CHECK(cfg.extractMaxTotalBytes == 2ULL * 1024 * 1024 * 1024);
    CHECK(cfg.extractMaxEntries == 100'000);
    CHECK(cfg.extractTimeout == std::chrono::milliseconds(120'000));
    CHECK(cfg.readerMaxInlineBinaryBytes == 10ULL * 1024 * 1024);
    CHECK(cfg.zendesk.timeout == std::chrono::milliseconds(30'000));
    CHECK_FALSE(cfg.zendesk.hasCredentials());
}

TEST_CASE("loadConfig prefers environment over file over default", "[config][catch2]") {
    CleanEnv env;
    TempDir dir;
    auto file = write_file(dir.path() / "config.toml", kConfig);

    SECTION("file values apply when the environment is empty") {
        auto cfg = loadConfig(file.string());
        CHECK(cfg.cacheDir == std::filesystem::path("/srv/attachments"));
        CHECK(cfg.evictionMaxTotalBytes == 1'000'000);
        CHECK(cfg.extractMaxEntries == 500);
        CHECK(cfg.extractTimeout == std::chrono::milliseconds(5000));
        CHECK(cfg.zendesk.subdomain == "acme");
        CHECK(cfg.zendesk.email == "support@acme.test");
        CHECK(cfg.zendesk.apiToken == "file-token");
        CHECK(cfg.zendesk.hasCredentials());
        // untouched keys keep defaults
        CHECK(cfg.extractMaxTotalBytes == 2ULL * 1024 * 1024 * 1024);
    }

    SECTION("environment overrides the file") {
        ScopedEnvVar dirEnv("ZENDESK_ATTACHMENT_CACHE_DIR", std::string("/env/cache"));
        ScopedEnvVar tokenEnv("ZENDESK_API_TOKEN", std::string("env-token"));
        ScopedEnvVar maxBytes("ATTACHD_CACHE_MAX_BYTES", std::string("2048"));

        auto cfg = loadConfig(file.string());
        CHECK(cfg.cacheDir == std::filesystem::path("/env/cache"));
        CHECK(cfg.zendesk.apiToken == "env-token");
        CHECK(cfg.evictionMaxTotalBytes == 2048);
        CHECK(cfg.zendesk.subdomain == "acme");
    }

    SECTION("empty environment values are ignored") {
        ScopedEnvVar dirEnv("ZENDESK_ATTACHMENT_CACHE_DIR", std::string(""));
        auto cfg = loadConfig(file.string());
        CHECK(cfg.cacheDir == std::filesystem::path("/srv/attachments"));
    }

    SECTION("malformed numbers fall back to the default") {
        ScopedEnvVar maxAge("ATTACHD_CACHE_MAX_AGE_HOURS", std::string("soon"));
        auto cfg = loadConfig(file.string());
        CHECK(cfg.evictionMaxAgeHours == 0);
    }
}

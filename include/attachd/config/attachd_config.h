#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace attachd::config {

struct ZendeskSettings {
    std::string domain;    // full host, e.g. "acme.zendesk.com" (takes precedence)
    std::string subdomain; // "acme" -> acme.zendesk.com
    std::string email;
    std::string apiToken;
    std::string password;
    std::chrono::milliseconds timeout{30'000};

    bool hasCredentials() const {
        return (!domain.empty() || !subdomain.empty()) && !email.empty() &&
               (!apiToken.empty() || !password.empty());
    }
};

/**
 * @brief Effective server configuration.
 *
 * Each value resolves from its environment variable, then the config file, then the
 * default below.
 */
struct AttachdConfig {
    std::filesystem::path configFile;

    // [cache]
    std::filesystem::path cacheDir; // empty -> temp directory default
    std::uint64_t evictionMaxTotalBytes = 0;
    std::uint64_t evictionMaxAgeHours = 0;

    // [extract]
    std::uint64_t extractMaxTotalBytes = 2ULL * 1024 * 1024 * 1024;
    std::uint64_t extractMaxEntries = 100'000;
    std::chrono::milliseconds extractTimeout{120'000};

    // [reader]
    std::uint64_t readerMaxInlineBinaryBytes = 10ULL * 1024 * 1024;

    // [zendesk]
    ZendeskSettings zendesk;
};

// Load configuration; an empty override resolves the config file via get_config_path().
AttachdConfig loadConfig(const std::string& configOverride = "");

} // namespace attachd::config

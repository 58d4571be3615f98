#include <attachd/config/attachd_config.h>
#include <attachd/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <optional>
#include <system_error>

namespace attachd::config {

namespace {

class Resolver {
public:
    explicit Resolver(std::filesystem::path file) : file_(std::move(file)) {
        std::error_code ec;
        haveFile_ = !file_.empty() && std::filesystem::exists(file_, ec);
    }

    std::string string(const char* env, const std::string& section, const std::string& key) const {
        if (env) {
            if (auto v = env_value(env)) {
                return *v;
            }
        }
        if (haveFile_) {
            return parse_config_value(file_, section, key);
        }
        return {};
    }

    std::uint64_t u64(const char* env, const std::string& section, const std::string& key,
                      std::uint64_t def) const {
        auto raw = string(env, section, key);
        if (raw.empty()) {
            return def;
        }
        if (auto v = parse_u64(raw)) {
            return *v;
        }
        spdlog::warn("Ignoring malformed value for {}.{}: '{}'", section, key, raw);
        return def;
    }

    bool haveFile() const { return haveFile_; }

private:
    std::filesystem::path file_;
    bool haveFile_ = false;
};

} // namespace

AttachdConfig loadConfig(const std::string& configOverride) {
    AttachdConfig cfg;
    cfg.configFile = get_config_path(configOverride);
    Resolver r(cfg.configFile);
    if (r.haveFile()) {
        spdlog::debug("Loading configuration from {}", cfg.configFile.string());
    } else if (!configOverride.empty()) {
        spdlog::warn("Config file not found: {}", cfg.configFile.string());
    }

    if (auto dir = r.string("ZENDESK_ATTACHMENT_CACHE_DIR", "cache", "dir"); !dir.empty()) {
        cfg.cacheDir = expand_tilde(dir);
    }
    cfg.evictionMaxTotalBytes = r.u64("ATTACHD_CACHE_MAX_BYTES", "cache", "max_total_bytes", 0);
    cfg.evictionMaxAgeHours = r.u64("ATTACHD_CACHE_MAX_AGE_HOURS", "cache", "max_age_hours", 0);

    cfg.extractMaxTotalBytes =
        r.u64(nullptr, "extract", "max_total_bytes", cfg.extractMaxTotalBytes);
    cfg.extractMaxEntries = r.u64(nullptr, "extract", "max_entries", cfg.extractMaxEntries);
    cfg.extractTimeout = std::chrono::milliseconds(
        r.u64(nullptr, "extract", "timeout_ms",
              static_cast<std::uint64_t>(cfg.extractTimeout.count())));

    cfg.readerMaxInlineBinaryBytes =
        r.u64(nullptr, "reader", "max_inline_binary_bytes", cfg.readerMaxInlineBinaryBytes);

    cfg.zendesk.domain = r.string("ZENDESK_DOMAIN", "zendesk", "domain");
    cfg.zendesk.subdomain = r.string("ZENDESK_SUBDOMAIN", "zendesk", "subdomain");
    cfg.zendesk.email = r.string("ZENDESK_EMAIL", "zendesk", "email");
    cfg.zendesk.apiToken = r.string("ZENDESK_API_TOKEN", "zendesk", "api_token");
    cfg.zendesk.password = r.string("ZENDESK_PASSWORD", "zendesk", "password");
    cfg.zendesk.timeout = std::chrono::milliseconds(
        r.u64(nullptr, "zendesk", "timeout_ms",
              static_cast<std::uint64_t>(cfg.zendesk.timeout.count())));

    return cfg;
}

} // namespace attachd::config

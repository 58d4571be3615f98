#include <attachd/upstream/zendesk_fetcher.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <mutex>

namespace attachd::upstream {

namespace {

constexpr size_t kMaxErrorBodyChars = 512;

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlEasyDeleter {
    void operator()(CURL* c) const {
        if (c)
            curl_easy_cleanup(c);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const {
        if (l)
            curl_slist_free_all(l);
    }
};

Error upstreamError(std::string message) {
    return Error{ErrorCode::UpstreamFetchError, std::move(message)};
}

std::string truncateBody(const std::string& body) {
    if (body.size() <= kMaxErrorBodyChars)
        return body;
    return body.substr(0, kMaxErrorBodyChars) + "...";
}

} // namespace

ZendeskAttachmentFetcher::ZendeskAttachmentFetcher(config::ZendeskSettings settings)
    : settings_(std::move(settings)) {}

std::string ZendeskAttachmentFetcher::baseUrl(const config::ZendeskSettings& settings) {
    std::string host;
    if (!settings.domain.empty()) {
        host = settings.domain;
    } else if (!settings.subdomain.empty()) {
        host = settings.subdomain + ".zendesk.com";
    } else {
        return {};
    }
    while (!host.empty() && host.back() == '/') {
        host.pop_back();
    }
    if (host.starts_with("http://") || host.starts_with("https://")) {
        return host;
    }
    return "https://" + host;
}

std::string ZendeskAttachmentFetcher::basicCredentials(const config::ZendeskSettings& settings) {
    if (!settings.apiToken.empty()) {
        return settings.email + "/token:" + settings.apiToken;
    }
    return settings.email + ":" + settings.password;
}

Result<FetchedAttachment>
ZendeskAttachmentFetcher::parseAttachmentJson(const nlohmann::json& body,
                                              const cache::AttachmentId& id) {
    if (!body.is_object() || !body.contains("attachment") || !body["attachment"].is_object()) {
        return upstreamError("Unexpected attachment response for " + id);
    }
    const auto& a = body["attachment"];
    auto str = [&a](const char* key) {
        auto it = a.find(key);
        return (it != a.end() && it->is_string()) ? it->get<std::string>() : std::string{};
    };
    FetchedAttachment out;
    out.sourceLocator = str("content_url");
    if (out.sourceLocator.empty()) {
        return upstreamError("Attachment " + id + " has no content_url");
    }
    out.filename = str("file_name");
    out.contentType = str("content_type");
    return out;
}

Result<ZendeskAttachmentFetcher::HttpResponse>
ZendeskAttachmentFetcher::get(const std::string& url) const {
    ensureCurlGlobalInit();
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    HttpResponse resp;
    char errbuf[CURL_ERROR_SIZE] = {0};
    const std::string credentials = basicCredentials(settings_);
    std::unique_ptr<curl_slist, CurlSlistDeleter> headers(
        curl_slist_append(nullptr, "Accept: application/json, */*"));

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
    curl_easy_setopt(curl.get(), CURLOPT_USERPWD, credentials.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(settings_.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long long>(settings_.timeout.count(), 10'000)));
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        return upstreamError("GET " + url + " failed: " + detail);
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    char* ct = nullptr;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
        resp.contentType = ct;
    }
    return resp;
}

Result<FetchedAttachment> ZendeskAttachmentFetcher::fetch(const cache::AttachmentId& id) {
    const std::string base = baseUrl(settings_);
    if (base.empty() || !settings_.hasCredentials()) {
        return upstreamError("Zendesk credentials are not configured (set ZENDESK_SUBDOMAIN or "
                             "ZENDESK_DOMAIN, ZENDESK_EMAIL and ZENDESK_API_TOKEN)");
    }

    const std::string lookupUrl = base + "/api/v2/attachments/" + id + ".json";
    auto lookup = get(lookupUrl);
    if (!lookup) {
        return lookup.error();
    }
    if (lookup.value().status >= 400) {
        return upstreamError("Zendesk API returned HTTP " + std::to_string(lookup.value().status) +
                             " for attachment " + id + ": " + truncateBody(lookup.value().body));
    }
    auto body = nlohmann::json::parse(lookup.value().body, nullptr, false);
    if (body.is_discarded()) {
        return upstreamError("Malformed JSON from Zendesk for attachment " + id);
    }
    auto meta = parseAttachmentJson(body, id);
    if (!meta) {
        return meta.error();
    }
    FetchedAttachment out = std::move(meta).value();

    spdlog::debug("Downloading attachment {} from {}", id, out.sourceLocator);
    auto content = get(out.sourceLocator);
    if (!content) {
        return content.error();
    }
    if (content.value().status >= 400) {
        return upstreamError("Attachment download returned HTTP " +
                             std::to_string(content.value().status) + " for " + id);
    }
    if (out.contentType.empty()) {
        out.contentType = content.value().contentType;
    }
    out.bytes = std::move(content).value().body;
    spdlog::info("Fetched attachment {} ({} bytes)", id, out.bytes.size());
    return out;
}

} // namespace attachd::upstream

#pragma once

#include <attachd/config/attachd_config.h>
#include <attachd/upstream/attachment_fetcher.h>

#include <nlohmann/json.hpp>

#include <string>

namespace attachd::upstream {

/**
 * @brief Fetches ticket attachments through the Zendesk REST API using libcurl.
 *
 * Looks up /api/v2/attachments/<id>.json for the content URL and name, then downloads
 * the content following redirects. No retries; every request is bounded by the
 * configured timeout.
 */
class ZendeskAttachmentFetcher : public IAttachmentFetcher {
public:
    explicit ZendeskAttachmentFetcher(config::ZendeskSettings settings);

    Result<FetchedAttachment> fetch(const cache::AttachmentId& id) override;

    // "https://acme.zendesk.com"; empty when neither domain nor subdomain is set.
    static std::string baseUrl(const config::ZendeskSettings& settings);

    // "user@x/token:abc" when an API token is set, otherwise "user@x:password".
    static std::string basicCredentials(const config::ZendeskSettings& settings);

    // Extract name/type/url from an attachment lookup response.
    static Result<FetchedAttachment> parseAttachmentJson(const nlohmann::json& body,
                                                         const cache::AttachmentId& id);

private:
    struct HttpResponse {
        long status = 0;
        std::string body;
        std::string contentType;
    };

    Result<HttpResponse> get(const std::string& url) const;

    config::ZendeskSettings settings_;
};

} // namespace attachd::upstream

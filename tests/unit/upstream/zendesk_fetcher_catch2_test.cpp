#include <catch2/catch_test_macros.hpp>

#include <attachd/upstream/zendesk_fetcher.h>

using attachd::ErrorCode;
using attachd::config::ZendeskSettings;
using attachd::upstream::ZendeskAttachmentFetcher;

TEST_CASE("Zendesk base URL resolution", "[upstream][zendesk][catch2]") {
    ZendeskSettings s;
    CHECK(ZendeskAttachmentFetcher::baseUrl(s).empty());

    s.subdomain = "acme";
    CHECK(ZendeskAttachmentFetcher::baseUrl(s) == "https://acme.zendesk.com");

    s.domain = "support.acme.test/";
    CHECK(ZendeskAttachmentFetcher::baseUrl(s) == "https://support.acme.test");

    s.domain = "http://localhost:8080";
    CHECK(ZendeskAttachmentFetcher::baseUrl(s) == "http://localhost:8080");
}

TEST_CASE("Zendesk basic credentials", "[upstream][zendesk][catch2]") {
    ZendeskSettings s;
    s.email = "agent@acme.test";
    s.password = "hunter2";
    CHECK(ZendeskAttachmentFetcher::basicCredentials(s) == "agent@acme.test:hunter2");

    s.apiToken = "tok";
    CHECK(ZendeskAttachmentFetcher::basicCredentials(s) == "agent@acme.test/token:tok");
}

TEST_CASE("Zendesk attachment lookup parsing", "[upstream][zendesk][catch2]") {
    const nlohmann::json body = {
        {"attachment",
         {{"id", 498483},
          {"file_name", "crash.log"},
          {"content_url", "https://acme.zendesk.com/attachments/token/abc/?name=crash.log"},
          {"content_type", "text/plain"},
          {"size", 2532}}}};

    auto parsed = ZendeskAttachmentFetcher::parseAttachmentJson(body, "498483");
    REQUIRE(parsed);
    CHECK(parsed.value().filename == "crash.log");
    CHECK(parsed.value().contentType == "text/plain");
    CHECK(parsed.value().sourceLocator ==
          "https://acme.zendesk.com/attachments/token/abc/?name=crash.log");
    CHECK(parsed.value().bytes.empty());

    auto noUrl = ZendeskAttachmentFetcher::parseAttachmentJson(
        nlohmann::json{{"attachment", {{"file_name", "x"}}}}, "1");
    REQUIRE_FALSE(noUrl);
    CHECK(noUrl.error().code == ErrorCode::UpstreamFetchError);

    auto wrongShape =
        ZendeskAttachmentFetcher::parseAttachmentJson(nlohmann::json{{"error", "nope"}}, "1");
    REQUIRE_FALSE(wrongShape);
    CHECK(wrongShape.error().code == ErrorCode::UpstreamFetchError);
}

TEST_CASE("Zendesk fetch requires credentials", "[upstream][zendesk][catch2]") {
    ZendeskSettings s;
    s.subdomain = "acme";
    ZendeskAttachmentFetcher fetcher(s);

    auto r = fetcher.fetch("123");
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::UpstreamFetchError);
    CHECK(r.error().message.find("ZENDESK_API_TOKEN") != std::string::npos);
}

#include <catch2/catch_test_macros.hpp>

#include <attachd/cache/archive_extractor.h>
#include <attachd/cache/content_search.h>
#include <attachd/cache/entry_store.h>

#include "../../common/archive_fixtures.h"
#include "../../common/test_helpers_catch2.h"

#include <set>
#include <string>
#include <vector>

using attachd::ErrorCode;
using attachd::cache::ArchiveExtractor;
using attachd::cache::CacheRoot;
using attachd::cache::ContentSearchEngine;
using attachd::cache::EntryStore;
using attachd::cache::SearchRequest;
using attachd::test::ArchiveMember;
using attachd::test::TempDir;
using attachd::test::TestArchiveFormat;

namespace {

std::string repeatedErrors(int count) {
    std::string out;
    for (int i = 1; i <= count; ++i) {
        out += "ERROR failure " + std::to_string(i) + "\n";
        out += "INFO ok\n";
    }
    return out;
}

struct SearchFixture {
    TempDir dir;
    EntryStore store{CacheRoot(dir.path() / "cache")};
    ContentSearchEngine engine{store};

    SearchFixture() {
        const auto bytes = attachd::test::write_archive(
            dir.path() / "bundle.tar.gz",
            {ArchiveMember::file("app.log", "a\nb\nERROR boom\nc\nd\ne\n"),
             ArchiveMember::file("logs/worker.log", repeatedErrors(150)),
             ArchiveMember::file("logs/notes.txt", "ERROR in notes\n"),
             ArchiveMember::file("core.bin", std::string("ERROR\0\0\0", 8))},
            TestArchiveFormat::TarGz);
        REQUIRE(store.write("60", bytes, "bundle.tar.gz"));
        ArchiveExtractor extractor(store);
        REQUIRE(extractor.extract("60"));
    }
};

} // namespace

TEST_CASE("ContentSearchEngine::globSelects", "[cache][search][catch2]") {
    CHECK(ContentSearchEngine::globSelects("*", "a/b/c.log"));
    CHECK(ContentSearchEngine::globSelects("", "c.log"));
    CHECK(ContentSearchEngine::globSelects("*.log", "deep/dir/c.log"));
    CHECK_FALSE(ContentSearchEngine::globSelects("*.log", "deep/dir/c.txt"));
    CHECK(ContentSearchEngine::globSelects("logs/*.log", "logs/c.log"));
    CHECK_FALSE(ContentSearchEngine::globSelects("logs/*.log", "other/logs/c.log"));
    CHECK(ContentSearchEngine::globSelects("**/logs/*.log", "other/logs/c.log"));
}

TEST_CASE_METHOD(SearchFixture, "Search caps results and reports truncation",
                 "[cache][search][catch2]") {
    SearchRequest req;
    req.pattern = "ERROR failure";
    req.glob = "*.log";

    auto r = engine.search("60", req);
    REQUIRE(r);
    CHECK(r.value().totalMatches == 150);
    CHECK(r.value().matches.size() == 100);
    CHECK(r.value().truncated);
    CHECK(r.value().matches.front().path == "logs/worker.log");
    CHECK(r.value().matches.front().line == 1);
    CHECK(r.value().matches.back().content == "ERROR failure 100");

    req.maxResults = 500;
    auto all = engine.search("60", req);
    REQUIRE(all);
    CHECK(all.value().matches.size() == 150);
    CHECK_FALSE(all.value().truncated);
}

TEST_CASE_METHOD(SearchFixture, "Search returns surrounding context", "[cache][search][catch2]") {
    SearchRequest req;
    req.pattern = "boom";

    auto r = engine.search("60", req);
    REQUIRE(r);
    REQUIRE(r.value().matches.size() == 1);
    const auto& m = r.value().matches[0];
    CHECK(m.path == "app.log");
    CHECK(m.line == 3);
    CHECK(m.content == "ERROR boom");
    CHECK(m.contextBefore == std::vector<std::string>{"a", "b"});
    CHECK(m.contextAfter == std::vector<std::string>{"c", "d"});

    SECTION("no context") {
        req.contextLines = 0;
        auto bare = engine.search("60", req);
        REQUIRE(bare);
        CHECK(bare.value().matches[0].contextBefore.empty());
        CHECK(bare.value().matches[0].contextAfter.empty());
    }

    SECTION("json shape") {
        const auto j = m.toJson();
        CHECK(j["path"] == "app.log");
        CHECK(j["line"] == 3);
        CHECK(j["context_before"].size() == 2);
        CHECK(j["context_after"].size() == 2);
    }
}

TEST_CASE_METHOD(SearchFixture, "Search skips binary files and honours the glob",
                 "[cache][search][catch2]") {
    SearchRequest req;
    req.pattern = "^ERROR";
    req.maxResults = 1000;

    auto r = engine.search("60", req);
    REQUIRE(r);
    // app.log, worker.log and notes.txt; core.bin is binary
    CHECK(r.value().filesSearched == 3);
    std::set<std::string> files;
    for (const auto& m : r.value().matches)
        files.insert(m.path);
    CHECK(files == std::set<std::string>{"app.log", "logs/notes.txt", "logs/worker.log"});

    req.glob = "logs/*.txt";
    auto scoped = engine.search("60", req);
    REQUIRE(scoped);
    CHECK(scoped.value().filesSearched == 1);
    CHECK(scoped.value().totalMatches == 1);
}

TEST_CASE_METHOD(SearchFixture, "Search input errors", "[cache][search][catch2]") {
    SearchRequest req;
    req.pattern = "(unclosed";
    auto bad = engine.search("60", req);
    REQUIRE_FALSE(bad);
    CHECK(bad.error().code == ErrorCode::InvalidArgument);

    req.pattern = "x";
    auto missing = engine.search("61", req);
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::NotFound);
}

TEST_CASE("Search over a non-archive original", "[cache][search][catch2]") {
    TempDir dir;
    EntryStore store{CacheRoot(dir.path() / "cache")};
    REQUIRE(store.write("62", "first\nneedle here\nlast\n", "plain.log"));
    ContentSearchEngine engine(store);

    SearchRequest req;
    req.pattern = "needle";
    auto r = engine.search("62", req);
    REQUIRE(r);
    REQUIRE(r.value().matches.size() == 1);
    CHECK(r.value().matches[0].path == "plain.log");
    CHECK(r.value().matches[0].line == 2);
    CHECK(r.value().matches[0].contextAfter == std::vector<std::string>{"last"});
}

TEST_CASE("Search survives pathological patterns on very long lines", "[cache][search][catch2]") {
    TempDir dir;
    EntryStore store{CacheRoot(dir.path() / "cache")};
    const std::string content = std::string(200'000, 'a') + "\nab c\nac\n";
    REQUIRE(store.write("63", content, "minified.log"));
    ContentSearchEngine engine(store);

    SearchRequest req;
    req.pattern = "(a|b)*c";
    req.contextLines = 0;
    auto r = engine.search("63", req);
    REQUIRE(r);
    CHECK(r.value().filesSearched == 1);
    CHECK(r.value().totalMatches == 2);
    REQUIRE(r.value().matches.size() == 2);
    CHECK(r.value().matches[0].line == 2);
    CHECK(r.value().matches[1].line == 3);
}

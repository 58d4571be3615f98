#include <catch2/catch_test_macros.hpp>

#include <attachd/cache/archive_extractor.h>
#include <attachd/cache/entry_store.h>
#include <attachd/cache/file_lister.h>

#include "../../common/archive_fixtures.h"
#include "../../common/test_helpers_catch2.h"

#include <algorithm>
#include <string>
#include <vector>

using attachd::ErrorCode;
using attachd::cache::ArchiveExtractor;
using attachd::cache::CacheRoot;
using attachd::cache::EntryStore;
using attachd::cache::FileInfo;
using attachd::cache::FileLister;
using attachd::test::ArchiveMember;
using attachd::test::TempDir;
using attachd::test::TestArchiveFormat;

namespace {

std::vector<std::string> paths(const std::vector<FileInfo>& files) {
    std::vector<std::string> out;
    for (const auto& f : files)
        out.push_back(f.path);
    return out;
}

} // namespace

TEST_CASE("FileLister lists an extracted tree with glob filtering", "[cache][lister][catch2]") {
    TempDir dir;
    EntryStore store{CacheRoot(dir.path() / "cache")};
    const auto bytes = attachd::test::write_archive(
        dir.path() / "bundle.tar.gz",
        {ArchiveMember::file("logs/app.log", "1\n"), ArchiveMember::file("logs/old/app.1.log", "2\n"),
         ArchiveMember::file("config.yaml", "k: v\n")},
        TestArchiveFormat::TarGz);
    REQUIRE(store.write("10", bytes, "bundle.tar.gz"));
    ArchiveExtractor extractor(store);
    REQUIRE(extractor.extract("10"));

    FileLister lister(store);

    SECTION("default pattern returns everything") {
        auto all = lister.list("10");
        REQUIRE(all);
        CHECK(paths(all.value()) == std::vector<std::string>{"config.yaml", "logs", "logs/app.log",
                                                            "logs/old", "logs/old/app.1.log"});
        auto empty = lister.list("10", "");
        REQUIRE(empty);
        CHECK(empty.value().size() == all.value().size());
    }

    SECTION("recursive extension filter") {
        auto logs = lister.list("10", "**/*.log");
        REQUIRE(logs);
        CHECK(paths(logs.value()) ==
              std::vector<std::string>{"logs/app.log", "logs/old/app.1.log"});
        for (const auto& f : logs.value()) {
            CHECK_FALSE(f.isDirectory);
            CHECK(f.size.has_value());
        }
    }

    SECTION("top-level only") {
        auto top = lister.list("10", "*");
        REQUIRE(top);
        CHECK(paths(top.value()) == std::vector<std::string>{"config.yaml", "logs"});
    }

    SECTION("json shape") {
        auto top = lister.list("10", "*");
        REQUIRE(top);
        CHECK(top.value()[0].toJson() ==
              nlohmann::json{{"path", "config.yaml"}, {"type", "file"}, {"size", 5}});
        CHECK(top.value()[1].toJson() == nlohmann::json{{"path", "logs"}, {"type", "directory"}});
    }
}

TEST_CASE("FileLister falls back to the original file", "[cache][lister][catch2]") {
    TempDir dir;
    EntryStore store{CacheRoot(dir.path() / "cache")};
    REQUIRE(store.write("11", "hello", "notes.txt"));

    FileLister lister(store);
    auto files = lister.list("11");
    REQUIRE(files);
    REQUIRE(files.value().size() == 1);
    CHECK(files.value()[0].path == "notes.txt");
    CHECK(files.value()[0].size == 5u);

    auto none = lister.list("11", "*.zip");
    REQUIRE(none);
    CHECK(none.value().empty());
}

TEST_CASE("FileLister reports missing entries", "[cache][lister][catch2]") {
    TempDir dir;
    EntryStore store{CacheRoot(dir.path() / "cache")};
    FileLister lister(store);

    auto r = lister.list("12");
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::NotFound);

    auto bad = lister.list("../12");
    REQUIRE_FALSE(bad);
    CHECK(bad.error().code == ErrorCode::InvalidPath);
}

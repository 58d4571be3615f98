#include <catch2/catch_test_macros.hpp>

#include <attachd/cache/archive_extractor.h>
#include <attachd/cache/entry_store.h>
#include <attachd/cache/paginated_reader.h>
#include <attachd/common/base64.h>

#include "../../common/archive_fixtures.h"
#include "../../common/test_helpers_catch2.h"

#include <algorithm>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using attachd::ErrorCode;
using attachd::cache::ArchiveExtractor;
using attachd::cache::CacheRoot;
using attachd::cache::EntryStore;
using attachd::cache::PaginatedReader;
using attachd::cache::ReadOptions;
using attachd::test::ArchiveMember;
using attachd::test::TempDir;
using attachd::test::TestArchiveFormat;
using attachd::test::numbered_lines;

namespace {

size_t countLines(const std::string& s) {
    if (s.empty())
        return 0;
    return static_cast<size_t>(std::count(s.begin(), s.end(), '\n')) + 1;
}

} // namespace

TEST_CASE("PaginatedReader pages through a large text file", "[cache][reader][catch2]") {
    TempDir dir;
    EntryStore store{CacheRoot(dir.path() / "cache")};
    REQUIRE(store.write("20", numbered_lines(5000), "big.log", "text/plain"));
    PaginatedReader reader(store);

    auto first = reader.read("20", "big.log");
    REQUIRE(first);
    REQUIRE_FALSE(first.value().isBinary());
    const auto& p1 = first.value().text();
    CHECK(p1.linesReturned == 2000);
    CHECK(p1.totalLines == 5000);
    CHECK(p1.hasMore);
    CHECK(countLines(p1.content) == 2000);
    CHECK(p1.content.starts_with("1\tline 1\n2\tline 2\n"));
    CHECK(p1.content.ends_with("2000\tline 2000"));

    auto second = reader.read("20", "big.log", 2000, 2000);
    REQUIRE(second);
    CHECK(second.value().text().linesReturned == 2000);
    CHECK(second.value().text().hasMore);
    CHECK(second.value().text().content.starts_with("2001\tline 2001\n"));

    auto third = reader.read("20", "big.log", 4000, 2000);
    REQUIRE(third);
    const auto& p3 = third.value().text();
    CHECK(p3.linesReturned == 1000);
    CHECK_FALSE(p3.hasMore);
    CHECK(p3.content.ends_with("5000\tline 5000"));

    auto past = reader.read("20", "big.log", 6000, 10);
    REQUIRE(past);
    CHECK(past.value().text().linesReturned == 0);
    CHECK(past.value().text().content.empty());
    CHECK(past.value().text().totalLines == 5000);
    CHECK_FALSE(past.value().text().hasMore);
}

TEST_CASE("PaginatedReader text edge cases", "[cache][reader][catch2]") {
    TempDir dir;
    EntryStore store{CacheRoot(dir.path() / "cache")};
    PaginatedReader reader(store);

    SECTION("CRLF and missing final newline") {
        REQUIRE(store.write("21", "a\r\nb\r\nc", "win.txt"));
        auto r = reader.read("21", "win.txt");
        REQUIRE(r);
        CHECK(r.value().text().content == "1\ta\n2\tb\n3\tc");
        CHECK(r.value().text().totalLines == 3);
    }

    SECTION("empty file") {
        REQUIRE(store.write("22", "", "empty.txt"));
        auto r = reader.read("22", "empty.txt");
        REQUIRE(r);
        CHECK_FALSE(r.value().isBinary());
        CHECK(r.value().text().totalLines == 0);
        CHECK_FALSE(r.value().text().hasMore);
    }

    SECTION("zero limit") {
        REQUIRE(store.write("23", numbered_lines(3), "three.txt"));
        auto r = reader.read("23", "three.txt", 0, 0);
        REQUIRE(r);
        CHECK(r.value().text().linesReturned == 0);
        CHECK(r.value().text().hasMore);
    }

    SECTION("negative offset or limit") {
        REQUIRE(store.write("24", "x\n", "x.txt"));
        auto off = reader.read("24", "x.txt", -1, 10);
        REQUIRE_FALSE(off);
        CHECK(off.error().code == ErrorCode::InvalidArgument);
        auto lim = reader.read("24", "x.txt", 0, -5);
        REQUIRE_FALSE(lim);
        CHECK(lim.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("PaginatedReader confines paths to the entry", "[cache][reader][catch2]") {
    TempDir dir;
    EntryStore store{CacheRoot(dir.path() / "cache")};
    REQUIRE(store.write("30", "secret\n", "secret.txt"));
    REQUIRE(store.write("31", "mine\n", "mine.txt"));
    PaginatedReader reader(store);

    for (const char* bad : {"../../30/original/secret.txt", "/etc/passwd", "../metadata.json"}) {
        INFO(bad);
        auto r = reader.read("31", bad);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidPath);
    }

    auto missing = reader.read("31", "nope.txt");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::NotFound);

    auto noEntry = reader.read("99", "mine.txt");
    REQUIRE_FALSE(noEntry);
    CHECK(noEntry.error().code == ErrorCode::NotFound);
}

TEST_CASE("PaginatedReader reads inside an extracted archive", "[cache][reader][catch2]") {
    TempDir dir;
    EntryStore store{CacheRoot(dir.path() / "cache")};
    const std::string png("\x89PNG\r\n\x1A\n\0\0\0\rIHDR", 16);
    const auto bytes = attachd::test::write_archive(
        dir.path() / "b.zip",
        {ArchiveMember::file("logs/app.log", "first\nsecond\n"),
         ArchiveMember::file("img/shot.png", png)},
        TestArchiveFormat::Zip);
    REQUIRE(store.write("40", bytes, "b.zip", "application/zip"));
    ArchiveExtractor extractor(store);
    REQUIRE(extractor.extract("40"));
    PaginatedReader reader(store);

    auto text = reader.read("40", "logs/app.log", 1, 10);
    REQUIRE(text);
    CHECK(text.value().path == "logs/app.log");
    CHECK(text.value().text().content == "2\tsecond");

    auto dirRead = reader.read("40", "logs");
    REQUIRE_FALSE(dirRead);
    CHECK(dirRead.error().code == ErrorCode::InvalidPath);

    auto bin = reader.read("40", "img/shot.png");
    REQUIRE(bin);
    REQUIRE(bin.value().isBinary());
    CHECK(bin.value().binary().size == png.size());
    CHECK(bin.value().binary().contentBase64 == attachd::common::base64Encode(png));
    CHECK(bin.value().binary().contentType == "image/png");
}

TEST_CASE("PaginatedReader binary originals", "[cache][reader][catch2]") {
    TempDir dir;
    EntryStore store{CacheRoot(dir.path() / "cache")};
    const std::string blob("\0\1\2\3\4\5\6\7", 8);

    SECTION("stored content type wins") {
        REQUIRE(store.write("50", blob, "dump.bin", "application/x-core"));
        PaginatedReader reader(store);
        auto r = reader.read("50", "dump.bin");
        REQUIRE(r);
        REQUIRE(r.value().isBinary());
        CHECK(r.value().binary().contentType == "application/x-core");
        CHECK(r.value().binary().contentBase64 == "AAECAwQFBgc=");
    }

    SECTION("unknown type falls back to octet-stream") {
        REQUIRE(store.write("51", blob, "dump.unknownext"));
        PaginatedReader reader(store);
        auto r = reader.read("51", "dump.unknownext");
        REQUIRE(r);
        CHECK(r.value().binary().contentType == "application/octet-stream");
    }

    SECTION("inline size cap") {
        REQUIRE(store.write("52", blob, "dump.bin"));
        PaginatedReader reader(store, ReadOptions{4});
        auto r = reader.read("52", "dump.bin");
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::ResourceExhausted);
    }
}

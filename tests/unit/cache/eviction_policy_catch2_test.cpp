#include <catch2/catch_test_macros.hpp>

#include <attachd/cache/eviction_policy.h>

#include <chrono>

using namespace std::chrono_literals;
using attachd::TimePoint;
using attachd::cache::CompositeEvictionPolicy;
using attachd::cache::EntryUsage;
using attachd::cache::MaxAgePolicy;
using attachd::cache::MaxTotalBytesPolicy;
using attachd::cache::makeEvictionPolicy;

namespace {

const TimePoint kNow = TimePoint{} + 1000h;

std::vector<EntryUsage> sampleEntries() {
    return {
        {"new", kNow - 1h, 400},
        {"old", kNow - 100h, 300},
        {"mid", kNow - 10h, 300},
    };
}

} // namespace

TEST_CASE("MaxTotalBytesPolicy evicts oldest first", "[cache][eviction][catch2]") {
    const auto entries = sampleEntries();

    CHECK(MaxTotalBytesPolicy(1000).selectVictims(entries, kNow).empty());
    CHECK(MaxTotalBytesPolicy(900).selectVictims(entries, kNow) ==
          std::vector<std::string>{"old"});
    CHECK(MaxTotalBytesPolicy(500).selectVictims(entries, kNow) ==
          std::vector<std::string>{"old", "mid"});
    CHECK(MaxTotalBytesPolicy(0).selectVictims(entries, kNow).size() == 3);
}

TEST_CASE("MaxAgePolicy evicts entries older than the cutoff", "[cache][eviction][catch2]") {
    CHECK(MaxAgePolicy(24h).selectVictims(sampleEntries(), kNow) ==
          std::vector<std::string>{"old"});
    CHECK(MaxAgePolicy(200h).selectVictims(sampleEntries(), kNow).empty());
}

TEST_CASE("Composite policy unions children without duplicates", "[cache][eviction][catch2]") {
    CompositeEvictionPolicy composite;
    composite.add(std::make_shared<MaxAgePolicy>(24h));
    composite.add(std::make_shared<MaxTotalBytesPolicy>(500));
    CHECK(composite.name() == "max_age+max_total_bytes");
    CHECK(composite.selectVictims(sampleEntries(), kNow) ==
          std::vector<std::string>{"old", "mid"});
}

TEST_CASE("makeEvictionPolicy from configuration", "[cache][eviction][catch2]") {
    CHECK(makeEvictionPolicy(0, 0) == nullptr);

    auto bytesOnly = makeEvictionPolicy(1024, 0);
    REQUIRE(bytesOnly);
    CHECK(bytesOnly->name() == "max_total_bytes");

    auto both = makeEvictionPolicy(1024, 48);
    REQUIRE(both);
    CHECK(both->name() == "max_total_bytes+max_age");
}

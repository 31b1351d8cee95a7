#include <retrace/cache/FileCacheBackend.hpp>
#include <retrace/cache/MemoryCacheBackend.hpp>

#include "unit/RetraceTestHelper.hpp"

#include <doctest/doctest.h>

#include <string>
#include <thread>
#include <vector>

using namespace RT;
using namespace RT::Cache;
using namespace std::chrono_literals;

namespace {

auto bytes_of(std::string_view text) -> std::vector<std::byte> {
    std::vector<std::byte> out;
    out.reserve(text.size());
    for (char c : text) {
        out.push_back(static_cast<std::byte>(c));
    }
    return out;
}

void check_roundtrip(CacheBackend& backend) {
    auto miss = backend.get("s1/sig/abc");
    REQUIRE(miss.has_value());
    CHECK_FALSE(miss->has_value());

    REQUIRE(backend.put("s1/sig/abc", bytes_of("hello")).has_value());
    auto hit = backend.get("s1/sig/abc");
    REQUIRE(hit.has_value());
    REQUIRE(hit->has_value());
    CHECK(**hit == bytes_of("hello"));

    // Overwrites replace the stored bytes.
    REQUIRE(backend.put("s1/sig/abc", bytes_of("world!")).has_value());
    CHECK(backend.get("s1/sig/abc")->value() == bytes_of("world!"));

    REQUIRE(backend.evict("s1/sig/abc").has_value());
    CHECK_FALSE(backend.get("s1/sig/abc")->has_value());
    // Evicting a missing key is not an error.
    CHECK(backend.evict("s1/sig/abc").has_value());
}

void check_session_eviction(CacheBackend& backend) {
    REQUIRE(backend.put("alpha/sig/1", bytes_of("a1")).has_value());
    REQUIRE(backend.put("alpha/sig/2", bytes_of("a2")).has_value());
    REQUIRE(backend.put("alphabet/sig/1", bytes_of("b1")).has_value());
    REQUIRE(backend.put("beta/sig/1", bytes_of("c1")).has_value());

    auto removed = backend.evictSession("alpha");
    REQUIRE(removed.has_value());
    CHECK(*removed == 2);
    CHECK_FALSE(backend.get("alpha/sig/1")->has_value());
    CHECK_FALSE(backend.get("alpha/sig/2")->has_value());
    CHECK(backend.get("alphabet/sig/1")->has_value());
    CHECK(backend.get("beta/sig/1")->has_value());

    auto none = backend.evictSession("gamma");
    REQUIRE(none.has_value());
    CHECK(*none == 0);

    REQUIRE(backend.clear().has_value());
    CHECK_FALSE(backend.get("alphabet/sig/1")->has_value());
    CHECK_FALSE(backend.get("beta/sig/1")->has_value());
}

} // namespace

TEST_SUITE("cache.backend.memory") {
    TEST_CASE("Store and retrieve") {
        MemoryCacheBackend backend;
        CHECK(backend.name() == "memory");
        check_roundtrip(backend);
    }

    TEST_CASE("Session eviction") {
        MemoryCacheBackend backend;
        check_session_eviction(backend);
        CHECK(backend.stats().entries == 0);
        CHECK(backend.stats().bytes == 0);
    }

    TEST_CASE("Entry limit evicts least recently used") {
        MemoryCacheBackend backend{MemoryCacheBackend::Limits{2, 0, 0ms}};
        REQUIRE(backend.put("s/x/1", bytes_of("1")).has_value());
        REQUIRE(backend.put("s/x/2", bytes_of("2")).has_value());
        // Touch 1 so 2 becomes the eviction candidate.
        CHECK(backend.get("s/x/1")->has_value());
        REQUIRE(backend.put("s/x/3", bytes_of("3")).has_value());

        CHECK(backend.get("s/x/1")->has_value());
        CHECK_FALSE(backend.get("s/x/2")->has_value());
        CHECK(backend.get("s/x/3")->has_value());
        CHECK(backend.stats().evictedEntries == 1);
    }

    TEST_CASE("A single-entry cache keeps the newest value") {
        MemoryCacheBackend backend{MemoryCacheBackend::Limits{1, 0, 0ms}};
        REQUIRE(backend.put("s/x/1", bytes_of("1")).has_value());
        REQUIRE(backend.put("s/x/2", bytes_of("2")).has_value());
        CHECK_FALSE(backend.get("s/x/1")->has_value());
        CHECK(backend.get("s/x/2")->has_value());
        CHECK(backend.stats().entries == 1);
    }

    TEST_CASE("Byte limit") {
        MemoryCacheBackend backend{MemoryCacheBackend::Limits{0, 10, 0ms}};
        REQUIRE(backend.put("s/x/1", bytes_of("123456")).has_value());
        REQUIRE(backend.put("s/x/2", bytes_of("123456")).has_value());
        CHECK(backend.stats().entries == 1);
        CHECK(backend.stats().bytes == 6);
        CHECK(backend.get("s/x/2")->has_value());

        // An entry larger than the whole budget is still kept on its own.
        REQUIRE(backend.put("s/x/3", bytes_of("0123456789abcdef")).has_value());
        CHECK(backend.stats().entries == 1);
        CHECK(backend.get("s/x/3")->has_value());
    }

    TEST_CASE("Entries expire after the ttl") {
        MemoryCacheBackend backend{MemoryCacheBackend::Limits{0, 0, 5ms}};
        REQUIRE(backend.put("s/x/1", bytes_of("1")).has_value());
        std::this_thread::sleep_for(30ms);
        CHECK_FALSE(backend.get("s/x/1")->has_value());
        CHECK(backend.stats().expiredEntries == 1);
        CHECK(backend.stats().entries == 0);
    }
}

TEST_SUITE("cache.backend.file") {
    TEST_CASE("Store and retrieve") {
        Test::TempDir    temp("retrace_file_cache");
        FileCacheBackend backend{FileCacheBackend::Options{temp.path, 0ms, false}};
        CHECK(backend.name() == "filesystem");
        check_roundtrip(backend);
    }

    TEST_CASE("Entries live under their session directory") {
        Test::TempDir    temp("retrace_file_cache");
        FileCacheBackend backend{FileCacheBackend::Options{temp.path, 0ms, true}};
        REQUIRE(backend.put("sess/sig/digest", bytes_of("payload")).has_value());

        auto const path = backend.pathForKey("sess/sig/digest");
        CHECK(path.parent_path() == temp.path / "sess");
        CHECK(path.extension() == ".rtbf");
        CHECK(std::filesystem::exists(path));

        // No temp files are left behind by the atomic write.
        std::size_t files = 0;
        for (auto const& entry : std::filesystem::directory_iterator(temp.path / "sess")) {
            (void)entry;
            ++files;
        }
        CHECK(files == 1);
    }

    TEST_CASE("Session names that are not plain path components are hashed") {
        Test::TempDir    temp("retrace_file_cache");
        FileCacheBackend backend{FileCacheBackend::Options{temp.path, 0ms, false}};
        auto const       path = backend.pathForKey("../escape/sig/digest");
        CHECK(path.parent_path().parent_path() == temp.path);
        REQUIRE(backend.put("../escape/sig/digest", bytes_of("x")).has_value());
        CHECK(backend.get("../escape/sig/digest")->has_value());
    }

    TEST_CASE("Session eviction") {
        Test::TempDir    temp("retrace_file_cache");
        FileCacheBackend backend{FileCacheBackend::Options{temp.path, 0ms, false}};
        check_session_eviction(backend);
    }

    TEST_CASE("Entries expire after the ttl") {
        Test::TempDir    temp("retrace_file_cache");
        FileCacheBackend backend{FileCacheBackend::Options{temp.path, 10ms, false}};
        REQUIRE(backend.put("s/x/1", bytes_of("1")).has_value());
        std::this_thread::sleep_for(100ms);
        auto expired = backend.get("s/x/1");
        REQUIRE(expired.has_value());
        CHECK_FALSE(expired->has_value());
        CHECK_FALSE(std::filesystem::exists(backend.pathForKey("s/x/1")));
    }

    TEST_CASE("Entries persist across backend instances") {
        Test::TempDir temp("retrace_file_cache");
        {
            FileCacheBackend writer{FileCacheBackend::Options{temp.path, 0ms, false}};
            REQUIRE(writer.put("s/x/1", bytes_of("kept")).has_value());
        }
        FileCacheBackend reader{FileCacheBackend::Options{temp.path, 0ms, false}};
        auto             hit = reader.get("s/x/1");
        REQUIRE(hit.has_value());
        REQUIRE(hit->has_value());
        CHECK(**hit == bytes_of("kept"));
    }
}

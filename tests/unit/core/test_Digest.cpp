#include <retrace/core/Digest.hpp>

#include <doctest/doctest.h>

#include <string>

using namespace RT;

TEST_SUITE("core.digest") {
    TEST_CASE("Known SHA-256 vectors") {
        CHECK(sha256Hex(std::string_view{""}) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
        CHECK(sha256Hex(std::string_view{"abc"})
              == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    TEST_CASE("Stream snapshots match one-shot digests of every prefix") {
        Sha256Stream stream;
        std::string  fed;
        for (std::string_view chunk : {"[", "{\"a\":1}", ",{\"b\":2}"}) {
            REQUIRE(stream.update(chunk).has_value());
            fed.append(chunk);
            auto snapshot = stream.snapshotHex("]");
            REQUIRE(snapshot.has_value());
            CHECK(*snapshot == sha256Hex(std::string_view{fed + "]"}));
        }
        // Snapshots do not disturb the running context.
        auto plain = stream.snapshotHex();
        REQUIRE(plain.has_value());
        CHECK(*plain == sha256Hex(std::string_view{fed}));
    }
}

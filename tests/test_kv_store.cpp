#include <catch2/catch_test_macros.hpp>

#include "storage/kv_store.hpp"

#include <array>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <unistd.h>

using json = nlohmann::json;

TEST_CASE("KeyValueStore", "[storage]") {
    KeyValueStore kv;
    REQUIRE(kv.open(":memory:"));

    SECTION("PutAndGet") {
        REQUIRE(kv.put("answer", 42));
        REQUIRE(kv.put("nested", {{"a", json::array({1, 2})}, {"b", "x"}}));
        REQUIRE(kv.get("answer").value() == 42);
        REQUIRE((*kv.get("nested"))["a"][1] == 2);
        REQUIRE_FALSE(kv.get("missing").has_value());
    }

    SECTION("BinaryValuesSurvive") {
        std::vector<uint8_t> bytes = {0, 1, 254, 255};
        REQUIRE(kv.put("blob", json::binary(bytes)));
        auto v = kv.get("blob");
        REQUIRE(v->is_binary());
        REQUIRE(std::vector<uint8_t>(v->get_binary()) == bytes);
    }

    SECTION("PutReplaces") {
        REQUIRE(kv.put("k", "first"));
        REQUIRE(kv.put("k", "second"));
        REQUIRE(kv.get("k").value() == "second");
    }

    SECTION("RemoveIgnoresAbsentKeys") {
        REQUIRE(kv.put("a", 1));
        REQUIRE(kv.put("b", 2));
        std::array<std::string, 3> keys = {"a", "b", "c"};
        REQUIRE(kv.remove(keys));
        REQUIRE_FALSE(kv.get("a").has_value());
        REQUIRE_FALSE(kv.get("b").has_value());
        REQUIRE(kv.total_bytes() == 0);
    }

    SECTION("TotalBytesCountsKeysAndValues") {
        REQUIRE(kv.total_bytes() == 0);
        REQUIRE(kv.put("k", json::binary({1, 2, 3})));
        // key (1) + CBOR byte string header (1) + payload (3)
        REQUIRE(kv.total_bytes() == 5);
    }
}

TEST_CASE("KeyValueStore quota", "[storage]") {
    KeyValueStore kv(64);
    REQUIRE(kv.open(":memory:"));
    REQUIRE(kv.quota() == 64);

    SECTION("OversizedPutLeavesOldValue") {
        REQUIRE(kv.put("k", "small"));
        auto r = kv.put("k", std::string(100, 'x'));
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == StoreErrorKind::QuotaExceeded);
        REQUIRE(kv.get("k").value() == "small");
    }

    SECTION("ReplacingFreesTheOldValue") {
        REQUIRE(kv.put("k", std::string(50, 'x')));
        REQUIRE(kv.put("k", std::string(55, 'y')));
        REQUIRE(kv.get("k").value() == std::string(55, 'y'));
    }

    SECTION("PutAllIsAtomic") {
        REQUIRE(kv.put("a", 1));
        auto r = kv.put_all({{"a", 2}, {"b", std::string(100, 'z')}});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(kv.get("a").value() == 1);
        REQUIRE_FALSE(kv.get("b").has_value());

        REQUIRE(kv.put_all({{"a", 3}, {"b", "ok"}}));
        REQUIRE(kv.get("a").value() == 3);
        REQUIRE(kv.get("b").value() == "ok");
    }
}

TEST_CASE("KeyValueStore on disk", "[storage]") {
    auto dir = std::filesystem::temp_directory_path() /
               ("tapedeck_test_kv_" + std::to_string(getpid()));
    auto path = (dir / "state.db").string();

    {
        KeyValueStore kv;
        REQUIRE(kv.open(path));
        REQUIRE(kv.put("persisted", "yes"));
    }
    {
        KeyValueStore kv;
        REQUIRE(kv.open(path));
        REQUIRE(kv.get("persisted").value() == "yes");
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("KeyValueStore closed", "[storage]") {
    KeyValueStore kv;
    REQUIRE_FALSE(kv.is_open());
    auto r = kv.put("k", 1);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().kind == StoreErrorKind::Io);
    REQUIRE_FALSE(kv.get("k").has_value());
}

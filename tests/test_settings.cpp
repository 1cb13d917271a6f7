#include <doctest/doctest.h>
#include "rovy/device_identity.hpp"
#include "rovy/kv_store.hpp"
#include "rovy/settings.hpp"
#include "fakes.hpp"

#include <fstream>

using namespace rovy;
using rovy::test::TempDir;

static void write_file(const std::filesystem::path& p, const std::string& text) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p);
    out << text;
}

TEST_CASE("Missing config file yields defaults") {
    TempDir tmp;
    const Settings s = load_settings(tmp.path / "config.json");
    CHECK(s.default_base_url == "http://192.168.1.10:8000");
    CHECK(s.probe_timeout_ms == 1500);
    CHECK(s.poll_interval_ms == 10000u);
    CHECK(s.hotspot_host == "192.168.4.1");
    CHECK(s.device_name_prefix == "ROVY-");
}

TEST_CASE("Config overlays known keys and ignores mistyped ones") {
    TempDir tmp;
    write_file(tmp.path / "config.json",
               R"({"probe_timeout_ms": 500,
                   "default_base_url": "http://10.1.1.9:9000",
                   "poll_interval_ms": "fast",
                   "unknown_key": true})");
    const Settings s = load_settings(tmp.path / "config.json");
    CHECK(s.probe_timeout_ms == 500);
    CHECK(s.default_base_url == "http://10.1.1.9:9000");
    CHECK(s.poll_interval_ms == 10000u);
}

TEST_CASE("Malformed config falls back to defaults") {
    TempDir tmp;
    write_file(tmp.path / "config.json", "{ not json");
    CHECK(load_settings(tmp.path / "config.json").request_timeout_ms == 5000);

    write_file(tmp.path / "config.json", "[1, 2, 3]");
    CHECK(load_settings(tmp.path / "config.json").max_sweep_candidates == 260);
}

TEST_CASE("FileStore round-trips values and creates its directory lazily") {
    TempDir tmp;
    FileStore store(tmp.path / "state");

    CHECK_FALSE(store.get(keys::BASE_URL).has_value());
    CHECK_FALSE(std::filesystem::exists(tmp.path / "state"));

    REQUIRE(store.put(keys::BASE_URL, "http://10.0.0.5:8000"));
    CHECK(std::filesystem::exists(tmp.path / "state" / "robot_base_url.json"));
    CHECK(store.get(keys::BASE_URL) == std::optional<std::string>("http://10.0.0.5:8000"));

    REQUIRE(store.put(keys::BASE_URL, "http://10.0.0.6:8000"));
    CHECK(store.get(keys::BASE_URL) == std::optional<std::string>("http://10.0.0.6:8000"));

    CHECK(store.erase(keys::BASE_URL));
    CHECK_FALSE(store.get(keys::BASE_URL).has_value());
    CHECK(store.erase(keys::BASE_URL));      // already gone
}

TEST_CASE("MemoryStore read-only mode refuses writes") {
    MemoryStore store;
    REQUIRE(store.put("a", "1"));
    store.set_read_only(true);
    CHECK_FALSE(store.put("b", "2"));
    CHECK_FALSE(store.erase("a"));
    CHECK(store.get("a") == std::optional<std::string>("1"));
    CHECK(store.size() == 1);
}

TEST_CASE("Generated UUIDs are version 4") {
    const std::string id = generate_uuid_v4();
    REQUIRE(id.size() == 36);
    CHECK(id[8] == '-');
    CHECK(id[13] == '-');
    CHECK(id[14] == '4');
    CHECK(std::string("89ab").find(id[19]) != std::string::npos);
    CHECK(generate_uuid_v4() != id);
}

TEST_CASE("Device id is created once and reused") {
    MemoryStore store;
    std::string first;
    {
        DeviceIdentity ident(store);
        first = ident.id();
        CHECK_FALSE(first.empty());
        CHECK_FALSE(ident.is_temporary());
        CHECK(ident.id() == first);
    }
    DeviceIdentity again(store);
    CHECK(again.id() == first);
    CHECK(store.get(keys::DEVICE_ID) == std::optional<std::string>(first));
}

TEST_CASE("Device id falls back to a temporary id when storage fails") {
    MemoryStore store;
    store.set_read_only(true);
    DeviceIdentity ident(store);
    CHECK(ident.id().rfind("temp-", 0) == 0);
    CHECK(ident.is_temporary());
    CHECK(store.size() == 0);
}

#include <doctest/doctest.h>
#include "rovy/error.hpp"
#include "rovy/wire.hpp"
#include "fakes.hpp"

#include <nlohmann/json.hpp>

using namespace rovy;

TEST_CASE("Status words parse case-insensitively") {
    CHECK(parse_wifi_status("idle") == WifiStatus::Idle);
    CHECK(parse_wifi_status("Connecting") == WifiStatus::Connecting);
    CHECK(parse_wifi_status("connected") == WifiStatus::Connected);
    CHECK(parse_wifi_status("CONNECTED") == WifiStatus::Connected);
    CHECK(parse_wifi_status(" FAILED ") == WifiStatus::Failed);
}

TEST_CASE("Unknown status collapses to idle and is flagged") {
    const auto r = classify_wifi_status("rebooting");
    CHECK(r.status == WifiStatus::Idle);
    CHECK_FALSE(r.recognized);
    CHECK(classify_wifi_status("connected").recognized);
}

TEST_CASE("Notification values decode from base64 and fall back to plain text") {
    auto a = decode_status_value(base64_encode("connected"));
    CHECK(a.status == WifiStatus::Connected);
    CHECK(a.recognized);

    auto b = decode_status_value(base64_encode("failed"));
    CHECK(b.status == WifiStatus::Failed);

    // "idle" is itself valid base64 but decodes to garbage
    auto c = decode_status_value("idle");
    CHECK(c.status == WifiStatus::Idle);
    CHECK(c.recognized);

    auto d = decode_status_value("connected");
    CHECK(d.status == WifiStatus::Connected);

    auto e = decode_status_value(base64_encode("warming_up"));
    CHECK(e.status == WifiStatus::Idle);
    CHECK_FALSE(e.recognized);
}

TEST_CASE("Wi-Fi config payload is compact JSON with ssid then password") {
    CHECK(wifi_config_json("HomeNet", "secret123") == R"({"ssid":"HomeNet","password":"secret123"})");
    CHECK(wifi_config_json("Cafe", "") == R"({"ssid":"Cafe","password":""})");
}

TEST_CASE("Wi-Fi config payload escapes and survives the base64 transport") {
    const std::string ssid = "My \"Net\"";
    const std::string pass = "p\\w\xC3\xA9";
    std::string decoded;
    REQUIRE(base64_decode(encode_wifi_config(ssid, pass), decoded));

    const auto j = nlohmann::json::parse(decoded);
    CHECK(j.at("ssid").get<std::string>() == ssid);
    CHECK(j.at("password").get<std::string>() == pass);
}

TEST_CASE("Status names") {
    CHECK(std::string(to_string(WifiStatus::Connecting)) == "connecting");
    CHECK(std::string(to_string(WifiStatus::Failed)) == "failed");
}

TEST_CASE("base64 encodes with padding") {
    CHECK(base64_encode("") == "");
    CHECK(base64_encode("f") == "Zg==");
    CHECK(base64_encode("fo") == "Zm8=");
    CHECK(base64_encode("foo") == "Zm9v");
    CHECK(base64_encode("connected") == "Y29ubmVjdGVk");
}

TEST_CASE("base64 decode accepts padded and unpadded input, rejects junk") {
    std::string out;
    CHECK(base64_decode("Zm9v", out));
    CHECK(out == "foo");
    CHECK(base64_decode("Zg==", out));
    CHECK(out == "f");
    CHECK(base64_decode("Zg", out));
    CHECK(out == "f");

    CHECK_FALSE(base64_decode("Zm9v!", out));
    CHECK(out.empty());
    CHECK_FALSE(base64_decode("Z", out));
    CHECK_FALSE(base64_decode("Zg==Zg", out));
}

TEST_CASE("Oversized credentials are rejected instead of serialized as null") {
    const std::string huge(1000, 'x');
    CHECK(test::error_code_of([&] { wifi_config_json("HomeNet", huge); }) == ErrorCode::InvalidArgument);
    CHECK(test::error_code_of([&] { encode_wifi_config(huge, "secret"); }) == ErrorCode::InvalidArgument);

    // longest real credentials still fit
    const std::string ssid(32, 's');
    const std::string pass(63, 'p');
    const auto j = nlohmann::json::parse(wifi_config_json(ssid, pass));
    CHECK(j.at("password").get<std::string>() == pass);
}

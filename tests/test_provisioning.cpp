#include <doctest/doctest.h>
#include "rovy/provisioning_link.hpp"
#include "fakes.hpp"

#include <nlohmann/json.hpp>

using namespace rovy;
using namespace rovy::test;

static RadioDevice dev(const std::string& id, std::optional<std::string> name, std::optional<int> rssi) {
    return RadioDevice{id, std::move(name), rssi};
}

TEST_CASE("Radio operations fail fast when the build has no radio") {
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::unavailable("no Bluetooth LE backend in this build"), nullptr, gate);

    CHECK(link.unavailable_reason() == std::optional<std::string>("no Bluetooth LE backend in this build"));
    CHECK(error_code_of([&] { link.scan(10); }) == ErrorCode::AdapterUnavailable);
    CHECK(error_code_of([&] { link.connect("x"); }) == ErrorCode::AdapterUnavailable);
    CHECK(gate.asked == 0);
}

TEST_CASE("Declared support without a backend is downgraded") {
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), nullptr, gate);
    CHECK(link.unavailable_reason() == std::optional<std::string>("Bluetooth backend not initialized"));
}

TEST_CASE("Permissions and adapter power are checked before radio use") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);

    gate.grant = false;
    CHECK(error_code_of([&] { link.connect("a"); }) == ErrorCode::PermissionDenied);
    CHECK(radio.connects.empty());

    gate.grant = true;
    radio.state = AdapterState::Unauthorized;
    CHECK(error_code_of([&] { link.connect("a"); }) == ErrorCode::PermissionDenied);

    radio.state = AdapterState::PoweredOff;
    try {
        link.connect("a");
        FAIL("expected adapter error");
    } catch (const LinkError& e) {
        CHECK(e.code() == ErrorCode::AdapterUnavailable);
        CHECK(std::string(e.what()) == "Bluetooth is turned off. Please enable Bluetooth.");
    }

    radio.state = AdapterState::Resetting;
    try {
        link.connect("a");
        FAIL("expected adapter error");
    } catch (const LinkError& e) {
        CHECK(std::string(e.what()).find("Current state: Resetting") != std::string::npos);
    }
}

TEST_CASE("Scan keeps prefixed devices once each with the latest signal") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);

    radio.advertisements = {
        dev("a", "ROVY-1", -70),
        dev("b", "Speaker", -40),
        dev("c", std::nullopt, -30),
        dev("a", "ROVY-1", -50),
        dev("d", "ROVY-2", std::nullopt),
    };

    std::vector<std::string> reported;
    const auto found = link.scan(50, [&](const RadioDevice& d) { reported.push_back(d.id); });

    REQUIRE(found.size() == 2);
    CHECK(found[0].id == "a");
    CHECK(found[0].signal_strength == std::optional<int>(-50));
    CHECK(found[1].id == "d");
    CHECK(reported == std::vector<std::string>{"a", "d"});
    CHECK(link.state() == ProvisioningState::Idle);
    CHECK(radio.scans_started == 1);
    CHECK(radio.scans_stopped == 1);
}

TEST_CASE("A failing radio stack surfaces as ScanFailed") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);

    radio.advertisements = {dev("a", "ROVY-1", -70)};
    radio.scan_error = "adapter reset";
    CHECK(error_code_of([&] { link.scan(1000); }) == ErrorCode::ScanFailed);
    CHECK(link.state() == ProvisioningState::Idle);
}

TEST_CASE("Dropping a scan handle stops the radio scan") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);

    radio.advertisements = {dev("a", "ROVY-1", -70)};
    {
        auto handle = link.start_scan(0);
        RadioDevice d;
        REQUIRE(handle->next(d, 10));
        CHECK(d.id == "a");
        CHECK_FALSE(handle->finished());
    }
    CHECK(radio.scans_stopped == 1);
}

TEST_CASE("Scan handle queue is bounded and drops the oldest") {
    ScanHandle h(0);
    for (size_t i = 0; i < SCAN_QUEUE_CAP + 3; ++i) h.push(dev(std::to_string(i), "ROVY-x", -1));
    CHECK(h.dropped() == 3);

    RadioDevice d;
    REQUIRE(h.next(d, 0));
    CHECK(d.id == "3");

    h.stop();
    h.push(dev("late", "ROVY-x", -1));
    size_t left = 0;
    while (h.next(d, 0)) ++left;
    CHECK(left == SCAN_QUEUE_CAP - 1);
    CHECK(h.finished());
}

TEST_CASE("Connect verifies the provisioning service and seeds the status") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);

    radio.initial_value = base64_encode("connecting");
    link.connect("dev-1");

    CHECK(link.is_connected());
    CHECK(link.state() == ProvisioningState::Connected);
    CHECK(link.session().connected_device_id == std::optional<std::string>("dev-1"));
    CHECK(link.current_status() == WifiStatus::Connecting);
    CHECK(gate.asked == 1);
}

TEST_CASE("Missing service or characteristics fail the connection") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);

    radio.services = {};
    CHECK(error_code_of([&] { link.connect("dev-1"); }) == ErrorCode::ServiceNotFound);
    CHECK(link.state() == ProvisioningState::Failed);
    CHECK_FALSE(link.is_connected());
    CHECK(radio.gatt->cancels == 1);

    radio.services = {provisioning_service(true, false)};
    CHECK(error_code_of([&] { link.connect("dev-1"); }) == ErrorCode::CharacteristicNotFound);

    radio.services = {provisioning_service(false, true)};
    CHECK(error_code_of([&] { link.connect("dev-1"); }) == ErrorCode::CharacteristicNotFound);

    radio.services = {provisioning_service()};
    radio.refuse_connect = true;
    CHECK(error_code_of([&] { link.connect("dev-1"); }) == ErrorCode::ConnectFailed);
}

TEST_CASE("An unreadable initial status does not fail the connection") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);

    radio.fail_read = true;
    link.connect("dev-1");
    CHECK(link.is_connected());
    CHECK(link.current_status() == WifiStatus::Idle);
}

TEST_CASE("Sending Wi-Fi config while disconnected leaves the session alone") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);

    const ProvisioningState before = link.state();
    CHECK(error_code_of([&] { link.send_config("HomeNet", "secret123"); }) == ErrorCode::NotConnected);
    CHECK(link.state() == before);
    CHECK(radio.gatt->writes.empty());

    radio.services = {};
    CHECK_THROWS_AS(link.connect("dev-1"), LinkError);
    CHECK(error_code_of([&] { link.send_config("HomeNet", "secret123"); }) == ErrorCode::NotConnected);
    CHECK(link.state() == ProvisioningState::Failed);
}

TEST_CASE("Wi-Fi config is written as base64 JSON and moves to configuring") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);
    link.connect("dev-1");

    CHECK(error_code_of([&] { link.send_config("   ", "x"); }) == ErrorCode::InvalidArgument);
    CHECK(radio.gatt->writes.empty());

    link.send_config("  HomeNet ", "secret123");
    REQUIRE(radio.gatt->writes.size() == 1);
    std::string decoded;
    REQUIRE(base64_decode(radio.gatt->writes[0], decoded));
    const auto j = nlohmann::json::parse(decoded);
    CHECK(j["ssid"] == "HomeNet");
    CHECK(j["password"] == "secret123");
    CHECK(link.state() == ProvisioningState::Configuring);
}

TEST_CASE("A rejected write fails the session") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);
    radio.fail_write = true;
    link.connect("dev-1");

    try {
        link.send_config("HomeNet", "pw");
        FAIL("expected write failure");
    } catch (const LinkError& e) {
        CHECK(e.code() == ErrorCode::WriteFailed);
        CHECK(std::string(e.what()).rfind("Failed to send Wi-Fi configuration:", 0) == 0);
    }
    CHECK(link.state() == ProvisioningState::Failed);
}

TEST_CASE("Status notifications drive the configuring outcome") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);
    link.connect("dev-1");
    link.send_config("HomeNet", "pw");

    radio.notify("connecting");
    CHECK(link.poll() == 1);
    CHECK(link.state() == ProvisioningState::Configuring);
    CHECK(link.current_status() == WifiStatus::Connecting);

    radio.notify("connected");
    CHECK(link.wait_for_status(1000) == WifiStatus::Connected);
    CHECK(link.state() == ProvisioningState::Connected);
}

TEST_CASE("Failure notification fails the session") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);
    link.connect("dev-1");
    link.send_config("HomeNet", "wrong");

    radio.notify("failed");
    CHECK(link.wait_for_status(1000) == WifiStatus::Failed);
    CHECK(link.state() == ProvisioningState::Failed);
}

TEST_CASE("Waiting without an answer times out in configuring") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);
    link.connect("dev-1");
    link.send_config("HomeNet", "pw");

    CHECK(link.wait_for_status(50) == WifiStatus::Idle);
    CHECK(link.state() == ProvisioningState::Configuring);
}

TEST_CASE("Unknown notification values read as idle") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);
    radio.initial_value = base64_encode("connected");
    link.connect("dev-1");
    CHECK(link.current_status() == WifiStatus::Connected);

    radio.notify("rebooting");
    link.poll();
    CHECK(link.current_status() == WifiStatus::Idle);
}

TEST_CASE("Status listeners get the current value, then every change") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);
    link.connect("dev-1");

    std::vector<WifiStatus> seen;
    const int id = link.on_status_change([&](WifiStatus s) { seen.push_back(s); });
    link.on_status_change([](WifiStatus) { throw std::runtime_error("listener bug"); });
    REQUIRE(seen.size() == 1);
    CHECK(seen[0] == WifiStatus::Idle);

    radio.notify("connecting");
    link.poll();
    CHECK(seen.size() == 2);
    CHECK(seen[1] == WifiStatus::Connecting);

    link.remove_status_callback(id);
    radio.notify("connected");
    link.poll();
    CHECK(seen.size() == 2);
}

TEST_CASE("Disconnect tears down the subscription and ignores late notifications") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);
    link.connect("dev-1");

    link.disconnect();
    CHECK_FALSE(link.is_connected());
    CHECK(link.state() == ProvisioningState::Idle);
    CHECK(radio.gatt->unsubscribes == 1);
    CHECK(radio.gatt->cancels == 1);

    radio.notify("connected");
    CHECK(link.poll() == 0);
    CHECK(link.current_status() == WifiStatus::Idle);

    link.disconnect();                          // no-op
    CHECK(radio.gatt->cancels == 1);
}

TEST_CASE("Reconnecting drops the previous connection first") {
    FakeRadioBackend radio;
    FakePermissionGate gate;
    ProvisioningLink link(RadioSupport::ok(), &radio, gate);
    link.connect("dev-1");
    link.connect("dev-2");
    CHECK(radio.gatt->cancels == 1);
    CHECK(link.session().connected_device_id == std::optional<std::string>("dev-2"));
}

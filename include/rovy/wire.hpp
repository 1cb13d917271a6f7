#pragma once
/**
 * @file wire.hpp
 * @brief Provisioning wire payloads: the Wi-Fi config object and the status word.
 *
 * @details
 * The radio provisioning service moves exactly two kinds of value:
 *   - **config** (write): a compact JSON object `{"ssid":"...","password":"..."}`,
 *     base64-encoded for transport.
 *   - **status** (read/notify): one of the literal words
 *     `idle | connecting | connected | failed`, base64-encoded for transport.
 *
 * ## JSON backend
 * The config object is built with ArduinoJson in a fixed-size document, the
 * same codec the robot firmware uses to read it, so field order (`ssid` then
 * `password`) and escaping match on both ends. On non-Arduino toolchains
 * wire.cpp switches off the Arduino String/Stream/PROGMEM extensions before
 * the library is included. Host-side JSON (HTTP payloads, persisted
 * state) uses nlohmann::json instead.
 *
 * ## Transport encoding
 * Both values cross the radio as RFC 4648 base64. base64_encode() and
 * base64_decode() wrap mbedTLS (mbedtls/base64.h), the codec the robot's
 * ESP32 firmware links as well.
 *
 * ## Unrecognized status words
 * classify_wifi_status() collapses anything outside the four known words to
 * `Idle`, which is what the robot firmware contract has always meant by
 * "nothing useful to report". The `recognized` flag lets callers tell a real
 * `idle` from a collapsed one, and the provisioning link logs the collapse.
 */

#include <string>

namespace rovy {

enum class WifiStatus { Idle, Connecting, Connected, Failed };

const char* to_string(WifiStatus status);

/**
 * @brief Outcome of reading a status word.
 */
struct WifiStatusReading {
    WifiStatus status = WifiStatus::Idle;
    bool recognized = false;   ///< false when the input was collapsed to Idle
};

/**
 * @brief Case-insensitive, whitespace-tolerant status parse.
 *
 * "Connected", "CONNECTED" and " connected\n" all read as Connected.
 * Empty or unknown input reads as Idle with recognized == false.
 */
WifiStatusReading classify_wifi_status(const std::string& text);

/// Shorthand for classify_wifi_status(text).status.
WifiStatus parse_wifi_status(const std::string& text);

/**
 * @brief Decode a status characteristic value as delivered by the radio stack.
 *
 * Values are normally base64 of the status word. When the base64 reading
 * does not yield a known word, the raw text is tried as-is, so stacks that
 * hand over already-decoded text still work.
 */
WifiStatusReading decode_status_value(const std::string& transport_value);

/// Padded base64 of `raw`.
std::string base64_encode(const std::string& raw);

/**
 * @brief Decode base64, tolerating stripped '=' padding.
 * @return false (and `out` cleared) on characters outside the alphabet,
 *         misplaced padding or an impossible length.
 */
bool base64_decode(const std::string& encoded, std::string& out);

/**
 * @brief Serialize Wi-Fi credentials as compact JSON: {"ssid":..,"password":..}.
 *
 * @note SSIDs are at most 32 bytes and WPA passphrases at most 63, which fit
 *       the fixed document with room to spare.
 * @throws LinkError(InvalidArgument) when the values do not fit the document.
 */
std::string wifi_config_json(const std::string& ssid, const std::string& password);

/**
 * @brief JSON + base64: the exact bytes written to the config characteristic.
 */
std::string encode_wifi_config(const std::string& ssid, const std::string& password);

} // namespace rovy

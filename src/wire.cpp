// ============================================================================
// wire.cpp — implementation for wire.hpp
// For the payload contract see the matching .hpp.
// ============================================================================

#include "rovy/wire.hpp"
#include "rovy/error.hpp"
#include "rovy/net_util.hpp"

#include <mbedtls/base64.h>
#include <vector>

// Host builds: no Arduino String/Stream/PROGMEM. Must precede the library include.
#ifndef ARDUINO
  #define ARDUINOJSON_ENABLE_ARDUINO_STRING  0
  #define ARDUINOJSON_ENABLE_ARDUINO_STREAM  0
  #define ARDUINOJSON_ENABLE_ARDUINO_PRINT   0
  #define ARDUINOJSON_ENABLE_PROGMEM         0
#endif
#include <ArduinoJson.hpp>

using ArduinoJson::StaticJsonDocument;
using ArduinoJson::JsonObject;

namespace rovy {

const char* to_string(WifiStatus status) {
    switch (status) {
        case WifiStatus::Idle:       return "idle";
        case WifiStatus::Connecting: return "connecting";
        case WifiStatus::Connected:  return "connected";
        case WifiStatus::Failed:     return "failed";
    }
    return "idle";
}

WifiStatusReading classify_wifi_status(const std::string& text) {
    const std::string s = to_lower(trim(text));
    WifiStatusReading r;
    r.recognized = true;
    if      (s == "idle")       r.status = WifiStatus::Idle;
    else if (s == "connecting") r.status = WifiStatus::Connecting;
    else if (s == "connected")  r.status = WifiStatus::Connected;
    else if (s == "failed")     r.status = WifiStatus::Failed;
    else {
        r.status = WifiStatus::Idle;      // lossy by contract; caller logs it
        r.recognized = false;
    }
    return r;
}

WifiStatus parse_wifi_status(const std::string& text) {
    return classify_wifi_status(text).status;
}

std::string base64_encode(const std::string& raw) {
    if (raw.empty()) return {};
    const auto* src = reinterpret_cast<const unsigned char*>(raw.data());

    // 4 output chars per 3 input bytes, plus the terminator mbedTLS writes
    std::vector<unsigned char> buf(((raw.size() + 2) / 3) * 4 + 1);
    size_t olen = 0;
    if (mbedtls_base64_encode(buf.data(), buf.size(), &olen, src, raw.size()) != 0) {
        throw LinkError(ErrorCode::InvalidArgument, "base64 encode failed");
    }
    return std::string(reinterpret_cast<const char*>(buf.data()), olen);
}

bool base64_decode(const std::string& encoded, std::string& out) {
    out.clear();
    std::string in = encoded;
    switch (in.size() % 4) {
        case 0:  break;
        case 1:  return false;
        case 2:  in += "=="; break;
        default: in += "=";  break;
    }
    if (in.empty()) return true;

    const auto* src = reinterpret_cast<const unsigned char*>(in.data());
    std::vector<unsigned char> buf((in.size() / 4) * 3 + 1);
    size_t olen = 0;
    if (mbedtls_base64_decode(buf.data(), buf.size(), &olen, src, in.size()) != 0) {
        return false;
    }
    out.assign(reinterpret_cast<const char*>(buf.data()), olen);
    return true;
}

WifiStatusReading decode_status_value(const std::string& transport_value) {
    std::string decoded;
    if (base64_decode(transport_value, decoded)) {
        WifiStatusReading r = classify_wifi_status(decoded);
        if (r.recognized) return r;
    }
    // short plain words such as "idle" are also valid base64, so the decoded
    // reading only wins when it produced a known word
    return classify_wifi_status(transport_value);
}

std::string wifi_config_json(const std::string& ssid, const std::string& password) {
    // fixed-capacity document; members serialize in insertion order
    StaticJsonDocument<384> doc;
    JsonObject obj = doc.to<JsonObject>();
    obj["ssid"]     = ssid;       // std::string is copied into the document pool
    obj["password"] = password;
    if (doc.overflowed()) {
        throw LinkError(ErrorCode::InvalidArgument, "Wi-Fi credentials too long");
    }

    std::string out;
    out.reserve(doc.memoryUsage() + 32);
    ArduinoJson::serializeJson(doc, out);
    return out;
}

std::string encode_wifi_config(const std::string& ssid, const std::string& password) {
    return base64_encode(wifi_config_json(ssid, password));
}

} // namespace rovy

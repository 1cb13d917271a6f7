#pragma once
// Scripted stand-ins for the HTTP and radio seams, shared by the unit tests.

#include "rovy/error.hpp"
#include "rovy/provisioning_link.hpp"
#include "rovy/scan_handle.hpp"
#include "rovy/transport/http_client.hpp"
#include "rovy/transport/radio_backend.hpp"
#include "rovy/wire.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace rovy {
namespace test {

// Error code a call threw, or nullopt when it returned normally.
template <typename F>
std::optional<ErrorCode> error_code_of(F&& fn) {
    try {
        fn();
    } catch (const LinkError& e) {
        return e.code();
    }
    return std::nullopt;
}

// Scratch directory removed on scope exit.
struct TempDir {
    std::filesystem::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = std::filesystem::temp_directory_path()
             / ("rovy-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

// ---------------------------------------------------------------------------
// HTTP
// ---------------------------------------------------------------------------
inline HttpResponse json_response(const std::string& body, int status = 200) {
    HttpResponse r;
    r.status = status;
    r.content_type = "application/json";
    r.body = body;
    return r;
}

inline HttpResponse html_response(const std::string& body, int status = 200) {
    HttpResponse r;
    r.status = status;
    r.content_type = "text/html; charset=utf-8";
    r.body = body;
    return r;
}

inline HttpResponse status_response(int status) {
    HttpResponse r;
    r.status = status;
    r.content_type = "application/json";
    return r;
}

inline HttpResponse transport_error(HttpError e, const std::string& msg = "fake transport error") {
    HttpResponse r;
    r.error = e;
    r.error_message = msg;
    return r;
}

// Routes by exact URL; anything unrouted is "connection refused".
class FakeHttpClient : public HttpClient {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    void route(const std::string& url, HttpResponse resp) {
        std::lock_guard<std::mutex> lk(mu_);
        routes_[url] = std::move(resp);
    }
    void set_handler(Handler h) {
        std::lock_guard<std::mutex> lk(mu_);
        handler_ = std::move(h);
    }

    HttpResponse send(const HttpRequest& request) override {
        Handler h;
        {
            std::lock_guard<std::mutex> lk(mu_);
            requests_.push_back(request);
            h = handler_;
            if (!h) {
                auto it = routes_.find(request.url);
                if (it != routes_.end()) return it->second;
                return transport_error(HttpError::ConnectionFailed, "connection refused");
            }
        }
        return h(request);
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lk(mu_);
        return requests_;
    }
    std::vector<std::string> urls() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<std::string> out;
        for (const auto& r : requests_) out.push_back(r.url);
        return out;
    }
    size_t count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return requests_.size();
    }
    void clear_requests() {
        std::lock_guard<std::mutex> lk(mu_);
        requests_.clear();
    }

private:
    mutable std::mutex                  mu_;
    std::map<std::string, HttpResponse> routes_;
    Handler                             handler_;
    std::vector<HttpRequest>            requests_;
};

// ---------------------------------------------------------------------------
// Radio
// ---------------------------------------------------------------------------
class FakePermissionGate : public PermissionGate {
public:
    bool grant = true;
    int  asked = 0;

    std::set<Permission> required_permissions() const override {
        return {Permission::BluetoothScan, Permission::BluetoothConnect, Permission::FineLocation};
    }
    bool request(const std::set<Permission>&) override {
        ++asked;
        return grant;
    }
};

struct GattLog {
    std::vector<std::string> writes;            // base64 values
    int  unsubscribes = 0;
    int  cancels = 0;
    GattConnection::NotifyFn notify;            // last subscriber
};

class FakeGattConnection : public GattConnection {
public:
    explicit FakeGattConnection(std::shared_ptr<GattLog> log) : log_(std::move(log)) {}

    std::vector<GattService> services_list;
    std::string initial_value;                  // returned by read()
    bool        fail_read  = false;
    bool        fail_write = false;

    std::vector<GattService> services() override { return services_list; }

    std::string read(const std::string&, const std::string&) override {
        if (fail_read) throw LinkError(ErrorCode::RequestFailed, "read failed");
        return initial_value;
    }
    void write_with_response(const std::string&, const std::string&, const std::string& value) override {
        if (fail_write) throw std::runtime_error("GATT error 0x0e");
        log_->writes.push_back(value);
    }
    void subscribe(const std::string&, const std::string&, NotifyFn fn) override { log_->notify = std::move(fn); }
    void unsubscribe() override { ++log_->unsubscribes; }
    void cancel() override { ++log_->cancels; }

private:
    std::shared_ptr<GattLog> log_;
};

inline GattService provisioning_service(bool with_config = true, bool with_status = true) {
    GattService s;
    s.uuid = ROVY_WIFI_SERVICE_UUID;
    if (with_config) s.characteristics.push_back({"1234ABCD-0001-1000-8000-00805F9B34FB", false, true, false});
    if (with_status) s.characteristics.push_back({"1234abcd-0002-1000-8000-00805f9b34fb", true, false, true});
    return s;
}

class FakeRadioBackend : public RadioBackend {
public:
    AdapterState state = AdapterState::PoweredOn;
    std::vector<RadioDevice> advertisements;     // pushed on start_scan
    std::string scan_error;                      // fail the scan after pushing
    bool refuse_connect = false;

    // shape of the next connection
    std::vector<GattService> services{provisioning_service()};
    std::string initial_value = base64_encode("idle");
    bool fail_read  = false;
    bool fail_write = false;

    std::shared_ptr<GattLog> gatt = std::make_shared<GattLog>();
    int scans_started = 0;
    int scans_stopped = 0;
    std::vector<std::string> connects;

    AdapterState adapter_state() override { return state; }

    void start_scan(ScanHandle& sink) override {
        ++scans_started;
        for (const auto& d : advertisements) sink.push(d);
        if (!scan_error.empty()) sink.fail(scan_error);
    }
    void stop_scan() override { ++scans_stopped; }

    std::unique_ptr<GattConnection> connect(const std::string& device_id, int) override {
        connects.push_back(device_id);
        if (refuse_connect) return nullptr;
        auto c = std::make_unique<FakeGattConnection>(gatt);
        c->services_list = services;
        c->initial_value = initial_value;
        c->fail_read     = fail_read;
        c->fail_write    = fail_write;
        return c;
    }

    // robot side: emit a status notification
    void notify(const std::string& word) {
        if (gatt->notify) gatt->notify(base64_encode(word));
    }
};

} // namespace test
} // namespace rovy

/**
 * @file main.cpp
 * @brief rovyctl: command line front end for robot provisioning, discovery and sessions.
 *
 * Responsibilities:
 *  - Parse global options and one subcommand (CLI11).
 *  - Resolve the state dir (~/.config/rovy), load config.json, then apply CLI overrides.
 *  - Build the object graph once: FileStore -> DeviceIdentity -> SessionManager,
 *    CurlHttpClient for HTTP, ProvisioningLink for the radio.
 *  - Print results as key=value lines (default) or JSON (--format json).
 *
 * Exit codes:
 *   0 ok
 *   1 runtime error (radio, HTTP, robot said no)
 *   2 usage or configuration error (bad SSID, bad PIN, bad URL)
 *   3 not found or timed out
 *
 * Notes:
 *  - This build ships no BLE backend, so ble-scan and provision report
 *    reason=adapter_unavailable. The library side is complete behind RadioBackend.
 *  - SIGINT stops watch loops and cancels a running discovery sweep.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h> // isatty

#include <CLI/CLI11.hpp>
#include <nlohmann/json.hpp>

#include "rovy/device_identity.hpp"
#include "rovy/discovery.hpp"
#include "rovy/error.hpp"
#include "rovy/host_network.hpp"
#include "rovy/kv_store.hpp"
#include "rovy/log.hpp"
#include "rovy/net_util.hpp"
#include "rovy/provisioning_link.hpp"
#include "rovy/robot_directory.hpp"
#include "rovy/session_manager.hpp"
#include "rovy/settings.hpp"
#include "rovy/transport/http_curl.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace rovy;

enum ExitCode { EXIT_OK = 0, EXIT_RUNTIME = 1, EXIT_USAGE = 2, EXIT_NOT_FOUND = 3 };

// ---------- small utilities ----------

static std::atomic<bool> g_stop{false};

static void on_sigint(int) { g_stop.store(true); }

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

static uint64_t now_ms_steady() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

using Fields = std::vector<std::pair<std::string, std::string>>;

// One result record: "k=v k=v" or a JSON object per line.
struct Printer {
  bool as_json{false};
  Ansi ansi;

  static std::string quote(const std::string& v) {
    if (v.find_first_of(" \t\"=") == std::string::npos && !v.empty()) return v;
    std::string out = "\"";
    for (char c : v) { if (c == '"' || c == '\\') out += '\\'; out += c; }
    return out + "\"";
  }

  void record(const Fields& fields) const {
    if (as_json) {
      json j = json::object();
      for (const auto& kv : fields) j[kv.first] = kv.second;
      std::cout << j.dump() << "\n";
      return;
    }
    bool first = true;
    for (const auto& kv : fields) {
      if (!first) std::cout << ' ';
      first = false;
      std::string v = quote(kv.second);
      if (kv.first == "status") v = (kv.second == "ok") ? ansi.green(v) : ansi.red(v);
      std::cout << kv.first << '=' << v;
    }
    std::cout << "\n";
  }

  void json_value(const json& j) const { std::cout << j.dump(as_json ? -1 : 2) << "\n"; }
};

static int exit_for(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidArgument:
    case ErrorCode::NotConfigured:  return EXIT_USAGE;
    case ErrorCode::Timeout:        return EXIT_NOT_FOUND;
    default:                        return EXIT_RUNTIME;
  }
}

static int report_error(const Printer& out, const LinkError& e) {
  out.record({{"status", "error"}, {"reason", to_string(e.code())}, {"msg", e.what()}});
  return exit_for(e.code());
}

static std::string fmt_num(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", v);
  return buf;
}

static Fields status_fields(const ConnectionSession& s, const std::optional<RobotStatus>& st) {
  Fields f;
  f.emplace_back("status", st ? "ok" : "offline");
  f.emplace_back("url", s.base_url);
  if (st) {
    if (st->robot_id)        f.emplace_back("robot", *st->robot_id);
    if (st->name)            f.emplace_back("name", *st->name);
    if (st->battery)         f.emplace_back("battery", fmt_num(*st->battery));
    if (st->cpu_load)        f.emplace_back("cpu", fmt_num(*st->cpu_load));
    if (st->temperature_c)   f.emplace_back("temp_c", fmt_num(*st->temperature_c));
    if (st->humidity)        f.emplace_back("humidity", fmt_num(*st->humidity));
    if (st->uptime_seconds)  f.emplace_back("uptime_s", std::to_string(*st->uptime_seconds));
    if (st->network.ip)      f.emplace_back("ip", *st->network.ip);
    if (st->network.wifi_ssid)       f.emplace_back("ssid", *st->network.wifi_ssid);
    if (st->network.signal_strength) f.emplace_back("rssi", std::to_string(*st->network.signal_strength));
    if (st->claimed)         f.emplace_back("claimed", *st->claimed ? "true" : "false");
    if (st->token_valid)     f.emplace_back("token_valid", *st->token_valid ? "true" : "false");
  }
  if (s.last_updated) f.emplace_back("updated", *s.last_updated);
  if (s.last_error)   f.emplace_back("error", *s.last_error);
  return f;
}

static void print_status(const Printer& out, const SessionManager& mgr) {
  const auto st = mgr.status();
  if (out.as_json && st) {
    json j = st->raw;
    j["baseUrl"] = mgr.session().base_url;
    if (mgr.session().last_updated) j["lastUpdated"] = *mgr.session().last_updated;
    out.json_value(j);
    return;
  }
  out.record(status_fields(mgr.session(), st));
}

static std::string read_line(const std::string& prompt) {
  std::cerr << prompt << std::flush;
  std::string line;
  std::getline(std::cin, line);
  return line;
}

// ---------- main ----------

int main(int argc, char** argv) {
  // global options
  std::string opt_format = "kv";            // kv|json
  bool opt_no_color = false;
  bool opt_verbose = false;
  bool opt_quiet = false;
  bool opt_print_log = false;
  std::string opt_state_dir;
  int opt_timeout_ms = 0;                    // 0 => config
  int opt_probe_timeout_ms = 0;              // 0 => config

  CLI::App app{"rovyctl - robot provisioning, discovery and session control"};
  app.require_subcommand(1);

  app.add_option("--format", opt_format, "Output format: kv|json")->check(CLI::IsMember({"kv", "json"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("-v,--verbose", opt_verbose, "Debug logging");
  app.add_flag("-q,--quiet", opt_quiet, "Errors only");
  app.add_flag("--print-log", opt_print_log, "Print the in-memory log ring on exit");
  app.add_option("--state-dir", opt_state_dir, "Override state directory");
  app.add_option("--timeout", opt_timeout_ms, "HTTP request timeout in ms")->check(CLI::NonNegativeNumber);
  app.add_option("--probe-timeout", opt_probe_timeout_ms, "Discovery probe timeout in ms")->check(CLI::NonNegativeNumber);

  // ble-scan
  int scan_ms = 0;
  auto* c_scan = app.add_subcommand("ble-scan", "Scan for robots advertising over Bluetooth LE");
  c_scan->add_option("--scan-ms", scan_ms, "Scan window in ms (default from config)");

  // provision
  std::string prov_device, prov_ssid, prov_password;
  int prov_wait_ms = 30000;
  auto* c_prov = app.add_subcommand("provision", "Send Wi-Fi credentials to a robot over Bluetooth LE");
  c_prov->add_option("--device", prov_device, "Radio device id from ble-scan")->required();
  c_prov->add_option("--ssid", prov_ssid, "Wi-Fi network name")->required();
  c_prov->add_option("--password", prov_password, "Wi-Fi password (empty for open networks)");
  c_prov->add_option("--wait-ms", prov_wait_ms, "How long to wait for the robot to join");

  // discover
  std::string disc_host_ip, disc_status_ip;
  bool disc_no_adopt = false;
  auto* c_disc = app.add_subcommand("discover", "Find the robot on the local network");
  c_disc->add_option("--host-ip", disc_host_ip, "Use this host IPv4 instead of detecting it");
  c_disc->add_option("--status-ip", disc_status_ip, "Address the robot last reported");
  c_disc->add_flag("--no-adopt", disc_no_adopt, "Only print the address, keep the session unchanged");

  // status / watch
  auto* c_status = app.add_subcommand("status", "Refresh and print robot status once");
  int watch_count = 0;
  auto* c_watch = app.add_subcommand("watch", "Poll robot status until interrupted");
  c_watch->add_option("--count", watch_count, "Stop after this many refreshes (0 = forever)");

  // pairing
  std::string pair_pin;
  auto* c_pair = app.add_subcommand("pair", "Pair with the robot using the PIN it displays");
  c_pair->add_option("--pin", pair_pin, "6-digit PIN (prompted when omitted)");

  // directory
  bool robots_check = false;
  auto* c_robots = app.add_subcommand("robots", "List paired robots");
  c_robots->add_flag("--check", robots_check, "Check whether each robot is reachable");

  std::string connect_url;
  auto* c_connect = app.add_subcommand("connect", "Reconnect to a paired robot by URL or IP");
  c_connect->add_option("url", connect_url, "Robot URL or IP")->required();

  std::string set_url;
  auto* c_set_url = app.add_subcommand("set-url", "Set the robot base URL");
  c_set_url->add_option("url", set_url, "Robot base URL")->required();

  auto* c_clear = app.add_subcommand("clear", "Forget the current connection and credentials");

  // robot wifi
  auto* c_wscan = app.add_subcommand("wifi-scan", "List networks visible to the robot");
  std::string wc_ssid, wc_password;
  auto* c_wconn = app.add_subcommand("wifi-connect", "Ask the robot to join a Wi-Fi network");
  c_wconn->add_option("--ssid", wc_ssid, "Wi-Fi network name")->required();
  c_wconn->add_option("--password", wc_password, "Wi-Fi password");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  if (opt_verbose) set_log_level(LogLevel::Debug);
  if (opt_quiet)   set_log_level(LogLevel::Error);

  Printer out;
  out.as_json = (opt_format == "json");
  out.ansi.enabled = !opt_no_color && !out.as_json && is_tty_stdout();

  // state + config
  const fs::path state_dir = opt_state_dir.empty() ? default_state_dir() : fs::path(opt_state_dir);
  Settings settings = load_settings(state_dir / "config.json");
  if (opt_timeout_ms > 0)       settings.request_timeout_ms = opt_timeout_ms;
  if (opt_probe_timeout_ms > 0) settings.probe_timeout_ms = opt_probe_timeout_ms;

  FileStore store(state_dir);
  DeviceIdentity identity(store);
  CurlHttpClient http;
  SessionManager mgr(http, store, identity, settings);
  mgr.load();

  NoPermissionGate permissions;
  ProvisioningLink link(RadioSupport::unavailable("no Bluetooth LE backend in this build"),
                        nullptr, permissions, settings);

  std::signal(SIGINT, on_sigint);

  int rc = EXIT_OK;
  try {
    if (c_scan->parsed()) {
      const auto devices = link.scan(scan_ms, [&](const RadioDevice& d) {
        out.record({{"device", d.id}, {"name", d.display_name.value_or("")},
                    {"rssi", d.signal_strength ? std::to_string(*d.signal_strength) : ""}});
      });
      out.record({{"status", "ok"}, {"found", std::to_string(devices.size())}});
      if (devices.empty()) rc = EXIT_NOT_FOUND;

    } else if (c_prov->parsed()) {
      link.connect(prov_device);
      link.send_config(prov_ssid, prov_password);
      const WifiStatus ws = link.wait_for_status(prov_wait_ms);
      link.disconnect();
      if (ws == WifiStatus::Connected) {
        out.record({{"status", "ok"}, {"wifi", to_string(ws)}});
      } else if (ws == WifiStatus::Failed) {
        out.record({{"status", "error"}, {"reason", "wifi_failed"}, {"wifi", to_string(ws)}});
        rc = EXIT_RUNTIME;
      } else {
        out.record({{"status", "timeout"}, {"wifi", to_string(ws)}});
        rc = EXIT_NOT_FOUND;
      }

    } else if (c_disc->parsed()) {
      const bool auto_host = disc_host_ip.empty();
      std::string host = disc_host_ip;
      if (auto_host) host = primary_ipv4().value_or("");

      DiscoveryInputs in = mgr.discovery_inputs(host);
      if (!disc_status_ip.empty()) in.known_status_ip = disc_status_ip;

      DiscoveryEngine engine(http, settings);
      DiscoveryEngine::HostIpFn watch_host;
      if (auto_host) watch_host = [] { return primary_ipv4(); };

      auto job = std::async(std::launch::async, [&] { return engine.sweep(in, watch_host); });
      while (job.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (g_stop.load()) engine.cancel();
      }
      const SweepReport rep = job.get();

      if (rep.result == SweepResult::Found) {
        if (!disc_no_adopt) mgr.adopt_discovered(*rep.url);
        out.record({{"status", "ok"}, {"url", *rep.url}, {"probed", std::to_string(rep.probed)},
                    {"adopted", disc_no_adopt ? "false" : "true"}});
      } else {
        out.record({{"status", to_string(rep.result)}, {"hint", rep.hint},
                    {"probed", std::to_string(rep.probed)}});
        rc = EXIT_NOT_FOUND;
      }

    } else if (c_status->parsed()) {
      const bool ok = mgr.refresh_status();
      print_status(out, mgr);
      if (!ok) rc = EXIT_RUNTIME;

    } else if (c_watch->parsed()) {
      int seen = 0;
      mgr.set_polling(true, now_ms_steady());
      print_status(out, mgr);
      ++seen;
      while (!g_stop.load() && (watch_count <= 0 || seen < watch_count)) {
        if (mgr.tick(now_ms_steady())) {
          print_status(out, mgr);
          ++seen;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
      mgr.set_polling(false, now_ms_steady());

    } else if (c_pair->parsed()) {
      mgr.request_pairing();
      if (pair_pin.empty()) pair_pin = trim(read_line("Enter the 6-digit PIN shown on the robot: "));
      const ClaimResult claim = mgr.confirm_pairing(pair_pin);
      out.record({{"status", "ok"}, {"robot", mgr.session().active_robot_id.value_or("")},
                  {"session", claim.session_id ? "yes" : "no"}});

    } else if (c_robots->parsed()) {
      const auto robots = mgr.directory().list();
      const std::string me = identity.id();
      for (const auto& r : robots) {
        Fields f{{"robot", r.robot_id}, {"url", r.base_url}};
        if (r.name)           f.emplace_back("name", *r.name);
        if (r.last_ip)        f.emplace_back("last_ip", *r.last_ip);
        if (r.last_wifi_ssid) f.emplace_back("ssid", *r.last_wifi_ssid);
        if (r.last_seen)      f.emplace_back("last_seen", *r.last_seen);
        f.emplace_back("this_device", r.device_id == me ? "true" : "false");
        if (robots_check) {
          const RobotCheck chk = check_robot(http, r, settings.status_check_timeout_ms);
          f.emplace_back("availability", to_string(chk.availability));
        }
        out.record(f);
      }
      out.record({{"status", "ok"}, {"count", std::to_string(robots.size())}});

    } else if (c_connect->parsed()) {
      if (mgr.connect_to_stored_robot(connect_url)) {
        print_status(out, mgr);
      } else {
        out.record({{"status", "not_found"}, {"url", connect_url}});
        rc = EXIT_NOT_FOUND;
      }

    } else if (c_set_url->parsed()) {
      mgr.set_base_url(set_url);
      out.record({{"status", "ok"}, {"url", mgr.session().base_url}});

    } else if (c_clear->parsed()) {
      mgr.clear_connection();
      out.record({{"status", "ok"}, {"url", mgr.session().base_url}});

    } else if (c_wscan->parsed()) {
      const auto nets = mgr.scan_wifi();
      if (out.as_json) {
        out.json_value(json{{"networks", nets}});
      } else {
        for (const auto& n : nets) out.record({{"ssid", n}});
        out.record({{"status", "ok"}, {"count", std::to_string(nets.size())}});
      }

    } else if (c_wconn->parsed()) {
      mgr.connect_wifi(WifiCredentials{wc_ssid, wc_password});
      out.record({{"status", "ok"}, {"ssid", trim(wc_ssid)}});
    }
  } catch (const LinkError& e) {
    rc = report_error(out, e);
  }

  if (opt_print_log) {
    std::cout << out.ansi.bold("-- log --") << "\n";
    for (const auto& line : recent_logs()) std::cout << out.ansi.dim(line) << "\n";
  }
  return rc;
}

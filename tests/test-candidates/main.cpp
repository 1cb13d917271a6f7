/**
 * @file main.cpp
 * @brief CLI Test Tool for the rovy discovery candidate list and health probe
 *
 * This program prints the ordered list of URLs the discovery sweep would try
 * for a given set of inputs, and can probe a single URL the same way the sweep
 * does. It is meant for checking candidate ordering on a real network before
 * running a full `rovyctl discover`.
 *
 * @section usage Basic Usage
 *
 * @code
 *   ./test-candidates <subcommand> [options...]
 * @endcode
 *
 * Example:
 * @code
 *   Candidates for a laptop on 10.0.0.42 that last saw the robot on .15
 *   ./test-candidates list --host-ip 10.0.0.42 --known-url http://10.0.0.15:8000 --limit 5
 *
 *   Laptop joined the robot hotspot
 *   ./test-candidates list --host-ip 192.168.4.37
 *
 *   Use the detected host address
 *   ./test-candidates list --detect
 *
 *   Probe one robot
 *   ./test-candidates probe --url http://10.0.0.15:8000 --timeout 1500
 * @endcode
 *
 * @section subcommands Available Subcommands
 *
 * @subcommand list
 * - Prints one candidate URL per line, in probe order
 * - Options: `--host-ip`, `--detect`, `--known-url`, `--status-ip`,
 *   `--known-ip` (repeatable), `--limit`
 *
 * @subcommand probe
 * - Runs the health probe against one URL and prints the outcome
 *   (ok, timeout, rejected, unreachable, not_json)
 * - Requires: `--url`
 *
 * @note Exit status is 0 when the probe finds a robot, 1 otherwise.
 */

#include <iostream>
#include <string>
#include <vector>
#include "CLI/CLI11.hpp"
#include "rovy/discovery.hpp"
#include "rovy/host_network.hpp"
#include "rovy/log.hpp"
#include "rovy/transport/http_curl.hpp"

using namespace rovy;

int main(int argc, char** argv) {

    CLI::App app{"rovy discovery candidate tester"};
    app.require_subcommand(1);

    // Subcommand: list
    DiscoveryInputs in;
    std::string status_ip;
    bool detect = false;
    size_t limit = 0;
    auto cmd_list = app.add_subcommand("list", "Print candidate URLs in probe order");
    cmd_list->add_option("--host-ip", in.host_ip, "Host IPv4 address");
    cmd_list->add_flag("--detect", detect, "Detect the host IPv4 address");
    cmd_list->add_option("--known-url", in.known_base_url, "Last known robot base URL");
    cmd_list->add_option("--status-ip", status_ip, "Address the robot last reported");
    cmd_list->add_option("--known-ip", in.known_ips, "Last IP of a paired robot (repeatable)");
    cmd_list->add_option("--limit", limit, "Print at most this many (0 = all)");

    // Subcommand: probe
    std::string url;
    int timeout_ms = 1500;
    auto cmd_probe = app.add_subcommand("probe", "Probe one URL for a robot");
    cmd_probe->add_option("--url", url, "Robot base URL")->required();
    cmd_probe->add_option("--timeout", timeout_ms, "Probe timeout in ms");

    CLI11_PARSE(app, argc, argv);

    set_log_to_stderr(false);
    CurlHttpClient http;
    DiscoveryEngine engine(http);

    if (*cmd_list) {
        if (detect) in.host_ip = primary_ipv4().value_or("");
        if (!status_ip.empty()) in.known_status_ip = status_ip;

        const auto urls = engine.candidates(in);
        std::cout << "Host IP:     " << (in.host_ip.empty() ? "(none)" : in.host_ip) << "\n"
                  << "Candidates:  " << urls.size() << "\n";
        for (size_t i = 0; i < urls.size(); ++i) {
            if (limit && i >= limit) break;
            std::cout << "  " << (i + 1) << ". " << urls[i] << "\n";
        }
    } else if (*cmd_probe) {
        const ProbeOutcome outcome = engine.probe_outcome(url, timeout_ms);
        std::cout << "URL:         " << url << "\n"
                  << "Outcome:     " << to_string(outcome) << "\n";
        return outcome == ProbeOutcome::Ok ? 0 : 1;
    }

    return 0;
}

//
// Created by opencode on 06/03/2026.
//

#include "runctl/readiness_probe.hpp"
#include "runctl/errors.hpp"
#include <thread>
#include <cpr/cpr.h>
#include <sockpp/tcp_connector.h>
#include <sockpp/inet_address.h>

namespace runctl {

    ReadinessProbe::ReadinessProbe(std::string tcp_endpoint, std::string http_url)
        : http_url_(std::move(http_url)) {
        if (!tcp_endpoint.empty()) {
            auto [host, port] = parse_endpoint(tcp_endpoint);
            tcp_host_ = host;
            tcp_port_ = port;
        }
    }

    bool ReadinessProbe::is_configured() const {
        return tcp_port_ > 0 || !http_url_.empty();
    }

    bool ReadinessProbe::check() {
        if (tcp_port_ > 0 && !check_tcp()) {
            return false;
        }
        if (!http_url_.empty() && !check_http()) {
            return false;
        }
        last_error_.clear();
        return true;
    }

    ProbeResult ReadinessProbe::wait_until_ready(std::chrono::milliseconds timeout,
                                                 const std::function<bool()>& still_alive) {
        auto start = std::chrono::steady_clock::now();

        while (true) {
            if (still_alive && !still_alive()) {
                last_error_ = "Process exited before becoming ready";
                return ProbeResult::PROCESS_EXITED;
            }

            if (check()) {
                return ProbeResult::READY;
            }

            if (std::chrono::steady_clock::now() - start >= timeout) {
                last_error_ = "Timeout waiting for readiness (" + last_error_ + ")";
                return ProbeResult::TIMED_OUT;
            }

            // Wait a bit before trying again
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    std::string ReadinessProbe::describe() const {
        std::string description;
        if (tcp_port_ > 0) {
            description = "tcp " + tcp_host_ + ":" + std::to_string(tcp_port_);
        }
        if (!http_url_.empty()) {
            if (!description.empty()) {
                description += ", ";
            }
            description += "http " + http_url_;
        }
        return description;
    }

    std::pair<std::string, int> ReadinessProbe::parse_endpoint(const std::string& endpoint) {
        std::string host = "127.0.0.1";
        std::string port_str = endpoint;

        size_t colon = endpoint.rfind(':');
        if (colon != std::string::npos) {
            if (colon > 0) {
                host = endpoint.substr(0, colon);
            }
            port_str = endpoint.substr(colon + 1);
        }

        int port = 0;
        try {
            size_t consumed = 0;
            port = std::stoi(port_str, &consumed);
            if (consumed != port_str.length()) {
                port = 0;
            }
        } catch (const std::exception&) {
            port = 0;
        }

        if (port <= 0 || port > 65535) {
            throw SupervisorError(ErrorKind::CONFIG_ERROR,
                "Invalid TCP probe endpoint: " + endpoint + " (expected host:port)");
        }

        return {host, port};
    }

    bool ReadinessProbe::check_tcp() {
        try {
            sockpp::tcp_connector conn;
            sockpp::inet_address addr(tcp_host_, static_cast<in_port_t>(tcp_port_));

            // Try to connect with short timeout
            if (!conn.connect(addr, std::chrono::milliseconds(1000))) {
                last_error_ = "tcp " + tcp_host_ + ":" + std::to_string(tcp_port_) +
                              " refused connection";
                return false;
            }

            conn.close();
            return true;

        } catch (const std::exception& e) {
            last_error_ = std::string("tcp probe: ") + e.what();
            return false;
        }
    }

    bool ReadinessProbe::check_http() {
        cpr::Response response = cpr::Get(cpr::Url{http_url_},
                                          cpr::Timeout{2000},
                                          cpr::Redirect(false));

        if (response.error) {
            last_error_ = "http " + http_url_ + ": " + response.error.message;
            return false;
        }

        if (response.status_code < 200 || response.status_code >= 400) {
            last_error_ = "http " + http_url_ + " returned status " +
                          std::to_string(response.status_code);
            return false;
        }

        return true;
    }

} // namespace runctl

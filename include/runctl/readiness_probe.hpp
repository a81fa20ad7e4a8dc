/**
 * @file readiness_probe.hpp
 * @brief Optional check that a freshly started target is serving
 *
 * Two probe kinds are supported:
 * - TCP:  connect to host:port (sockpp), 1s connect timeout
 * - HTTP: GET a URL (cpr), any 2xx/3xx status passes
 *
 * When both are configured both must pass.
 */

#pragma once

#include <string>
#include <chrono>
#include <functional>
#include <utility>

namespace runctl {

    /**
     * @brief Outcome of waiting for readiness
     */
    enum class ProbeResult {
        READY,            ///< Probe passed
        TIMED_OUT,        ///< Probe kept failing until the deadline
        PROCESS_EXITED    ///< Target died while waiting
    };

    /**
     * @brief Readiness probe for the supervised target
     *
     * Usage:
     *   ReadinessProbe probe("127.0.0.1:5000", "");
     *   auto result = probe.wait_until_ready(std::chrono::seconds(10),
     *                                        [&] { return target.is_alive(); });
     */
    class ReadinessProbe {
    public:
        /**
         * @brief Construct probe
         *
         * @param tcp_endpoint "host:port", or empty to skip the TCP probe
         * @param http_url URL to GET, or empty to skip the HTTP probe
         * @throws SupervisorError CONFIG_ERROR if tcp_endpoint is malformed
         */
        ReadinessProbe(std::string tcp_endpoint, std::string http_url);

        /**
         * @brief Whether any probe kind is configured
         */
        [[nodiscard]] bool is_configured() const;

        /**
         * @brief Runs every configured probe once
         *
         * @return true if all configured probes pass (or none is configured)
         */
        bool check();

        /**
         * @brief Polls check() every 100ms until it passes or timeout expires
         *
         * @param timeout Maximum time to wait
         * @param still_alive Called between attempts; returning false ends
         *        the wait with PROCESS_EXITED
         */
        ProbeResult wait_until_ready(std::chrono::milliseconds timeout,
                                     const std::function<bool()>& still_alive);

        /**
         * @brief Human readable list of configured probes
         *
         * @return std::string e.g. "tcp 127.0.0.1:5000, http http://127.0.0.1:5000/signals"
         */
        [[nodiscard]] std::string describe() const;

        [[nodiscard]] std::string get_last_error() const { return last_error_; }

        /**
         * @brief Splits "host:port"
         *
         * A bare ":port" or "port" means 127.0.0.1.
         *
         * @throws SupervisorError CONFIG_ERROR on a missing or invalid port
         */
        static std::pair<std::string, int> parse_endpoint(const std::string& endpoint);

    private:
        bool check_tcp();
        bool check_http();

        std::string tcp_host_;
        int tcp_port_ = 0;
        std::string http_url_;
        std::string last_error_;
    };

} // namespace runctl

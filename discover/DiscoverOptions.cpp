/**
 * \file discover/DiscoverOptions.cpp
 * \brief Implementation of discover tool CLI and configuration option helpers.
 */

#include "DiscoverOptions.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <atomic>
#include <mutex>
#include <string>
#include <type_traits>

namespace speedwire_opts { namespace discover_opts {

namespace {
    std::mutex g_mtx;
    /// Bound directly to CLI11; seeded from JSON by the providers.
    DiscoverOptions g_options;
    std::atomic<bool> g_registered{false};

    template <typename T>
    void read_json(const nlohmann::json& section, const char* key, T& out) {
        if (!section.contains(key)) return;
        const auto& v = section[key];
        if constexpr (std::is_same_v<T, bool>) {
            if (v.is_boolean()) out = v.get<bool>();
        } else if constexpr (std::is_integral_v<T>) {
            if (v.is_number_integer()) out = v.get<T>();
        } else {
            if (v.is_string()) out = v.get<T>();
        }
    }
}

DiscoverOptions get() {
    std::lock_guard<std::mutex> lk(g_mtx);
    return g_options;
}

void register_options() {
    bool expected = false;
    if (!g_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }

    // "discover" section: what to look for and how loudly
    Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::lock_guard<std::mutex> lk(g_mtx);
        DiscoverOptions defaults;
        if (j.contains("discover") && j["discover"].is_object()) {
            const auto& d = j["discover"];
            read_json(d, "interface", defaults.interface_name);
            read_json(d, "password", defaults.password);
            read_json(d, "timeout_ms", defaults.timeout_ms);
            read_json(d, "verbose_packets", defaults.verbose_packets);
            read_json(d, "log_level", defaults.log_level);
        }
        g_options.interface_name = defaults.interface_name;
        g_options.password = defaults.password;
        g_options.timeout_ms = defaults.timeout_ms;
        g_options.verbose_packets = defaults.verbose_packets;
        g_options.log_level = defaults.log_level;

        app.add_option("-i,--interface", g_options.interface_name, "Network interface to listen on (default: any)")
            ->group("Discover");
        app.add_option("-p,--password", g_options.password, "User password for device login")
            ->group("Discover");
        app.add_option("-t,--timeout-ms", g_options.timeout_ms, "Discovery window in milliseconds")
            ->check(CLI::Range(100, 600000))
            ->group("Discover");
        app.add_flag("--verbose-packets", g_options.verbose_packets, "Trace dropped packets and read errors")
            ->group("Discover");
        app.add_option("--log-level", g_options.log_level, "Log level: debug|info|warning|error|critical")
            ->check(CLI::IsMember({"debug", "info", "warning", "error", "critical"}))
            ->group("Discover");
    });

    // "connection" section: multicast group parameters
    Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::lock_guard<std::mutex> lk(g_mtx);
        DiscoverOptions defaults;
        if (j.contains("connection") && j["connection"].is_object()) {
            const auto& c = j["connection"];
            read_json(c, "group", defaults.group);
            read_json(c, "port", defaults.port);
        }
        g_options.group = defaults.group;
        g_options.port = defaults.port;

        app.add_option("--group", g_options.group, "Multicast group address")
            ->group("Connection");
        app.add_option("--port", g_options.port, "Multicast UDP port")
            ->check(CLI::Range(1, 65535))
            ->group("Connection");
    });
}

} } // namespace speedwire_opts::discover_opts

namespace {
    struct DiscoverOptsAutoReg {
        DiscoverOptsAutoReg() { speedwire_opts::discover_opts::register_options(); }
    } discover_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}

/**
 * \file discover/DiscoverOptions.hpp
 * \brief Option types and accessors for the discover tool.
 */
#pragma once

#include <string>

/** \brief Aggregated discover tool configuration (JSON defaults overridden by CLI flags). */
struct DiscoverOptions {
    std::string interface_name;          ///< Listen interface; empty selects the default route.
    std::string password{"0000"};        ///< User password sent in the login request.
    int timeout_ms{3000};                ///< Discovery window.
    bool verbose_packets{false};         ///< Detailed packet tracing.
    std::string log_level{"info"};       ///< Minimum level printed to stdout.
    std::string group{"239.12.255.254"}; ///< Multicast group.
    int port{9522};                      ///< Multicast and device port.
};

/** \brief Helper API for the discover tool's CLI and config options. */
namespace speedwire_opts { namespace discover_opts {
    /** \brief Values after the last successful \c Options::load_and_parse. */
    DiscoverOptions get();
    /** \brief Register the "discover" and "connection" providers (idempotent). */
    void register_options();
} }

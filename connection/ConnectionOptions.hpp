/**
 * \file ConnectionOptions.hpp
 * \brief Construction-time settings shared by the registry and its connections.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "logger.hpp"

namespace speedwire {

class IDeviceVerifier;

/** \brief Settings for \ref ConnectionRegistry and \ref Connection. */
struct ConnectionOptions {
    static constexpr const char* kDefaultGroup = "239.12.255.254";
    static constexpr std::uint16_t kDefaultPort = 9522;

    std::string group_address{kDefaultGroup}; ///< Speedwire multicast group.
    std::uint16_t port{kDefaultPort};         ///< UDP port of the group and of unicast device traffic.
    int receive_buffer_size{2048};            ///< SO_RCVBUF of the multicast socket.
    std::size_t datagram_buffer_size{2048};   ///< Largest datagram the receive loop reads.

    std::size_t receiver_channel_capacity{10};
    std::size_t watcher_channel_capacity{10};

    std::chrono::milliseconds discovery_interval{500};
    std::chrono::milliseconds simple_discovery_timeout{3000};
    std::size_t results_capacity{10};

    /// Sink for all diagnostics; null discards everything.
    std::shared_ptr<Logger> logger;
    /// Log every read error and every dropped notification.
    bool detailed_packet_logging{false};
    /// Turns a responding IP into a Device; null selects SpeedwireDeviceVerifier.
    std::shared_ptr<IDeviceVerifier> verifier;
};

} // namespace speedwire

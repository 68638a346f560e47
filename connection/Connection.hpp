/**
 * \file Connection.hpp
 * \brief Multicast connection: receive loop, packet fan-out and discovery entry points.
 * \ingroup connection_module
 * \details A Connection exclusively owns one \ref transport::IDatagramSocket.
 *  A background thread reads datagrams, decodes them and fans them out to
 *  two independent subscriber registries:
 *  - receivers, keyed by the source IP of the datagram;
 *  - discovery watchers, notified with the source IP of every decoded datagram.
 *
 *  Delivery never blocks the receive loop: channels are bounded and a full
 *  channel loses the packet (drop-newest).
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "BoundedQueue.hpp"
#include "Deadline.hpp"
#include "logger.hpp"
#include "connection/ConnectionOptions.hpp"
#include "device/Device.hpp"
#include "proto/Packet.hpp"
#include "transport/socket/IDatagramSocket.hpp"

namespace speedwire {

class IDeviceVerifier;

/**
 * \defgroup connection_module Connection
 * \brief Shared multicast socket, subscriber registries and discovery.
 */

/** \brief One open multicast socket and its subscribers.
 *  \ingroup connection_module
 */
class Connection {
public:
    using PacketPtr = std::shared_ptr<const proto::Packet>;
    using PacketChannel = std::shared_ptr<BoundedQueue<PacketPtr>>;
    using DiscoveryChannel = std::shared_ptr<BoundedQueue<std::string>>;
    using DeviceChannel = std::shared_ptr<BoundedQueue<std::shared_ptr<Device>>>;

    /**
     * \brief Take ownership of \p socket; the receive loop starts with \ref start.
     * \param group Multicast group datagrams such as discovery requests are sent to.
     */
    Connection(std::shared_ptr<transport::IDatagramSocket> socket, transport::Endpoint group,
               ConnectionOptions options);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // === Lifecycle ===
    /** \brief Launch the receive thread. Calling it twice has no effect. */
    void start();

    /** \brief Stop the receive loop and close the socket.
     *  \details Requests shutdown on the socket (unblocking a pending read),
     *  joins the receive thread, then closes the socket. Idempotent.
     */
    void close();

    bool is_open() const { return !closed_.load(); }
    const transport::Endpoint& group() const { return group_; }
    const ConnectionOptions& options() const { return options_; }
    const std::shared_ptr<Logger>& logger() const { return logger_; }

    // === Outbound ===
    /**
     * \brief Serialize \p packet and send it to \p destination.
     * \throws SendError if the socket reports an error.
     */
    void send_packet(const transport::Endpoint& destination, const proto::Packet& packet);

    // === Subscriptions ===
    /** \brief Channel sized with the configured receiver capacity. */
    PacketChannel make_receiver_channel() const;
    /** \brief Channel sized with the configured watcher capacity. */
    DiscoveryChannel make_discovery_channel() const;

    void register_receiver(const std::string& ip, PacketChannel channel);
    /** \brief Remove \p channel from the receivers of \p ip; unknown pairs are ignored. */
    void unregister_receiver(const std::string& ip, const PacketChannel& channel);

    void register_discoverer(DiscoveryChannel channel);
    /** \brief Remove \p channel from the discovery watchers; unknown channels are ignored. */
    void unregister_discoverer(const DiscoveryChannel& channel);

    std::size_t receiver_count(const std::string& ip) const;
    std::size_t discoverer_count() const;

    // === Discovery ===
    /**
     * \brief Broadcast discovery requests until \p deadline fires and publish every verified device.
     * \details Only one discovery runs per connection at a time; a second caller
     *  blocks until the first returns. Devices are deduplicated by source IP and
     *  pushed to \p results in verification completion order. \p results is not
     *  closed on return.
     */
    void discover_devices(Deadline& deadline, const DeviceChannel& results, const std::string& password);

    /** \brief Run \ref discover_devices for the configured window and collect the results. */
    std::vector<std::shared_ptr<Device>> discover_devices_simple(const std::string& password);

    /**
     * \brief Verify the device at \p ip with the configured verifier.
     * \throws DeviceError on failure.
     */
    std::shared_ptr<Device> open_device(const std::string& ip, const std::string& password);

    // === Tracing ===
    void set_detailed_packet_logging(bool enabled) { detailed_packet_logging_.store(enabled); }
    bool detailed_packet_logging() const { return detailed_packet_logging_.load(); }

private:
    void receive_loop();
    void handle_discovered(const std::string& ip);
    void handle_packet(const std::string& ip, const PacketPtr& packet);

    std::shared_ptr<transport::IDatagramSocket> socket_;
    transport::Endpoint group_;
    ConnectionOptions options_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<IDeviceVerifier> verifier_;
    std::atomic<bool> detailed_packet_logging_{false};

    std::thread receive_thread_;
    std::mutex lifecycle_mtx_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> closed_{false};

    mutable std::shared_mutex receivers_mtx_;
    std::unordered_map<std::string, std::vector<PacketChannel>> receivers_;

    mutable std::shared_mutex discoverers_mtx_;
    std::vector<DiscoveryChannel> discoverers_;

    // Serializes discovery sessions; distinct from the registry locks
    std::mutex discovery_session_mtx_;
};

} // namespace speedwire

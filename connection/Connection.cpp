/**
 * \file Connection.cpp
 * \brief Receive loop, subscriber fan-out and discovery entry points.
 * \ingroup connection_module
 */
#include "Connection.hpp"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "device/IDeviceVerifier.hpp"
#include "device/SpeedwireDeviceVerifier.hpp"
#include "discovery/DiscoverySession.hpp"
#include "transport/Errors.hpp"

namespace speedwire {

Connection::Connection(std::shared_ptr<transport::IDatagramSocket> socket, transport::Endpoint group,
                       ConnectionOptions options)
    : socket_(std::move(socket)),
      group_(std::move(group)),
      options_(std::move(options)),
      logger_(or_null_logger(options_.logger)),
      verifier_(options_.verifier),
      detailed_packet_logging_(options_.detailed_packet_logging) {
    if (!socket_) {
        throw std::invalid_argument("Connection requires a socket");
    }
    if (!verifier_) {
        verifier_ = std::make_shared<SpeedwireDeviceVerifier>();
    }
}

Connection::~Connection() {
    close();
}

void Connection::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mtx_);
    if (closed_.load()) {
        throw std::logic_error("Connection::start after close");
    }
    if (started_.exchange(true)) {
        return;
    }
    receive_thread_ = std::thread(&Connection::receive_loop, this);
    logger_->debug("listening on " + group_.to_string() + " (" + socket_->socket_type() + " " +
                   socket_->local_endpoint() + ")");
}

void Connection::close() {
    std::lock_guard<std::mutex> lock(lifecycle_mtx_);
    if (closed_.exchange(true)) {
        return;
    }
    stop_requested_.store(true);
    socket_->shutdown();
    if (receive_thread_.joinable()) {
        receive_thread_.join();
    }
    socket_->close();
    logger_->debug("closed connection " + group_.to_string());
}

void Connection::receive_loop() {
    std::vector<std::uint8_t> buffer(options_.datagram_buffer_size);

    while (!stop_requested_.load()) {
        size_t bytes_read = 0;
        transport::Endpoint source;
        std::error_code ec;
        socket_->receive_from(buffer.data(), buffer.size(), bytes_read, source, ec);
        if (ec) {
            if (stop_requested_.load() || !socket_->is_open()) {
                break;
            }
            // failed to read from udp -> retry
            if (detailed_packet_logging()) {
                logger_->debug("UDP read failed: " + ec.message());
            }
            continue;
        }

        auto packet = std::make_shared<proto::Packet>();
        if (auto err = packet->read(std::span<const std::uint8_t>(buffer.data(), bytes_read))) {
            logger_->warning("recv " + source.ip + " invalid: " + err.message());
            continue;
        }
        logger_->debug("recv " + source.ip + ": [" + packet->to_string() + "]");

        handle_discovered(source.ip);
        handle_packet(source.ip, packet);
    }
}

void Connection::handle_packet(const std::string& ip, const PacketPtr& packet) {
    std::shared_lock<std::shared_mutex> lock(receivers_mtx_);
    auto it = receivers_.find(ip);
    if (it == receivers_.end()) {
        return;
    }
    for (const auto& channel : it->second) {
        if (!channel->try_push(packet) && detailed_packet_logging()) {
            logger_->debug("receiver channel busy -> drop packet from " + ip + ": [" + packet->to_string() + "]");
        }
    }
}

void Connection::handle_discovered(const std::string& ip) {
    std::shared_lock<std::shared_mutex> lock(discoverers_mtx_);
    for (const auto& channel : discoverers_) {
        if (!channel->try_push(ip) && detailed_packet_logging()) {
            logger_->debug("discover channel busy -> skip notify for " + ip);
        }
    }
}

void Connection::send_packet(const transport::Endpoint& destination, const proto::Packet& packet) {
    logger_->debug("send " + destination.ip + ": [" + packet.to_string() + "]");

    const auto bytes = packet.bytes();
    size_t bytes_written = 0;
    std::error_code ec;
    socket_->send_to(bytes.data(), bytes.size(), destination, bytes_written, ec);
    if (ec) {
        logger_->warning("send " + destination.ip + " failed: " + ec.message());
        throw SendError(ec, "send " + destination.to_string());
    }
}

Connection::PacketChannel Connection::make_receiver_channel() const {
    return std::make_shared<BoundedQueue<PacketPtr>>(options_.receiver_channel_capacity);
}

Connection::DiscoveryChannel Connection::make_discovery_channel() const {
    return std::make_shared<BoundedQueue<std::string>>(options_.watcher_channel_capacity);
}

void Connection::register_receiver(const std::string& ip, PacketChannel channel) {
    std::unique_lock<std::shared_mutex> lock(receivers_mtx_);
    receivers_[ip].push_back(std::move(channel));
}

void Connection::unregister_receiver(const std::string& ip, const PacketChannel& channel) {
    std::unique_lock<std::shared_mutex> lock(receivers_mtx_);
    auto it = receivers_.find(ip);
    if (it == receivers_.end()) {
        return; // IP not registered -> nothing to remove
    }
    std::erase(it->second, channel);
}

void Connection::register_discoverer(DiscoveryChannel channel) {
    std::unique_lock<std::shared_mutex> lock(discoverers_mtx_);
    discoverers_.push_back(std::move(channel));
}

void Connection::unregister_discoverer(const DiscoveryChannel& channel) {
    std::unique_lock<std::shared_mutex> lock(discoverers_mtx_);
    std::erase(discoverers_, channel);
}

std::size_t Connection::receiver_count(const std::string& ip) const {
    std::shared_lock<std::shared_mutex> lock(receivers_mtx_);
    auto it = receivers_.find(ip);
    return it == receivers_.end() ? 0 : it->second.size();
}

std::size_t Connection::discoverer_count() const {
    std::shared_lock<std::shared_mutex> lock(discoverers_mtx_);
    return discoverers_.size();
}

void Connection::discover_devices(Deadline& deadline, const DeviceChannel& results, const std::string& password) {
    std::lock_guard<std::mutex> session_lock(discovery_session_mtx_);

    DiscoverySession session(*this, *verifier_, deadline, results, password);
    session.run();
}

std::vector<std::shared_ptr<Device>> Connection::discover_devices_simple(const std::string& password) {
    auto results = std::make_shared<BoundedQueue<std::shared_ptr<Device>>>(options_.results_capacity);

    std::vector<std::shared_ptr<Device>> devices;
    std::thread consumer([&devices, results]() {
        while (auto device = results->pop()) {
            devices.push_back(std::move(*device));
        }
    });

    try {
        Deadline deadline(options_.simple_discovery_timeout);
        discover_devices(deadline, results, password);
    } catch (...) {
        results->close();
        consumer.join();
        throw;
    }

    results->close();
    consumer.join();
    return devices;
}

std::shared_ptr<Device> Connection::open_device(const std::string& ip, const std::string& password) {
    return verifier_->verify(*this, ip, password);
}

} // namespace speedwire

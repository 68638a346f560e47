/**
 * \file DiscoverySession.cpp
 * \brief Sender, collector and verification roles of a discovery run.
 * \ingroup connection_module
 */
#include "DiscoverySession.hpp"

#include <exception>
#include <system_error>

#include "device/IDeviceVerifier.hpp"
#include "proto/Packet.hpp"
#include "transport/Errors.hpp"

namespace speedwire {

DiscoverySession::DiscoverySession(Connection& connection, IDeviceVerifier& verifier, Deadline& deadline,
                                   Connection::DeviceChannel results, std::string password)
    : connection_(connection),
      verifier_(verifier),
      deadline_(deadline),
      results_(std::move(results)),
      password_(std::move(password)),
      logger_(or_null_logger(connection.logger())) {}

void DiscoverySession::run() {
    auto watcher = connection_.make_discovery_channel();
    connection_.register_discoverer(watcher);

    std::thread collector(&DiscoverySession::collect, this, watcher);

    // Stops notifications, then lets the collector drain and join its verifications
    auto finish = [&]() {
        connection_.unregister_discoverer(watcher);
        watcher->close();
        collector.join();
    };

    try {
        while (!deadline_.wait_for(connection_.options().discovery_interval)) {
            send_discovery_request();
        }
    } catch (...) {
        finish();
        throw;
    }
    finish();

    std::lock_guard<std::mutex> lock(known_mtx_);
    logger_->debug("discover - session done, " + std::to_string(known_.size()) + " ip(s) seen");
}

void DiscoverySession::send_discovery_request() {
    logger_->debug("send discover package");
    try {
        connection_.send_packet(connection_.group(), proto::Packet::discovery_request());
    } catch (const SendError& e) {
        logger_->warning(std::string("discover - failed to send request: ") + e.what());
    }
}

void DiscoverySession::collect(const Connection::DiscoveryChannel& watcher) {
    while (auto ip = watcher->pop()) {
        if (deadline_.expired()) {
            break;
        }
        {
            std::lock_guard<std::mutex> lock(known_mtx_);
            // reserve the IP so later notifications do not start a second verification
            if (!known_.emplace(*ip, nullptr).second) {
                continue;
            }
        }
        try {
            verifications_.emplace_back(&DiscoverySession::verify, this, *ip);
        } catch (const std::system_error& e) {
            logger_->error("discover - cannot start verification for " + *ip + ": " + e.what());
            std::lock_guard<std::mutex> lock(known_mtx_);
            known_.erase(*ip);
        }
    }

    for (auto& verification : verifications_) {
        verification.join();
    }
}

void DiscoverySession::verify(const std::string& ip) {
    std::shared_ptr<Device> device;
    try {
        device = verifier_.verify(connection_, ip, password_);
    } catch (const std::exception& e) {
        logger_->info("discover - skip ip " + ip + ": " + e.what());
        return;
    }
    if (!device) {
        logger_->info("discover - skip ip " + ip + ": no device");
        return;
    }

    logger_->info("found device " + std::to_string(device->serial()) + " at " + ip);
    {
        std::lock_guard<std::mutex> lock(known_mtx_);
        known_[ip] = device;
    }
    if (!results_->push(device)) {
        logger_->debug("discover - results closed, dropping device at " + ip);
    }
}

} // namespace speedwire

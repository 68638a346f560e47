/**
 * \file DiscoverySession.hpp
 * \brief One deadline-bounded run of the discovery protocol.
 * \ingroup connection_module
 * \details The session is a small task group sharing one \ref Deadline:
 *  - the sender role runs on the calling thread and broadcasts a discovery
 *    request every interval until the deadline fires;
 *  - a collector thread consumes "traffic seen from IP" notifications and
 *    starts one verification thread per IP it has not seen before;
 *  - verification threads are never cancelled; the collector joins all of
 *    them before \ref run returns.
 *
 *  Deduplication is by source IP only. An IP whose verification failed stays
 *  known for the rest of the session and is not verified again.
 */
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "Deadline.hpp"
#include "connection/Connection.hpp"
#include "device/Device.hpp"

namespace speedwire {

class IDeviceVerifier;

/** \brief State of a single discovery run; lives only inside one discover call. */
class DiscoverySession {
public:
    DiscoverySession(Connection& connection, IDeviceVerifier& verifier, Deadline& deadline,
                     Connection::DeviceChannel results, std::string password);

    DiscoverySession(const DiscoverySession&) = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;

    /** \brief Run until the deadline fires and every started verification finished. */
    void run();

private:
    void collect(const Connection::DiscoveryChannel& watcher);
    void verify(const std::string& ip);
    void send_discovery_request();

    Connection& connection_;
    IDeviceVerifier& verifier_;
    Deadline& deadline_;
    Connection::DeviceChannel results_;
    std::string password_;
    std::shared_ptr<Logger> logger_;

    // IP -> device; nullptr while verifying or after a failed verification
    mutable std::mutex known_mtx_;
    std::map<std::string, std::shared_ptr<Device>> known_;

    // Only touched by the collector thread
    std::vector<std::thread> verifications_;
};

} // namespace speedwire

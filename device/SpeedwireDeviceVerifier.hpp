/**
 * \file SpeedwireDeviceVerifier.hpp
 * \brief Verifies a device by logging in with the user password.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "IDeviceVerifier.hpp"
#include "proto/Data2Command.hpp"

namespace speedwire {

/** \brief Default \ref IDeviceVerifier: a user login request answered by the device.
 *  \details Listens for the reply on a receiver channel registered for the IP,
 *  so the connection's receive loop must be running.
 */
class SpeedwireDeviceVerifier : public IDeviceVerifier {
public:
    explicit SpeedwireDeviceVerifier(std::chrono::milliseconds reply_timeout = std::chrono::milliseconds(1000),
                                     proto::ClientIdentity identity = {});

    std::shared_ptr<Device> verify(Connection& connection, const std::string& ip,
                                   const std::string& password) override;

private:
    std::uint16_t next_sequence();

    std::chrono::milliseconds reply_timeout_;
    proto::ClientIdentity identity_;
    std::atomic<std::uint16_t> sequence_{1};
};

} // namespace speedwire

/**
 * \file IDeviceVerifier.hpp
 * \brief Seam between discovery and device construction.
 */
#pragma once

#include <memory>
#include <string>

#include "Device.hpp"

namespace speedwire {

class Connection;

/** \brief Builds a \ref Device from an IP that produced traffic. */
class IDeviceVerifier {
public:
    virtual ~IDeviceVerifier() = default;

    /**
     * \brief Verify the device at \p ip using \p password.
     * \details Called concurrently from several threads, one per IP.
     * \throws DeviceError if the device does not answer or rejects the password.
     */
    virtual std::shared_ptr<Device> verify(Connection& connection, const std::string& ip,
                                           const std::string& password) = 0;
};

} // namespace speedwire

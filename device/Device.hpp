/**
 * \file Device.hpp
 * \brief A verified device reachable at a source IP.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace speedwire {

/** \brief Device that answered a login at \ref ip. */
class Device {
public:
    Device(std::string ip, std::uint16_t susy_id, std::uint32_t serial)
        : ip_(std::move(ip)), susy_id_(susy_id), serial_(serial) {}

    const std::string& ip() const { return ip_; }
    std::uint16_t susy_id() const { return susy_id_; }
    std::uint32_t serial() const { return serial_; }

    /** \brief "serial <n> (susy <id>) at <ip>". */
    std::string to_string() const;

private:
    std::string ip_;
    std::uint16_t susy_id_;
    std::uint32_t serial_;
};

/** \brief Device could not be verified (no answer, wrong password, bad reply). */
class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace speedwire

/**
 * \file transport/Errors.hpp
 * \brief Exception types surfaced to callers of the connection API.
 * \ingroup socket_backend
 */
#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace speedwire {

/** \brief Multicast group or interface name could not be resolved. */
class ResolutionError : public std::runtime_error {
public:
    explicit ResolutionError(const std::string& what) : std::runtime_error(what) {}
};

/** \brief Socket could not be opened or configured. */
class SocketError : public std::system_error {
public:
    SocketError(std::error_code ec, const std::string& what) : std::system_error(ec, what) {}
};

/** \brief Outbound datagram could not be written. */
class SendError : public std::system_error {
public:
    SendError(std::error_code ec, const std::string& what) : std::system_error(ec, what) {}
};

} // namespace speedwire

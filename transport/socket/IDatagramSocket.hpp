/**
 * \file IDatagramSocket.hpp
 * \brief Blocking datagram socket interface used by a connection.
 * \ingroup socket_backend
 * \details Both operations report failures through a \c std::error_code out
 *  parameter and never throw. \ref shutdown must unblock a thread waiting in
 *  \ref receive_from so the owner can stop its receive loop.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

/** \defgroup socket_backend Socket Backend
 *  \brief Datagram socket interface, its factory and the POSIX multicast backend.
 */

namespace speedwire::transport {

/** \brief IPv4 address and UDP port. */
struct Endpoint {
    std::string ip;
    std::uint16_t port{0};

    std::string to_string() const { return ip + ":" + std::to_string(port); }
    bool operator==(const Endpoint&) const = default;
};

/** \brief Datagram socket role interface.
 *  \ingroup socket_backend
 */
struct IDatagramSocket {
    virtual ~IDatagramSocket() = default;

    /** \brief Blocking read of one datagram; fills \p bytes_read and \p source, sets \p error on failure. */
    virtual void receive_from(void* buffer, size_t size, size_t& bytes_read, Endpoint& source, std::error_code& error) = 0;
    /** \brief Write one datagram to \p destination; sets \p error on failure. */
    virtual void send_to(const void* buffer, size_t size, const Endpoint& destination, size_t& bytes_written,
                         std::error_code& error) = 0;

    /** \brief Close the underlying transport; subsequent operations fail with bad_file_descriptor. */
    virtual void close() = 0;
    /** \brief Request shutdown - interrupts a blocked \ref receive_from. */
    virtual void shutdown() {}
    /** \brief True if underlying transport is currently open. */
    virtual bool is_open() const = 0;
    /** \brief Native handle (or -1 if not applicable). */
    virtual int get_handle() const = 0;
    /** \brief Local endpoint string representation. */
    virtual std::string local_endpoint() const = 0;
    /** \brief Transport/backend type identifier (e.g. "udp_multicast"). */
    virtual std::string socket_type() const = 0;
};

} // namespace speedwire::transport

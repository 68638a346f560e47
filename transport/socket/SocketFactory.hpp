/**
 * \file SocketFactory.hpp
 * \brief Resolution of multicast parameters and construction of multicast sockets.
 * \ingroup socket_backend
 * \details Centralizes name resolution and backend construction so the
 *  connection registry only deals with resolved \ref MulticastGroup values.
 * \see IDatagramSocket \see MulticastSocket
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "logger.hpp"

namespace speedwire::transport {

struct IDatagramSocket;

/** \brief Fully resolved parameters for opening a multicast listening socket. */
struct MulticastGroup {
    std::string address;             ///< Dotted IPv4 multicast group.
    std::uint16_t port{0};           ///< UDP port shared by group and devices.
    std::string interface_name;      ///< Requested interface; empty means default.
    unsigned int interface_index{0}; ///< Kernel index of \ref interface_name (0 = default).
    int receive_buffer_size{2048};   ///< SO_RCVBUF applied after opening.
};

/** \brief Static factory for resolving and opening multicast sockets.
 *  \ingroup socket_backend
 */
class SocketFactory {
public:
    /** \brief Signature of a socket opener; the registry accepts replacements for testing. */
    using Opener = std::function<std::shared_ptr<IDatagramSocket>(const MulticastGroup&, std::shared_ptr<Logger>)>;

    /**
     * \brief Resolve group address and interface name.
     * \param address Multicast group, numeric or host name.
     * \param port UDP port.
     * \param interface_name Interface to listen on; empty selects the default.
     * \throws ResolutionError if the group is not an IPv4 multicast address or the interface is unknown.
     */
    static MulticastGroup resolve(const std::string& address, std::uint16_t port, const std::string& interface_name);

    /**
     * \brief Open and configure a multicast socket for \p group.
     * \throws SocketError if the socket cannot be opened or configured.
     */
    static std::shared_ptr<IDatagramSocket> create_multicast(const MulticastGroup& group, std::shared_ptr<Logger> logger);

    /** \brief Default opener forwarding to \ref create_multicast. */
    static Opener default_opener();

private:
    // Static-only: prevent instantiation
    SocketFactory() = delete;
};

} // namespace speedwire::transport

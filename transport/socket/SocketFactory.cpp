/**
 * \file SocketFactory.cpp
 * \brief Group/interface resolution and multicast socket construction.
 * \ingroup socket_backend
 */
#include "SocketFactory.hpp"
#include "IDatagramSocket.hpp"
#include "posix/MulticastSocket.hpp"
#include "transport/Errors.hpp"

#include <arpa/inet.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace speedwire::transport {

namespace {

/** \brief Resolve \p address to an IPv4 address; numeric strings skip DNS. */
in_addr resolve_ipv4(const std::string& address) {
    in_addr result{};
    if (inet_pton(AF_INET, address.c_str(), &result) == 1) {
        return result;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* info = nullptr;
    int rc = getaddrinfo(address.c_str(), nullptr, &hints, &info);
    if (rc != 0 || info == nullptr) {
        throw ResolutionError("cannot resolve multicast address '" + address + "': " + gai_strerror(rc));
    }
    result = reinterpret_cast<sockaddr_in*>(info->ai_addr)->sin_addr;
    freeaddrinfo(info);
    return result;
}

} // namespace

MulticastGroup SocketFactory::resolve(const std::string& address, std::uint16_t port, const std::string& interface_name) {
    if (address.empty()) {
        throw ResolutionError("multicast address must not be empty");
    }
    in_addr group = resolve_ipv4(address);
    if (!IN_MULTICAST(ntohl(group.s_addr))) {
        throw ResolutionError("not an IPv4 multicast address: " + address);
    }

    char text[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &group, text, sizeof(text));

    MulticastGroup resolved;
    resolved.address = text;
    resolved.port = port;
    resolved.interface_name = interface_name;

    // listen interface is optional
    if (!interface_name.empty()) {
        unsigned int index = if_nametoindex(interface_name.c_str());
        if (index == 0) {
            throw ResolutionError("unknown network interface: " + interface_name);
        }
        resolved.interface_index = index;
    }
    return resolved;
}

std::shared_ptr<IDatagramSocket> SocketFactory::create_multicast(const MulticastGroup& group, std::shared_ptr<Logger> logger) {
    return MulticastSocket::open(group, std::move(logger));
}

SocketFactory::Opener SocketFactory::default_opener() {
    return [](const MulticastGroup& group, std::shared_ptr<Logger> logger) {
        return create_multicast(group, std::move(logger));
    };
}

} // namespace speedwire::transport

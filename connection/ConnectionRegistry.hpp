/**
 * \file ConnectionRegistry.hpp
 * \brief Interface name to open \ref Connection map with reference counting.
 * \ingroup connection_module
 * \details Guarantees at most one multicast socket per network interface. The
 *  registry is an ordinary object; the owner decides its lifetime and tests
 *  build their own instance with a fake socket opener.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "connection/Connection.hpp"
#include "connection/ConnectionOptions.hpp"
#include "transport/socket/SocketFactory.hpp"

namespace speedwire {

/** \brief Shares one \ref Connection per interface name.
 *  \ingroup connection_module
 */
class ConnectionRegistry {
public:
    explicit ConnectionRegistry(ConnectionOptions options,
                                transport::SocketFactory::Opener opener = transport::SocketFactory::default_opener());
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * \brief Return the connection for \p interface_name, opening it on first use.
     * \param interface_name Network interface to listen on; empty selects the default.
     * \details Each call takes one reference; pair it with \ref release.
     *  The registry is only updated once the connection is fully started.
     * \throws ResolutionError if the group address or interface cannot be resolved.
     * \throws SocketError if the socket cannot be opened or configured.
     */
    std::shared_ptr<Connection> obtain(const std::string& interface_name);

    /** \brief Drop one reference; the last one closes the connection. Unknown names are ignored. */
    void release(const std::string& interface_name);

    /** \brief Close every connection regardless of outstanding references. */
    void close_all();

    bool contains(const std::string& interface_name) const;
    std::size_t size() const;
    /** \brief Outstanding references for \p interface_name (0 if not open). */
    int reference_count(const std::string& interface_name) const;

private:
    struct Entry {
        std::shared_ptr<Connection> connection;
        int references{0};
    };

    ConnectionOptions options_;
    transport::SocketFactory::Opener opener_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex mtx_;
    std::unordered_map<std::string, Entry> connections_;
};

} // namespace speedwire

/**
 * \file ConnectionRegistry.cpp
 * \brief Implementation of the per-interface connection registry.
 * \ingroup connection_module
 */
#include "ConnectionRegistry.hpp"

#include <system_error>

#include "transport/Errors.hpp"

namespace speedwire {

namespace {

std::string describe(const std::string& interface_name) {
    return interface_name.empty() ? std::string("<default>") : interface_name;
}

} // namespace

ConnectionRegistry::ConnectionRegistry(ConnectionOptions options, transport::SocketFactory::Opener opener)
    : options_(std::move(options)), opener_(std::move(opener)), logger_(or_null_logger(options_.logger)) {
    if (!opener_) {
        opener_ = transport::SocketFactory::default_opener();
    }
}

ConnectionRegistry::~ConnectionRegistry() {
    close_all();
}

std::shared_ptr<Connection> ConnectionRegistry::obtain(const std::string& interface_name) {
    std::scoped_lock lk(mtx_);

    // connection already known
    if (auto it = connections_.find(interface_name); it != connections_.end()) {
        ++it->second.references;
        return it->second.connection;
    }

    auto group = transport::SocketFactory::resolve(options_.group_address, options_.port, interface_name);
    group.receive_buffer_size = options_.receive_buffer_size;

    auto socket = opener_(group, logger_);
    if (!socket) {
        throw SocketError(std::make_error_code(std::errc::bad_file_descriptor),
                          "no socket for interface " + describe(interface_name));
    }

    auto connection = std::make_shared<Connection>(std::move(socket), transport::Endpoint{group.address, group.port},
                                                   options_);
    connection->start();

    connections_.emplace(interface_name, Entry{connection, 1});
    logger_->info("opened connection " + group.address + ":" + std::to_string(group.port) + " on " +
                  describe(interface_name));
    return connection;
}

void ConnectionRegistry::release(const std::string& interface_name) {
    std::scoped_lock lk(mtx_);
    auto it = connections_.find(interface_name);
    if (it == connections_.end()) {
        return;
    }
    if (--it->second.references > 0) {
        return;
    }
    // Closed under the lock: a concurrent obtain() must not open a second socket
    // for this interface while the old one is still bound
    it->second.connection->close();
    connections_.erase(it);
    logger_->info("closed connection on " + describe(interface_name));
}

void ConnectionRegistry::close_all() {
    std::scoped_lock lk(mtx_);
    for (auto& [name, entry] : connections_) {
        entry.connection->close();
    }
    connections_.clear();
}

bool ConnectionRegistry::contains(const std::string& interface_name) const {
    std::scoped_lock lk(mtx_);
    return connections_.count(interface_name) != 0;
}

std::size_t ConnectionRegistry::size() const {
    std::scoped_lock lk(mtx_);
    return connections_.size();
}

int ConnectionRegistry::reference_count(const std::string& interface_name) const {
    std::scoped_lock lk(mtx_);
    auto it = connections_.find(interface_name);
    return it == connections_.end() ? 0 : it->second.references;
}

} // namespace speedwire

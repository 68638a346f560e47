/**
 * \file MulticastSocket.hpp
 * \brief POSIX UDP socket joined to an IPv4 multicast group.
 * \ingroup socket_backend
 * \details Binds the wildcard address on the group port, joins the group on the
 *  requested interface and disables multicast loopback so the process does not
 *  read back its own discovery requests.
 */
#pragma once

#include "transport/socket/IDatagramSocket.hpp"
#include "transport/socket/SocketFactory.hpp"
#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

namespace speedwire::transport {

/** \brief Blocking multicast datagram socket.
 *  \ingroup socket_backend
 */
class MulticastSocket : public IDatagramSocket {
public:
    /**
     * \brief Open, bind and join \p group.
     * \throws SocketError if any step fails; no descriptor is leaked.
     */
    static std::shared_ptr<MulticastSocket> open(const MulticastGroup& group, std::shared_ptr<Logger> logger);

    ~MulticastSocket() override;

    MulticastSocket(const MulticastSocket&) = delete;
    MulticastSocket& operator=(const MulticastSocket&) = delete;

    // === I/O operations ===
    /** \brief Blocking receive; retries internal read timeouts until shutdown or close. */
    void receive_from(void* buffer, size_t size, size_t& bytes_read, Endpoint& source, std::error_code& error) override;
    void send_to(const void* buffer, size_t size, const Endpoint& destination, size_t& bytes_written,
                 std::error_code& error) override;

    // === Closing / teardown ===
    void close() override;

    /** \brief Request shutdown - interrupts a blocked \ref receive_from.
     *  \details Sets an atomic flag checked between read timeouts and shuts the
     *  descriptor down so a pending recvfrom returns immediately on Linux.
     */
    void shutdown() override;

    // === Status & information ===
    bool is_open() const override;
    int get_handle() const override;
    std::string local_endpoint() const override;
    std::string socket_type() const override;

    /** \brief Group this socket joined. */
    const MulticastGroup& group() const { return group_; }

private:
    MulticastSocket(int fd, MulticastGroup group, std::shared_ptr<Logger> logger);

    /** \brief Apply membership and socket options. Sets \p error and returns false on failure. */
    bool configure(std::error_code& error, std::string& step);

    /** \brief Read timeout used so blocked receives can observe \ref shutdown. */
    static constexpr std::chrono::milliseconds kReceivePollInterval{500};

    int socket_fd_{-1};
    mutable std::mutex socket_mtx_; // Protects socket_fd_ access
    std::atomic<bool> shutdown_requested_{false};
    MulticastGroup group_;
    std::shared_ptr<Logger> logger_{};
};

} // namespace speedwire::transport

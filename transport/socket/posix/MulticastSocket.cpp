/**
 * \file MulticastSocket.cpp
 * \brief Implementation of the POSIX multicast datagram socket.
 * \ingroup socket_backend
 */
#include "MulticastSocket.hpp"
#include "SocketErrno.hpp"
#include "transport/Errors.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace speedwire::transport {

std::shared_ptr<MulticastSocket> MulticastSocket::open(const MulticastGroup& group, std::shared_ptr<Logger> logger) {
    int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) {
        throw SocketError(SocketErrno::translate(errno), "cannot create UDP socket");
    }

    // Constructed before configuration so the destructor closes fd on failure
    std::shared_ptr<MulticastSocket> socket(new MulticastSocket(fd, group, logger));

    std::error_code ec;
    std::string step;
    if (!socket->configure(ec, step)) {
        socket->close();
        if (logger) {
            logger->error("MulticastSocket: " + step + " failed for " + group.address + ":" +
                          std::to_string(group.port) + ": " + ec.message());
        }
        throw SocketError(ec, step + " " + group.address + ":" + std::to_string(group.port));
    }

    if (logger) {
        logger->debug("MulticastSocket: joined " + group.address + ":" + std::to_string(group.port) +
                      (group.interface_name.empty() ? std::string{} : " on " + group.interface_name) +
                      " fd " + std::to_string(fd));
    }
    return socket;
}

MulticastSocket::MulticastSocket(int fd, MulticastGroup group, std::shared_ptr<Logger> logger)
    : socket_fd_(fd), group_(std::move(group)), logger_(std::move(logger)) {}

MulticastSocket::~MulticastSocket() {
    // Direct cleanup, no virtual dispatch
    std::lock_guard<std::mutex> lock(socket_mtx_);
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

bool MulticastSocket::configure(std::error_code& error, std::string& step) {
    const int fd = socket_fd_;

    int reuse = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        step = "SO_REUSEADDR";
        error = SocketErrno::translate(errno);
        return false;
    }

    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_port = htons(group_.port);
    bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        step = "bind";
        error = SocketErrno::translate(errno);
        return false;
    }

    ip_mreqn membership{};
    if (inet_pton(AF_INET, group_.address.c_str(), &membership.imr_multiaddr) != 1) {
        step = "parse group";
        error = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    membership.imr_address.s_addr = htonl(INADDR_ANY);
    membership.imr_ifindex = static_cast<int>(group_.interface_index);
    if (::setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership, sizeof(membership)) < 0) {
        step = "IP_ADD_MEMBERSHIP";
        error = SocketErrno::translate(errno);
        return false;
    }

    // Outgoing multicast follows the listen interface when one was named
    if (group_.interface_index != 0) {
        ip_mreqn outgoing{};
        outgoing.imr_ifindex = static_cast<int>(group_.interface_index);
        if (::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_IF, &outgoing, sizeof(outgoing)) < 0) {
            step = "IP_MULTICAST_IF";
            error = SocketErrno::translate(errno);
            return false;
        }
    }

    unsigned char loop = 0;
    if (::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) < 0) {
        step = "IP_MULTICAST_LOOP";
        error = SocketErrno::translate(errno);
        return false;
    }

    if (group_.receive_buffer_size > 0) {
        int size = group_.receive_buffer_size;
        if (::setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &size, sizeof(size)) < 0) {
            step = "SO_RCVBUF";
            error = SocketErrno::translate(errno);
            return false;
        }
    }

    timeval tv{};
    tv.tv_sec = 0;
    tv.tv_usec = static_cast<suseconds_t>(kReceivePollInterval.count() * 1000);
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        step = "SO_RCVTIMEO";
        error = SocketErrno::translate(errno);
        return false;
    }

    error = std::error_code{};
    return true;
}

void MulticastSocket::receive_from(void* buffer, size_t size, size_t& bytes_read, Endpoint& source,
                                   std::error_code& error) {
    // Loop over SO_RCVTIMEO timeouts so shutdown()/close() from another thread is observed
    while (true) {
        if (shutdown_requested_.load(std::memory_order_relaxed)) {
            error = std::make_error_code(std::errc::bad_file_descriptor);
            bytes_read = 0;
            return;
        }

        int fd;
        {
            std::lock_guard<std::mutex> lock(socket_mtx_);
            fd = socket_fd_;
        }
        if (fd < 0) {
            error = std::make_error_code(std::errc::bad_file_descriptor);
            bytes_read = 0;
            return;
        }

        sockaddr_in from{};
        socklen_t from_len = sizeof(from);
        ssize_t result = ::recvfrom(fd, buffer, size, 0, reinterpret_cast<sockaddr*>(&from), &from_len);
        if (result >= 0) {
            if (shutdown_requested_.load(std::memory_order_relaxed)) {
                // shutdown(SHUT_RDWR) wakes recvfrom with a zero-length read
                error = std::make_error_code(std::errc::bad_file_descriptor);
                bytes_read = 0;
                return;
            }
            char text[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &from.sin_addr, text, sizeof(text));
            source.ip = text;
            source.port = ntohs(from.sin_port);
            bytes_read = static_cast<size_t>(result);
            error = std::error_code{};
            return;
        }

        int err = errno;
        if (SocketErrno::is_retryable_errno(err)) {
            continue;
        }
        error = SocketErrno::translate(err);
        bytes_read = 0;
        return;
    }
}

void MulticastSocket::send_to(const void* buffer, size_t size, const Endpoint& destination, size_t& bytes_written,
                              std::error_code& error) {
    int fd;
    {
        std::lock_guard<std::mutex> lock(socket_mtx_);
        fd = socket_fd_;
    }
    if (fd < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        bytes_written = 0;
        return;
    }

    sockaddr_in to{};
    to.sin_family = AF_INET;
    to.sin_port = htons(destination.port);
    if (inet_pton(AF_INET, destination.ip.c_str(), &to.sin_addr) != 1) {
        error = std::make_error_code(std::errc::invalid_argument);
        bytes_written = 0;
        return;
    }

    ssize_t result = ::sendto(fd, buffer, size, 0, reinterpret_cast<const sockaddr*>(&to), sizeof(to));
    if (result >= 0) {
        bytes_written = static_cast<size_t>(result);
        error = std::error_code{};
    } else {
        bytes_written = 0;
        error = SocketErrno::translate(errno);
    }
}

void MulticastSocket::shutdown() {
    shutdown_requested_.store(true, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(socket_mtx_);
    if (socket_fd_ >= 0) {
        // ENOTCONN is expected for an unconnected UDP socket; the read timeout covers that case
        if (::shutdown(socket_fd_, SHUT_RDWR) < 0 && errno != ENOTCONN && logger_) {
            logger_->debug("MulticastSocket: shutdown failed: " + SocketErrno::translate(errno).message());
        }
    }
}

void MulticastSocket::close() {
    int fd_to_close = -1;
    {
        std::lock_guard<std::mutex> lock(socket_mtx_);
        if (socket_fd_ >= 0) {
            fd_to_close = socket_fd_;
            socket_fd_ = -1; // Invalidate immediately under lock
        }
    }
    if (fd_to_close >= 0) {
        ip_mreqn membership{};
        if (inet_pton(AF_INET, group_.address.c_str(), &membership.imr_multiaddr) == 1) {
            membership.imr_ifindex = static_cast<int>(group_.interface_index);
            if (::setsockopt(fd_to_close, IPPROTO_IP, IP_DROP_MEMBERSHIP, &membership, sizeof(membership)) < 0 &&
                logger_) {
                logger_->debug("MulticastSocket: leave group failed: " + SocketErrno::translate(errno).message());
            }
        }
        ::close(fd_to_close);
    }
}

bool MulticastSocket::is_open() const {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    return socket_fd_ >= 0;
}

int MulticastSocket::get_handle() const {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    return socket_fd_;
}

std::string MulticastSocket::local_endpoint() const {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    if (socket_fd_ < 0) return "";

    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (::getsockname(socket_fd_, reinterpret_cast<sockaddr*>(&local), &len) != 0) {
        return "";
    }
    char text[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &local.sin_addr, text, sizeof(text));
    return std::string(text) + ":" + std::to_string(ntohs(local.sin_port));
}

std::string MulticastSocket::socket_type() const {
    return "udp_multicast";
}

} // namespace speedwire::transport

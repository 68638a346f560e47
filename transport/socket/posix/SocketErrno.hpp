/**
 * \file SocketErrno.hpp
 * \brief errno interpretation helpers for the POSIX socket backend.
 * \ingroup socket_backend
 * \details Maps host errno values to portable \c std::errc codes and
 *  classifies the conditions a blocking receive loop should simply retry.
 */
#pragma once

#include <cerrno>
#include <system_error>

// Ensure ESHUTDOWN is defined on all platforms
#ifndef ESHUTDOWN
#define ESHUTDOWN 200  // Use a high value that's unlikely to conflict
#endif

namespace speedwire::transport {

/** \brief Interpret errno values produced by socket calls. */
class SocketErrno {
public:
    /** \brief True if the errno means "nothing to read yet" (timeout or would-block). */
    static bool is_would_block_errno(int errno_val) {
        return errno_val == EAGAIN || errno_val == EWOULDBLOCK || errno_val == EINPROGRESS ||
               errno_val == ETIMEDOUT;
    }

    /** \brief True if a receive should be retried without treating it as a failure. */
    static bool is_retryable_errno(int errno_val) {
        return is_would_block_errno(errno_val) || errno_val == EINTR;
    }

    /** \brief Translate errno to a portable std::error_code. */
    static std::error_code translate(int errno_val) {
        switch (errno_val) {
            case EINPROGRESS:
            case EALREADY:
                return std::make_error_code(std::errc::operation_in_progress);
#ifdef EAGAIN
            case EAGAIN:
#endif
#if defined(EWOULDBLOCK) && ( !defined(EAGAIN) || (EWOULDBLOCK != EAGAIN) )
            case EWOULDBLOCK:
#endif
                return std::make_error_code(std::errc::resource_unavailable_try_again);
            case EINTR:
                return std::make_error_code(std::errc::interrupted);
            case ENETDOWN:
            case ENETUNREACH:
                return std::make_error_code(std::errc::network_unreachable);
            case EHOSTUNREACH:
                return std::make_error_code(std::errc::host_unreachable);
            case EACCES:
                return std::make_error_code(std::errc::permission_denied);
            case EPROTONOSUPPORT:
                return std::make_error_code(std::errc::protocol_not_supported);
            case ENOPROTOOPT:
                return std::make_error_code(std::errc::no_protocol_option);
            case EOPNOTSUPP:
                return std::make_error_code(std::errc::function_not_supported);
            case ECONNREFUSED:
                return std::make_error_code(std::errc::connection_refused);
            case ETIMEDOUT:
                return std::make_error_code(std::errc::timed_out);
            case EADDRINUSE:
                return std::make_error_code(std::errc::address_in_use);
            case EADDRNOTAVAIL:
                return std::make_error_code(std::errc::address_not_available);
            case EBADF:
                return std::make_error_code(std::errc::bad_file_descriptor);
            case EINVAL:
                return std::make_error_code(std::errc::invalid_argument);
            case EMSGSIZE:
                return std::make_error_code(std::errc::message_size);
            case ENOMEM:
                return std::make_error_code(std::errc::not_enough_memory);
            case ENOBUFS:
                return std::make_error_code(std::errc::no_buffer_space);
            case ENODEV:
                return std::make_error_code(std::errc::no_such_device);
            case ESHUTDOWN:
                return std::make_error_code(std::errc::connection_aborted);
            default:
                return std::error_code(errno_val, std::system_category());
        }
    }
};

} // namespace speedwire::transport

/**
 * \file proto/ProtoError.hpp
 * \brief Error codes reported while decoding Speedwire datagrams.
 * \ingroup proto_module
 */
#pragma once

#include <system_error>
#include <type_traits>

namespace speedwire::proto {

/** \brief Reasons a datagram is rejected by \ref Packet::read. */
enum class proto_errc {
    too_short = 1,   ///< Shorter than the fixed frame header.
    bad_magic,       ///< Does not start with "SMA\0".
    missing_group,   ///< First entry is not the group tag.
    truncated_entry, ///< Entry length runs past the end of the datagram.
    missing_end,     ///< No end-of-packet marker.
};

/** \brief Category named "speedwire.proto". */
const std::error_category& proto_category() noexcept;

inline std::error_code make_error_code(proto_errc e) noexcept {
    return {static_cast<int>(e), proto_category()};
}

} // namespace speedwire::proto

template <>
struct std::is_error_code_enum<speedwire::proto::proto_errc> : std::true_type {};

/**
 * \file proto/Packet.hpp
 * \brief Speedwire datagram framing (signature, group tag, tagged entries).
 * \ingroup proto_module
 */
#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <system_error>
#include <vector>

/**
 * \defgroup proto_module Speedwire Protocol Module
 * \brief Encoding and decoding of the datagrams exchanged on the multicast group.
 */

namespace speedwire::proto {

/** \brief Well known entry tags. */
namespace tags {
    constexpr std::uint16_t kGroup = 0x02A0;     ///< Mandatory first entry, carries the group id.
    constexpr std::uint16_t kData2 = 0x0010;     ///< Protocol payload (device commands, meter data).
    constexpr std::uint16_t kDiscovery = 0x0020; ///< Discovery request marker.
    constexpr std::uint16_t kEnd = 0x0000;       ///< End-of-packet marker (with length 0).
}

/** \brief One tagged entry of a datagram. */
struct Entry {
    std::uint16_t tag{};
    std::vector<std::uint8_t> data;
};

/**
 * \brief Decoded Speedwire datagram.
 * \ingroup proto_module
 *
 * Wire layout (all header fields big endian):
 * \code
 *   "SMA\0" | len=4 tag=0x02A0 group:u32 | { len:u16 tag:u16 data[len] }* | len=0 tag=0
 * \endcode
 */
class Packet {
public:
    static constexpr std::uint32_t kBroadcastGroup = 0xFFFFFFFF;
    static constexpr std::uint32_t kDefaultGroup = 0x00000001;

    Packet() = default;
    explicit Packet(std::uint32_t group) : group_(group) {}

    /** \brief Build the request that prompts every device to identify itself. */
    static Packet discovery_request();

    /**
     * \brief Replace the contents of this packet with the decoded datagram.
     * \return Empty error code on success, a \ref proto_errc otherwise. On
     *  failure the packet is left unchanged.
     */
    std::error_code read(std::span<const std::uint8_t> bytes);

    /** \brief Serialize to wire format. */
    std::vector<std::uint8_t> bytes() const;

    /** \brief Short human readable summary used in log lines. */
    std::string to_string() const;

    std::uint32_t group() const { return group_; }

    const std::vector<Entry>& entries() const { return entries_; }
    void add_entry(std::uint16_t tag, std::vector<std::uint8_t> data);

    /** \brief First entry with \p tag, or nullptr. */
    const Entry* find(std::uint16_t tag) const;

    /** \brief Protocol id (first two data bytes) of the data2 entry, 0 if absent. */
    std::uint16_t protocol_id() const;

private:
    std::uint32_t group_{kDefaultGroup};
    std::vector<Entry> entries_;
};

} // namespace speedwire::proto

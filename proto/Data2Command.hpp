/**
 * \file proto/Data2Command.hpp
 * \brief Device command payload (protocol 0x6065) carried in the data2 entry.
 * \ingroup proto_module
 */
#pragma once

#include "Packet.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace speedwire::proto {

/**
 * \brief Addressed request/response exchanged with a single device.
 * \ingroup proto_module
 *
 * Body layout after the big endian protocol id (little endian fields):
 * length in 32-bit words (u8), control (u8), destination susy/serial/control,
 * source susy/serial/control, error code, fragment id, packet id, command,
 * then command specific parameters padded to a word boundary.
 */
struct Data2Command {
    static constexpr std::uint16_t kProtocolId = 0x6065;
    static constexpr std::uint8_t kRequestControl = 0xA0;
    static constexpr std::uint16_t kAnySusyId = 0xFFFF;
    static constexpr std::uint32_t kAnySerial = 0xFFFFFFFF;
    static constexpr std::uint16_t kPacketIdFlag = 0x8000;

    static constexpr std::uint32_t kLoginCommand = 0xFFFD040C;
    static constexpr std::uint16_t kErrorInvalidPassword = 0x0100;

    std::uint8_t control{kRequestControl};
    std::uint16_t dst_susy_id{kAnySusyId};
    std::uint32_t dst_serial{kAnySerial};
    std::uint16_t dst_control{0};
    std::uint16_t src_susy_id{0};
    std::uint32_t src_serial{0};
    std::uint16_t src_control{0};
    std::uint16_t error_code{0};
    std::uint16_t fragment_id{0};
    std::uint16_t packet_id{0};
    std::uint32_t command{0};
    std::vector<std::uint8_t> params;

    /** \brief Encode into a data2 entry payload, protocol id included. */
    std::vector<std::uint8_t> encode() const;

    /** \brief Decode a data2 entry payload; nullopt if it is not a well formed 0x6065 body. */
    static std::optional<Data2Command> decode(std::span<const std::uint8_t> data);

    /** \brief Wrap into a complete packet for the default group. */
    Packet to_packet() const;

    /** \brief Extract the command from a packet's data2 entry, if any. */
    static std::optional<Data2Command> from_packet(const Packet& packet);

    /** \brief Packet id without the request flag bit. */
    std::uint16_t sequence() const { return static_cast<std::uint16_t>(packet_id & ~kPacketIdFlag); }
};

/** \brief Identity this client uses as the source of its requests. */
struct ClientIdentity {
    std::uint16_t susy_id{0x0078};
    std::uint32_t serial{0x3A28A5F2};
};

/**
 * \brief Build a user login request addressed to any device.
 * \param identity Source address of this client.
 * \param sequence Packet id (request flag is added).
 * \param password User password, at most 12 characters are used.
 * \param unix_time Current time in seconds.
 */
Data2Command make_login_request(const ClientIdentity& identity, std::uint16_t sequence,
                                const std::string& password, std::uint32_t unix_time);

} // namespace speedwire::proto

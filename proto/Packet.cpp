/**
 * \file proto/Packet.cpp
 * \brief Speedwire datagram encoder/decoder.
 * \ingroup proto_module
 */
#include "Packet.hpp"
#include "ProtoError.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>

namespace speedwire::proto {

namespace {

constexpr std::uint8_t kSignature[4] = {'S', 'M', 'A', 0};
constexpr std::size_t kEntryHeaderSize = 4;

std::uint16_t read_u16_be(const std::uint8_t* p) {
    return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

std::uint32_t read_u32_be(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

void write_u16_be(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

void write_u32_be(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 24));
    out.push_back(static_cast<std::uint8_t>(v >> 16));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

} // namespace

Packet Packet::discovery_request() {
    Packet p(kBroadcastGroup);
    p.add_entry(tags::kDiscovery, {});
    return p;
}

std::error_code Packet::read(std::span<const std::uint8_t> bytes) {
    // signature + group entry header + group id
    if (bytes.size() < sizeof(kSignature) + kEntryHeaderSize + 4) {
        return proto_errc::too_short;
    }
    if (std::memcmp(bytes.data(), kSignature, sizeof(kSignature)) != 0) {
        return proto_errc::bad_magic;
    }

    std::size_t pos = sizeof(kSignature);
    if (read_u16_be(&bytes[pos]) != 4 || read_u16_be(&bytes[pos + 2]) != tags::kGroup) {
        return proto_errc::missing_group;
    }
    const std::uint32_t group = read_u32_be(&bytes[pos + kEntryHeaderSize]);
    pos += kEntryHeaderSize + 4;

    std::vector<Entry> entries;
    for (;;) {
        if (bytes.size() - pos < kEntryHeaderSize) {
            return proto_errc::missing_end;
        }
        const std::uint16_t len = read_u16_be(&bytes[pos]);
        const std::uint16_t tag = read_u16_be(&bytes[pos + 2]);
        pos += kEntryHeaderSize;
        if (len == 0 && tag == tags::kEnd) {
            break; // trailing padding is ignored
        }
        if (bytes.size() - pos < len) {
            return proto_errc::truncated_entry;
        }
        entries.push_back(Entry{tag, std::vector<std::uint8_t>(bytes.begin() + static_cast<std::ptrdiff_t>(pos),
                                                                bytes.begin() + static_cast<std::ptrdiff_t>(pos + len))});
        pos += len;
    }

    group_ = group;
    entries_ = std::move(entries);
    return {};
}

std::vector<std::uint8_t> Packet::bytes() const {
    std::vector<std::uint8_t> out(std::begin(kSignature), std::end(kSignature));
    write_u16_be(out, 4);
    write_u16_be(out, tags::kGroup);
    write_u32_be(out, group_);
    for (const auto& entry : entries_) {
        write_u16_be(out, static_cast<std::uint16_t>(entry.data.size()));
        write_u16_be(out, entry.tag);
        out.insert(out.end(), entry.data.begin(), entry.data.end());
    }
    write_u16_be(out, 0);
    write_u16_be(out, tags::kEnd);
    return out;
}

std::string Packet::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << "group=0x" << std::setw(8) << group_;
    for (const auto& entry : entries_) {
        oss << " tag=0x" << std::setw(4) << entry.tag << "/" << std::dec << entry.data.size() << std::hex;
    }
    if (auto proto_id = protocol_id(); proto_id != 0) {
        oss << " proto=0x" << std::setw(4) << proto_id;
    }
    return oss.str();
}

void Packet::add_entry(std::uint16_t tag, std::vector<std::uint8_t> data) {
    entries_.push_back(Entry{tag, std::move(data)});
}

const Entry* Packet::find(std::uint16_t tag) const {
    for (const auto& entry : entries_) {
        if (entry.tag == tag) return &entry;
    }
    return nullptr;
}

std::uint16_t Packet::protocol_id() const {
    const Entry* data2 = find(tags::kData2);
    if (!data2 || data2->data.size() < 2) return 0;
    return read_u16_be(data2->data.data());
}

} // namespace speedwire::proto

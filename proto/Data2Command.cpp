#include "Data2Command.hpp"

namespace speedwire::proto {

namespace {

constexpr std::size_t kBodyHeaderSize = 28; // everything between protocol id and params
constexpr std::size_t kPasswordLength = 12;
constexpr std::uint8_t kUserPasswordKey = 0x88;
constexpr std::uint32_t kUserGroup = 0x00000007;
constexpr std::uint32_t kLoginTimeoutSeconds = 900;

class LittleEndianWriter {
public:
    explicit LittleEndianWriter(std::vector<std::uint8_t>& out) : out_(out) {}
    void u8(std::uint8_t v) { out_.push_back(v); }
    void u16(std::uint16_t v) { u8(static_cast<std::uint8_t>(v)); u8(static_cast<std::uint8_t>(v >> 8)); }
    void u32(std::uint32_t v) { u16(static_cast<std::uint16_t>(v)); u16(static_cast<std::uint16_t>(v >> 16)); }

private:
    std::vector<std::uint8_t>& out_;
};

class LittleEndianReader {
public:
    LittleEndianReader(std::span<const std::uint8_t> in, std::size_t pos) : in_(in), pos_(pos) {}
    std::uint8_t u8() { return in_[pos_++]; }
    std::uint16_t u16() { auto lo = u8(); auto hi = u8(); return static_cast<std::uint16_t>(lo | (hi << 8)); }
    std::uint32_t u32() { std::uint32_t lo = u16(); std::uint32_t hi = u16(); return lo | (hi << 16); }
    std::size_t pos() const { return pos_; }

private:
    std::span<const std::uint8_t> in_;
    std::size_t pos_;
};

} // namespace

std::vector<std::uint8_t> Data2Command::encode() const {
    std::vector<std::uint8_t> padded = params;
    padded.resize((padded.size() + 3) / 4 * 4, 0);

    std::vector<std::uint8_t> out;
    out.reserve(2 + kBodyHeaderSize + padded.size());
    out.push_back(static_cast<std::uint8_t>(kProtocolId >> 8));
    out.push_back(static_cast<std::uint8_t>(kProtocolId & 0xFF));

    LittleEndianWriter w(out);
    w.u8(static_cast<std::uint8_t>((kBodyHeaderSize + padded.size()) / 4));
    w.u8(control);
    w.u16(dst_susy_id);
    w.u32(dst_serial);
    w.u16(dst_control);
    w.u16(src_susy_id);
    w.u32(src_serial);
    w.u16(src_control);
    w.u16(error_code);
    w.u16(fragment_id);
    w.u16(packet_id);
    w.u32(command);
    out.insert(out.end(), padded.begin(), padded.end());
    return out;
}

std::optional<Data2Command> Data2Command::decode(std::span<const std::uint8_t> data) {
    if (data.size() < 2 + kBodyHeaderSize) return std::nullopt;
    if (((data[0] << 8) | data[1]) != kProtocolId) return std::nullopt;

    const std::size_t body_size = static_cast<std::size_t>(data[2]) * 4;
    if (body_size < kBodyHeaderSize || body_size > data.size() - 2) return std::nullopt;

    LittleEndianReader r(data, 3);
    Data2Command cmd;
    cmd.control = r.u8();
    cmd.dst_susy_id = r.u16();
    cmd.dst_serial = r.u32();
    cmd.dst_control = r.u16();
    cmd.src_susy_id = r.u16();
    cmd.src_serial = r.u32();
    cmd.src_control = r.u16();
    cmd.error_code = r.u16();
    cmd.fragment_id = r.u16();
    cmd.packet_id = r.u16();
    cmd.command = r.u32();
    cmd.params.assign(data.begin() + static_cast<std::ptrdiff_t>(r.pos()),
                      data.begin() + static_cast<std::ptrdiff_t>(2 + body_size));
    return cmd;
}

Packet Data2Command::to_packet() const {
    Packet packet(Packet::kDefaultGroup);
    packet.add_entry(tags::kData2, encode());
    return packet;
}

std::optional<Data2Command> Data2Command::from_packet(const Packet& packet) {
    const Entry* data2 = packet.find(tags::kData2);
    if (!data2) return std::nullopt;
    return decode(data2->data);
}

Data2Command make_login_request(const ClientIdentity& identity, std::uint16_t sequence,
                                const std::string& password, std::uint32_t unix_time) {
    Data2Command cmd;
    cmd.dst_control = 0x0100;
    cmd.src_susy_id = identity.susy_id;
    cmd.src_serial = identity.serial;
    cmd.src_control = 0x0100;
    cmd.packet_id = static_cast<std::uint16_t>(sequence | Data2Command::kPacketIdFlag);
    cmd.command = Data2Command::kLoginCommand;

    LittleEndianWriter w(cmd.params);
    w.u32(kUserGroup);
    w.u32(kLoginTimeoutSeconds);
    w.u32(unix_time);
    w.u32(0);
    for (std::size_t i = 0; i < kPasswordLength; ++i) {
        const std::uint8_t c = i < password.size() ? static_cast<std::uint8_t>(password[i]) : 0;
        w.u8(static_cast<std::uint8_t>(c + kUserPasswordKey));
    }
    return cmd;
}

} // namespace speedwire::proto

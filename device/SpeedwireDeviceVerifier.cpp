#include "SpeedwireDeviceVerifier.hpp"

#include <cstdio>
#include <ctime>
#include <optional>

#include "Deadline.hpp"
#include "connection/Connection.hpp"

namespace speedwire {

namespace {

// Keeps the reply inbox registered for the duration of one verification
class ReceiverRegistration {
public:
    ReceiverRegistration(Connection& connection, std::string ip, Connection::PacketChannel channel)
        : connection_(connection), ip_(std::move(ip)), channel_(std::move(channel)) {
        connection_.register_receiver(ip_, channel_);
    }
    ~ReceiverRegistration() { connection_.unregister_receiver(ip_, channel_); }

    ReceiverRegistration(const ReceiverRegistration&) = delete;
    ReceiverRegistration& operator=(const ReceiverRegistration&) = delete;

private:
    Connection& connection_;
    std::string ip_;
    Connection::PacketChannel channel_;
};

std::string hex16(std::uint16_t value) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%04X", value);
    return buf;
}

} // namespace

SpeedwireDeviceVerifier::SpeedwireDeviceVerifier(std::chrono::milliseconds reply_timeout,
                                                 proto::ClientIdentity identity)
    : reply_timeout_(reply_timeout), identity_(identity) {}

std::uint16_t SpeedwireDeviceVerifier::next_sequence() {
    // 15 bits; the top bit is the request flag
    return static_cast<std::uint16_t>(sequence_.fetch_add(1) & 0x7FFF);
}

std::shared_ptr<Device> SpeedwireDeviceVerifier::verify(Connection& connection, const std::string& ip,
                                                        const std::string& password) {
    auto inbox = connection.make_receiver_channel();
    ReceiverRegistration registration(connection, ip, inbox);

    const std::uint16_t sequence = next_sequence();
    const auto request = proto::make_login_request(identity_, sequence, password,
                                                   static_cast<std::uint32_t>(std::time(nullptr)));
    connection.send_packet(transport::Endpoint{ip, connection.group().port}, request.to_packet());

    Deadline wait(reply_timeout_);
    while (!wait.expired()) {
        auto packet = inbox->pop_for(wait.remaining());
        if (!packet) {
            continue;
        }
        auto reply = proto::Data2Command::from_packet(**packet);
        if (!reply || reply->sequence() != sequence) {
            continue; // other traffic from the same device
        }
        if (reply->error_code == proto::Data2Command::kErrorInvalidPassword) {
            throw DeviceError("invalid password");
        }
        if (reply->error_code != 0) {
            throw DeviceError("login rejected with error " + hex16(reply->error_code));
        }
        return std::make_shared<Device>(ip, reply->src_susy_id, reply->src_serial);
    }
    throw DeviceError("no response");
}

} // namespace speedwire

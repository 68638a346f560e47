// GoogleTest tests for the login-based device verifier
#include "FakeDatagramSocket.hpp"
#include "TestSupport.hpp"
#include "connection/Connection.hpp"
#include "device/SpeedwireDeviceVerifier.hpp"
#include "proto/Data2Command.hpp"
#include <gtest/gtest.h>

#include <optional>
#include <thread>

using namespace speedwire;
using namespace speedwire::test;
using namespace std::chrono_literals;

namespace {

const transport::Endpoint kGroup{"239.12.255.254", 9522};
constexpr std::uint16_t kDeviceSusyId = 0x0174;
constexpr std::uint32_t kDeviceSerial = 2001234567;

class VerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        socket = std::make_shared<FakeDatagramSocket>();
        ConnectionOptions opts;
        opts.logger = log.logger;
        opts.verifier = std::make_shared<SpeedwireDeviceVerifier>(200ms);
        connection = std::make_unique<Connection>(socket, kGroup, opts);
        connection->start();
    }

    void TearDown() override { connection->close(); }

    /** Reply to login requests like a device; nullopt means stay silent. */
    void device_answers(std::optional<std::uint16_t> error_code) {
        socket->set_send_hook([this, error_code](const FakeDatagramSocket::Sent& sent) {
            if (sent.destination == kGroup || !error_code) return;
            proto::Packet request;
            if (request.read(sent.bytes)) return;
            auto login = proto::Data2Command::from_packet(request);
            if (!login || login->command != proto::Data2Command::kLoginCommand) return;

            proto::Data2Command reply;
            reply.control = 0xD0;
            reply.dst_susy_id = login->src_susy_id;
            reply.dst_serial = login->src_serial;
            reply.src_susy_id = kDeviceSusyId;
            reply.src_serial = kDeviceSerial;
            reply.error_code = *error_code;
            reply.packet_id = login->packet_id;
            reply.command = login->command | 1;

            // unrelated traffic first; the verifier has to skip it
            socket->inject_packet(sent.destination.ip, device_traffic(1));
            socket->inject_packet(sent.destination.ip, reply.to_packet());
        });
    }

    CapturingLogger log;
    std::shared_ptr<FakeDatagramSocket> socket;
    std::unique_ptr<Connection> connection;
};

} // namespace

TEST_F(VerifierTest, SuccessfulLoginBuildsDevice)
{
    device_answers(0);
    auto device = connection->open_device("10.0.0.7", "0000");

    ASSERT_NE(device, nullptr);
    EXPECT_EQ(device->ip(), "10.0.0.7");
    EXPECT_EQ(device->susy_id(), kDeviceSusyId);
    EXPECT_EQ(device->serial(), kDeviceSerial);
    EXPECT_EQ(connection->receiver_count("10.0.0.7"), 0u);
    EXPECT_EQ(socket->sent_to(transport::Endpoint{"10.0.0.7", 9522}), 1u);
}

TEST_F(VerifierTest, WrongPasswordIsDeviceError)
{
    device_answers(proto::Data2Command::kErrorInvalidPassword);
    try {
        connection->open_device("10.0.0.7", "bad");
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_STREQ(e.what(), "invalid password");
    }
    EXPECT_EQ(connection->receiver_count("10.0.0.7"), 0u);
}

TEST_F(VerifierTest, OtherErrorCodeIsDeviceError)
{
    device_answers(0x0017);
    EXPECT_THROW(connection->open_device("10.0.0.7", "0000"), DeviceError);
}

TEST_F(VerifierTest, SilentDeviceTimesOut)
{
    device_answers(std::nullopt);
    const auto start = std::chrono::steady_clock::now();
    try {
        connection->open_device("10.0.0.7", "0000");
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_STREQ(e.what(), "no response");
    }
    EXPECT_GE(std::chrono::steady_clock::now() - start, 190ms);
    EXPECT_EQ(connection->receiver_count("10.0.0.7"), 0u);
}

TEST_F(VerifierTest, DiscoveryUsesLoginVerifier)
{
    device_answers(0);

    auto results = std::make_shared<BoundedQueue<std::shared_ptr<Device>>>(10);
    Deadline deadline(300ms);
    std::thread session([&] { connection->discover_devices(deadline, results, "0000"); });
    EXPECT_TRUE(eventually([&] { return connection->discoverer_count() == 1; }));
    socket->inject_packet("10.0.0.7", device_traffic(2));
    session.join();

    ASSERT_EQ(results->size(), 1u);
    EXPECT_EQ((*results->try_pop())->serial(), kDeviceSerial);
}

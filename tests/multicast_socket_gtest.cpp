// GoogleTest tests for the POSIX multicast socket backend (loopback only)
#include "transport/Errors.hpp"
#include "transport/socket/IDatagramSocket.hpp"
#include "transport/socket/SocketFactory.hpp"
#include <gtest/gtest.h>

#include <sys/socket.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>

using namespace speedwire;
using namespace speedwire::transport;
using namespace std::chrono_literals;

namespace {

constexpr const char* kGroupAddress = "239.12.255.254";

/** Open the real backend on \p port; nullptr only when the sandbox cannot create or bind UDP sockets. */
std::shared_ptr<IDatagramSocket> open_or_skip(std::uint16_t port, std::string& skip_reason) {
    auto group = SocketFactory::resolve(kGroupAddress, port, "");
    try {
        return SocketFactory::create_multicast(group, nullptr);
    } catch (const SocketError& e) {
        const std::string what = e.what();
        if (what.rfind("cannot create UDP socket", 0) != 0 && what.rfind("bind ", 0) != 0) {
            throw;
        }
        skip_reason = what;
        return nullptr;
    }
}

} // namespace

TEST(MulticastSocketTest, OpensConfiguredSocket)
{
    std::string reason;
    auto socket = open_or_skip(19522, reason);
    if (!socket) GTEST_SKIP() << "multicast socket unavailable: " << reason;

    EXPECT_TRUE(socket->is_open());
    EXPECT_GE(socket->get_handle(), 0);
    EXPECT_EQ(socket->socket_type(), "udp_multicast");
    EXPECT_EQ(socket->local_endpoint(), "0.0.0.0:19522");

    int rcvbuf = 0;
    socklen_t len = sizeof(rcvbuf);
    ASSERT_EQ(::getsockopt(socket->get_handle(), SOL_SOCKET, SO_RCVBUF, &rcvbuf, &len), 0);
    // the kernel doubles the requested size and applies its own minimum
    EXPECT_GE(rcvbuf, 2048);

    socket->close();
    EXPECT_FALSE(socket->is_open());
    EXPECT_EQ(socket->get_handle(), -1);
    EXPECT_NO_THROW(socket->close());
}

TEST(MulticastSocketTest, ReceiveReportsLoopbackSource)
{
    std::string reason;
    auto socket = open_or_skip(19523, reason);
    if (!socket) GTEST_SKIP() << "multicast socket unavailable: " << reason;

    const std::array<std::uint8_t, 4> payload{'S', 'M', 'A', 0};
    std::size_t written = 0;
    std::error_code ec;
    socket->send_to(payload.data(), payload.size(), Endpoint{"127.0.0.1", 19523}, written, ec);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(written, payload.size());

    std::array<std::uint8_t, 2048> buffer{};
    std::size_t read = 0;
    Endpoint source;
    socket->receive_from(buffer.data(), buffer.size(), read, source, ec);
    ASSERT_FALSE(ec) << ec.message();
    ASSERT_EQ(read, payload.size());
    EXPECT_EQ(std::memcmp(buffer.data(), payload.data(), payload.size()), 0);
    EXPECT_EQ(source.ip, "127.0.0.1");
    EXPECT_EQ(source.port, 19523);
    socket->close();
}

TEST(MulticastSocketTest, ShutdownUnblocksPendingReceive)
{
    std::string reason;
    auto socket = open_or_skip(19524, reason);
    if (!socket) GTEST_SKIP() << "multicast socket unavailable: " << reason;

    std::atomic<bool> returned{false};
    std::error_code ec;
    std::size_t read = 1;
    std::chrono::steady_clock::time_point returned_at;
    std::thread reader([&] {
        std::array<std::uint8_t, 2048> buffer{};
        Endpoint source;
        socket->receive_from(buffer.data(), buffer.size(), read, source, ec);
        returned_at = std::chrono::steady_clock::now();
        returned.store(true);
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(returned.load());
    const auto shutdown_at = std::chrono::steady_clock::now();
    socket->shutdown();
    reader.join();

    EXPECT_EQ(ec, std::make_error_code(std::errc::bad_file_descriptor));
    EXPECT_EQ(read, 0u);
    EXPECT_LT(returned_at - shutdown_at, 250ms);
    socket->close();
}

TEST(MulticastSocketTest, SendToInvalidAddressFails)
{
    std::string reason;
    auto socket = open_or_skip(19525, reason);
    if (!socket) GTEST_SKIP() << "multicast socket unavailable: " << reason;

    const std::uint8_t byte = 0;
    std::size_t written = 1;
    std::error_code ec;
    socket->send_to(&byte, 1, Endpoint{"not-an-ip", 9522}, written, ec);
    EXPECT_EQ(ec, std::make_error_code(std::errc::invalid_argument));
    EXPECT_EQ(written, 0u);

    socket->close();
    socket->send_to(&byte, 1, Endpoint{"127.0.0.1", 19525}, written, ec);
    EXPECT_EQ(ec, std::make_error_code(std::errc::bad_file_descriptor));
}

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <thread>

#include "vgc_driver/errors.hpp"
#include "vgc_driver/tcp_transport.hpp"
#include "vgc_driver/transport.hpp"

using namespace vgc_driver;
using namespace std::chrono_literals;

TEST(ReceiveBuffer, PopTimesOutWhenNothingArrives)
{
  ReceiveBuffer rx;
  EXPECT_THROW(rx.pop(8, 20ms), Timeout);
}

TEST(ReceiveBuffer, PopReturnsAtMostMaxBytes)
{
  ReceiveBuffer rx;
  rx.push("abcdef", 6);
  EXPECT_EQ(rx.pop(4, 20ms), "abcd");
  EXPECT_EQ(rx.pop(4, 20ms), "ef");
  EXPECT_THROW(rx.pop(4, 20ms), Timeout);
}

TEST(ReceiveBuffer, EofIsReportedAfterBufferedBytes)
{
  ReceiveBuffer rx;
  rx.push("ab", 2);
  rx.set_eof();
  EXPECT_EQ(rx.pop(8, 20ms), "ab");
  EXPECT_EQ(rx.pop(8, 20ms), "");
  EXPECT_EQ(rx.pop(8, 20ms), "");
}

TEST(ReceiveBuffer, ErrorIsReportedAfterBufferedBytes)
{
  ReceiveBuffer rx;
  rx.push("x", 1);
  rx.set_error("Connection reset by peer");
  EXPECT_EQ(rx.pop(8, 20ms), "x");
  EXPECT_THROW(rx.pop(8, 20ms), ConnectionFault);
}

TEST(ReceiveBuffer, DiscardDropsDataButKeepsEof)
{
  ReceiveBuffer rx;
  rx.push("stale", 5);
  rx.discard();
  EXPECT_THROW(rx.pop(8, 20ms), Timeout);

  rx.push("stale", 5);
  rx.set_eof();
  rx.discard();
  EXPECT_EQ(rx.pop(8, 20ms), "");
}

TEST(ReceiveBuffer, ResetClearsEndOfStream)
{
  ReceiveBuffer rx;
  rx.set_error("gone");
  rx.reset();
  EXPECT_THROW(rx.pop(8, 20ms), Timeout);
}

TEST(ReceiveBuffer, PushFromReaderThreadWakesWaiter)
{
  ReceiveBuffer rx;
  std::thread reader([&rx] {
    std::this_thread::sleep_for(20ms);
    rx.push("z", 1);
  });
  EXPECT_EQ(rx.pop(8, 2000ms), "z");
  reader.join();
}

class TcpTransportTest : public ::testing::Test
{
protected:
  uint16_t port() const { return acceptor_.local_endpoint().port(); }

  // Reads until `n` bytes have arrived or the transport gives up.
  static std::string recv_exactly(Transport & t, size_t n)
  {
    std::string got;
    while (got.size() < n) {
      std::string chunk = t.recv(n - got.size(), 1000ms);
      if (chunk.empty()) break;
      got += chunk;
    }
    return got;
  }

  asio::io_context io_;
  asio::ip::tcp::acceptor acceptor_{
    io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)};
};

TEST_F(TcpTransportTest, ExchangesBytesWithPeer)
{
  TcpTransport t("127.0.0.1", port());
  t.open();
  asio::ip::tcp::socket peer(io_);
  acceptor_.accept(peer);
  EXPECT_TRUE(t.is_open());
  EXPECT_EQ(t.describe(), "tcp://127.0.0.1:" + std::to_string(port()));

  t.send("PR1\r\n");
  std::array<char, 5> buf{};
  asio::read(peer, asio::buffer(buf));
  EXPECT_EQ(std::string(buf.data(), buf.size()), "PR1\r\n");

  const std::string answer = "\x06\r\n0,1.0E-03\r\n";
  asio::write(peer, asio::buffer(answer));
  EXPECT_EQ(recv_exactly(t, answer.size()), answer);

  t.close();
  EXPECT_FALSE(t.is_open());
  EXPECT_THROW(t.recv(8, 20ms), ConnectionFault);
  EXPECT_THROW(t.send("PR1\r\n"), ConnectionFault);
}

TEST_F(TcpTransportTest, SilentPeerTimesOut)
{
  TcpTransport t("127.0.0.1", port());
  t.open();
  asio::ip::tcp::socket peer(io_);
  acceptor_.accept(peer);
  EXPECT_THROW(t.recv(8, 50ms), Timeout);
}

TEST_F(TcpTransportTest, PeerCloseIsEndOfStream)
{
  TcpTransport t("127.0.0.1", port());
  t.open();
  {
    asio::ip::tcp::socket peer(io_);
    acceptor_.accept(peer);
    const std::string last = "\x15\r\n";
    asio::write(peer, asio::buffer(last));
    asio::error_code ec;
    peer.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    peer.close(ec);
  }
  EXPECT_EQ(recv_exactly(t, 3), "\x15\r\n");
  EXPECT_EQ(t.recv(8, 1000ms), "");
}

TEST_F(TcpTransportTest, ReopenAfterClose)
{
  TcpTransport t("127.0.0.1", port());
  t.open();
  asio::ip::tcp::socket first(io_);
  acceptor_.accept(first);
  t.close();

  t.open();
  asio::ip::tcp::socket second(io_);
  acceptor_.accept(second);
  const std::string hello = "25\r\n";
  asio::write(second, asio::buffer(hello));
  EXPECT_EQ(recv_exactly(t, hello.size()), hello);
}

TEST(TcpTransport, RefusedConnectionIsConnectionFault)
{
  asio::io_context io;
  uint16_t port = 0;
  {
    // Take a free port, then release it so nothing listens there.
    asio::ip::tcp::acceptor a(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    port = a.local_endpoint().port();
  }
  TcpTransport t("127.0.0.1", port);
  EXPECT_THROW(t.open(), ConnectionFault);
  EXPECT_FALSE(t.is_open());
}

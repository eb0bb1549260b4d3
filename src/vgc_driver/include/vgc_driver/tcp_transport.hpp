#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <string>

#include <asio.hpp>
#include <io_context/io_context.hpp>

#include "vgc_driver/transport.hpp"

namespace vgc_driver
{

// TCP client (e.g. the controller's Ethernet port or a serial-to-LAN bridge).
// Reads run on the IoContext thread and feed a ReceiveBuffer.
class TcpTransport : public Transport
{
public:
  TcpTransport(const std::string & host, uint16_t port);
  ~TcpTransport() override;

  void open() override;
  void close() override;
  bool is_open() const override;

  void send(const std::string & bytes) override;
  std::string recv(size_t max_bytes, std::chrono::milliseconds timeout) override;
  void discard_input() override { rx_.discard(); }

  std::string describe() const override;

private:
  void start_receive();

  std::string host_;
  uint16_t port_;

  // Declared before the io members so they outlive the IoContext threads.
  ReceiveBuffer rx_;
  mutable std::mutex socket_mutex_;
  bool open_{false};
  std::array<char, 256> chunk_{};

  std::shared_ptr<drivers::common::IoContext> io_ctx_;
  std::unique_ptr<asio::ip::tcp::socket> socket_;
};

} // namespace vgc_driver

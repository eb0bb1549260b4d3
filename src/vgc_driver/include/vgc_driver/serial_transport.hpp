#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <serial_driver/serial_driver.hpp>
#include <serial_driver/serial_port.hpp>
#include <io_context/io_context.hpp>

#include "vgc_driver/transport.hpp"

namespace vgc_driver
{

// RS-232 link to the controller front panel port (8N1, no flow control).
class SerialTransport : public Transport
{
public:
  SerialTransport(const std::string & device, uint32_t baud);
  ~SerialTransport() override;

  void open() override;
  void close() override;
  bool is_open() const override;

  void send(const std::string & bytes) override;
  std::string recv(size_t max_bytes, std::chrono::milliseconds timeout) override;
  void discard_input() override { rx_.discard(); }

  std::string describe() const override { return device_; }

private:
  std::string device_;
  uint32_t baud_;

  ReceiveBuffer rx_;

  std::shared_ptr<drivers::common::IoContext> io_ctx_;
  std::unique_ptr<drivers::serial_driver::SerialDriver> driver_;
};

} // namespace vgc_driver

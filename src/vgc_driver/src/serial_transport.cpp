#include "vgc_driver/serial_transport.hpp"
#include "vgc_driver/errors.hpp"

using drivers::serial_driver::SerialDriver;
using drivers::serial_driver::SerialPortConfig;
using drivers::serial_driver::FlowControl;
using drivers::serial_driver::Parity;
using drivers::serial_driver::StopBits;
using drivers::common::IoContext;

namespace vgc_driver
{

SerialTransport::SerialTransport(const std::string & device, uint32_t baud)
: device_(device), baud_(baud)
{
}

SerialTransport::~SerialTransport()
{
  close();
}

void SerialTransport::open()
{
  if (is_open()) return;
  rx_.reset();
  try {
    driver_.reset();
    io_ctx_ = std::make_shared<IoContext>(1);
    driver_ = std::make_unique<SerialDriver>(*io_ctx_);

    SerialPortConfig cfg(baud_, FlowControl::NONE, Parity::NONE, StopBits::ONE);
    driver_->init_port(device_, cfg);
    driver_->port()->open();
  } catch (const std::exception & e) {
    driver_.reset();
    throw ConnectionFault("Could not open " + device_ + ": " + e.what());
  }

  // async_receive re-arms itself after every chunk until the port closes.
  driver_->port()->async_receive(
    [this](std::vector<uint8_t> & buffer, const size_t & n) {
      rx_.push(reinterpret_cast<const char *>(buffer.data()), n);
    });
}

void SerialTransport::close()
{
  if (driver_ && driver_->port() && driver_->port()->is_open()) {
    driver_->port()->close();
  }
}

bool SerialTransport::is_open() const
{
  return driver_ && driver_->port() && driver_->port()->is_open();
}

void SerialTransport::send(const std::string & bytes)
{
  if (!is_open()) throw ConnectionFault("serial port " + device_ + " is not open");
  std::vector<uint8_t> tx(bytes.begin(), bytes.end());
  size_t n = 0;
  try {
    n = driver_->port()->send(tx);
  } catch (const std::exception & e) {
    throw ConnectionFault("write to " + device_ + " failed: " + e.what());
  }
  if (n != tx.size()) {
    throw ConnectionFault("short write to " + device_ + " (" + std::to_string(n) + "/" +
                          std::to_string(tx.size()) + " bytes)");
  }
}

std::string SerialTransport::recv(size_t max_bytes, std::chrono::milliseconds timeout)
{
  if (!is_open()) throw ConnectionFault("serial port " + device_ + " is not open");
  return rx_.pop(max_bytes, timeout);
}

} // namespace vgc_driver

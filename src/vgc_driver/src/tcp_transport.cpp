#include "vgc_driver/tcp_transport.hpp"
#include "vgc_driver/errors.hpp"

namespace vgc_driver
{

TcpTransport::TcpTransport(const std::string & host, uint16_t port)
: host_(host), port_(port)
{
}

TcpTransport::~TcpTransport()
{
  close();
}

void TcpTransport::open()
{
  if (is_open()) return;

  // Old socket must go before the IoContext that serves it.
  socket_.reset();
  io_ctx_ = std::make_shared<drivers::common::IoContext>(1);
  socket_ = std::make_unique<asio::ip::tcp::socket>(io_ctx_->ios());
  rx_.reset();

  asio::error_code ec;
  asio::ip::tcp::resolver resolver(io_ctx_->ios());
  auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
  if (!ec) asio::connect(*socket_, endpoints, ec);
  if (ec) {
    asio::error_code ignored;
    socket_->close(ignored);
    throw ConnectionFault("Could not connect to " + host_ + ":" + std::to_string(port_) +
                          ": " + ec.message());
  }
  // Short ASCII frames; do not let Nagle hold the ENQ byte.
  socket_->set_option(asio::ip::tcp::no_delay(true), ec);

  {
    std::lock_guard<std::mutex> lk(socket_mutex_);
    open_ = true;
  }
  start_receive();
}

void TcpTransport::start_receive()
{
  std::lock_guard<std::mutex> lk(socket_mutex_);
  if (!open_) return;
  socket_->async_read_some(asio::buffer(chunk_),
    [this](const asio::error_code & ec, size_t n) {
      if (!ec) {
        rx_.push(chunk_.data(), n);
        start_receive();
        return;
      }
      if (ec == asio::error::eof) {
        rx_.set_eof();
      } else if (ec != asio::error::operation_aborted) {
        rx_.set_error(ec.message());
      }
    });
}

void TcpTransport::close()
{
  std::lock_guard<std::mutex> lk(socket_mutex_);
  if (!open_) return;
  open_ = false;
  asio::error_code ec;
  socket_->shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket_->close(ec);
}

bool TcpTransport::is_open() const
{
  std::lock_guard<std::mutex> lk(socket_mutex_);
  return open_;
}

void TcpTransport::send(const std::string & bytes)
{
  std::lock_guard<std::mutex> lk(socket_mutex_);
  if (!open_) throw ConnectionFault("not connected to " + describe());
  asio::error_code ec;
  asio::write(*socket_, asio::buffer(bytes.data(), bytes.size()), ec);
  if (ec) throw ConnectionFault("write to " + describe() + " failed: " + ec.message());
}

std::string TcpTransport::recv(size_t max_bytes, std::chrono::milliseconds timeout)
{
  if (!is_open()) throw ConnectionFault("not connected to " + describe());
  return rx_.pop(max_bytes, timeout);
}

std::string TcpTransport::describe() const
{
  return "tcp://" + host_ + ":" + std::to_string(port_);
}

} // namespace vgc_driver

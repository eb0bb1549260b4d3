#include "vgc_driver/connection_config.hpp"
#include "vgc_driver/serial_transport.hpp"
#include "vgc_driver/tcp_transport.hpp"

#include <stdexcept>

namespace vgc_driver
{

static int to_int(const std::string & key, const std::string & value)
{
  try {
    return std::stoi(value);
  } catch (const std::exception &) {
    throw std::invalid_argument("parameter '" + key + "' is not an integer: '" + value + "'");
  }
}

ConnectionConfig ConnectionConfig::from_parameters(const Getter & getp)
{
  ConnectionConfig c;
  c.transport   = getp("transport", c.transport);
  c.host        = getp("host", c.host);
  c.device      = getp("device", c.device);
  c.profile     = getp("profile", c.profile);
  if (auto s = getp("port", ""); !s.empty())        c.port = to_int("port", s);
  if (auto s = getp("baud", ""); !s.empty())        c.baud = to_int("baud", s);
  if (auto s = getp("timeout_ms", ""); !s.empty())  c.timeout_ms = to_int("timeout_ms", s);
  if (auto s = getp("gauge_count", ""); !s.empty()) c.gauge_count = to_int("gauge_count", s);
  return c;
}

ConnectionConfig declare_connection_parameters(rclcpp::Node & node)
{
  ConnectionConfig c;
  c.transport   = node.declare_parameter<std::string>("transport", c.transport);
  c.host        = node.declare_parameter<std::string>("host", c.host);
  c.port        = node.declare_parameter("port", c.port);
  c.device      = node.declare_parameter<std::string>("device", c.device);
  c.baud        = node.declare_parameter("baud", c.baud);
  c.timeout_ms  = node.declare_parameter("timeout_ms", c.timeout_ms);
  c.profile     = node.declare_parameter<std::string>("profile", c.profile);
  c.gauge_count = node.declare_parameter("gauge_count", c.gauge_count);
  return c;
}

TransportPtr make_transport(const ConnectionConfig & cfg)
{
  if (cfg.transport == "tcp") {
    if (cfg.port <= 0 || cfg.port > 65535) {
      throw std::invalid_argument("port out of range: " + std::to_string(cfg.port));
    }
    return std::make_unique<TcpTransport>(cfg.host, static_cast<uint16_t>(cfg.port));
  }
  if (cfg.transport == "serial") {
    if (cfg.baud <= 0) throw std::invalid_argument("baud must be positive");
    return std::make_unique<SerialTransport>(cfg.device, static_cast<uint32_t>(cfg.baud));
  }
  throw std::invalid_argument("unknown transport '" + cfg.transport + "' (tcp|serial)");
}

DeviceProfile make_profile(const ConnectionConfig & cfg)
{
  DeviceProfile p = profile_by_name(cfg.profile);
  if (cfg.gauge_count < 0) throw std::invalid_argument("gauge_count must be >= 0");
  if (cfg.gauge_count > 0) p.gauge_count = cfg.gauge_count;
  return p;
}

} // namespace vgc_driver

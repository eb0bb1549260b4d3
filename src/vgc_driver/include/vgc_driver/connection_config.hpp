#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "rclcpp/rclcpp.hpp"

#include "vgc_driver/transport.hpp"
#include "vgc_driver/vgc_controller.hpp"

namespace vgc_driver
{

/**
 * @brief Where and how to reach the controller.
 *
 * Keys (ros2_control <hardware> params or node params):
 *   - transport  (string) : "tcp" | "serial", default "tcp"
 *   - host       (string) : default "127.0.0.1"
 *   - port       (int)    : default 8000
 *   - device     (string) : serial device, default "/dev/ttyUSB0"
 *   - baud       (int)    : default 9600
 *   - timeout_ms (int)    : per-read timeout, default 1000
 *   - profile    (string) : vgc501 | vgc502 | vgc503 | generic, default "vgc502"
 *   - gauge_count(int)    : 0 = ask the device, default 0
 */
struct ConnectionConfig
{
  std::string transport{"tcp"};
  std::string host{"127.0.0.1"};
  int port{8000};
  std::string device{"/dev/ttyUSB0"};
  int baud{9600};
  int timeout_ms{1000};
  std::string profile{"vgc502"};
  int gauge_count{0};

  std::chrono::milliseconds timeout() const { return std::chrono::milliseconds(timeout_ms); }

  // getp(key, default) -> value, as in a hardware_parameters lookup.
  using Getter = std::function<std::string(const std::string &, const std::string &)>;
  static ConnectionConfig from_parameters(const Getter & getp);
};

ConnectionConfig declare_connection_parameters(rclcpp::Node & node);

// Throws std::invalid_argument for an unknown transport name or bad port/baud.
TransportPtr make_transport(const ConnectionConfig & cfg);

// Profile + gauge_count override.
DeviceProfile make_profile(const ConnectionConfig & cfg);

} // namespace vgc_driver

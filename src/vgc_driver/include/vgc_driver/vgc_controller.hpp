#pragma once
#include <chrono>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include "rclcpp/rclcpp.hpp"

#include "vgc_driver/errors.hpp"
#include "vgc_driver/framer.hpp"
#include "vgc_driver/handshake.hpp"
#include "vgc_driver/reply_decoder.hpp"
#include "vgc_driver/transport.hpp"

namespace vgc_driver
{

// "No valid reading this cycle". Never a real measurement.
constexpr double kNoReading = std::numeric_limits<double>::max();
constexpr int kNoUnit = -1;

// What a controller generation can answer. gauge_count 0 = ask the device (AYT).
struct DeviceProfile
{
  std::string name;
  bool has_identity{true};
  bool has_temperature{true};
  int gauge_count{0};
};

// vgc501 / vgc502 / vgc503 / generic; throws std::invalid_argument otherwise.
DeviceProfile profile_by_name(const std::string & name);

using AtomicValue = std::variant<double, std::string>;

/**
 * @brief Command facade for one VGC50x controller.
 *
 * Owns the transport. Every public call, accessors included, holds an internal
 * recursive mutex for its whole duration (a lazy identity query and the read
 * that triggered it are one unit), so a poller and a console can share an
 * instance.
 *
 * Error policy:
 *   - NAK                -> WrongCommand
 *   - neither ACK nor NAK -> UnknownResponse
 *   - timeouts, payload failures, malformed numbers -> kNoReading
 *   - bad gauge / unit arguments -> std::invalid_argument, before any I/O
 *   - transport failures outside the payload read -> ConnectionFault
 */
class VgcController
{
public:
  VgcController(TransportPtr transport,
                DeviceProfile profile,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(1000),
                std::optional<rclcpp::Logger> logger = std::nullopt);
  ~VgcController();

  VgcController(const VgcController &) = delete;
  VgcController & operator=(const VgcController &) = delete;

  void connect();
  void disconnect();
  bool is_connected() const;

  double read_pressure(int gauge = 1);
  double read_temperature();

  int get_pressure_unit();
  bool set_pressure_unit(int code);

  void initialize_identity();

  AtomicValue get_atomic_value(const std::string & name);

  // Raw passthrough; reply is the payload line without CR LF.
  bool send_command(const std::string & command, std::string & reply);

  const DeviceProfile & profile() const { return profile_; }
  DeviceIdentity identity() const;
  int gauge_count() const;
  std::string pressure_unit() const;

private:
  Exchange exchange(const std::string & command);
  // Throws for REJECTED / UNKNOWN_ACK; true when a payload is available.
  bool check(const Exchange & ex, const std::string & command);
  void require(bool supported, const char * what) const;
  void validate_gauge(int gauge);

  TransportPtr transport_;
  DeviceProfile profile_;
  std::optional<rclcpp::Logger> logger_;
  Framer framer_;
  HandshakeEngine engine_;
  mutable std::recursive_mutex io_mutex_;

  DeviceIdentity identity_;
  int gauge_count_{0};
  bool identity_attempted_{false};  // set once AYT has answered on this connection
  std::string unit_;
};

} // namespace vgc_driver

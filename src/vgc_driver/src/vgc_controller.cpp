#include "vgc_driver/vgc_controller.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace vgc_driver
{

static std::string to_lower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

DeviceProfile profile_by_name(const std::string & name)
{
  const std::string n = to_lower(name);
  if (n == "vgc501" || n == "vgc502" || n == "vgc503") return DeviceProfile{n, true, true, 0};
  // Older single-purpose gauges: PRx only, no AYT / TMP.
  if (n == "generic") return DeviceProfile{n, false, false, 0};
  throw std::invalid_argument("unknown device profile '" + name + "'");
}

VgcController::VgcController(TransportPtr transport,
                             DeviceProfile profile,
                             std::chrono::milliseconds timeout,
                             std::optional<rclcpp::Logger> logger)
: transport_(std::move(transport)),
  profile_(std::move(profile)),
  logger_(std::move(logger)),
  framer_(*transport_, timeout),
  engine_(framer_, logger_),
  gauge_count_(profile_.gauge_count)
{
  if (logger_) {
    RCLCPP_INFO(*logger_, "VgcController for %s (profile %s, timeout %ld ms)",
                transport_->describe().c_str(), profile_.name.c_str(),
                static_cast<long>(timeout.count()));
  }
}

VgcController::~VgcController()
{
  disconnect();
}

void VgcController::connect()
{
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);
  if (transport_->is_open()) return;
  try {
    transport_->open();
  } catch (const ConnectionFault & e) {
    if (logger_) RCLCPP_ERROR(*logger_, "Connection refused: %s", e.what());
    throw;
  }
  // A new connection may reach a different controller.
  identity_ = DeviceIdentity{};
  identity_attempted_ = false;
  gauge_count_ = profile_.gauge_count;
  unit_.clear();
  if (logger_) RCLCPP_INFO(*logger_, "Connected to %s", transport_->describe().c_str());
}

void VgcController::disconnect()
{
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);
  if (!transport_->is_open()) return;
  transport_->close();
  if (logger_) RCLCPP_INFO(*logger_, "Connection closed");
}

bool VgcController::is_connected() const
{
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);
  return transport_->is_open();
}

DeviceIdentity VgcController::identity() const
{
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);
  return identity_;
}

int VgcController::gauge_count() const
{
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);
  return gauge_count_;
}

std::string VgcController::pressure_unit() const
{
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);
  return unit_;
}

Exchange VgcController::exchange(const std::string & command)
{
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);
  return engine_.run(command);
}

bool VgcController::check(const Exchange & ex, const std::string & command)
{
  switch (ex.state) {
    case HandshakeState::Complete:
      return true;
    case HandshakeState::Rejected:
      throw WrongCommand("Wrong command sent: " + command);
    case HandshakeState::UnknownAck:
      throw UnknownResponse(ex.raw_ack);
    default:
      return false;
  }
}

void VgcController::require(bool supported, const char * what) const
{
  if (!supported) {
    throw UnsupportedOperation(std::string(what) + " is unsupported for device variant '" +
                               profile_.name + "'");
  }
}

void VgcController::validate_gauge(int gauge)
{
  if (gauge < 1) {
    throw std::invalid_argument("gauge must be a positive integer, got " + std::to_string(gauge));
  }
  if (gauge_count_ == 0 && profile_.has_identity && !identity_attempted_) {
    initialize_identity();
  }
  if (gauge_count_ > 0 && gauge > gauge_count_) {
    throw std::invalid_argument("gauge " + std::to_string(gauge) + " exceeds gauge count " +
                                std::to_string(gauge_count_));
  }
}

double VgcController::read_pressure(int gauge)
{
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);
  validate_gauge(gauge);
  const std::string cmd = "PR" + std::to_string(gauge);
  Exchange ex = exchange(cmd);
  if (!check(ex, cmd)) return kNoReading;
  try {
    return reply_decoder::decode_pressure(ex.payload);
  } catch (const DecodeError & e) {
    if (logger_) RCLCPP_ERROR(*logger_, "Failed to parse pressure response: %s", e.what());
    return kNoReading;
  }
}

double VgcController::read_temperature()
{
  require(profile_.has_temperature, "TMP");
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);
  Exchange ex = exchange("TMP");
  if (!check(ex, "TMP")) return kNoReading;
  try {
    return reply_decoder::decode_scalar(ex.payload);
  } catch (const DecodeError & e) {
    if (logger_) RCLCPP_ERROR(*logger_, "Failed to parse temperature response: %s", e.what());
    return kNoReading;
  }
}

int VgcController::get_pressure_unit()
{
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);
  Exchange ex = exchange("UNI");
  if (!check(ex, "UNI")) return kNoUnit;
  int code = kNoUnit;
  try {
    code = reply_decoder::decode_unit(ex.payload);
  } catch (const DecodeError & e) {
    if (logger_) RCLCPP_ERROR(*logger_, "Failed to parse unit response: %s", e.what());
    throw;
  }
  unit_ = unit_name(code);
  if (logger_) RCLCPP_DEBUG(*logger_, "Pressure unit: %s", unit_.c_str());
  return code;
}

bool VgcController::set_pressure_unit(int code)
{
  if (code < kMinUnitCode || code > kMaxUnitCode) {
    throw std::invalid_argument("unit code must be 0..5, got " + std::to_string(code));
  }
  const std::string cmd = "UNI," + std::to_string(code);
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);
  Exchange ex = exchange(cmd);
  if (!check(ex, cmd)) return false;

  int echo = kNoUnit;
  try {
    echo = reply_decoder::decode_unit(ex.payload);
  } catch (const DecodeError & e) {
    if (logger_) RCLCPP_ERROR(*logger_, "Failed to parse unit echo: %s", e.what());
    return false;
  }
  if (echo != code) {
    if (logger_) RCLCPP_WARN(*logger_, "Unit echo %d does not match requested %d", echo, code);
    return false;
  }
  unit_ = unit_name(code);
  if (logger_) RCLCPP_INFO(*logger_, "Pressure unit set to %s", unit_.c_str());
  return true;
}

void VgcController::initialize_identity()
{
  require(profile_.has_identity, "AYT");
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);

  try {
    get_pressure_unit();
  } catch (const DecodeError &) {
    // already logged; identity is still worth having
  }

  Exchange ex = exchange("AYT");
  if (!check(ex, "AYT")) {
    // Silent or interrupted: ask again on the next gauge validation.
    if (logger_) RCLCPP_WARN(*logger_, "No identity reply (%s)", to_string(ex.state));
    return;
  }
  identity_attempted_ = true;
  try {
    identity_ = reply_decoder::decode_identity(ex.payload);
  } catch (const DecodeError & e) {
    if (logger_) RCLCPP_ERROR(*logger_, "Malformed identity reply: %s", e.what());
    return;
  }
  gauge_count_ = identity_.gauge_count;
  if (gauge_count_ == 0 && logger_) {
    RCLCPP_WARN(*logger_, "Could not derive gauge count from type '%s' / model '%s'",
                identity_.type.c_str(), identity_.model.c_str());
  }
  if (logger_) {
    RCLCPP_INFO(*logger_, "Identity: type=%s model=%s serial=%lld fw=%s hw=%s gauges=%d",
                identity_.type.c_str(), identity_.model.c_str(),
                static_cast<long long>(identity_.serial), identity_.firmware.c_str(),
                identity_.hardware.c_str(), gauge_count_);
  }
}

AtomicValue VgcController::get_atomic_value(const std::string & name)
{
  const std::string n = to_lower(name);
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);

  // "pressure_unit" is the unit, not a reading.
  if (n.find("unit") != std::string::npos) {
    if (unit_.empty()) get_pressure_unit();
    if (unit_.empty()) return kNoReading;
    return unit_;
  }
  if (n.find("pressure") != std::string::npos) {
    // "pressure2", "gauge_pressure_3" -> trailing digits select the gauge
    size_t i = n.size();
    while (i > 0 && std::isdigit(static_cast<unsigned char>(n[i - 1]))) --i;
    int gauge = 1;
    if (i < n.size()) {
      try {
        gauge = std::stoi(n.substr(i));
      } catch (const std::out_of_range &) {
        throw std::invalid_argument("gauge number out of range in '" + name + "'");
      }
    }
    return read_pressure(gauge);
  }
  if (n.find("temp") != std::string::npos) {
    return read_temperature();
  }
  if (logger_) RCLCPP_WARN(*logger_, "Unknown atomic value '%s'", name.c_str());
  return kNoReading;
}

bool VgcController::send_command(const std::string & command, std::string & reply)
{
  if (command.empty() || command.find_first_of("\r\n") != std::string::npos) {
    throw std::invalid_argument("command must be a single non-empty line");
  }
  std::lock_guard<std::recursive_mutex> lk(io_mutex_);
  Exchange ex = exchange(command);
  if (!check(ex, command)) return false;
  reply = ex.payload;
  return true;
}

} // namespace vgc_driver

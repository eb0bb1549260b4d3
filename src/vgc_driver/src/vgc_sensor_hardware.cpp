#include "vgc_driver/vgc_sensor_hardware.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace vgc_driver
{

static rclcpp::Logger logger()
{
  return rclcpp::get_logger("VgcSensorHardware");
}

hardware_interface::CallbackReturn
VgcSensorHardware::on_init(const hardware_interface::HardwareInfo & info)
{
  RCLCPP_INFO(logger(), "start initialization");
  if (SensorInterface::on_init(info) != hardware_interface::CallbackReturn::SUCCESS)
    return hardware_interface::CallbackReturn::ERROR;

  // Helper to read params from <hardware> block
  auto getp = [&](const std::string &name, const std::string &def)->std::string{
    auto it = info_.hardware_parameters.find(name);
    return (it!=info_.hardware_parameters.end()) ? it->second : def;
  };

  try {
    cfg_ = ConnectionConfig::from_parameters(getp);
    const int poll_ms = std::stoi(getp("poll_period_ms", "1000"));
    poll_period_s_ = std::max(0, poll_ms) / 1000.0;
    vgc_ = std::make_unique<VgcController>(create_transport(cfg_), make_profile(cfg_),
                                           cfg_.timeout(), logger());
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger(), "Bad hardware parameters: %s", e.what());
    return hardware_interface::CallbackReturn::ERROR;
  }

  channels_.clear();
  int next_gauge = 1;
  for (const auto & s : info_.sensors) {
    for (const auto & si : s.state_interfaces) {
      if (si.name == "pressure") {
        int gauge = next_gauge++;
        auto it = s.parameters.find("gauge");
        if (it != s.parameters.end()) {
          try { gauge = std::stoi(it->second); } catch (const std::exception &) { gauge = 0; }
        }
        if (gauge < 1) {
          RCLCPP_ERROR(logger(), "Sensor '%s': gauge must be a positive integer", s.name.c_str());
          return hardware_interface::CallbackReturn::ERROR;
        }
        channels_.push_back({s.name, si.name, Quantity::Pressure, gauge});
        RCLCPP_INFO(logger(), "Sensor '%s/pressure' -> gauge %d", s.name.c_str(), gauge);
      } else if (si.name == "temperature") {
        if (!vgc_->profile().has_temperature) {
          RCLCPP_ERROR(logger(), "Sensor '%s': temperature is unsupported for profile '%s'",
                       s.name.c_str(), vgc_->profile().name.c_str());
          return hardware_interface::CallbackReturn::ERROR;
        }
        channels_.push_back({s.name, si.name, Quantity::Temperature, 0});
      } else {
        RCLCPP_WARN(logger(), "Ignoring state interface '%s/%s'", s.name.c_str(), si.name.c_str());
      }
    }
  }

  if (channels_.empty()) {
    RCLCPP_ERROR(logger(), "No 'pressure' or 'temperature' state interfaces declared.");
    return hardware_interface::CallbackReturn::ERROR;
  }

  values_.assign(channels_.size(), std::numeric_limits<double>::quiet_NaN());
  RCLCPP_INFO(logger(), "Initialization OK; %zu channel(s) on %s, poll every %.3f s",
              channels_.size(), cfg_.transport.c_str(), poll_period_s_);
  return hardware_interface::CallbackReturn::SUCCESS;
}

std::vector<hardware_interface::StateInterface>
VgcSensorHardware::export_state_interfaces()
{
  std::vector<hardware_interface::StateInterface> si;
  si.reserve(channels_.size());
  for (size_t i=0;i<channels_.size();++i) {
    si.emplace_back(channels_[i].sensor, channels_[i].interface, &values_[i]);
  }
  RCLCPP_INFO(logger(), "Exported %zu state interfaces", si.size());
  return si;
}

hardware_interface::CallbackReturn
VgcSensorHardware::on_configure(const rclcpp_lifecycle::State &)
{
  try {
    vgc_->connect();
  } catch (const VgcError & e) {
    RCLCPP_ERROR(logger(), "Failed to connect: %s", e.what());
    return hardware_interface::CallbackReturn::ERROR;
  }
  return hardware_interface::CallbackReturn::SUCCESS;
}

hardware_interface::CallbackReturn
VgcSensorHardware::on_cleanup(const rclcpp_lifecycle::State &)
{
  vgc_->disconnect();
  return hardware_interface::CallbackReturn::SUCCESS;
}

hardware_interface::CallbackReturn
VgcSensorHardware::on_activate(const rclcpp_lifecycle::State &)
{
  if (vgc_->profile().has_identity) {
    try {
      vgc_->initialize_identity();
    } catch (const VgcError & e) {
      RCLCPP_ERROR(logger(), "Identity query failed: %s", e.what());
      return hardware_interface::CallbackReturn::ERROR;
    }
    for (const auto & c : channels_) {
      if (c.quantity == Quantity::Pressure && vgc_->gauge_count() > 0 && c.gauge > vgc_->gauge_count()) {
        RCLCPP_ERROR(logger(), "Sensor '%s' maps to gauge %d but the controller has %d",
                     c.sensor.c_str(), c.gauge, vgc_->gauge_count());
        return hardware_interface::CallbackReturn::ERROR;
      }
    }
  }
  std::fill(values_.begin(), values_.end(), std::numeric_limits<double>::quiet_NaN());
  first_poll_ = true;
  RCLCPP_INFO(logger(), "Activated; pressure unit '%s'", vgc_->pressure_unit().c_str());
  return hardware_interface::CallbackReturn::SUCCESS;
}

hardware_interface::CallbackReturn
VgcSensorHardware::on_deactivate(const rclcpp_lifecycle::State &)
{
  return hardware_interface::CallbackReturn::SUCCESS;
}

TransportPtr VgcSensorHardware::create_transport(const ConnectionConfig & cfg)
{
  return make_transport(cfg);
}

bool VgcSensorHardware::reconnect()
{
  vgc_->disconnect();
  try {
    vgc_->connect();
    if (vgc_->profile().has_identity) vgc_->initialize_identity();
  } catch (const VgcError & e) {
    RCLCPP_ERROR(logger(), "Reconnect failed: %s", e.what());
    return false;
  }
  return true;
}

hardware_interface::return_type
VgcSensorHardware::read(const rclcpp::Time &, const rclcpp::Duration &period)
{
  // The controller answers in tens of ms; do not hammer it at the cm rate.
  since_poll_s_ += period.seconds();
  if (!first_poll_ && since_poll_s_ < poll_period_s_) return hardware_interface::return_type::OK;
  since_poll_s_ = 0.0;
  first_poll_ = false;

  for (size_t i = 0; i < channels_.size(); ++i) {
    const Channel &c = channels_[i];
    double v = kNoReading;
    try {
      v = (c.quantity == Quantity::Pressure) ? vgc_->read_pressure(c.gauge) : vgc_->read_temperature();
    } catch (const WrongCommand & e) {
      RCLCPP_ERROR(logger(), "%s/%s: %s", c.sensor.c_str(), c.interface.c_str(), e.what());
    } catch (const UnknownResponse & e) {
      // Framing is out of step; start over on a fresh connection.
      RCLCPP_ERROR(logger(), "%s/%s: %s; reconnecting", c.sensor.c_str(), c.interface.c_str(), e.what());
      if (!reconnect()) return hardware_interface::return_type::ERROR;
    } catch (const ConnectionFault & e) {
      RCLCPP_ERROR(logger(), "%s/%s: %s", c.sensor.c_str(), c.interface.c_str(), e.what());
      return hardware_interface::return_type::ERROR;
    } catch (const std::exception & e) {
      // Bad gauge mapping, unsupported command: nothing a retry would fix.
      RCLCPP_ERROR(logger(), "%s/%s: %s", c.sensor.c_str(), c.interface.c_str(), e.what());
      return hardware_interface::return_type::ERROR;
    }

    if (v == kNoReading) {
      RCLCPP_WARN_THROTTLE(logger(), ros_clock_, 5000,
        "%s/%s: no valid reading this cycle", c.sensor.c_str(), c.interface.c_str());
      values_[i] = std::numeric_limits<double>::quiet_NaN();
    } else {
      values_[i] = v;
    }
  }
  return hardware_interface::return_type::OK;
}

} // namespace vgc_driver

#include "pluginlib/class_list_macros.hpp"
PLUGINLIB_EXPORT_CLASS(vgc_driver::VgcSensorHardware, hardware_interface::SensorInterface)

#pragma once
#include <memory>
#include <string>
#include <vector>

#include "hardware_interface/sensor_interface.hpp"
#include "hardware_interface/handle.hpp"
#include "hardware_interface/hardware_info.hpp"
#include "hardware_interface/types/hardware_interface_return_values.hpp"
#include "rclcpp/rclcpp.hpp"
#include "rclcpp_lifecycle/state.hpp"

#include "vgc_driver/connection_config.hpp"
#include "vgc_driver/vgc_controller.hpp"

namespace vgc_driver
{

/**
 * @brief ros2_control sensor exposing VGC50x gauges as state interfaces.
 *
 * <hardware> params: the ConnectionConfig keys plus
 *   - poll_period_ms (int) : minimum time between device reads, default 1000
 *
 * <sensor> elements:
 *   - state interface "pressure"    -> PR<gauge>; sensor param "gauge",
 *                                      default = position among pressure sensors + 1
 *   - state interface "temperature" -> TMP
 *
 * Missing readings are published as NaN.
 */
class VgcSensorHardware : public hardware_interface::SensorInterface
{
public:
  RCLCPP_SHARED_PTR_DEFINITIONS(VgcSensorHardware)

  hardware_interface::CallbackReturn on_init(const hardware_interface::HardwareInfo & info) override;

  std::vector<hardware_interface::StateInterface> export_state_interfaces() override;

  hardware_interface::CallbackReturn on_configure(const rclcpp_lifecycle::State &) override;
  hardware_interface::CallbackReturn on_cleanup(const rclcpp_lifecycle::State &) override;
  hardware_interface::CallbackReturn on_activate(const rclcpp_lifecycle::State &) override;
  hardware_interface::CallbackReturn on_deactivate(const rclcpp_lifecycle::State &) override;

  hardware_interface::return_type read(const rclcpp::Time &, const rclcpp::Duration &) override;

protected:
  // Called once from on_init.
  virtual TransportPtr create_transport(const ConnectionConfig & cfg);

private:
  enum class Quantity { Pressure, Temperature };
  struct Channel
  {
    std::string sensor;
    std::string interface;
    Quantity quantity;
    int gauge;  // pressure only
  };

  bool reconnect();

  ConnectionConfig cfg_;
  double poll_period_s_{1.0};
  double since_poll_s_{0.0};
  bool first_poll_{true};

  std::vector<Channel> channels_;
  std::vector<double> values_;

  std::unique_ptr<VgcController> vgc_;
  rclcpp::Clock ros_clock_{RCL_STEADY_TIME};
};

} // namespace vgc_driver

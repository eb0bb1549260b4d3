#include <iostream>
#include <sstream>
#include <string>
#include <memory>

#include "rclcpp/rclcpp.hpp"

#include "vgc_driver/connection_config.hpp"
#include "vgc_driver/vgc_controller.hpp"

using vgc_driver::kNoReading;

// Manual command entry. Built-ins map to the facade, everything else is sent
// through the raw ACK/ENQ passthrough.
static void print_help()
{
  std::cout <<
    "  pressure [n]   read gauge n (default 1)\n"
    "  temp           read controller temperature\n"
    "  unit [code]    get / set pressure unit (0=mbar 1=Torr 2=Pascal 3=Micron 4=hPascal 5=Volt)\n"
    "  ident          query identity (AYT)\n"
    "  help, quit\n"
    "  <anything else> raw command, e.g. PR1, AYT, TMP\n";
}

static void print_reading(double v)
{
  if (v == kNoReading) std::cout << "no reading" << std::endl;
  else std::cout << v << std::endl;
}

static void handle(vgc_driver::VgcController & vgc, const std::string & line)
{
  std::istringstream ss(line);
  std::string word;
  ss >> word;

  if (word == "pressure") {
    int gauge = 1;
    ss >> gauge;
    print_reading(vgc.read_pressure(gauge));
  } else if (word == "temp") {
    print_reading(vgc.read_temperature());
  } else if (word == "unit") {
    int code = 0;
    if (ss >> code) {
      std::cout << (vgc.set_pressure_unit(code) ? "ok" : "failed") << std::endl;
    } else if (vgc.get_pressure_unit() == vgc_driver::kNoUnit) {
      std::cout << "no reading" << std::endl;
    } else {
      std::cout << vgc.pressure_unit() << std::endl;
    }
  } else if (word == "ident") {
    vgc.initialize_identity();
    const auto id = vgc.identity();
    std::cout << id.type << " " << id.model << " serial=" << id.serial
              << " fw=" << id.firmware << " hw=" << id.hardware
              << " gauges=" << vgc.gauge_count() << std::endl;
  } else if (word == "help") {
    print_help();
  } else {
    std::string reply;
    if (vgc.send_command(line, reply)) std::cout << reply << std::endl;
    else std::cout << "no reply" << std::endl;
  }
}

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  auto node = rclcpp::Node::make_shared("vgc_console");

  std::unique_ptr<vgc_driver::VgcController> vgc;
  try {
    auto cfg = vgc_driver::declare_connection_parameters(*node);
    vgc = std::make_unique<vgc_driver::VgcController>(
      vgc_driver::make_transport(cfg), vgc_driver::make_profile(cfg),
      cfg.timeout(), node->get_logger());
    vgc->connect();
  } catch (const std::exception & e) {
    RCLCPP_ERROR(node->get_logger(), "%s", e.what());
    rclcpp::shutdown();
    return 1;
  }

  print_help();
  std::string line;
  while (rclcpp::ok()) {
    std::cout << "vgc> " << std::flush;
    if (!std::getline(std::cin, line)) break;
    line = vgc_driver::strip(line);
    if (line.empty()) continue;
    if (line == "quit" || line == "exit") break;

    try {
      handle(*vgc, line);
    } catch (const vgc_driver::ConnectionFault & e) {
      RCLCPP_ERROR(node->get_logger(), "%s; reconnecting", e.what());
      vgc->disconnect();
      try { vgc->connect(); } catch (const vgc_driver::VgcError & e2) {
        RCLCPP_ERROR(node->get_logger(), "%s", e2.what());
        break;
      }
    } catch (const std::exception & e) {
      // NAK, unknown handshake, bad arguments: report and keep the prompt.
      RCLCPP_ERROR(node->get_logger(), "%s", e.what());
    }
  }

  vgc->disconnect();
  rclcpp::shutdown();
  return 0;
}

#include <gtest/gtest.h>

#include <map>

#include "vgc_driver/connection_config.hpp"

using namespace vgc_driver;

static ConnectionConfig from_map(const std::map<std::string, std::string> & params)
{
  return ConnectionConfig::from_parameters(
    [&](const std::string & key, const std::string & def) {
      auto it = params.find(key);
      return it != params.end() ? it->second : def;
    });
}

TEST(ConnectionConfig, Defaults)
{
  ConnectionConfig c = from_map({});
  EXPECT_EQ(c.transport, "tcp");
  EXPECT_EQ(c.host, "127.0.0.1");
  EXPECT_EQ(c.port, 8000);
  EXPECT_EQ(c.timeout().count(), 1000);
  EXPECT_EQ(c.profile, "vgc502");
}

TEST(ConnectionConfig, HardwareParameters)
{
  ConnectionConfig c = from_map({{"transport", "serial"}, {"device", "/dev/ttyS3"},
                                 {"baud", "19200"}, {"timeout_ms", "250"},
                                 {"profile", "vgc503"}, {"gauge_count", "3"}});
  EXPECT_EQ(c.transport, "serial");
  EXPECT_EQ(c.device, "/dev/ttyS3");
  EXPECT_EQ(c.baud, 19200);
  EXPECT_EQ(c.timeout().count(), 250);
  EXPECT_EQ(make_profile(c).gauge_count, 3);
  EXPECT_EQ(make_profile(c).name, "vgc503");
}

TEST(ConnectionConfig, RejectsBadValues)
{
  EXPECT_THROW(from_map({{"port", "eighty"}}), std::invalid_argument);
  EXPECT_THROW(make_transport(from_map({{"transport", "usb"}})), std::invalid_argument);
  EXPECT_THROW(make_transport(from_map({{"port", "70000"}})), std::invalid_argument);
  EXPECT_THROW(make_profile(from_map({{"profile", "pkr251"}})), std::invalid_argument);
  EXPECT_THROW(make_profile(from_map({{"gauge_count", "-1"}})), std::invalid_argument);
}

TEST(ConnectionConfig, TransportDescribesEndpoint)
{
  auto tcp = make_transport(from_map({{"host", "10.0.0.7"}, {"port", "8000"}}));
  EXPECT_EQ(tcp->describe(), "tcp://10.0.0.7:8000");
  EXPECT_FALSE(tcp->is_open());

  auto serial = make_transport(from_map({{"transport", "serial"}, {"device", "/dev/ttyUSB1"}}));
  EXPECT_EQ(serial->describe(), "/dev/ttyUSB1");
  EXPECT_FALSE(serial->is_open());
}

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace vgc_driver
{

constexpr int kMinUnitCode = 0;
constexpr int kMaxUnitCode = 5;

struct DeviceIdentity
{
  std::string type;
  std::string model;
  int64_t serial{0};
  std::string firmware;
  std::string hardware;
  int gauge_count{0};  // 0 = unknown
};

// Parsers for the payload lines returned after ENQ. All throw DecodeError.
namespace reply_decoder
{

std::vector<std::string> split(const std::string & payload, char sep = ',');

// "<status>,<value>" -> value
double decode_pressure(const std::string & payload);

// Whole payload as a number (TMP).
double decode_scalar(const std::string & payload);

// Last field as a unit code 0..5; accepts "3" and the "UNI,2" echo.
int decode_unit(const std::string & payload);

// "type,model,serial,firmware,hardware". gauge_count comes from the trailing
// digit of type, else of model, else stays 0.
DeviceIdentity decode_identity(const std::string & payload);

}  // namespace reply_decoder

// "mbar", "Torr", ... ; throws std::invalid_argument outside 0..5.
const char * unit_name(int code);

} // namespace vgc_driver

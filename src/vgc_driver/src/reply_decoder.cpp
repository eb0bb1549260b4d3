#include "vgc_driver/reply_decoder.hpp"
#include "vgc_driver/errors.hpp"
#include "vgc_driver/handshake.hpp"

#include <array>
#include <cctype>
#include <stdexcept>

namespace vgc_driver
{

static const std::array<const char *, 6> kUnitNames = {
  "mbar", "Torr", "Pascal", "Micron", "hPascal", "Volt"
};

const char * unit_name(int code)
{
  if (code < kMinUnitCode || code > kMaxUnitCode) {
    throw std::invalid_argument("unit code " + std::to_string(code) + " outside 0..5");
  }
  return kUnitNames[static_cast<size_t>(code)];
}

namespace reply_decoder
{

std::vector<std::string> split(const std::string & payload, char sep)
{
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    auto pos = payload.find(sep, start);
    out.push_back(strip(payload.substr(start, pos - start)));
    if (pos == std::string::npos) break;
    start = pos + 1;
  }
  return out;
}

// std::stod accepts "1.0abc"; the device never sends trailing junk, so reject it.
static double to_double(const std::string & field)
{
  const std::string s = strip(field);
  size_t idx = 0;
  double v = 0.0;
  try {
    v = std::stod(s, &idx);
  } catch (const std::exception &) {
    throw DecodeError("not a number: '" + s + "'");
  }
  if (idx != s.size()) throw DecodeError("not a number: '" + s + "'");
  return v;
}

static long long to_integer(const std::string & field)
{
  const std::string s = strip(field);
  size_t idx = 0;
  long long v = 0;
  try {
    v = std::stoll(s, &idx);
  } catch (const std::exception &) {
    throw DecodeError("not an integer: '" + s + "'");
  }
  if (idx != s.size()) throw DecodeError("not an integer: '" + s + "'");
  return v;
}

double decode_pressure(const std::string & payload)
{
  auto fields = split(strip(payload));
  if (fields.size() < 2) {
    throw DecodeError("pressure reply needs 2 fields, got '" + payload + "'");
  }
  return to_double(fields[1]);
}

double decode_scalar(const std::string & payload)
{
  return to_double(payload);
}

int decode_unit(const std::string & payload)
{
  auto fields = split(strip(payload));
  const long long code = to_integer(fields.back());
  if (code < kMinUnitCode || code > kMaxUnitCode) {
    throw DecodeError("unit code " + std::to_string(code) + " outside 0..5");
  }
  return static_cast<int>(code);
}

static int trailing_digit(const std::string & s)
{
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.back()))) return -1;
  return s.back() - '0';
}

DeviceIdentity decode_identity(const std::string & payload)
{
  auto fields = split(strip(payload));
  if (fields.size() != 5) {
    throw DecodeError("identity reply needs 5 fields, got " + std::to_string(fields.size()) +
                      " in '" + payload + "'");
  }
  DeviceIdentity id;
  id.type = fields[0];
  id.model = fields[1];
  id.serial = to_integer(fields[2]);
  id.firmware = fields[3];
  id.hardware = fields[4];

  int n = trailing_digit(id.type);
  if (n < 0) n = trailing_digit(id.model);
  id.gauge_count = n < 0 ? 0 : n;
  return id;
}

}  // namespace reply_decoder

} // namespace vgc_driver

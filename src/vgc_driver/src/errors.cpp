#include "vgc_driver/errors.hpp"

#include <cstdio>

namespace vgc_driver
{

UnknownResponse::UnknownResponse(const std::string & raw)
: VgcError("Unknown response: " + escape_bytes(raw)), raw_(raw)
{
}

std::string escape_bytes(const std::string & bytes)
{
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    if (c == '\r') { out += "\\r"; continue; }
    if (c == '\n') { out += "\\n"; continue; }
    if (c >= 0x20 && c < 0x7f) { out.push_back(static_cast<char>(c)); continue; }
    char hex[5];
    std::snprintf(hex, sizeof(hex), "\\x%02x", c);
    out += hex;
  }
  return out;
}

} // namespace vgc_driver

#include "vgc_driver/framer.hpp"
#include "vgc_driver/errors.hpp"

namespace vgc_driver
{

void Framer::send(const std::string & bytes)
{
  if (!transport_.is_open()) throw ConnectionFault("not connected");
  transport_.send(bytes);
}

void Framer::discard_input()
{
  if (transport_.is_open()) transport_.discard_input();
}

static bool ends_with(const std::string & s, const std::string & suffix)
{
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string Framer::read_line(const std::string & terminator, size_t max_bytes)
{
  if (!transport_.is_open()) throw ConnectionFault("not connected");

  std::string line;
  while (line.size() < max_bytes) {
    // One byte at a time so nothing after the terminator is consumed.
    std::string b = transport_.recv(1, timeout_);
    if (b.empty()) break;  // peer closed
    line += b;
    if (!terminator.empty() && ends_with(line, terminator)) break;
  }
  return line;
}

} // namespace vgc_driver

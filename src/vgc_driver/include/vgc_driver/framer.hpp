#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include "vgc_driver/transport.hpp"

namespace vgc_driver
{

constexpr char kLineTerminator[] = "\r\n";
constexpr size_t kMaxLineBytes = 4096;

// Line-oriented view of a Transport. Does not own it.
class Framer
{
public:
  Framer(Transport & transport, std::chrono::milliseconds timeout)
  : transport_(transport), timeout_(timeout) {}

  void send(const std::string & bytes);

  // Throws away whatever is buffered from earlier, unanswered exchanges.
  void discard_input();

  // Accumulates single bytes until the buffer ends with `terminator`, reaches
  // `max_bytes`, or the peer closes. The terminator stays in the result.
  std::string read_line(const std::string & terminator = kLineTerminator,
                        size_t max_bytes = kMaxLineBytes);

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  Transport & transport_;
  std::chrono::milliseconds timeout_;
};

} // namespace vgc_driver

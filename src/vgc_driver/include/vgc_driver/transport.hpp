#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace vgc_driver
{

/**
 * @brief Ordered, reliable byte stream to one controller.
 *
 * Implementations own the socket / serial port. A VgcController owns exactly
 * one transport; nothing else writes to it.
 *
 *   send(bytes)                 : write all bytes or throw ConnectionFault
 *   recv(max_bytes, timeout)    : 1..max_bytes bytes, "" when the peer closed,
 *                                 throws Timeout / ConnectionFault
 *   discard_input()             : forget unread bytes before a new command
 */
class Transport
{
public:
  virtual ~Transport() = default;

  virtual void open() = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual void send(const std::string & bytes) = 0;
  virtual std::string recv(size_t max_bytes, std::chrono::milliseconds timeout) = 0;

  // Drops bytes already received but not read (late replies to a command that
  // timed out). End-of-stream and errors stay pending.
  virtual void discard_input() = 0;

  // Human readable endpoint for log lines ("tcp://host:port", "/dev/ttyUSB0").
  virtual std::string describe() const = 0;
};

using TransportPtr = std::unique_ptr<Transport>;

// Bytes delivered by an async reader thread, consumed by blocking recv().
class ReceiveBuffer
{
public:
  void push(const char * data, size_t n);
  void set_eof();
  void set_error(const std::string & what);
  void reset();
  void discard();

  // Blocks up to `timeout`. Returns "" on end of stream.
  std::string pop(size_t max_bytes, std::chrono::milliseconds timeout);

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::string data_;
  bool eof_{false};
  std::string error_;
};

} // namespace vgc_driver

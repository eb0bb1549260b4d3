#pragma once
#include <stdexcept>
#include <string>

namespace vgc_driver
{

// Base of every fault the driver raises. Input-contract violations are
// std::invalid_argument instead, so callers can tell bugs from device noise.
class VgcError : public std::runtime_error
{
public:
  explicit VgcError(const std::string & what) : std::runtime_error(what) {}
};

// Socket / serial failure: refused, reset, not connected, write error.
class ConnectionFault : public VgcError
{
public:
  explicit ConnectionFault(const std::string & what) : VgcError(what) {}
};

// No data inside the per-read window.
class Timeout : public VgcError
{
public:
  explicit Timeout(const std::string & what) : VgcError(what) {}
};

// Device answered NAK.
class WrongCommand : public VgcError
{
public:
  explicit WrongCommand(const std::string & what) : VgcError(what) {}
};

// Handshake was neither ACK nor NAK. Keeps the raw bytes for diagnostics.
class UnknownResponse : public VgcError
{
public:
  explicit UnknownResponse(const std::string & raw);

  const std::string & raw() const { return raw_; }

private:
  std::string raw_;
};

// Payload did not have the shape the command expects.
class DecodeError : public VgcError
{
public:
  explicit DecodeError(const std::string & what) : VgcError(what) {}
};

// Operation not available on the configured device profile.
class UnsupportedOperation : public VgcError
{
public:
  explicit UnsupportedOperation(const std::string & what) : VgcError(what) {}
};

// Printable rendering of raw protocol bytes, e.g. "\x06\r\n" -> "\\x06\\r\\n".
std::string escape_bytes(const std::string & bytes);

} // namespace vgc_driver

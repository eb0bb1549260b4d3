#include "vgc_driver/handshake.hpp"
#include "vgc_driver/errors.hpp"

namespace vgc_driver
{

const char * to_string(HandshakeState s)
{
  switch (s) {
    case HandshakeState::Sent:          return "SENT";
    case HandshakeState::AwaitPayload:  return "AWAIT_PAYLOAD";
    case HandshakeState::Complete:      return "COMPLETE";
    case HandshakeState::TimedOut:      return "TIMED_OUT";
    case HandshakeState::Rejected:      return "REJECTED";
    case HandshakeState::UnknownAck:    return "UNKNOWN_ACK";
    case HandshakeState::PayloadFailed: return "PAYLOAD_FAILED";
  }
  return "?";
}

std::string strip(const std::string & s)
{
  const char * ws = " \t\r\n";
  auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return std::string();
  auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

Exchange HandshakeEngine::run(const std::string & command)
{
  Exchange ex;
  const std::string tx = command + kLineTerminator;
  if (logger_) RCLCPP_DEBUG(*logger_, "Sending command: %s", escape_bytes(tx).c_str());
  // A reply that arrived after an earlier timeout must not be taken as ours.
  framer_.discard_input();
  framer_.send(tx);

  std::string ack;
  try {
    ack = framer_.read_line();
  } catch (const Timeout &) {
    if (logger_) RCLCPP_WARN(*logger_, "Timeout waiting for acknowledgment of '%s'", command.c_str());
    ex.state = HandshakeState::TimedOut;
    return ex;
  }
  if (ack.empty()) throw ConnectionFault("connection closed by peer during handshake");

  ex.raw_ack = strip(ack);
  if (logger_) RCLCPP_DEBUG(*logger_, "Acknowledgment received: %s", escape_bytes(ack).c_str());

  if (ex.raw_ack == std::string(1, kNak)) {
    if (logger_) RCLCPP_ERROR(*logger_, "Received NAK for '%s'", command.c_str());
    ex.state = HandshakeState::Rejected;
    return ex;
  }
  if (ex.raw_ack != std::string(1, kAck)) {
    if (logger_) RCLCPP_ERROR(*logger_, "Unknown acknowledgment: %s", escape_bytes(ex.raw_ack).c_str());
    ex.state = HandshakeState::UnknownAck;
    return ex;
  }

  ex.state = HandshakeState::AwaitPayload;
  if (logger_) RCLCPP_DEBUG(*logger_, "ACK received, sending ENQ");
  framer_.send(std::string(1, kEnq));

  std::string line;
  try {
    line = framer_.read_line();
  } catch (const Timeout &) {
    if (logger_) RCLCPP_WARN(*logger_, "Timeout waiting for payload of '%s'", command.c_str());
    ex.state = HandshakeState::PayloadFailed;
    return ex;
  } catch (const ConnectionFault & e) {
    if (logger_) RCLCPP_WARN(*logger_, "Payload read for '%s' failed: %s", command.c_str(), e.what());
    ex.state = HandshakeState::PayloadFailed;
    return ex;
  }
  if (line.empty()) {
    if (logger_) RCLCPP_WARN(*logger_, "Connection closed before payload of '%s'", command.c_str());
    ex.state = HandshakeState::PayloadFailed;
    return ex;
  }

  ex.payload = strip(line);
  if (logger_) RCLCPP_DEBUG(*logger_, "Response to '%s': %s", command.c_str(), ex.payload.c_str());
  ex.state = HandshakeState::Complete;
  return ex;
}

} // namespace vgc_driver

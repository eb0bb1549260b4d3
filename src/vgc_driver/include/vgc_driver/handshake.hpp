#pragma once
#include <optional>
#include <string>
#include <utility>

#include "rclcpp/rclcpp.hpp"

#include "vgc_driver/framer.hpp"

namespace vgc_driver
{

constexpr char kAck = '\x06';
constexpr char kNak = '\x15';
constexpr char kEnq = '\x05';

enum class HandshakeState
{
  Sent,
  AwaitPayload,
  Complete,       // payload holds the reply line
  TimedOut,       // no handshake line
  Rejected,       // NAK
  UnknownAck,     // raw_ack holds what came instead
  PayloadFailed,  // ACK seen, payload read timed out or faulted
};

const char * to_string(HandshakeState s);

// Outcome of one command cycle. The engine never throws for protocol states;
// the caller decides which of them are faults.
struct Exchange
{
  HandshakeState state{HandshakeState::Sent};
  std::string payload;  // stripped of surrounding whitespace and CR LF
  std::string raw_ack;

  bool ok() const { return state == HandshakeState::Complete; }
};

/**
 * @brief ACK / ENQ / NAK wrapper around every data-returning command.
 *
 *   SENT --write "CMD\r\n"--> read line
 *     timeout          -> TIMED_OUT
 *     ACK              -> AWAIT_PAYLOAD --write ENQ--> read line
 *                            timeout / fault -> PAYLOAD_FAILED
 *                            line            -> COMPLETE
 *     NAK              -> REJECTED
 *     anything else    -> UNKNOWN_ACK
 *
 * Unread input is discarded before the command goes out. Send failures and
 * faults while reading the handshake line propagate as ConnectionFault.
 */
class HandshakeEngine
{
public:
  HandshakeEngine(Framer & framer, std::optional<rclcpp::Logger> logger = std::nullopt)
  : framer_(framer), logger_(std::move(logger)) {}

  Exchange run(const std::string & command);

private:
  Framer & framer_;
  std::optional<rclcpp::Logger> logger_;
};

// Trims spaces, tabs, CR and LF from both ends.
std::string strip(const std::string & s);

} // namespace vgc_driver

#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal transport interfaces the relay core depends on.
 *
 * The core never talks to a chat network directly. A wrapper supplies:
 *  - an ISource the receiving worker pulls messages from, and
 *  - an IDestination the pipeline hands each delivery to.
 *
 * Contract:
 *  - receive() blocks until a message is available, the source is exhausted
 *    (RxResult::None) or it fails (RxResult::Error, reason in err).
 *  - deliver() returns true only once the destination accepted the send.
 *    A false return means "not sent"; the pipeline leaves the message
 *    unmarked so a later redelivery can retry it.
 *  - name() is a short identifier for logs.
 */

#include <string>

#include "linkrelay/message.hpp"

namespace linkrelay::transport {

enum class RxResult { Ok = 0, None = 1, Error = 2 };

class ISource {
public:
  virtual ~ISource() = default;
  virtual RxResult    receive(InboundMessage& out, std::string& err) = 0;
  virtual const char* name() const = 0;
};

class IDestination {
public:
  virtual ~IDestination() = default;
  virtual bool        deliver(const Delivery& d, std::string& err) = 0;
  virtual const char* name() const = 0;
};

} // namespace linkrelay::transport

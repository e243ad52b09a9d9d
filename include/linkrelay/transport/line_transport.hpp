#pragma once
/**
 * @file line_transport.hpp
 * @brief JSON-lines transport over iostreams (stdin/stdout in the daemon).
 *
 * Inbound, one object per line:
 *   {"source_id":-1001,"message_id":42,"text":"...","attachment":"ref"}
 * Outbound, one object per delivery:
 *   {"dest":"@channel","text":"...","attachment":"ref","silent":true}
 *
 * `text` may be omitted (empty); `attachment` may be omitted or null.
 * Blank lines are ignored; malformed lines are logged and skipped.
 */

#include <iosfwd>
#include <mutex>
#include <string>
#include <utility>

#include "linkrelay/transport/transport_base.hpp"

namespace linkrelay::transport {

/// Parse one inbound line. `err`: bad_json, not_object, bad_source_id, bad_message_id, bad_text, bad_attachment.
bool parse_inbound_line(const std::string& line, InboundMessage& out, std::string& err);

/// Serialize one delivery as a single JSON line (no trailing newline).
std::string format_delivery(const std::string& dest, const Delivery& d);

class LineSource : public ISource {
public:
  /// `fd` is the descriptor behind `in` (STDIN_FILENO in the daemon), or -1.
  explicit LineSource(std::istream& in, int fd = -1) : in_(in), fd_(fd) {}

  /// Next well-formed line. RxResult::None at end of input.
  RxResult    receive(InboundMessage& out, std::string& err) override;
  const char* name() const override { return "lines-in"; }

  /// True when the next receive() has input waiting: bytes already in the
  /// stream buffer, or a readable `fd`. Never blocks.
  bool ready() const;

  size_t skipped() const { return skipped_; }

private:
  std::istream& in_;
  int           fd_;
  size_t        line_no_{0};
  size_t        skipped_{0};
};

class LineDestination : public IDestination {
public:
  LineDestination(std::ostream& out, std::string dest) : out_(out), dest_(std::move(dest)) {}

  bool        deliver(const Delivery& d, std::string& err) override;
  const char* name() const override { return "lines-out"; }

private:
  std::ostream& out_;
  std::string   dest_;
  std::mutex    mutex_;
};

} // namespace linkrelay::transport

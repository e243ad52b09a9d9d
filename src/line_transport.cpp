#include "linkrelay/transport/line_transport.hpp"

#include <istream>
#include <ostream>

#include <poll.h>

#include <nlohmann/json.hpp>

#include "linkrelay/log.hpp"

namespace linkrelay::transport {

using json = nlohmann::json;

// -----------------------------------------------------------------------------
// parse_inbound_line() - One JSON object -> InboundMessage.
// PRE:
//   - `line` is one complete line without the newline.
// POLICY:
//   - Identity fields must be integers; anything else rejects the line.
//   - Unknown keys are ignored.
// -----------------------------------------------------------------------------
bool parse_inbound_line(const std::string& line, InboundMessage& out, std::string& err) {
  json j = json::parse(line, nullptr, false);
  if (j.is_discarded()) { err = "bad_json"; return false; }
  if (!j.is_object())   { err = "not_object"; return false; }

  auto sid = j.find("source_id");
  if (sid == j.end() || !sid->is_number_integer()) { err = "bad_source_id"; return false; }
  auto mid = j.find("message_id");
  if (mid == j.end() || !mid->is_number_integer()) { err = "bad_message_id"; return false; }

  InboundMessage m;
  m.source_id  = sid->get<int64_t>();
  m.message_id = mid->get<int64_t>();

  auto text = j.find("text");
  if (text != j.end() && !text->is_null()) {
    if (!text->is_string()) { err = "bad_text"; return false; }
    m.text = text->get<std::string>();
  }

  auto att = j.find("attachment");
  if (att != j.end() && !att->is_null()) {
    if (!att->is_string()) { err = "bad_attachment"; return false; }
    m.attachment = att->get<std::string>();
  }

  out = std::move(m);
  return true;
}

std::string format_delivery(const std::string& dest, const Delivery& d) {
  json j;
  j["dest"] = dest;
  j["text"] = d.text;
  if (d.attachment) j["attachment"] = *d.attachment;
  j["silent"] = d.silent;
  // Byte-level rewrites can split a UTF-8 sequence; invalid bytes become U+FFFD.
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

RxResult LineSource::receive(InboundMessage& out, std::string& err) {
  std::string line;
  while (std::getline(in_, line)) {
    ++line_no_;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;

    std::string why;
    if (parse_inbound_line(line, out, why)) return RxResult::Ok;
    ++skipped_;
    log::warn() << "event=bad_input line=" << line_no_ << " reason=" << why;
  }
  if (in_.bad()) {
    err = "read_failed";
    return RxResult::Error;
  }
  return RxResult::None;
}

bool LineSource::ready() const {
  std::streambuf* buf = in_.rdbuf();
  if (buf && buf->in_avail() > 0) return true;
  if (fd_ < 0) return false;

  pollfd pfd{fd_, POLLIN, 0};
  return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & (POLLIN | POLLHUP)) != 0;
}

bool LineDestination::deliver(const Delivery& d, std::string& err) {
  std::string line;
  try {
    line = format_delivery(dest_, d);
  } catch (const json::exception& e) {
    err = std::string("encode_failed reason=") + e.what();
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line << '\n';
  out_.flush();
  if (!out_) {
    err = "write_failed";
    return false;
  }
  return true;
}

} // namespace linkrelay::transport

/**
 * @file message.hpp
 * @brief Plain value types that cross the transport boundary.
 *
 * @details
 * `InboundMessage` is what a source transport hands the relay; `Delivery` is
 * what the relay asks a destination transport to send. Both are plain
 * structs: the relay never needs more than identity, text and an optional
 * attachment handle, and a transport is free to carry richer data behind the
 * attachment reference (file id, media path, URL).
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace linkrelay {

/**
 * @struct InboundMessage
 * @brief One message observed on a source feed.
 *
 * Identity is the pair (source_id, message_id). Text may be empty for
 * attachment-only messages.
 */
struct InboundMessage {
  int64_t                    source_id{0};
  int64_t                    message_id{0};
  std::string                text;
  std::optional<std::string> attachment;   ///< opaque transport reference
};

/**
 * @struct Delivery
 * @brief One send request to the destination feed.
 *
 * When `attachment` is set, `text` is its caption. `silent` asks the
 * destination not to notify recipients; the pipeline always sets it.
 */
struct Delivery {
  std::string                text;
  std::optional<std::string> attachment;
  bool                       silent{true};
};

} // namespace linkrelay

#pragma once

#include "klm/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace klm::host::sp {

/// Scalability-protocol framing as KiCad's API server speaks it on an
/// `ipc://` endpoint: an 8-byte connection header from each side, then
/// messages of `0x01`, a big-endian u64 length and the payload. Request and
/// reply payloads start with a 4-byte big-endian request id.

inline constexpr std::uint16_t PROTO_REQ0 = 0x30;
inline constexpr std::uint16_t PROTO_REP0 = 0x31;

inline constexpr std::size_t CONNECTION_HEADER_SIZE = 8;
inline constexpr std::size_t FRAME_PREFIX_SIZE = 9;
inline constexpr std::uint32_t REQUEST_ID_FLAG = 0x80000000u;
inline constexpr std::uint64_t MAX_MESSAGE_SIZE = 16u * 1024u * 1024u;

[[nodiscard]] std::string connection_header(std::uint16_t protocol);

/// Fails unless `header` is a well-formed header announcing `expected_peer`.
[[nodiscard]] common::Status check_connection_header(const std::string &header,
                                                     std::uint16_t expected_peer);

[[nodiscard]] std::string frame(const std::string &payload);

/// Payload length announced by a 9-byte frame prefix. Oversized frames fail.
[[nodiscard]] common::Result<std::uint64_t> frame_length(const std::string &prefix);

struct Message {
  std::uint32_t request_id = 0;
  std::string body;
};

[[nodiscard]] std::string join_message(std::uint32_t request_id, const std::string &body);

/// Fails when the payload is too short or the id lacks REQUEST_ID_FLAG.
[[nodiscard]] common::Result<Message> split_message(const std::string &payload);

} // namespace klm::host::sp

#include "klm/host/sp_frame.hpp"

#include <utility>

namespace klm::host::sp {

namespace {

void put_be(std::string &out, const std::uint64_t value, const int bytes) {
  for (int shift = (bytes - 1) * 8; shift >= 0; shift -= 8) {
    out.push_back(static_cast<char>((value >> shift) & 0xFF));
  }
}

std::uint64_t get_be(const std::string &in, const std::size_t offset, const int bytes) {
  std::uint64_t value = 0;
  for (int i = 0; i < bytes; ++i) {
    value = (value << 8) | static_cast<unsigned char>(in[offset + static_cast<std::size_t>(i)]);
  }
  return value;
}

} // namespace

std::string connection_header(const std::uint16_t protocol) {
  std::string header{'\0', 'S', 'P', '\0'};
  put_be(header, protocol, 2);
  put_be(header, 0, 2);
  return header;
}

common::Status check_connection_header(const std::string &header,
                                       const std::uint16_t expected_peer) {
  if (header.size() != CONNECTION_HEADER_SIZE || header[0] != '\0' || header[1] != 'S' ||
      header[2] != 'P' || header[3] != '\0' || header[6] != '\0' || header[7] != '\0') {
    return common::Status::error("peer is not a scalability-protocol endpoint");
  }
  const auto peer = static_cast<std::uint16_t>(get_be(header, 4, 2));
  if (peer != expected_peer) {
    return common::Status::error("peer speaks protocol " + std::to_string(peer) + ", expected " +
                                 std::to_string(expected_peer));
  }
  return common::Status::success();
}

std::string frame(const std::string &payload) {
  std::string out;
  out.reserve(FRAME_PREFIX_SIZE + payload.size());
  out.push_back('\x01');
  put_be(out, payload.size(), 8);
  out += payload;
  return out;
}

common::Result<std::uint64_t> frame_length(const std::string &prefix) {
  if (prefix.size() != FRAME_PREFIX_SIZE || prefix[0] != '\x01') {
    return common::Result<std::uint64_t>::failure("malformed message frame");
  }
  const std::uint64_t length = get_be(prefix, 1, 8);
  if (length > MAX_MESSAGE_SIZE) {
    return common::Result<std::uint64_t>::failure("message of " + std::to_string(length) +
                                                  " bytes exceeds the size limit");
  }
  return common::Result<std::uint64_t>::success(length);
}

std::string join_message(const std::uint32_t request_id, const std::string &body) {
  std::string out;
  out.reserve(4 + body.size());
  put_be(out, request_id | REQUEST_ID_FLAG, 4);
  out += body;
  return out;
}

common::Result<Message> split_message(const std::string &payload) {
  if (payload.size() < 4) {
    return common::Result<Message>::failure("message is shorter than its request id");
  }
  Message message;
  message.request_id = static_cast<std::uint32_t>(get_be(payload, 0, 4));
  if ((message.request_id & REQUEST_ID_FLAG) == 0) {
    return common::Result<Message>::failure("message carries no request id");
  }
  message.body = payload.substr(4);
  return common::Result<Message>::success(std::move(message));
}

} // namespace klm::host::sp

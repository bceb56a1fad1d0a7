#pragma once

#include "klm/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace klm::host {

inline constexpr const char *CLIENT_NAME = "kicad-library-manager";

/// What the host application reports about the board open in its editor.
struct BoardContext {
  std::string project_path;
  std::string board_name;
};

/// Environment handed to the plugin by the host. Read-only, logged, passed on.
struct HostEnvironment {
  std::optional<std::string> socket;
  std::optional<std::string> token;

  [[nodiscard]] static HostEnvironment from_process();
};

class HostClient {
public:
  virtual ~HostClient() = default;

  /// failure: host unreachable or protocol error.
  /// success(nullopt): host reachable, no board open.
  [[nodiscard]] virtual common::Result<std::optional<BoardContext>>
  fetch_board(std::chrono::milliseconds timeout) = 0;
};

/// KiCad's API endpoint when KICAD_API_SOCKET is unset: `/tmp/kicad/api.sock`,
/// or `%TEMP%\kicad\api.sock` on Windows.
[[nodiscard]] std::filesystem::path default_socket_path();

/// Strips an `ipc://` scheme; nullopt for schemes this client cannot speak.
[[nodiscard]] std::optional<std::filesystem::path>
socket_path_from_address(const std::optional<std::string> &address);

/// Serialized `ApiRequest` carrying `GetOpenDocuments(DOCTYPE_PCB)`.
[[nodiscard]] std::string encode_board_request(const std::string &token,
                                               const std::string &client_name);

/// Decodes a serialized `ApiResponse`. Non-OK statuses and unexpected
/// payloads fail; a response listing no PCB document is nullopt.
[[nodiscard]] common::Result<std::optional<BoardContext>>
decode_board_reply(const std::string &bytes);

/// Client of KiCad's IPC API: protobuf envelopes over a req/rep connection
/// to the endpoint named by KICAD_API_SOCKET. One request per call; the
/// whole exchange, connect included, is bounded by the timeout.
class KicadApiClient final : public HostClient {
public:
  KicadApiClient(std::filesystem::path socket_path, std::string token);

  [[nodiscard]] common::Result<std::optional<BoardContext>>
  fetch_board(std::chrono::milliseconds timeout) override;

  [[nodiscard]] const std::filesystem::path &socket_path() const { return socket_path_; }

private:
  std::filesystem::path socket_path_;
  std::string token_;
  std::uint32_t next_request_id_ = 1;
};

/// Fails when the configured address cannot be served, which the bootstrap
/// treats as a missing IPC client.
[[nodiscard]] common::Result<std::unique_ptr<HostClient>>
make_kicad_api_client(const HostEnvironment &env);

} // namespace klm::host

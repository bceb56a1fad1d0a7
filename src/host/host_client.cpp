#include "klm/host/host_client.hpp"

#include "klm/common/fs.hpp"
#include "klm/host/ipc_stream.hpp"
#include "klm/host/sp_frame.hpp"
#include "kiapi/common/commands/editor_commands.pb.h"
#include "kiapi/common/envelope.pb.h"

namespace klm::host {

namespace {

constexpr const char *IPC_SCHEME = "ipc://";

using BoardResult = common::Result<std::optional<BoardContext>>;

} // namespace

HostEnvironment HostEnvironment::from_process() {
  HostEnvironment env;
  env.socket = common::env_value("KICAD_API_SOCKET");
  env.token = common::env_value("KICAD_API_TOKEN");
  return env;
}

std::filesystem::path default_socket_path() {
#ifdef _WIN32
  std::error_code ec;
  auto temp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    temp = std::filesystem::path(common::env_value("TEMP").value_or("C:\\Windows\\Temp"));
  }
  return temp / "kicad" / "api.sock";
#else
  return std::filesystem::path("/tmp/kicad/api.sock");
#endif
}

std::optional<std::filesystem::path>
socket_path_from_address(const std::optional<std::string> &address) {
  if (!address.has_value() || common::trim(*address).empty()) {
    return default_socket_path();
  }
  std::string value = common::trim(*address);
  if (common::starts_with(value, IPC_SCHEME)) {
    value = value.substr(std::string(IPC_SCHEME).size());
  } else if (value.find("://") != std::string::npos) {
    return std::nullopt;
  }
  if (value.empty()) {
    return std::nullopt;
  }
  return std::filesystem::path(value);
}

std::string encode_board_request(const std::string &token, const std::string &client_name) {
  kiapi::common::commands::GetOpenDocuments command;
  command.set_type(kiapi::common::types::DOCTYPE_PCB);

  kiapi::common::ApiRequest request;
  request.mutable_header()->set_kicad_token(token);
  request.mutable_header()->set_client_name(client_name);
  request.mutable_message()->PackFrom(command);
  return request.SerializeAsString();
}

BoardResult decode_board_reply(const std::string &bytes) {
  kiapi::common::ApiResponse response;
  if (!response.ParseFromString(bytes)) {
    return BoardResult::failure("KiCad sent a malformed API response");
  }

  const auto &status = response.status();
  if (status.status() != kiapi::common::AS_OK) {
    std::string message = "KiCad API returned " + kiapi::common::ApiStatusCode_Name(status.status());
    if (!status.error_message().empty()) {
      message += ": " + status.error_message();
    }
    return BoardResult::failure(message);
  }

  kiapi::common::commands::GetOpenDocumentsResponse documents;
  if (!response.message().UnpackTo(&documents)) {
    return BoardResult::failure("unexpected KiCad API payload: " + response.message().type_url());
  }
  for (const auto &document : documents.documents()) {
    if (document.type() != kiapi::common::types::DOCTYPE_PCB) {
      continue;
    }
    BoardContext board;
    board.project_path = document.project().path();
    board.board_name = document.board_filename();
    return BoardResult::success(std::move(board));
  }
  return BoardResult::success(std::nullopt);
}

KicadApiClient::KicadApiClient(std::filesystem::path socket_path, std::string token)
    : socket_path_(std::move(socket_path)), token_(std::move(token)) {}

BoardResult KicadApiClient::fetch_board(const std::chrono::milliseconds timeout) {
  const Deadline deadline = std::chrono::steady_clock::now() + timeout;

  IpcStream stream;
  if (auto connected = stream.connect(socket_path_, deadline); !connected.ok()) {
    return BoardResult::failure(connected.error());
  }
  if (auto sent = stream.write_all(sp::connection_header(sp::PROTO_REQ0), deadline); !sent.ok()) {
    return BoardResult::failure(sent.error());
  }
  auto header = stream.read_exact(sp::CONNECTION_HEADER_SIZE, deadline);
  if (!header.ok()) {
    return BoardResult::failure(header.error());
  }
  if (auto peer = sp::check_connection_header(header.value(), sp::PROTO_REP0); !peer.ok()) {
    return BoardResult::failure("KiCad API handshake failed: " + peer.error());
  }

  const std::uint32_t request_id = sp::REQUEST_ID_FLAG | next_request_id_++;
  const std::string request =
      sp::frame(sp::join_message(request_id, encode_board_request(token_, CLIENT_NAME)));
  if (auto sent = stream.write_all(request, deadline); !sent.ok()) {
    return BoardResult::failure(sent.error());
  }

  auto prefix = stream.read_exact(sp::FRAME_PREFIX_SIZE, deadline);
  if (!prefix.ok()) {
    return BoardResult::failure(prefix.error());
  }
  const auto length = sp::frame_length(prefix.value());
  if (!length.ok()) {
    return BoardResult::failure(length.error());
  }
  auto payload = stream.read_exact(static_cast<std::size_t>(length.value()), deadline);
  if (!payload.ok()) {
    return BoardResult::failure(payload.error());
  }
  auto reply = sp::split_message(payload.value());
  if (!reply.ok()) {
    return BoardResult::failure(reply.error());
  }
  if (reply.value().request_id != request_id) {
    return BoardResult::failure("KiCad answered a different request");
  }
  return decode_board_reply(reply.value().body);
}

common::Result<std::unique_ptr<HostClient>> make_kicad_api_client(const HostEnvironment &env) {
  auto path = socket_path_from_address(env.socket);
  if (!path.has_value()) {
    return common::Result<std::unique_ptr<HostClient>>::failure(
        "unsupported host API address: " + env.socket.value_or(""));
  }
  return common::Result<std::unique_ptr<HostClient>>::success(
      std::make_unique<KicadApiClient>(std::move(*path), env.token.value_or("")));
}

} // namespace klm::host

#include "test_framework.hpp"

#include "klm/host/host_client.hpp"
#include "klm/host/sp_frame.hpp"
#include "kiapi/common/commands/editor_commands.pb.h"
#include "kiapi/common/envelope.pb.h"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace api = kiapi::common;

/// Serialized OK response listing the given documents.
std::string documents_reply(const std::vector<api::types::DocumentSpecifier> &documents) {
  api::commands::GetOpenDocumentsResponse payload;
  for (const auto &document : documents) {
    *payload.add_documents() = document;
  }
  api::ApiResponse response;
  response.mutable_status()->set_status(api::AS_OK);
  response.mutable_message()->PackFrom(payload);
  return response.SerializeAsString();
}

api::types::DocumentSpecifier pcb_document(const std::string &project_dir,
                                           const std::string &board_file) {
  api::types::DocumentSpecifier document;
  document.set_type(api::types::DOCTYPE_PCB);
  document.set_board_filename(board_file);
  document.mutable_project()->set_name("demo");
  document.mutable_project()->set_path(project_dir);
  return document;
}

} // namespace

void register_host_tests(std::vector<klm::tests::TestCase> &tests) {
  using klm::tests::require;
  namespace hs = klm::host;
  namespace sp = klm::host::sp;
  namespace kt = klm::testing;

  tests.push_back({"host_socket_address_parsing", [] {
                     require(hs::socket_path_from_address(std::nullopt) ==
                                 hs::default_socket_path(),
                             "unset uses default");
                     require(hs::socket_path_from_address(std::string("  ")) ==
                                 hs::default_socket_path(),
                             "blank uses default");
                     require(hs::socket_path_from_address(std::string("ipc:///run/kicad.sock")) ==
                                 "/run/kicad.sock",
                             "ipc scheme stripped");
                     require(hs::socket_path_from_address(std::string("/run/plain.sock")) ==
                                 "/run/plain.sock",
                             "bare path kept");
                     require(!hs::socket_path_from_address(std::string("tcp://127.0.0.1:1")),
                             "tcp unsupported");
                     require(!hs::socket_path_from_address(std::string("ipc://")), "empty ipc");
                   }});

  tests.push_back({"host_environment_reads_kicad_variables", [] {
                     const kt::EnvGuard socket("KICAD_API_SOCKET", "ipc:///tmp/x.sock");
                     const kt::EnvGuard token("KICAD_API_TOKEN", std::nullopt);
                     const auto env = hs::HostEnvironment::from_process();
                     require(env.socket == "ipc:///tmp/x.sock", "socket");
                     require(!env.token.has_value(), "token should be missing");
                   }});

  tests.push_back({"sp_frame_header_and_message_layout", [] {
                     const auto header = sp::connection_header(sp::PROTO_REQ0);
                     require(header == std::string("\0SP\0\0\x30\0\0", 8), "req0 header bytes");
                     require(sp::check_connection_header(sp::connection_header(sp::PROTO_REP0),
                                                         sp::PROTO_REP0)
                                 .ok(),
                             "rep0 header accepted");
                     require(!sp::check_connection_header(header, sp::PROTO_REP0).ok(),
                             "wrong peer protocol rejected");
                     require(!sp::check_connection_header("HTTP/1.", sp::PROTO_REP0).ok(),
                             "non-SP peer rejected");

                     const auto framed = sp::frame(sp::join_message(7, "abc"));
                     require(framed == std::string("\x01\0\0\0\0\0\0\0\x07\x80\0\0\x07"
                                                   "abc",
                                                   16),
                             "frame layout");
                     const auto length = sp::frame_length(framed.substr(0, sp::FRAME_PREFIX_SIZE));
                     require(length.ok() && length.value() == 7, "frame length");
                     const auto message = sp::split_message(framed.substr(sp::FRAME_PREFIX_SIZE));
                     require(message.ok(), message.error());
                     require(message.value().request_id == (sp::REQUEST_ID_FLAG | 7u), "id");
                     require(message.value().body == "abc", "body");

                     require(!sp::split_message(std::string("\0\0\0\x01", 4)).ok(),
                             "id without the request flag rejected");
                     std::string oversized("\x01\0\0\0\0\x7f\0\0\0", 9);
                     require(!sp::frame_length(oversized).ok(), "oversized frame rejected");
                   }});

  tests.push_back({"board_request_asks_for_open_pcbs", [] {
                     const auto bytes = hs::encode_board_request("secret", hs::CLIENT_NAME);
                     api::ApiRequest request;
                     require(request.ParseFromString(bytes), "request should parse");
                     require(request.header().kicad_token() == "secret", "token");
                     require(request.header().client_name() == "kicad-library-manager",
                             "client name");
                     require(request.message().type_url() ==
                                 "type.googleapis.com/kiapi.common.commands.GetOpenDocuments",
                             "type url: " + request.message().type_url());
                     api::commands::GetOpenDocuments command;
                     require(request.message().UnpackTo(&command), "payload unpacks");
                     require(command.type() == api::types::DOCTYPE_PCB, "asks for boards");
                   }});

  tests.push_back({"board_reply_decoding", [] {
                     auto board = hs::decode_board_reply(
                         documents_reply({pcb_document("/p/demo", "demo.kicad_pcb")}));
                     require(board.ok() && board.value().has_value(), board.error());
                     require(board.value()->project_path == "/p/demo", "project path");
                     require(board.value()->board_name == "demo.kicad_pcb", "board name");

                     auto none = hs::decode_board_reply(documents_reply({}));
                     require(none.ok() && !none.value().has_value(), "no document is no board");

                     api::types::DocumentSpecifier schematic;
                     schematic.set_type(api::types::DOCTYPE_SCHEMATIC);
                     auto only_schematic = hs::decode_board_reply(documents_reply({schematic}));
                     require(only_schematic.ok() && !only_schematic.value().has_value(),
                             "non-PCB documents are skipped");

                     api::ApiResponse refused;
                     refused.mutable_status()->set_status(api::AS_TOKEN_MISMATCH);
                     refused.mutable_status()->set_error_message("bad token");
                     auto mismatch = hs::decode_board_reply(refused.SerializeAsString());
                     require(!mismatch.ok(), "non-OK status is a failure");
                     require(mismatch.error().find("AS_TOKEN_MISMATCH") != std::string::npos &&
                                 mismatch.error().find("bad token") != std::string::npos,
                             "status in message: " + mismatch.error());

                     api::ApiResponse wrong_payload;
                     wrong_payload.mutable_status()->set_status(api::AS_OK);
                     wrong_payload.mutable_message()->PackFrom(api::commands::GetOpenDocuments{});
                     require(!hs::decode_board_reply(wrong_payload.SerializeAsString()).ok(),
                             "unexpected payload type is a failure");
                     require(!hs::decode_board_reply("\xff\xff\xff").ok(),
                             "garbage is a failure");
                   }});

  tests.push_back({"make_host_client_rejects_unsupported_address", [] {
                     hs::HostEnvironment env;
                     env.socket = "tcp://localhost:9";
                     require(!hs::make_kicad_api_client(env).ok(), "tcp must be rejected");
                   }});

#ifndef _WIN32
  tests.push_back({"api_client_fetches_board", [] {
                     const kt::TempDir dir;
                     kt::FakeKicadServer server(
                         dir.path() / "api.sock",
                         documents_reply({pcb_document("/p/demo", "demo.kicad_pcb")}));
                     auto started = server.start();
                     require(started.ok(), started.error());

                     hs::HostEnvironment env;
                     env.socket = "ipc://" + server.socket_path().string();
                     env.token = "secret";
                     auto client = hs::make_kicad_api_client(env);
                     require(client.ok(), client.error());
                     auto board = client.value()->fetch_board(std::chrono::milliseconds(2000));
                     server.stop();

                     require(board.ok(), board.error());
                     require(board.value().has_value(), "board expected");
                     require(board.value()->project_path == "/p/demo", "project path");

                     api::ApiRequest request;
                     require(request.ParseFromString(server.last_request()), "request recorded");
                     require(request.header().kicad_token() == "secret", "token forwarded");
                   }});

  tests.push_back({"api_client_reports_no_board", [] {
                     const kt::TempDir dir;
                     kt::FakeKicadServer server(dir.path() / "api.sock", documents_reply({}));
                     require(server.start().ok(), "server start");
                     hs::KicadApiClient client(server.socket_path(), "");
                     auto board = client.fetch_board(std::chrono::milliseconds(2000));
                     server.stop();
                     require(board.ok(), board.error());
                     require(!board.value().has_value(), "no board expected");
                   }});

  tests.push_back({"api_client_fails_without_server", [] {
                     const kt::TempDir dir;
                     hs::KicadApiClient client(dir.path() / "absent.sock", "");
                     auto board = client.fetch_board(std::chrono::milliseconds(200));
                     require(!board.ok(), "connect should fail");
                   }});

  tests.push_back({"api_client_times_out_on_silent_host", [] {
                     const kt::TempDir dir;
                     kt::FakeKicadServer server(dir.path() / "api.sock", std::nullopt);
                     require(server.start().ok(), "server start");
                     hs::KicadApiClient client(server.socket_path(), "");
                     const auto begin = std::chrono::steady_clock::now();
                     auto board = client.fetch_board(std::chrono::milliseconds(300));
                     const auto elapsed = std::chrono::steady_clock::now() - begin;
                     server.stop();
                     require(!board.ok(), "silent host should time out");
                     require(elapsed < std::chrono::seconds(3), "timeout not honoured");
                   }});
#endif
}

#pragma once

#include "klm/config/schema.hpp"
#include "klm/host/host_client.hpp"
#include "klm/instance/exclusivity.hpp"
#include "klm/ui/toolkit.hpp"
#include "klm/workspace/config_store.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace klm::testing {

/// Config with the stderr sink switched off so test output stays readable.
config::Config quiet_config();

/// Sets or unsets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
  EnvGuard(std::string key, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;

private:
  std::string key_;
  std::optional<std::string> old_value_;
};

class TempDir {
public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  std::filesystem::path create_file(const std::string &name, const std::string &content) const;
  std::filesystem::path create_dir(const std::string &name) const;

private:
  std::filesystem::path path_;
};

/// Lays out `Database/categories.yml` under `dir`.
void make_repo_root(const std::filesystem::path &dir);

[[nodiscard]] std::string read_file(const std::filesystem::path &path);

struct ShownMessage {
  std::string title;
  std::string body;
  ui::Severity severity = ui::Severity::Info;
};

/// Everything a fake toolkit saw, shared with the test after the toolkit
/// itself has been handed to the code under test.
struct ToolkitLog {
  std::vector<ShownMessage> messages;
  int exit_requests = 0;
  bool top_level_windows = false;
  bool application_created = false;
  std::optional<std::pair<std::string, std::string>> main_window;
};

class FakeNotifier final : public ui::Notifier {
public:
  explicit FakeNotifier(std::shared_ptr<ToolkitLog> log);

  void show_message(const std::string &title, const std::string &body,
                    ui::Severity severity) override;
  [[nodiscard]] bool has_top_level_windows() const override;
  void exit_main_loop() override;

private:
  std::shared_ptr<ToolkitLog> log_;
};

class FakeToolkit final : public ui::Toolkit {
public:
  explicit FakeToolkit(std::shared_ptr<ToolkitLog> log, bool create_ok = true);

  [[nodiscard]] ui::Notifier &notifier() override { return notifier_; }
  [[nodiscard]] common::Status create_application() override;
  [[nodiscard]] common::Result<int> run_main_window(const std::string &repo_path,
                                                    const std::string &project_path) override;

private:
  std::shared_ptr<ToolkitLog> log_;
  FakeNotifier notifier_;
  bool create_ok_;
};

class FakeHostClient final : public host::HostClient {
public:
  explicit FakeHostClient(common::Result<std::optional<host::BoardContext>> reply);

  [[nodiscard]] common::Result<std::optional<host::BoardContext>>
  fetch_board(std::chrono::milliseconds timeout) override;

private:
  common::Result<std::optional<host::BoardContext>> reply_;
};

class MemoryConfigStore final : public workspace::ConfigStore {
public:
  explicit MemoryConfigStore(config::Config config = quiet_config());

  [[nodiscard]] common::Result<config::Config> load() override;
  [[nodiscard]] common::Status save(const config::Config &config) override;

  void fail_loads(std::string message) { load_error_ = std::move(message); }
  void fail_saves(std::string message) { save_error_ = std::move(message); }

  [[nodiscard]] const config::Config &current() const { return config_; }
  [[nodiscard]] int save_count() const { return save_count_; }

private:
  config::Config config_;
  std::optional<std::string> load_error_;
  std::optional<std::string> save_error_;
  int save_count_ = 0;
};

/// The exclusivity mechanism itself is broken.
class UnavailablePrimitive final : public instance::ExclusivityPrimitive {
public:
  [[nodiscard]] common::Result<instance::AcquireOutcome>
  acquire(const std::string &name, const std::filesystem::path &scope_dir) override;
  [[nodiscard]] common::Status remove_artifact(const std::string &name,
                                               const std::filesystem::path &scope_dir) override;
};

class ThrowingPrimitive final : public instance::ExclusivityPrimitive {
public:
  [[nodiscard]] common::Result<instance::AcquireOutcome>
  acquire(const std::string &name, const std::filesystem::path &scope_dir) override;
  [[nodiscard]] common::Status remove_artifact(const std::string &name,
                                               const std::filesystem::path &scope_dir) override;
};

/// Reports "already held" forever, even after the artifact was removed.
class AlwaysHeldPrimitive final : public instance::ExclusivityPrimitive {
public:
  [[nodiscard]] common::Result<instance::AcquireOutcome>
  acquire(const std::string &name, const std::filesystem::path &scope_dir) override;
  [[nodiscard]] common::Status remove_artifact(const std::string &name,
                                               const std::filesystem::path &scope_dir) override;

  [[nodiscard]] int acquire_calls() const { return acquire_calls_; }
  [[nodiscard]] int remove_calls() const { return remove_calls_; }

private:
  int acquire_calls_ = 0;
  int remove_calls_ = 0;
};

/// Stand-in for KiCad's API server on a unix socket. Completes the req/rep
/// connection handshake, remembers the last request body (a serialized
/// ApiRequest) and answers with `reply`, a serialized ApiResponse. With no
/// reply it reads the request and stays silent.
class FakeKicadServer {
public:
  FakeKicadServer(std::filesystem::path socket_path, std::optional<std::string> reply);
  ~FakeKicadServer();

  FakeKicadServer(const FakeKicadServer &) = delete;
  FakeKicadServer &operator=(const FakeKicadServer &) = delete;

  [[nodiscard]] common::Status start();
  void stop();

  [[nodiscard]] std::string last_request() const;
  [[nodiscard]] const std::filesystem::path &socket_path() const { return socket_path_; }

private:
  void run_loop();
  void serve(int client);
  [[nodiscard]] bool read_exact(int fd, std::size_t size, std::string &out) const;

  std::filesystem::path socket_path_;
  std::optional<std::string> reply_;
  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread worker_;
  mutable std::mutex request_mutex_;
  std::string last_request_;
};

} // namespace klm::testing

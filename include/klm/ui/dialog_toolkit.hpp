#pragma once

#include "klm/ui/toolkit.hpp"

#include <memory>
#include <string>

namespace klm::ui {

enum class DialogBackend {
  Zenity,
  Kdialog,
  Osascript,
  Win32,
};

/// Modal dialogs through the desktop's dialog helper.
class DialogNotifier final : public Notifier {
public:
  explicit DialogNotifier(DialogBackend backend);

  void show_message(const std::string &title, const std::string &body,
                    Severity severity) override;
  [[nodiscard]] bool has_top_level_windows() const override { return window_open_; }
  void exit_main_loop() override { quit_requested_ = true; }

  void set_window_open(bool open) { window_open_ = open; }
  [[nodiscard]] bool quit_requested() const { return quit_requested_; }

private:
  DialogBackend backend_;
  bool window_open_ = false;
  bool quit_requested_ = false;
};

/// Toolkit whose main window is the external UI executable. The child's
/// lifetime is the event loop.
class DialogToolkit final : public Toolkit {
public:
  DialogToolkit(DialogBackend backend, std::string ui_command);

  [[nodiscard]] Notifier &notifier() override { return notifier_; }
  [[nodiscard]] common::Status create_application() override;
  [[nodiscard]] common::Result<int> run_main_window(const std::string &repo_path,
                                                    const std::string &project_path) override;

  /// Full command line used to start the UI: run by the shell on POSIX,
  /// by CreateProcessW on Windows.
  [[nodiscard]] std::string main_window_command(const std::string &repo_path,
                                                const std::string &project_path) const;

private:
  DialogNotifier notifier_;
  std::string ui_command_;
  bool application_created_ = false;
};

/// Shell-safe single quoting.
[[nodiscard]] std::string shell_single_quote(const std::string &value);

/// Quoting for a CreateProcessW command line (CommandLineToArgvW rules).
[[nodiscard]] std::string windows_quote_argument(const std::string &value);

/// The platform's quoting for `main_window_command`.
[[nodiscard]] std::string quote_argument(const std::string &value);

/// Fails when no display or dialog helper is available.
[[nodiscard]] common::Result<std::unique_ptr<Toolkit>>
make_dialog_toolkit(const std::string &ui_command);

} // namespace klm::ui

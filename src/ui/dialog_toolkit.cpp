#include "klm/ui/dialog_toolkit.hpp"

#include "klm/common/fs.hpp"
#include "klm/platform/process.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/wait.h>
#endif

namespace klm::ui {

namespace {

#ifndef _WIN32
bool command_exists(const std::string &binary) {
  const std::string command = "command -v " + shell_single_quote(binary) + " >/dev/null 2>&1";
  return std::system(command.c_str()) == 0;
}
#endif

std::string escape_applescript_string(const std::string &value) {
  std::string out;
  out.reserve(value.size() + 8);
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}

#ifdef _WIN32
common::Result<int> run_process(const std::string &command_line) {
  const int size = MultiByteToWideChar(CP_UTF8, 0, command_line.c_str(), -1, nullptr, 0);
  if (size <= 0) {
    return common::Result<int>::failure("UI command line is not valid UTF-8");
  }
  std::wstring wide(static_cast<std::size_t>(size), L'\0');
  MultiByteToWideChar(CP_UTF8, 0, command_line.c_str(), -1, wide.data(), size);

  STARTUPINFOW startup{};
  startup.cb = sizeof(startup);
  PROCESS_INFORMATION process{};
  if (!CreateProcessW(nullptr, wide.data(), nullptr, nullptr, FALSE, 0, nullptr, nullptr,
                      &startup, &process)) {
    return common::Result<int>::failure("failed to start UI: " + command_line);
  }
  WaitForSingleObject(process.hProcess, INFINITE);
  DWORD code = 0;
  const BOOL have_code = GetExitCodeProcess(process.hProcess, &code);
  CloseHandle(process.hThread);
  CloseHandle(process.hProcess);
  if (!have_code) {
    return common::Result<int>::failure("failed to read UI exit status");
  }
  return common::Result<int>::success(static_cast<int>(code));
}
#else
int decode_exit_status(const int raw) {
  if (raw == -1) {
    return -1;
  }
  if (WIFEXITED(raw)) {
    return WEXITSTATUS(raw);
  }
  return 128 + (WIFSIGNALED(raw) ? WTERMSIG(raw) : 0);
}

common::Result<int> run_process(const std::string &command_line) {
  const int status = decode_exit_status(std::system(command_line.c_str()));
  if (status < 0) {
    return common::Result<int>::failure("failed to start UI: " + command_line);
  }
  return common::Result<int>::success(status);
}
#endif

std::string dialog_command(const DialogBackend backend, const std::string &title,
                           const std::string &body, const Severity severity) {
  switch (backend) {
  case DialogBackend::Zenity: {
    const char *kind = severity == Severity::Error     ? "--error"
                       : severity == Severity::Warning ? "--warning"
                                                       : "--info";
    return std::string("zenity ") + kind + " --no-markup --title=" + shell_single_quote(title) +
           " --text=" + shell_single_quote(body) + " >/dev/null 2>&1";
  }
  case DialogBackend::Kdialog: {
    const char *kind = severity == Severity::Error     ? "--error"
                       : severity == Severity::Warning ? "--sorry"
                                                       : "--msgbox";
    return std::string("kdialog ") + kind + " " + shell_single_quote(body) + " --title " +
           shell_single_quote(title) + " >/dev/null 2>&1";
  }
  case DialogBackend::Osascript: {
    const char *icon = severity == Severity::Error     ? "stop"
                       : severity == Severity::Warning ? "caution"
                                                       : "note";
    std::ostringstream script;
    script << "display dialog \"" << escape_applescript_string(body) << "\" with title \""
           << escape_applescript_string(title) << "\" buttons {\"OK\"} default button \"OK\""
           << " with icon " << icon;
    return "osascript -e " + shell_single_quote(script.str()) + " >/dev/null 2>&1";
  }
  case DialogBackend::Win32:
    break;
  }
  return {};
}

} // namespace

std::string shell_single_quote(const std::string &value) {
  std::string out = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string windows_quote_argument(const std::string &value) {
  std::string out = "\"";
  std::size_t backslashes = 0;
  for (const char ch : value) {
    if (ch == '\\') {
      ++backslashes;
      continue;
    }
    if (ch == '"') {
      out.append(backslashes * 2 + 1, '\\');
    } else {
      out.append(backslashes, '\\');
    }
    backslashes = 0;
    out.push_back(ch);
  }
  // Backslashes before the closing quote are doubled so it stays a quote.
  out.append(backslashes * 2, '\\');
  out.push_back('"');
  return out;
}

std::string quote_argument(const std::string &value) {
#ifdef _WIN32
  return windows_quote_argument(value);
#else
  return shell_single_quote(value);
#endif
}

DialogNotifier::DialogNotifier(const DialogBackend backend) : backend_(backend) {}

void DialogNotifier::show_message(const std::string &title, const std::string &body,
                                  const Severity severity) {
#ifdef _WIN32
  UINT flags = MB_OK;
  flags |= severity == Severity::Error     ? MB_ICONERROR
           : severity == Severity::Warning ? MB_ICONWARNING
                                           : MB_ICONINFORMATION;
  MessageBoxA(nullptr, body.c_str(), title.c_str(), flags);
#else
  const std::string command = dialog_command(backend_, title, body, severity);
  if (command.empty() || std::system(command.c_str()) != 0) {
    // The dialog helper vanished or was dismissed abnormally; keep the text.
    std::fputs((title + "\n" + body + "\n").c_str(), stderr);
  }
#endif
}

DialogToolkit::DialogToolkit(const DialogBackend backend, std::string ui_command)
    : notifier_(backend), ui_command_(std::move(ui_command)) {}

common::Status DialogToolkit::create_application() {
  if (common::trim(ui_command_).empty()) {
    return common::Status::error("no UI command configured (set ui_command or KLM_UI_COMMAND)");
  }
  application_created_ = true;
  return common::Status::success();
}

std::string DialogToolkit::main_window_command(const std::string &repo_path,
                                               const std::string &project_path) const {
  std::string program = common::trim(ui_command_);
  // Prefer a UI executable shipped next to the launcher.
  const auto sibling = platform::install_dir() / program;
  std::error_code ec;
  if (program.find_first_of("/\\") == std::string::npos &&
      std::filesystem::is_regular_file(sibling, ec)) {
    program = sibling.string();
  }
  return quote_argument(program) + " --repo " + quote_argument(repo_path) + " --project " +
         quote_argument(project_path);
}

common::Result<int> DialogToolkit::run_main_window(const std::string &repo_path,
                                                   const std::string &project_path) {
  if (!application_created_) {
    return common::Result<int>::failure("application was not created");
  }
  if (notifier_.quit_requested()) {
    return common::Result<int>::success(0);
  }

  const std::string command = main_window_command(repo_path, project_path);
  notifier_.set_window_open(true);
  auto status = run_process(command);
  notifier_.set_window_open(false);
  return status;
}

common::Result<std::unique_ptr<Toolkit>> make_dialog_toolkit(const std::string &ui_command) {
#if defined(_WIN32)
  return common::Result<std::unique_ptr<Toolkit>>::success(
      std::make_unique<DialogToolkit>(DialogBackend::Win32, ui_command));
#elif defined(__APPLE__)
  if (!command_exists("osascript")) {
    return common::Result<std::unique_ptr<Toolkit>>::failure("osascript is not available");
  }
  return common::Result<std::unique_ptr<Toolkit>>::success(
      std::make_unique<DialogToolkit>(DialogBackend::Osascript, ui_command));
#else
  if (!common::env_value("DISPLAY").has_value() &&
      !common::env_value("WAYLAND_DISPLAY").has_value()) {
    return common::Result<std::unique_ptr<Toolkit>>::failure(
        "no graphical display (DISPLAY / WAYLAND_DISPLAY unset)");
  }
  if (command_exists("zenity")) {
    return common::Result<std::unique_ptr<Toolkit>>::success(
        std::make_unique<DialogToolkit>(DialogBackend::Zenity, ui_command));
  }
  if (command_exists("kdialog")) {
    return common::Result<std::unique_ptr<Toolkit>>::success(
        std::make_unique<DialogToolkit>(DialogBackend::Kdialog, ui_command));
  }
  return common::Result<std::unique_ptr<Toolkit>>::failure(
      "no dialog helper found (install zenity or kdialog)");
#endif
}

} // namespace klm::ui

#pragma once

#include "klm/common/result.hpp"

#include <memory>
#include <string>

namespace klm::ui {

inline constexpr const char *APP_TITLE = "KiCad Library Manager";

enum class Severity {
  Info,
  Warning,
  Error,
};

/// Modal, synchronous user notification plus the bits of event-loop state
/// the bootstrap needs to avoid leaving an invisible process behind.
class Notifier {
public:
  virtual ~Notifier() = default;

  virtual void show_message(const std::string &title, const std::string &body,
                            Severity severity) = 0;
  [[nodiscard]] virtual bool has_top_level_windows() const = 0;
  virtual void exit_main_loop() = 0;
};

/// The GUI toolkit as seen from the bootstrap. Rendering lives behind
/// `run_main_window`.
class Toolkit {
public:
  virtual ~Toolkit() = default;

  [[nodiscard]] virtual Notifier &notifier() = 0;

  /// Application and event-loop construction.
  [[nodiscard]] virtual common::Status create_application() = 0;

  /// Shows the main window and blocks until its event loop ends. An empty
  /// `repo_path` asks the UI for setup mode.
  [[nodiscard]] virtual common::Result<int> run_main_window(const std::string &repo_path,
                                                            const std::string &project_path) = 0;
};

/// Error dialog through the toolkit when there is one, stderr otherwise.
void show_error(Toolkit *toolkit, const std::string &title, const std::string &message);

} // namespace klm::ui

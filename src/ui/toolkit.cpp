#include "klm/ui/toolkit.hpp"

#include <iostream>

namespace klm::ui {

void show_error(Toolkit *toolkit, const std::string &title, const std::string &message) {
  if (toolkit != nullptr) {
    auto &notifier = toolkit->notifier();
    notifier.show_message(title, message, Severity::Error);
    if (!notifier.has_top_level_windows()) {
      notifier.exit_main_loop();
    }
    return;
  }
  std::cerr << title << "\n" << message << "\n";
}

} // namespace klm::ui

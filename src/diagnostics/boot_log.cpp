#include "klm/diagnostics/boot_log.hpp"

#include <ctime>
#include <exception>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace klm::diagnostics {

BootLog::BootLog(std::filesystem::path path) : path_(std::move(path)) {}

void BootLog::append(const std::string &message) const noexcept {
  try {
    std::error_code ec;
    if (path_.has_parent_path()) {
      std::filesystem::create_directories(path_.parent_path(), ec);
    }
    std::ofstream out(path_, std::ios::app | std::ios::binary);
    if (!out) {
      return;
    }
    out << format_line(std::chrono::system_clock::now(), message) << '\n';
  } catch (const std::exception &) {
    // Best effort: the boot log must never take the launch down with it.
  }
}

std::string BootLog::format_line(const std::chrono::system_clock::time_point when,
                                 const std::string &message) {
  const std::time_t raw = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &raw);
#else
  localtime_r(&raw, &local);
#endif
  std::ostringstream line;
  line << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "] " << message;
  return line.str();
}

} // namespace klm::diagnostics

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace klm::diagnostics {

/// Append-only, timestamped launch log. Every append opens, writes and closes
/// the file; failures never reach the caller.
class BootLog {
public:
  explicit BootLog(std::filesystem::path path);

  void append(const std::string &message) const noexcept;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  /// `[YYYY-MM-DD HH:MM:SS] message` in local time, without the newline.
  [[nodiscard]] static std::string format_line(std::chrono::system_clock::time_point when,
                                               const std::string &message);

private:
  std::filesystem::path path_;
};

} // namespace klm::diagnostics

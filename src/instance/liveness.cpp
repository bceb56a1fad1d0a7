#include "klm/instance/liveness.hpp"

#include <charconv>
#include <limits>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <csignal>
#include <sys/types.h>
#endif

namespace klm::instance {

bool is_process_alive(const long long pid) {
  if (pid <= 0) {
    return false;
  }
#ifdef _WIN32
  if (pid > static_cast<long long>(std::numeric_limits<DWORD>::max())) {
    return false;
  }
  HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
  if (process == nullptr) {
    return GetLastError() == ERROR_ACCESS_DENIED;
  }
  DWORD code = 0;
  const bool running = GetExitCodeProcess(process, &code) != 0 && code == STILL_ACTIVE;
  CloseHandle(process);
  return running;
#else
  if (pid > static_cast<long long>(std::numeric_limits<pid_t>::max())) {
    return false;
  }
  if (kill(static_cast<pid_t>(pid), 0) == 0) {
    return true;
  }
  // EPERM: the process exists but belongs to someone else.
  return errno == EPERM;
#endif
}

bool is_process_alive(const std::string_view pid_text) {
  long long pid = 0;
  const auto *first = pid_text.data();
  const auto *last = first + pid_text.size();
  auto [ptr, ec] = std::from_chars(first, last, pid);
  if (pid_text.empty() || ec != std::errc() || ptr != last) {
    return false;
  }
  return is_process_alive(pid);
}

} // namespace klm::instance

#include "klm/diagnostics/crash_trace.hpp"

#include "klm/platform/cache_dir.hpp"

#include <array>
#include <csignal>
#include <cstring>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#if defined(__GLIBC__) || defined(__APPLE__)
#include <execinfo.h>
#define KLM_HAVE_BACKTRACE 1
#endif
#endif

namespace klm::diagnostics {

#ifndef _WIN32

namespace {

int g_fault_fd = -1;

constexpr std::array<int, 5> FATAL_SIGNALS = {SIGSEGV, SIGBUS, SIGFPE, SIGILL, SIGABRT};

void write_raw(const char *text) {
  if (g_fault_fd < 0 || text == nullptr) {
    return;
  }
  (void)::write(g_fault_fd, text, std::strlen(text));
}

const char *signal_label(const int signo) {
  switch (signo) {
  case SIGSEGV:
    return "SIGSEGV";
  case SIGBUS:
    return "SIGBUS";
  case SIGFPE:
    return "SIGFPE";
  case SIGILL:
    return "SIGILL";
  case SIGABRT:
    return "SIGABRT";
  default:
    return "signal";
  }
}

// Async-signal-safe only: write(2), backtrace_symbols_fd, sigaction, raise.
void on_fatal_signal(const int signo) {
  write_raw("\n=== fatal ");
  write_raw(signal_label(signo));
  write_raw(" in kicad-library-manager ===\n");
#ifdef KLM_HAVE_BACKTRACE
  std::array<void *, 64> frames{};
  const int depth = backtrace(frames.data(), static_cast<int>(frames.size()));
  backtrace_symbols_fd(frames.data(), depth, g_fault_fd);
#endif

  struct sigaction fallback {};
  fallback.sa_handler = SIG_DFL;
  sigemptyset(&fallback.sa_mask);
  sigaction(signo, &fallback, nullptr);
  raise(signo);
}

} // namespace

std::optional<std::filesystem::path> install_crash_trace(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  const auto path = dir / platform::FAULT_LOG_FILENAME;

  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
  if (fd < 0) {
    return std::nullopt;
  }
  const int previous = g_fault_fd;
  g_fault_fd = fd;
  if (previous >= 0) {
    ::close(previous);
  }

#ifdef KLM_HAVE_BACKTRACE
  // backtrace() loads libgcc lazily; do it now rather than inside the handler.
  std::array<void *, 1> warmup{};
  (void)backtrace(warmup.data(), static_cast<int>(warmup.size()));
#endif

  bool installed = false;
  for (const int signo : FATAL_SIGNALS) {
    struct sigaction action {};
    action.sa_handler = on_fatal_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESETHAND;
    if (sigaction(signo, &action, nullptr) == 0) {
      installed = true;
    }
  }
  if (!installed) {
    return std::nullopt;
  }
  return path;
}

#else

std::optional<std::filesystem::path> install_crash_trace(const std::filesystem::path &) {
  return std::nullopt;
}

#endif

} // namespace klm::diagnostics

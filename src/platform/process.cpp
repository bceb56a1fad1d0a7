#include "klm/platform/process.hpp"

#include "klm/common/fs.hpp"

#include <array>
#include <cstdint>

#ifdef _WIN32
#include <process.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

namespace klm::platform {

long long current_pid() {
#ifdef _WIN32
  return static_cast<long long>(_getpid());
#else
  return static_cast<long long>(getpid());
#endif
}

std::filesystem::path executable_path() {
#if defined(_WIN32)
  std::array<wchar_t, 4096> buffer{};
  const DWORD len = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
  if (len == 0 || len >= buffer.size()) {
    return {};
  }
  return std::filesystem::path(std::wstring(buffer.data(), len));
#elif defined(__APPLE__)
  std::array<char, 4096> buffer{};
  auto size = static_cast<std::uint32_t>(buffer.size());
  if (_NSGetExecutablePath(buffer.data(), &size) != 0) {
    return {};
  }
  std::error_code ec;
  auto resolved = std::filesystem::weakly_canonical(buffer.data(), ec);
  return ec ? std::filesystem::path(buffer.data()) : resolved;
#else
  std::error_code ec;
  auto resolved = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return {};
  }
  return resolved;
#endif
}

std::filesystem::path install_dir() {
  const auto exe = executable_path();
  if (!exe.empty() && exe.has_parent_path()) {
    return exe.parent_path();
  }
  return current_dir();
}

std::filesystem::path current_dir() {
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    return {};
  }
  return cwd;
}

std::filesystem::path user_home() {
  if (auto home = common::home_dir(); home.ok()) {
    return home.value();
  }
  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  return ec ? std::filesystem::path(".") : tmp;
}

std::string user_key() {
#ifndef _WIN32
  return std::to_string(static_cast<unsigned long long>(getuid()));
#else
  if (auto name = common::env_value("USERNAME"); name.has_value()) {
    return *name;
  }
  if (auto name = common::env_value("USER"); name.has_value()) {
    return *name;
  }
  return "user";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc > 0 ? argc : 0));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i] != nullptr ? argv[i] : "");
  }
  return out;
}

} // namespace klm::platform

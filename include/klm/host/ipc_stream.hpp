#pragma once

#include "klm/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace klm::host {

using Deadline = std::chrono::steady_clock::time_point;

/// Byte stream to a local IPC endpoint: a unix socket on POSIX, the named
/// pipe `\\.\pipe\<path>` on Windows. Every call gives up at the deadline.
class IpcStream {
public:
  IpcStream() = default;
  ~IpcStream();

  IpcStream(const IpcStream &) = delete;
  IpcStream &operator=(const IpcStream &) = delete;

  [[nodiscard]] common::Status connect(const std::filesystem::path &endpoint, Deadline deadline);
  [[nodiscard]] common::Status write_all(const std::string &bytes, Deadline deadline);
  [[nodiscard]] common::Result<std::string> read_exact(std::size_t size, Deadline deadline);
  void close();

private:
#ifdef _WIN32
  void *pipe_ = nullptr;
#else
  int fd_ = -1;
#endif
};

} // namespace klm::host

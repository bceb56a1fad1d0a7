#include "klm/host/ipc_stream.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <thread>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#endif

namespace klm::host {

namespace {

#if !defined(_WIN32) && defined(MSG_NOSIGNAL)
constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#else
constexpr int SEND_FLAGS = 0;
#endif

constexpr int POLL_SLICE_MS = 50;

int remaining_ms(const Deadline deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return static_cast<int>(std::clamp<long long>(left.count(), 0, POLL_SLICE_MS));
}

bool expired(const Deadline deadline) { return std::chrono::steady_clock::now() >= deadline; }

#ifndef _WIN32
/// Waits for `events` for at most one poll slice; false on a poll error.
bool wait_for(const int fd, const short events, const Deadline deadline) {
  struct pollfd pfd {
    .fd = fd,
    .events = events,
    .revents = 0,
  };
  return poll(&pfd, 1, remaining_ms(deadline)) >= 0 || errno == EINTR;
}
#endif

} // namespace

IpcStream::~IpcStream() { close(); }

#ifndef _WIN32

common::Status IpcStream::connect(const std::filesystem::path &endpoint, const Deadline deadline) {
  close();
  const std::string socket = endpoint.string();
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (socket.empty() || socket.size() >= sizeof(addr.sun_path)) {
    return common::Status::error("invalid host socket path: " + socket);
  }
  std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket.c_str());

  fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
  if (fd_ < 0) {
    return common::Status::error("failed to create unix socket");
  }
  const int flags = ::fcntl(fd_, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) != 0) {
    close();
    return common::Status::error("failed to make host socket non-blocking");
  }
#if defined(SO_NOSIGPIPE)
  const int one = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one)) != 0) {
    close();
    return common::Status::error("failed to configure host socket");
  }
#endif

  while (true) {
    if (::connect(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0 ||
        errno == EISCONN) {
      return common::Status::success();
    }
    const int err = errno;
    if (err != EINPROGRESS && err != EALREADY && err != EAGAIN && err != EINTR) {
      close();
      return common::Status::error("failed to connect to host socket " + socket + ": " +
                                   std::strerror(err));
    }
    if (expired(deadline)) {
      close();
      return common::Status::error("timed out connecting to host socket " + socket);
    }
    if (err == EAGAIN) {
      // Listener backlog is full; try again shortly.
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      continue;
    }
    if (!wait_for(fd_, POLLOUT, deadline)) {
      close();
      return common::Status::error("poll failed on host socket " + socket);
    }
  }
}

common::Status IpcStream::write_all(const std::string &bytes, const Deadline deadline) {
  if (fd_ < 0) {
    return common::Status::error("host socket is not connected");
  }
  std::size_t offset = 0;
  while (offset < bytes.size()) {
    const ssize_t sent = ::send(fd_, bytes.data() + offset, bytes.size() - offset, SEND_FLAGS);
    if (sent > 0) {
      offset += static_cast<std::size_t>(sent);
      continue;
    }
    if (sent < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      return common::Status::error(std::string("failed to send to host: ") +
                                   std::strerror(errno));
    }
    if (expired(deadline)) {
      return common::Status::error("timed out sending to host");
    }
    if (!wait_for(fd_, POLLOUT, deadline)) {
      return common::Status::error("poll failed on host socket");
    }
  }
  return common::Status::success();
}

common::Result<std::string> IpcStream::read_exact(const std::size_t size, const Deadline deadline) {
  if (fd_ < 0) {
    return common::Result<std::string>::failure("host socket is not connected");
  }
  std::string data;
  data.reserve(size);
  std::array<char, 4096> chunk{};
  while (data.size() < size) {
    const std::size_t want = std::min(chunk.size(), size - data.size());
    const ssize_t bytes = ::read(fd_, chunk.data(), want);
    if (bytes > 0) {
      data.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes == 0) {
      return common::Result<std::string>::failure("host closed the connection");
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      return common::Result<std::string>::failure(std::string("failed to read from host: ") +
                                                  std::strerror(errno));
    }
    if (expired(deadline)) {
      return common::Result<std::string>::failure("host request timed out");
    }
    if (!wait_for(fd_, POLLIN, deadline)) {
      return common::Result<std::string>::failure("poll failed on host socket");
    }
  }
  return common::Result<std::string>::success(std::move(data));
}

void IpcStream::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

#else

common::Status IpcStream::connect(const std::filesystem::path &endpoint, const Deadline deadline) {
  close();
  const std::wstring name = L"\\\\.\\pipe\\" + endpoint.wstring();
  while (true) {
    HANDLE pipe = CreateFileW(name.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr,
                              OPEN_EXISTING, 0, nullptr);
    if (pipe != INVALID_HANDLE_VALUE) {
      pipe_ = pipe;
      return common::Status::success();
    }
    const DWORD err = GetLastError();
    if (err != ERROR_PIPE_BUSY) {
      return common::Status::error("failed to open host pipe " + endpoint.string() + " (error " +
                                   std::to_string(err) + ")");
    }
    if (expired(deadline)) {
      return common::Status::error("timed out connecting to host pipe " + endpoint.string());
    }
    if (!WaitNamedPipeW(name.c_str(), static_cast<DWORD>(std::max(1, remaining_ms(deadline))))) {
      // Still busy after this slice; the deadline check above ends the loop.
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }
}

common::Status IpcStream::write_all(const std::string &bytes, const Deadline deadline) {
  if (pipe_ == nullptr) {
    return common::Status::error("host pipe is not connected");
  }
  std::size_t offset = 0;
  while (offset < bytes.size()) {
    if (expired(deadline)) {
      return common::Status::error("timed out sending to host");
    }
    DWORD written = 0;
    if (!WriteFile(static_cast<HANDLE>(pipe_), bytes.data() + offset,
                   static_cast<DWORD>(bytes.size() - offset), &written, nullptr)) {
      return common::Status::error("failed to send to host (error " +
                                   std::to_string(GetLastError()) + ")");
    }
    offset += written;
  }
  return common::Status::success();
}

common::Result<std::string> IpcStream::read_exact(const std::size_t size, const Deadline deadline) {
  if (pipe_ == nullptr) {
    return common::Result<std::string>::failure("host pipe is not connected");
  }
  std::string data;
  data.reserve(size);
  std::array<char, 4096> chunk{};
  while (data.size() < size) {
    DWORD available = 0;
    if (!PeekNamedPipe(static_cast<HANDLE>(pipe_), nullptr, 0, nullptr, &available, nullptr)) {
      return common::Result<std::string>::failure("host closed the connection");
    }
    if (available == 0) {
      if (expired(deadline)) {
        return common::Result<std::string>::failure("host request timed out");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      continue;
    }
    const DWORD want = static_cast<DWORD>(
        std::min<std::size_t>({chunk.size(), size - data.size(), static_cast<std::size_t>(available)}));
    DWORD read = 0;
    if (!ReadFile(static_cast<HANDLE>(pipe_), chunk.data(), want, &read, nullptr) || read == 0) {
      return common::Result<std::string>::failure("failed to read from host");
    }
    data.append(chunk.data(), read);
  }
  return common::Result<std::string>::success(std::move(data));
}

void IpcStream::close() {
  if (pipe_ != nullptr) {
    CloseHandle(static_cast<HANDLE>(pipe_));
    pipe_ = nullptr;
  }
}

#endif

} // namespace klm::host

#include "klm/instance/exclusivity.hpp"

#include "klm/common/fs.hpp"
#include "klm/instance/process_descriptor.hpp"
#include "klm/platform/process.hpp"

#include <cerrno>
#include <cstring>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace klm::instance {

namespace {

#ifdef _WIN32
int open_exclusive(const std::filesystem::path &path) {
  int fd = -1;
  const errno_t err = _wsopen_s(&fd, path.c_str(), _O_WRONLY | _O_CREAT | _O_EXCL | _O_BINARY,
                                _SH_DENYNO, _S_IREAD | _S_IWRITE);
  if (err != 0) {
    errno = err;
    return -1;
  }
  return fd;
}
int write_fd(int fd, const std::string &text) {
  return _write(fd, text.data(), static_cast<unsigned int>(text.size()));
}
void close_fd(int fd) { _close(fd); }
#else
int open_exclusive(const std::filesystem::path &path) {
  return ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
}
int write_fd(int fd, const std::string &text) {
  return static_cast<int>(::write(fd, text.data(), text.size()));
}
void close_fd(int fd) { ::close(fd); }
#endif

} // namespace

common::Result<AcquireOutcome> LockFilePrimitive::acquire(const std::string &name,
                                                          const std::filesystem::path &scope_dir) {
  if (name.empty()) {
    return common::Result<AcquireOutcome>::failure("lock name is empty");
  }
  if (auto dir = common::ensure_dir(scope_dir); !dir.ok()) {
    return common::Result<AcquireOutcome>::failure(dir.error());
  }

  const auto path = scope_dir / name;
  const int fd = open_exclusive(path);
  if (fd < 0) {
    if (errno == EEXIST) {
      AcquireOutcome held;
      if (auto content = common::read_text_file(path); content.ok()) {
        held.holder_pid = parse_pid(common::trim(content.value()));
      }
      return common::Result<AcquireOutcome>::success(std::move(held));
    }
    return common::Result<AcquireOutcome>::failure("cannot create lock file " + path.string() +
                                                   ": " + std::strerror(errno));
  }

  const long long pid = platform::current_pid();
  const std::string content = std::to_string(pid) + "\n";
  const bool written = write_fd(fd, content) == static_cast<int>(content.size());
  close_fd(fd);
  if (!written) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return common::Result<AcquireOutcome>::failure("cannot write lock file " + path.string());
  }

  AcquireOutcome outcome;
  outcome.handle = std::make_unique<LockFileHandle>(path, pid);
  return common::Result<AcquireOutcome>::success(std::move(outcome));
}

common::Status LockFilePrimitive::remove_artifact(const std::string &name,
                                                  const std::filesystem::path &scope_dir) {
  std::error_code ec;
  std::filesystem::remove(scope_dir / name, ec);
  if (ec) {
    return common::Status::error("failed to remove lock artifact: " + ec.message());
  }
  return common::Status::success();
}

LockFileHandle::LockFileHandle(std::filesystem::path path, const long long owner_pid)
    : path_(std::move(path)), owner_pid_(owner_pid) {}

LockFileHandle::~LockFileHandle() { release(); }

void LockFileHandle::release() {
  if (!held_) {
    return;
  }
  held_ = false;

  // Leave the file alone if a later recovery handed it to another process.
  auto content = common::read_text_file(path_);
  if (content.ok() && common::trim(content.value()) != std::to_string(owner_pid_)) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
}

} // namespace klm::instance

#pragma once

#include "klm/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace klm::instance {

/// Identifies the instance that currently holds the single-instance lock.
/// Advisory only: other launches read it to judge whether a lock is stale.
struct ProcessDescriptor {
  long long pid = 0;
  std::string executable_path;
  std::string working_directory;
  std::vector<std::string> launch_arguments;
  std::optional<std::string> ipc_socket_hint;
};

/// Digit-only decimal pid; anything else is nullopt.
[[nodiscard]] std::optional<long long> parse_pid(const std::string &raw);

/// Sorted keys, two-space indent, trailing newline.
[[nodiscard]] std::string serialize_descriptor(const ProcessDescriptor &descriptor);

/// nullopt for anything that is not an object with a digit-only pid.
[[nodiscard]] std::optional<ProcessDescriptor> parse_descriptor(const std::string &text);

class DescriptorStore {
public:
  explicit DescriptorStore(std::filesystem::path path);

  /// Replaces the file atomically. Callers treat failure as advisory.
  [[nodiscard]] common::Status write(const ProcessDescriptor &descriptor) const;

  /// Missing file, malformed payload or non-numeric pid all read as nullopt.
  [[nodiscard]] std::optional<ProcessDescriptor> read() const;

  [[nodiscard]] common::Status remove() const;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace klm::instance

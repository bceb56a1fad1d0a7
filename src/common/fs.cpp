#include "klm/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <utility>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

namespace klm::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::optional<std::string> env_value(const std::string &name) {
  const char *raw = std::getenv(name.c_str());
  if (raw == nullptr) {
    return std::nullopt;
  }
  std::string value = trim(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

Result<std::filesystem::path> home_dir() {
#ifdef _WIN32
  if (auto profile = env_value("USERPROFILE"); profile.has_value()) {
    return Result<std::filesystem::path>::success(std::filesystem::path(*profile));
  }
#endif
  if (auto home = env_value("HOME"); home.has_value()) {
    return Result<std::filesystem::path>::success(std::filesystem::path(*home));
  }
#ifndef _WIN32
  if (const passwd *pw = getpwuid(getuid()); pw != nullptr && pw->pw_dir != nullptr &&
                                             *pw->pw_dir != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(pw->pw_dir));
  }
#endif
  return Result<std::filesystem::path>::failure("home directory is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_home(std::string value) {
  if (!value.empty() && value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }
  return value;
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }
  value = expand_home(std::move(value));

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::string> read_text_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Result<std::string>::failure("Unable to open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return Result<std::string>::failure("Unable to read file: " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Status write_text_file_atomic(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return Status::error("Failed to create directory: " + ec.message());
    }
  }

  const std::filesystem::path tmp_path = path.string() + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error("Unable to write temporary file: " + tmp_path.string());
    }
    out << content;
    out.flush();
    if (!out) {
      std::filesystem::remove(tmp_path, ec);
      return Status::error("Short write to " + tmp_path.string());
    }
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    return Status::error("Failed to replace " + path.string() + ": " + ec.message());
  }
  return Status::success();
}

} // namespace klm::common

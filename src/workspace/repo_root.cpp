#include "klm/workspace/repo_root.hpp"

namespace klm::workspace {

bool is_repo_root(const std::filesystem::path &path) {
  if (path.empty()) {
    return false;
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    return false;
  }
  if (std::filesystem::is_regular_file(path / CATEGORIES_FILE, ec)) {
    return true;
  }
  return std::filesystem::is_directory(path / FOOTPRINTS_DIR, ec) &&
         std::filesystem::is_directory(path / SYMBOLS_DIR, ec);
}

std::filesystem::path containing_dir(const std::string &path) {
  if (path.empty()) {
    return {};
  }
  const std::filesystem::path candidate(path);
  std::error_code ec;
  if (std::filesystem::is_regular_file(candidate, ec)) {
    return candidate.parent_path();
  }
  if (std::filesystem::is_directory(candidate, ec)) {
    return candidate;
  }
  return {};
}

std::optional<std::filesystem::path> find_repo_root_upwards(const std::filesystem::path &start,
                                                            const int max_depth,
                                                            const RepoRootPredicate &predicate) {
  if (start.empty()) {
    return std::nullopt;
  }

  std::error_code ec;
  std::filesystem::path current = std::filesystem::absolute(start, ec);
  if (ec) {
    return std::nullopt;
  }
  current = current.lexically_normal();
  if (std::filesystem::is_regular_file(current, ec)) {
    current = current.parent_path();
  }
  // A trailing separator leaves an empty filename behind; drop it so
  // parent_path() really climbs.
  if (!current.has_filename() && current.has_parent_path() && current != current.root_path()) {
    current = current.parent_path();
  }

  for (int level = 0; level <= max_depth; ++level) {
    if (predicate(current)) {
      return current;
    }
    const auto parent = current.parent_path();
    if (parent.empty() || parent == current) {
      break;
    }
    current = parent;
  }
  return std::nullopt;
}

std::optional<std::filesystem::path> find_repo_root_auto(const std::vector<std::string> &hints,
                                                         const int max_depth,
                                                         const RepoRootPredicate &predicate) {
  for (const auto &hint : hints) {
    if (hint.empty()) {
      continue;
    }
    if (auto found = find_repo_root_upwards(hint, max_depth, predicate); found.has_value()) {
      return found;
    }
  }
  return std::nullopt;
}

} // namespace klm::workspace

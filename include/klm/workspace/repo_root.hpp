#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace klm::workspace {

using RepoRootPredicate = std::function<bool(const std::filesystem::path &)>;

inline constexpr const char *CATEGORIES_FILE = "Database/categories.yml";
inline constexpr const char *FOOTPRINTS_DIR = "Footprints";
inline constexpr const char *SYMBOLS_DIR = "Symbols";

/// A library repository root carries `Database/categories.yml`, or both the
/// `Footprints/` and `Symbols/` directories.
[[nodiscard]] bool is_repo_root(const std::filesystem::path &path);

/// Parent of a file, the path itself for a directory, empty otherwise.
[[nodiscard]] std::filesystem::path containing_dir(const std::string &path);

/// Walks from `start` (or its parent when it is a file) up through at most
/// `max_depth` ancestors, returning the first level accepted by `predicate`.
[[nodiscard]] std::optional<std::filesystem::path>
find_repo_root_upwards(const std::filesystem::path &start, int max_depth,
                       const RepoRootPredicate &predicate = is_repo_root);

/// Applies `find_repo_root_upwards` to each hint in order; empty hints are skipped.
[[nodiscard]] std::optional<std::filesystem::path>
find_repo_root_auto(const std::vector<std::string> &hints, int max_depth,
                    const RepoRootPredicate &predicate = is_repo_root);

} // namespace klm::workspace

#pragma once

#include "klm/workspace/config_store.hpp"
#include "klm/workspace/repo_root.hpp"

#include <optional>
#include <string>

namespace klm::workspace {

enum class ResolutionSource {
  HostProject,
  Configured,
  Discovered,
  None,
};

[[nodiscard]] std::string resolution_source_to_string(ResolutionSource source);

/// Ordered hints for the heuristic scan.
struct ResolverHints {
  std::string project_path;
  std::string working_dir;
  std::string install_dir;
};

struct Resolution {
  std::optional<std::filesystem::path> path;
  ResolutionSource source = ResolutionSource::None;
  /// True when this resolution wrote `repo_path` into the configuration.
  bool persisted = false;

  [[nodiscard]] bool found() const { return path.has_value(); }
};

class WorkingDirectoryResolver {
public:
  WorkingDirectoryResolver(ConfigStore &store, int max_depth,
                           RepoRootPredicate predicate = is_repo_root);

  /// First match wins: host project directory, configured `repo_path`,
  /// ancestor scan over the hints. A discovered root is persisted only when
  /// no `repo_path` was configured before.
  [[nodiscard]] Resolution resolve(const ResolverHints &hints);

private:
  void persist_if_unset(Resolution &resolution, const std::optional<config::Config> &loaded);

  ConfigStore &store_;
  int max_depth_;
  RepoRootPredicate predicate_;
};

} // namespace klm::workspace

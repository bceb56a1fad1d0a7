#include "klm/workspace/resolver.hpp"

#include "klm/common/fs.hpp"
#include "klm/observability/global.hpp"

namespace klm::workspace {

std::string resolution_source_to_string(const ResolutionSource source) {
  switch (source) {
  case ResolutionSource::HostProject:
    return "host_project";
  case ResolutionSource::Configured:
    return "configured";
  case ResolutionSource::Discovered:
    return "discovered";
  case ResolutionSource::None:
    return "none";
  }
  return "none";
}

WorkingDirectoryResolver::WorkingDirectoryResolver(ConfigStore &store, const int max_depth,
                                                   RepoRootPredicate predicate)
    : store_(store), max_depth_(max_depth < 0 ? 0 : max_depth), predicate_(std::move(predicate)) {}

Resolution WorkingDirectoryResolver::resolve(const ResolverHints &hints) {
  Resolution resolution;

  std::optional<config::Config> loaded;
  auto config = store_.load();
  if (config.ok()) {
    loaded = config.take();
  } else {
    observability::record_error("resolver", "config load failed: " + config.error());
  }

  const auto project_dir = containing_dir(hints.project_path);
  if (!project_dir.empty() && predicate_(project_dir)) {
    resolution.path = project_dir;
    resolution.source = ResolutionSource::HostProject;
    persist_if_unset(resolution, loaded);
    return resolution;
  }

  if (loaded.has_value()) {
    const std::string configured = common::trim(loaded->repo_path);
    if (!configured.empty() && predicate_(configured)) {
      resolution.path = std::filesystem::path(configured);
      resolution.source = ResolutionSource::Configured;
      return resolution;
    }
  }

  auto discovered = find_repo_root_auto({hints.project_path, hints.working_dir, hints.install_dir},
                                        max_depth_, predicate_);
  if (discovered.has_value()) {
    resolution.path = std::move(discovered);
    resolution.source = ResolutionSource::Discovered;
    persist_if_unset(resolution, loaded);
  }
  return resolution;
}

void WorkingDirectoryResolver::persist_if_unset(Resolution &resolution,
                                                const std::optional<config::Config> &loaded) {
  // Without a readable config we cannot tell whether the user set a value.
  if (!loaded.has_value() || !resolution.path.has_value()) {
    return;
  }
  if (!common::trim(loaded->repo_path).empty()) {
    return;
  }

  config::Config updated = *loaded;
  updated.repo_path = resolution.path->string();
  if (auto saved = store_.save(updated); !saved.ok()) {
    observability::record_error("resolver", "config save failed: " + saved.error());
    return;
  }
  resolution.persisted = true;
}

} // namespace klm::workspace

#pragma once

#include <functional>
#include <string_view>

namespace klm::instance {

using LivenessCheck = std::function<bool(long long)>;

/// Unknown states fold to "not alive": a false negative only costs an early
/// stale-lock recovery.
[[nodiscard]] bool is_process_alive(long long pid);

/// Parses a decimal pid first; anything unparsable is not alive.
[[nodiscard]] bool is_process_alive(std::string_view pid_text);

} // namespace klm::instance

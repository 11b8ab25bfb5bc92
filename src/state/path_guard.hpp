#pragma once

#include <filesystem>
#include <string>

namespace runtape::state {

// Resolves `path` to the location the OS would actually touch: every symbolic
// link is followed, including a final link whose target does not exist yet.
// Missing trailing components are appended lexically.
bool ResolveRealPath(const std::filesystem::path& path, std::filesystem::path& resolved,
                     std::string& error);

// True when `candidate` lies strictly below `base`. Both must already be
// resolved with ResolveRealPath.
bool IsStrictDescendant(const std::filesystem::path& base, const std::filesystem::path& candidate);

} // namespace runtape::state

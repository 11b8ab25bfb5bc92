#include "state/path_guard.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace runtape::state {

namespace {

constexpr int kMaxSymlinkHops = 40;

} // namespace

bool ResolveRealPath(const fs::path& path, fs::path& resolved, std::string& error) {
  std::error_code ec;
  fs::path current = fs::absolute(path, ec);
  if (ec) {
    error = "failed to make path absolute '" + path.string() + "': " + ec.message();
    return false;
  }
  current = current.lexically_normal();

  for (int hop = 0; hop <= kMaxSymlinkHops; ++hop) {
    // Canonicalize the parent first so relative link targets resolve against
    // the real containing directory.
    fs::path parent = current.parent_path();
    if (!parent.empty() && parent != current) {
      parent = fs::weakly_canonical(parent, ec);
      if (ec) {
        error = "failed to resolve '" + current.parent_path().string() + "': " + ec.message();
        return false;
      }
      current = parent / current.filename();
    }

    const fs::file_status link_status = fs::symlink_status(current, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
      error = "failed to stat '" + current.string() + "': " + ec.message();
      return false;
    }
    ec.clear();

    if (!fs::is_symlink(link_status)) {
      resolved = fs::weakly_canonical(current, ec);
      if (ec) {
        error = "failed to resolve '" + current.string() + "': " + ec.message();
        return false;
      }
      return true;
    }

    const fs::path target = fs::read_symlink(current, ec);
    if (ec) {
      error = "failed to read symlink '" + current.string() + "': " + ec.message();
      return false;
    }
    current = (target.is_absolute() ? target : current.parent_path() / target).lexically_normal();
  }

  error = "too many levels of symbolic links resolving '" + path.string() + "'";
  return false;
}

bool IsStrictDescendant(const fs::path& base, const fs::path& candidate) {
  const fs::path relative = candidate.lexically_relative(base);
  if (relative.empty() || relative == ".") {
    return false;
  }
  return *relative.begin() != "..";
}

} // namespace runtape::state

#ifndef RUNTAPE_CORE_FS_UTILS_HPP_
#define RUNTAPE_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace runtape::core {

inline constexpr std::filesystem::perms kPrivateDirectoryPerms = std::filesystem::perms::owner_all;
inline constexpr std::filesystem::perms kPrivateFilePerms =
    std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.parent_path() / ("." + output_path.filename().string() + ".tmp." +
                                      std::to_string(tick) + "." + std::to_string(suffix));
}

} // namespace detail

// Creates `dir` (and parents) and narrows its permissions to the owner.
// Permission tightening is best-effort on filesystems that ignore mode bits.
inline bool EnsurePrivateDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "directory path cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  if (!std::filesystem::is_directory(dir, ec)) {
    error = "path '" + dir.string() + "' exists but is not a directory";
    return false;
  }

  std::error_code perms_ec;
  std::filesystem::permissions(dir, kPrivateDirectoryPerms, std::filesystem::perm_options::replace,
                               perms_ec);
  return true;
}

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read file '" + path.string() + "'";
    return false;
  }

  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading file '" + path.string() + "'";
    return false;
  }
  return true;
}

// Atomic private file write:
// 1) write full content to a hidden temporary sibling (owner-only mode)
// 2) rename temp file over the destination
//
// Where rename-overwrite is restricted we fall back to remove+rename. Readers
// observe either the previous content or the new content, never a prefix.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    out_file.flush();
    if (!out_file) {
      std::error_code cleanup_ec;
      (void)std::filesystem::remove(temp_path, cleanup_ec);
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code perms_ec;
  std::filesystem::permissions(temp_path, kPrivateFilePerms,
                               std::filesystem::perm_options::replace, perms_ec);

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace runtape::core

#endif // RUNTAPE_CORE_FS_UTILS_HPP_

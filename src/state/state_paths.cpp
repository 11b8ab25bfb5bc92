#include "state/state_paths.hpp"

#include <cstdlib>

namespace runtape::state {

namespace {

std::string ReadEnv(std::string_view name) {
  const char* raw = std::getenv(std::string(name).c_str());
  if (raw == nullptr) {
    return {};
  }
  return raw;
}

} // namespace

bool ResolveStateRoot(std::filesystem::path& root, std::string& error) {
  const std::string override_root = ReadEnv(kStateRootEnvVar);
  if (!override_root.empty()) {
    root = std::filesystem::path(override_root);
    return true;
  }

#if defined(_WIN32)
  const std::string local_app_data = ReadEnv("LOCALAPPDATA");
  if (!local_app_data.empty()) {
    root = std::filesystem::path(local_app_data) / std::string(kAppDirName);
    return true;
  }
  const std::string user_profile = ReadEnv("USERPROFILE");
  if (!user_profile.empty()) {
    root = std::filesystem::path(user_profile) / "AppData" / "Local" / std::string(kAppDirName);
    return true;
  }
  error = "neither " + std::string(kStateRootEnvVar) + ", LOCALAPPDATA nor USERPROFILE is set";
  return false;
#else
  const std::string xdg_state_home = ReadEnv("XDG_STATE_HOME");
  if (!xdg_state_home.empty()) {
    root = std::filesystem::path(xdg_state_home) / std::string(kAppDirName);
    return true;
  }
  const std::string home = ReadEnv("HOME");
  if (!home.empty()) {
    root = std::filesystem::path(home) / ".local" / "state" / std::string(kAppDirName);
    return true;
  }
  error = "neither " + std::string(kStateRootEnvVar) + ", XDG_STATE_HOME nor HOME is set";
  return false;
#endif
}

std::filesystem::path LogFilePath(const std::filesystem::path& root) {
  return root / std::string(kLogsDirName) / std::string(kLogFileName);
}

} // namespace runtape::state

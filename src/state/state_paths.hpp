#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace runtape::state {

inline constexpr std::string_view kStateRootEnvVar = "RUNTAPE_STATE_ROOT";
inline constexpr std::string_view kAppDirName = "runtape";

inline constexpr std::string_view kSessionsDirName = "sessions";
inline constexpr std::string_view kLogsDirName = "logs";
inline constexpr std::string_view kLogFileName = "runtape.log";

inline constexpr std::string_view kMetaFileName = "meta.json";
inline constexpr std::string_view kFinalFileName = "final.json";
inline constexpr std::string_view kOutputFileName = "output.bin";
inline constexpr std::string_view kIndexFileName = "index.jsonl";
inline constexpr std::string_view kLockFileName = "append.lock";

// Resolves the store root from the environment:
// RUNTAPE_STATE_ROOT, then $XDG_STATE_HOME/runtape, then
// $HOME/.local/state/runtape (%LOCALAPPDATA%\runtape on Windows).
bool ResolveStateRoot(std::filesystem::path& root, std::string& error);

std::filesystem::path LogFilePath(const std::filesystem::path& root);

} // namespace runtape::state

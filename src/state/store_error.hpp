#pragma once

#include <string>
#include <string_view>

namespace runtape::state {

// Stable store failure categories. Callers branch on the code. The message
// carries the path-level detail for logs and stderr.
enum class StoreErrorCode {
  kNone,
  kInvalidSessionId,
  kSymlinkEscape,
  kNotFound,
  kCorrupt,
  kIo,
};

struct StoreError {
  StoreErrorCode code = StoreErrorCode::kNone;
  std::string message;

  void Clear() {
    code = StoreErrorCode::kNone;
    message.clear();
  }
};

inline std::string_view ToStableCode(StoreErrorCode code) {
  switch (code) {
  case StoreErrorCode::kNone:
    return "NONE";
  case StoreErrorCode::kInvalidSessionId:
    return "INVALID_SESSION_ID";
  case StoreErrorCode::kSymlinkEscape:
    return "SYMLINK_ESCAPE";
  case StoreErrorCode::kNotFound:
    return "NOT_FOUND";
  case StoreErrorCode::kCorrupt:
    return "CORRUPT";
  case StoreErrorCode::kIo:
    return "IO";
  }
  return "IO";
}

inline bool SetStoreError(StoreError& error, StoreErrorCode code, std::string message) {
  error.code = code;
  error.message = std::move(message);
  return false;
}

} // namespace runtape::state

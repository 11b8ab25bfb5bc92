#include "retention/sweeper.hpp"

#include <string_view>
#include <vector>

namespace runtape::retention {

namespace {

bool IsSecurityRejection(const state::StoreError& error) {
  return error.code == state::StoreErrorCode::kSymlinkEscape ||
         error.code == state::StoreErrorCode::kInvalidSessionId;
}

void LogSkipped(core::logging::Logger& logger, const std::string& session_id,
                std::string_view reason) {
  logger.Debug("session retained", {{"event", "cleanup_result"},
                                    {"session", session_id},
                                    {"cleanup_result", "skipped"},
                                    {"cleanup_reason", reason}});
}

void RemoveExpired(const state::SessionStore& store, core::logging::Logger& logger,
                   const std::string& session_id, std::string_view reason,
                   SweepResult& result) {
  state::StoreError remove_error;
  if (!store.RemoveSessionDirectory(session_id, remove_error)) {
    logger.Warn("session removal failed", {{"event", "cleanup_result"},
                                           {"session", session_id},
                                           {"cleanup_result", "error"},
                                           {"cleanup_reason", "remove_failed"},
                                           {"error", remove_error.message}});
    return;
  }
  ++result.removed;
  logger.Info("session removed", {{"event", "cleanup_result"},
                                  {"session", session_id},
                                  {"cleanup_result", "removed"},
                                  {"cleanup_reason", reason}});
}

void SweepUnreadable(const state::SessionStore& store, std::chrono::seconds default_ttl,
                     core::logging::Logger& logger, const std::string& session_id,
                     session::Timestamp now, SweepResult& result) {
  session::Timestamp latest{};
  state::StoreError stat_error;
  if (!store.LatestModificationTime(session_id, latest, stat_error)) {
    if (stat_error.code == state::StoreErrorCode::kNotFound) {
      LogSkipped(logger, session_id, "vanished");
      return;
    }
    if (IsSecurityRejection(stat_error)) {
      logger.Warn("session rejected by path guard", {{"event", "cleanup_result"},
                                                     {"session", session_id},
                                                     {"cleanup_result", "skipped"},
                                                     {"cleanup_reason", "security_rejected"},
                                                     {"error", stat_error.message}});
      return;
    }
    logger.Warn("session stat failed", {{"event", "cleanup_result"},
                                        {"session", session_id},
                                        {"cleanup_result", "error"},
                                        {"error", stat_error.message}});
    return;
  }

  if (now < latest + default_ttl) {
    LogSkipped(logger, session_id, "unreadable_not_expired");
    return;
  }
  RemoveExpired(store, logger, session_id, "unreadable_expired", result);
}

} // namespace

bool Sweep(const state::SessionStore& store, std::chrono::seconds default_ttl,
           core::logging::Logger& logger, SweepResult& result, std::string& error,
           session::Timestamp now) {
  result = SweepResult{};
  if (default_ttl.count() <= 0) {
    error = "ttl must be positive";
    return false;
  }

  std::vector<std::string> names;
  state::StoreError list_error;
  if (!store.ListSessionDirectoryNames(names, list_error)) {
    error = "read sessions dir: " + list_error.message;
    return false;
  }

  for (const std::string& session_id : names) {
    ++result.checked;

    session::SessionDetail detail;
    state::StoreError detail_error;
    if (!store.GetSession(session_id, detail, detail_error)) {
      if (IsSecurityRejection(detail_error)) {
        logger.Warn("session rejected by path guard", {{"event", "cleanup_result"},
                                                       {"session", session_id},
                                                       {"cleanup_result", "skipped"},
                                                       {"cleanup_reason", "security_rejected"},
                                                       {"error", detail_error.message}});
        continue;
      }
      SweepUnreadable(store, default_ttl, logger, session_id, now, result);
      continue;
    }

    const std::chrono::seconds ttl = detail.summary.retention_seconds > 0
                                         ? std::chrono::seconds(detail.summary.retention_seconds)
                                         : default_ttl;
    const session::Timestamp base = detail.summary.ended_at.value_or(detail.summary.started_at);
    if (now < base + ttl) {
      LogSkipped(logger, session_id, "not_expired");
      continue;
    }
    if (!session::IsTerminal(detail.summary.state)) {
      LogSkipped(logger, session_id, "active_session");
      continue;
    }
    RemoveExpired(store, logger, session_id, "expired", result);
  }

  logger.Info("retention sweep finished", {{"event", "cleanup_summary"},
                                           {"checked", std::to_string(result.checked)},
                                           {"removed", std::to_string(result.removed)}});
  return true;
}

} // namespace runtape::retention

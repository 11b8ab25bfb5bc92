#pragma once

#include "core/json_dom.hpp"
#include "state/session_store.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace runtape::mcp {

inline constexpr std::string_view kToolListSessions = "runtape_list_sessions";
inline constexpr std::string_view kToolGetSession = "runtape_get_session";
inline constexpr std::string_view kToolReadOutput = "runtape_read_output";
inline constexpr std::string_view kToolWaitOutput = "runtape_wait_output";

inline constexpr std::size_t kDefaultListLimit = 50;
inline constexpr std::chrono::milliseconds kDefaultWaitTimeout{30000};
inline constexpr std::chrono::milliseconds kMaxWaitTimeout{60000};
inline constexpr std::chrono::milliseconds kWaitPollInterval{100};

using ToolArguments = core::json::Value::Object;

// JSON array describing every tool for `tools/list`.
std::string ToolDefinitionsJson();

// Each handler renders the tool payload as a JSON object into `payload`.
// Failures carry a user-facing message prefixed with the failing step.
bool HandleListSessions(const state::SessionStore& store, const ToolArguments& args,
                        std::string& payload, std::string& error);
bool HandleGetSession(const state::SessionStore& store, const ToolArguments& args,
                      std::string& payload, std::string& error);
bool HandleReadOutput(const state::SessionStore& store, const ToolArguments& args,
                      std::string& payload, std::string& error);
bool HandleWaitOutput(const state::SessionStore& store, const ToolArguments& args,
                      std::string& payload, std::string& error);

// Dispatches by tool name; unknown names fail with "unknown tool: <name>".
bool CallTool(const state::SessionStore& store, std::string_view name, const ToolArguments& args,
              std::string& payload, std::string& error);

} // namespace runtape::mcp

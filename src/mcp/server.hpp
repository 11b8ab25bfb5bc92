#pragma once

#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "state/session_store.hpp"

#include <chrono>
#include <condition_variable>
#include <istream>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>

namespace runtape::mcp {

inline constexpr std::string_view kProtocolVersion = "2024-11-05";
inline constexpr std::string_view kServerName = "runtape";
inline constexpr std::string_view kServerVersion = "0.1.0";

inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kToolError = -32000;

struct ServerOptions {
  // Zero disables the periodic sweep.
  std::chrono::seconds gc_interval = std::chrono::minutes(10);
  std::chrono::seconds retention = std::chrono::hours(24);
};

// JSON-RPC 2.0 tool server over a framed byte stream. Requests are handled
// one at a time on the calling thread; retention sweeps run on a background
// thread between startup and end of input.
class Server {
public:
  Server(const state::SessionStore& store, core::logging::Logger& logger,
         ServerOptions options);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Returns true when input ended cleanly, false on a framing or write error.
  bool Serve(std::istream& in, std::ostream& out, std::string& error);

  // Handles one decoded request body. Returns false when no response is due
  // (notifications).
  bool HandleMessage(std::string_view body, std::string& response);

private:
  std::string HandleRequest(const core::json::Value& request, const std::string& id_json);
  std::string HandleToolCall(const core::json::Value* params, const std::string& id_json);

  void StartSweeper();
  void StopSweeper();
  void RunSweepOnce();

  const state::SessionStore& store_;
  core::logging::Logger& logger_;
  ServerOptions options_;

  std::mutex sweeper_mutex_;
  std::condition_variable sweeper_wakeup_;
  bool stop_sweeper_ = false;
  std::thread sweeper_;
};

} // namespace runtape::mcp

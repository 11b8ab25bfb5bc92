#include "mcp/server.hpp"

#include "core/json_utils.hpp"
#include "mcp/rpc_framing.hpp"
#include "mcp/tools.hpp"
#include "retention/sweeper.hpp"

#include <sstream>
#include <utility>

namespace runtape::mcp {

namespace {

using core::json::Value;

std::string ResultResponse(const std::string& id_json, std::string_view result_json) {
  std::string out = "{\"jsonrpc\":\"2.0\",\"id\":";
  out += id_json;
  out += ",\"result\":";
  out += result_json;
  out += "}";
  return out;
}

std::string ErrorResponse(const std::string& id_json, int code, std::string_view message) {
  std::ostringstream out;
  out << "{\"jsonrpc\":\"2.0\",\"id\":" << id_json << ",\"error\":{\"code\":" << code
      << ",\"message\":" << core::QuoteJson(message) << "}}";
  return out.str();
}

std::string WrapToolPayload(const std::string& payload) {
  std::string out = "{\"isError\":false,\"content\":[{\"type\":\"text\",\"text\":";
  out += core::QuoteJson(payload);
  out += "}],\"structuredContent\":";
  out += payload;
  out += "}";
  return out;
}

} // namespace

Server::Server(const state::SessionStore& store, core::logging::Logger& logger,
               ServerOptions options)
    : store_(store), logger_(logger), options_(options) {}

Server::~Server() {
  StopSweeper();
}

bool Server::Serve(std::istream& in, std::ostream& out, std::string& error) {
  logger_.Info("tool server started",
               {{"event", "mcp_started"},
                {"gc_interval_seconds", std::to_string(options_.gc_interval.count())},
                {"retention_seconds", std::to_string(options_.retention.count())}});
  StartSweeper();

  bool clean = true;
  while (true) {
    std::string body;
    const FrameReadStatus status = ReadFrame(in, body, error);
    if (status == FrameReadStatus::kEndOfStream) {
      break;
    }
    if (status == FrameReadStatus::kError) {
      clean = false;
      break;
    }

    std::string response;
    if (!HandleMessage(body, response)) {
      continue;
    }
    if (!WriteFrame(out, response, error)) {
      clean = false;
      break;
    }
  }

  StopSweeper();
  logger_.Info("tool server stopped", {{"event", "mcp_stopped"}, {"clean", clean ? "true" : "false"}});
  return clean;
}

bool Server::HandleMessage(std::string_view body, std::string& response) {
  Value request;
  std::string parse_error;
  if (!core::json::Parse(body, request, parse_error) || request.type != Value::Type::kObject) {
    logger_.Warn("invalid request json", {{"event", "mcp_request"}, {"error", parse_error}});
    response = ErrorResponse("null", kParseError, "invalid json");
    return true;
  }

  const Value* id = core::json::FindObjectField(request.object_value, "id");
  const bool is_notification = id == nullptr || id->type == Value::Type::kNull;
  const std::string id_json = is_notification ? "null" : core::json::Serialize(*id);

  const Value* method = core::json::FindObjectField(request.object_value, "method");
  if (method == nullptr || method->type != Value::Type::kString || method->string_value.empty()) {
    if (is_notification) {
      return false;
    }
    response = ErrorResponse(id_json, kInvalidRequest, "missing method");
    return true;
  }

  std::string handled = HandleRequest(request, id_json);
  if (is_notification) {
    return false;
  }
  response = std::move(handled);
  return true;
}

std::string Server::HandleRequest(const Value& request, const std::string& id_json) {
  const std::string& method =
      core::json::FindObjectField(request.object_value, "method")->string_value;
  logger_.Debug("request received", {{"event", "mcp_request"}, {"method", method}});

  if (method == "initialize") {
    std::ostringstream result;
    result << "{\"protocolVersion\":" << core::QuoteJson(kProtocolVersion)
           << ",\"capabilities\":{\"tools\":{}}"
           << ",\"serverInfo\":{\"name\":" << core::QuoteJson(kServerName)
           << ",\"version\":" << core::QuoteJson(kServerVersion) << "}}";
    return ResultResponse(id_json, result.str());
  }
  if (method == "notifications/initialized") {
    return ResultResponse(id_json, "{}");
  }
  if (method == "ping") {
    return ResultResponse(id_json, "{\"ok\":true}");
  }
  if (method == "tools/list") {
    return ResultResponse(id_json, "{\"tools\":" + ToolDefinitionsJson() + "}");
  }
  if (method == "tools/call") {
    return HandleToolCall(core::json::FindObjectField(request.object_value, "params"), id_json);
  }
  return ErrorResponse(id_json, kMethodNotFound, "method not found");
}

std::string Server::HandleToolCall(const Value* params, const std::string& id_json) {
  if (params == nullptr || params->type != Value::Type::kObject) {
    return ErrorResponse(id_json, kInvalidParams, "invalid tools/call params");
  }
  const Value* name = core::json::FindObjectField(params->object_value, "name");
  if (name == nullptr || name->type != Value::Type::kString) {
    return ErrorResponse(id_json, kInvalidParams, "invalid tools/call params");
  }
  static const ToolArguments kNoArguments;
  const ToolArguments* args = &kNoArguments;
  const Value* raw_args = core::json::FindObjectField(params->object_value, "arguments");
  if (raw_args != nullptr && raw_args->type != Value::Type::kNull) {
    if (raw_args->type != Value::Type::kObject) {
      return ErrorResponse(id_json, kInvalidParams, "invalid tools/call params");
    }
    args = &raw_args->object_value;
  }

  std::string payload;
  std::string error;
  if (!CallTool(store_, name->string_value, *args, payload, error)) {
    logger_.Warn("tool call failed",
                 {{"event", "mcp_tool_call"}, {"tool", name->string_value}, {"error", error}});
    return ErrorResponse(id_json, kToolError, error);
  }
  logger_.Debug("tool call completed", {{"event", "mcp_tool_call"}, {"tool", name->string_value}});
  return ResultResponse(id_json, WrapToolPayload(payload));
}

void Server::RunSweepOnce() {
  retention::SweepResult result;
  std::string error;
  if (!retention::Sweep(store_, options_.retention, logger_, result, error)) {
    logger_.Warn("retention sweep failed",
                 {{"event", "cleanup_result"}, {"cleanup_result", "error"}, {"error", error}});
    return;
  }
  logger_.Info("retention sweep completed", {{"event", "cleanup_result"},
                                             {"cleanup_result", "ok"},
                                             {"checked", std::to_string(result.checked)},
                                             {"removed", std::to_string(result.removed)}});
}

void Server::StartSweeper() {
  {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    stop_sweeper_ = false;
  }
  sweeper_ = std::thread([this]() {
    RunSweepOnce();
    if (options_.gc_interval.count() <= 0) {
      return;
    }
    std::unique_lock<std::mutex> lock(sweeper_mutex_);
    while (!sweeper_wakeup_.wait_for(lock, options_.gc_interval,
                                     [this]() { return stop_sweeper_; })) {
      lock.unlock();
      RunSweepOnce();
      lock.lock();
    }
  });
}

void Server::StopSweeper() {
  {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    stop_sweeper_ = true;
  }
  sweeper_wakeup_.notify_all();
  if (sweeper_.joinable()) {
    sweeper_.join();
  }
}

} // namespace runtape::mcp

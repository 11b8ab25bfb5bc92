#include "mcp/tools.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "session/metadata_json.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <thread>

namespace runtape::mcp {

namespace {

using core::json::Value;

bool ReadOptionalString(const ToolArguments& args, std::string_view key, std::string& out,
                        std::string& error) {
  const Value* value = core::json::FindObjectField(args, key);
  if (value == nullptr || value->type == Value::Type::kNull) {
    return true;
  }
  if (value->type != Value::Type::kString) {
    error = std::string(key) + " must be a string";
    return false;
  }
  out = value->string_value;
  return true;
}

bool ReadRequiredString(const ToolArguments& args, std::string_view key, std::string& out,
                        std::string& error) {
  if (!ReadOptionalString(args, key, out, error)) {
    return false;
  }
  if (out.empty()) {
    error = std::string(key) + " is required";
    return false;
  }
  return true;
}

// Non-positive values keep the default, matching how clients omit limits.
bool ReadOptionalPositiveInt(const ToolArguments& args, std::string_view key, std::int64_t& out,
                             std::string& error) {
  const Value* value = core::json::FindObjectField(args, key);
  if (value == nullptr || value->type == Value::Type::kNull) {
    return true;
  }
  std::int64_t parsed = 0;
  if (!core::json::AsInt64(*value, parsed)) {
    error = "parse " + std::string(key) + ": expected integer";
    return false;
  }
  if (parsed > 0) {
    out = parsed;
  }
  return true;
}

bool ParseCursor(std::string_view raw, std::uint64_t& cursor, std::string& error) {
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), cursor);
  if (ec != std::errc() || ptr != raw.data() + raw.size()) {
    error = "parse cursor: invalid decimal cursor '" + std::string(raw) + "'";
    return false;
  }
  return true;
}

void AppendChunks(std::ostringstream& out, const session::OutputPage& page) {
  out << "\"chunks\":[";
  for (std::size_t i = 0; i < page.chunks.size(); ++i) {
    if (i != 0U) {
      out << ",";
    }
    out << session::ToJson(page.chunks[i]);
  }
  out << "]";
}

std::string RenderOutputPage(std::string_view session_id, const session::OutputPage& page,
                             std::string_view extra_fields) {
  std::ostringstream out;
  out << "{\"schema_version\":" << core::QuoteJson(session::kSchemaVersion)
      << ",\"session_id\":" << core::QuoteJson(session_id) << ",";
  AppendChunks(out, page);
  out << ",\"next_cursor\":\"" << page.next_cursor << "\""
      << ",\"eof\":" << (page.eof ? "true" : "false") << extra_fields << "}";
  return out.str();
}

struct OutputRequest {
  std::string session_id;
  std::uint64_t cursor = 0;
  std::uint64_t max_bytes = state::kDefaultReadMaxBytes;
};

bool ParseOutputRequest(const ToolArguments& args, bool cursor_required, OutputRequest& request,
                        std::string& error) {
  if (!ReadRequiredString(args, "session_id", request.session_id, error)) {
    return false;
  }
  std::string raw_cursor;
  if (cursor_required) {
    if (!ReadRequiredString(args, "cursor", raw_cursor, error)) {
      return false;
    }
  } else if (!ReadOptionalString(args, "cursor", raw_cursor, error)) {
    return false;
  }
  if (!raw_cursor.empty() && !ParseCursor(raw_cursor, request.cursor, error)) {
    return false;
  }
  std::int64_t max_bytes = static_cast<std::int64_t>(state::kDefaultReadMaxBytes);
  if (!ReadOptionalPositiveInt(args, "max_bytes", max_bytes, error)) {
    return false;
  }
  request.max_bytes = static_cast<std::uint64_t>(max_bytes);
  return true;
}

} // namespace

std::string ToolDefinitionsJson() {
  std::ostringstream out;
  out << "["
      << "{\"name\":" << core::QuoteJson(kToolListSessions)
      << ",\"description\":\"List recent sessions with optional state and id prefix filters.\""
      << ",\"inputSchema\":{\"type\":\"object\",\"properties\":{"
         "\"state\":{\"type\":\"string\"},"
         "\"id_prefix\":{\"type\":\"string\"},"
         "\"limit\":{\"type\":\"integer\",\"minimum\":1}}}},"
      << "{\"name\":" << core::QuoteJson(kToolGetSession)
      << ",\"description\":\"Get detailed metadata and output stats for one session.\""
      << ",\"inputSchema\":{\"type\":\"object\",\"required\":[\"session_id\"],"
         "\"properties\":{\"session_id\":{\"type\":\"string\"}}}},"
      << "{\"name\":" << core::QuoteJson(kToolReadOutput)
      << ",\"description\":\"Read output chunks from a cursor.\""
      << ",\"inputSchema\":{\"type\":\"object\",\"required\":[\"session_id\"],"
         "\"properties\":{\"session_id\":{\"type\":\"string\"},"
         "\"cursor\":{\"type\":\"string\"},"
         "\"max_bytes\":{\"type\":\"integer\",\"minimum\":1}}}},"
      << "{\"name\":" << core::QuoteJson(kToolWaitOutput)
      << ",\"description\":\"Wait for output from a cursor.\""
      << ",\"inputSchema\":{\"type\":\"object\",\"required\":[\"session_id\",\"cursor\"],"
         "\"properties\":{\"session_id\":{\"type\":\"string\"},"
         "\"cursor\":{\"type\":\"string\"},"
         "\"max_bytes\":{\"type\":\"integer\",\"minimum\":1},"
         "\"timeout_ms\":{\"type\":\"integer\",\"minimum\":1}}}}"
      << "]";
  return out.str();
}

bool HandleListSessions(const state::SessionStore& store, const ToolArguments& args,
                        std::string& payload, std::string& error) {
  state::ListQuery query;
  query.limit = kDefaultListLimit;

  std::string raw_state;
  if (!ReadOptionalString(args, "state", raw_state, error) ||
      !ReadOptionalString(args, "id_prefix", query.id_prefix, error)) {
    return false;
  }
  if (!raw_state.empty()) {
    session::SessionState parsed_state = session::SessionState::kStarting;
    if (!session::ParseSessionState(raw_state, parsed_state)) {
      error = "parse state: unknown session state '" + raw_state + "'";
      return false;
    }
    query.state = parsed_state;
  }
  std::int64_t limit = static_cast<std::int64_t>(kDefaultListLimit);
  if (!ReadOptionalPositiveInt(args, "limit", limit, error)) {
    return false;
  }
  query.limit = static_cast<std::size_t>(limit);

  state::SessionListing listing;
  state::StoreError store_error;
  if (!store.ListSessions(query, listing, store_error)) {
    error = "list sessions: " + store_error.message;
    return false;
  }

  std::ostringstream out;
  out << "{\"schema_version\":" << core::QuoteJson(session::kSchemaVersion)
      << ",\"generated_at\":"
      << core::QuoteJson(core::FormatUtcTimestamp(std::chrono::system_clock::now()))
      << ",\"total_count\":" << listing.total
      << ",\"truncated\":" << (listing.total > listing.sessions.size() ? "true" : "false")
      << ",\"sessions\":[";
  for (std::size_t i = 0; i < listing.sessions.size(); ++i) {
    if (i != 0U) {
      out << ",";
    }
    out << session::ToJson(listing.sessions[i]);
  }
  out << "]}";
  payload = out.str();
  return true;
}

bool HandleGetSession(const state::SessionStore& store, const ToolArguments& args,
                      std::string& payload, std::string& error) {
  std::string session_id;
  if (!ReadRequiredString(args, "session_id", session_id, error)) {
    return false;
  }

  session::SessionDetail detail;
  state::StoreError store_error;
  if (!store.GetSession(session_id, detail, store_error)) {
    error = "get session: " + store_error.message;
    return false;
  }

  std::ostringstream out;
  out << "{\"schema_version\":" << core::QuoteJson(session::kSchemaVersion)
      << ",\"session\":" << session::ToJson(detail) << ",\"output_bytes\":" << detail.output_bytes
      << ",\"chunk_count\":" << detail.chunk_count << ",\"last_chunk_at\":";
  if (detail.last_chunk_at.has_value()) {
    out << core::QuoteJson(core::FormatUtcTimestamp(*detail.last_chunk_at));
  } else {
    out << "null";
  }
  out << "}";
  payload = out.str();
  return true;
}

bool HandleReadOutput(const state::SessionStore& store, const ToolArguments& args,
                      std::string& payload, std::string& error) {
  OutputRequest request;
  if (!ParseOutputRequest(args, false, request, error)) {
    return false;
  }

  session::OutputPage page;
  state::StoreError store_error;
  if (!store.ReadOutput(request.session_id, request.cursor, request.max_bytes, page,
                        store_error)) {
    error = "read output: " + store_error.message;
    return false;
  }
  payload = RenderOutputPage(request.session_id, page, "");
  return true;
}

bool HandleWaitOutput(const state::SessionStore& store, const ToolArguments& args,
                      std::string& payload, std::string& error) {
  OutputRequest request;
  if (!ParseOutputRequest(args, true, request, error)) {
    return false;
  }
  std::int64_t timeout_ms = kDefaultWaitTimeout.count();
  if (!ReadOptionalPositiveInt(args, "timeout_ms", timeout_ms, error)) {
    return false;
  }
  const std::chrono::milliseconds timeout =
      std::min(std::chrono::milliseconds(timeout_ms), kMaxWaitTimeout);

  const auto started = std::chrono::steady_clock::now();
  while (true) {
    session::OutputPage page;
    state::StoreError store_error;
    if (!store.ReadOutput(request.session_id, request.cursor, request.max_bytes, page,
                          store_error)) {
      error = "wait read output: " + store_error.message;
      return false;
    }
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (!page.chunks.empty() || page.eof) {
      payload = RenderOutputPage(request.session_id, page,
                                 ",\"timed_out\":false,\"waited_ms\":" +
                                     std::to_string(waited.count()));
      return true;
    }
    if (waited >= timeout) {
      payload = RenderOutputPage(request.session_id, page,
                                 ",\"timed_out\":true,\"waited_ms\":" +
                                     std::to_string(timeout.count()));
      return true;
    }
    std::this_thread::sleep_for(kWaitPollInterval);
  }
}

bool CallTool(const state::SessionStore& store, std::string_view name, const ToolArguments& args,
              std::string& payload, std::string& error) {
  if (name == kToolListSessions) {
    return HandleListSessions(store, args, payload, error);
  }
  if (name == kToolGetSession) {
    return HandleGetSession(store, args, payload, error);
  }
  if (name == kToolReadOutput) {
    return HandleReadOutput(store, args, payload, error);
  }
  if (name == kToolWaitOutput) {
    return HandleWaitOutput(store, args, payload, error);
  }
  error = "unknown tool: " + std::string(name);
  return false;
}

} // namespace runtape::mcp

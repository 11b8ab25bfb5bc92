#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "mcp/rpc_framing.hpp"
#include "mcp/server.hpp"
#include "session/model.hpp"
#include "state/session_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using runtape::core::json::Value;
using runtape::tests::common::AssertContains;
using runtape::tests::common::Fail;

const std::string kFinishedId = "01HZX3K4M5N6P7Q8R9S0T1V2W3";
const std::string kStartingId = "01HZX3K4M5N6P7Q8R9S0T1V2W4";

void SeedSessions(const runtape::state::SessionStore& store) {
  const auto now = std::chrono::system_clock::now();
  runtape::state::StoreError error;

  runtape::session::StartMetadata finished;
  finished.session_id = kFinishedId;
  finished.command = {"echo", "hi"};
  finished.started_at = now - std::chrono::seconds(5);
  finished.retention_seconds = 3600;
  finished.pid = 0;
  std::uint64_t offset = 0;
  if (!store.WriteStartMetadata(finished, error) ||
      !store.AppendOutput(kFinishedId, runtape::session::OutputChannel::kStdout, "hi\n", now,
                          offset, error)) {
    Fail("seed finished session failed: " + error.message);
  }
  runtape::session::FinalMetadata final_meta;
  final_meta.session_id = kFinishedId;
  final_meta.state = runtape::session::SessionState::kExited;
  final_meta.ended_at = now;
  final_meta.exit_code = 0;
  if (!store.WriteFinalMetadata(final_meta, error)) {
    Fail("seed final metadata failed: " + error.message);
  }

  runtape::session::StartMetadata starting;
  starting.session_id = kStartingId;
  starting.command = {"sleep", "1"};
  starting.started_at = now;
  starting.retention_seconds = 3600;
  starting.pid = 0;
  if (!store.WriteStartMetadata(starting, error)) {
    Fail("seed starting session failed: " + error.message);
  }
}

std::string Frame(const std::string& body) {
  return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

std::vector<Value> ReadResponses(const std::string& output) {
  std::istringstream in(output);
  std::vector<Value> responses;
  while (true) {
    std::string body;
    std::string error;
    const auto status = runtape::mcp::ReadFrame(in, body, error);
    if (status == runtape::mcp::FrameReadStatus::kEndOfStream) {
      return responses;
    }
    if (status != runtape::mcp::FrameReadStatus::kFrame) {
      Fail("malformed response frame: " + error);
    }
    Value value;
    if (!runtape::core::json::Parse(body, value, error)) {
      Fail("response is not JSON: " + error);
    }
    responses.push_back(std::move(value));
  }
}

const Value& Field(const Value& object, std::string_view key) {
  const Value* value = runtape::core::json::FindObjectField(object.object_value, key);
  if (value == nullptr) {
    Fail("missing field: " + std::string(key));
  }
  return *value;
}

std::int64_t IntField(const Value& object, std::string_view key) {
  std::int64_t out = 0;
  if (!runtape::core::json::AsInt64(Field(object, key), out)) {
    Fail("field is not an integer: " + std::string(key));
  }
  return out;
}

std::string ToolCall(int id, std::string_view tool, std::string_view arguments) {
  return "{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id) +
         ",\"method\":\"tools/call\",\"params\":{\"name\":\"" + std::string(tool) +
         "\",\"arguments\":" + std::string(arguments) + "}}";
}

} // namespace

int main() {
  using runtape::tests::common::CreateUniqueTempDir;
  using runtape::tests::common::RemovePathBestEffort;

  const fs::path root = CreateUniqueTempDir("runtape-mcp-server-smoke");
  runtape::state::SessionStore store;
  runtape::state::StoreError store_error;
  if (!store.Open(root, store_error)) {
    Fail("open store failed: " + store_error.message);
  }
  SeedSessions(store);

  std::ostringstream log_output;
  runtape::core::logging::Logger logger(runtape::core::logging::LogLevel::kDebug, log_output);
  runtape::mcp::ServerOptions options;
  options.gc_interval = std::chrono::seconds(0);
  runtape::mcp::Server server(store, logger, options);

  std::string input;
  input += Frame(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
  input += Frame(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
  input += Frame(R"({"jsonrpc":"2.0","id":"two","method":"tools/list"})");
  input += Frame(ToolCall(3, "runtape_list_sessions", R"({"limit":1})"));
  input += Frame(ToolCall(4, "runtape_get_session", "{\"session_id\":\"" + kFinishedId + "\"}"));
  input += Frame(ToolCall(5, "runtape_read_output",
                          "{\"session_id\":\"" + kFinishedId + "\",\"cursor\":\"1\"}"));
  input += Frame(ToolCall(6, "runtape_wait_output",
                          "{\"session_id\":\"" + kStartingId +
                              "\",\"cursor\":\"0\",\"timeout_ms\":150}"));
  input += Frame(ToolCall(7, "runtape_unknown", "{}"));
  input += Frame(ToolCall(8, "runtape_read_output", R"({"session_id":"../etc"})"));
  input += Frame(R"({"jsonrpc":"2.0","id":9,"method":"resources/list"})");
  input += Frame("{not json");
  input += Frame(R"({"jsonrpc":"2.0","id":10,"method":"ping"})");
  input += Frame(R"({"jsonrpc":"2.0","id":11,"method":"tools/call","params":[]})");
  input += Frame(ToolCall(12, "runtape_list_sessions", R"({"state":"paused"})"));

  std::istringstream in(input);
  std::ostringstream out;
  std::string error;
  if (!server.Serve(in, out, error)) {
    Fail("serve should end cleanly at end of input: " + error);
  }

  const std::vector<Value> responses = ReadResponses(out.str());
  if (responses.size() != 13U) {
    Fail("expected one response per request and none for notifications, got " +
         std::to_string(responses.size()));
  }

  // initialize
  const Value& init = Field(responses[0], "result");
  if (Field(init, "protocolVersion").string_value != "2024-11-05" ||
      Field(Field(init, "serverInfo"), "name").string_value != "runtape") {
    Fail("initialize should report protocol version and server name");
  }

  // tools/list echoes a string id and lists four tools
  if (Field(responses[1], "id").string_value != "two" ||
      Field(Field(responses[1], "result"), "tools").array_value.size() != 4U) {
    Fail("tools/list should expose four tools");
  }

  // list sessions with a limit reports truncation
  const Value& listed = Field(Field(responses[2], "result"), "structuredContent");
  if (IntField(listed, "total_count") != 2 || !Field(listed, "truncated").bool_value ||
      Field(listed, "sessions").array_value.size() != 1U) {
    Fail("limited list should be truncated with the full total");
  }
  if (Field(Field(listed, "sessions").array_value[0], "session_id").string_value != kStartingId) {
    Fail("list should return the newest session first");
  }
  const Value& content = Field(Field(responses[2], "result"), "content");
  if (content.array_value.size() != 1U ||
      Field(content.array_value[0], "type").string_value != "text") {
    Fail("tool results should carry a text content block");
  }

  // get session
  const Value& detail = Field(Field(responses[3], "result"), "structuredContent");
  if (Field(Field(detail, "session"), "state").string_value != "exited" ||
      IntField(detail, "output_bytes") != 3 || IntField(detail, "chunk_count") != 1) {
    Fail("get session should report state and output stats");
  }

  // read output from cursor 1
  const Value& page = Field(Field(responses[4], "result"), "structuredContent");
  const Value& chunks = Field(page, "chunks");
  if (chunks.array_value.size() != 1U ||
      Field(chunks.array_value[0], "data_base64").string_value != "aQo=" ||
      Field(chunks.array_value[0], "start_cursor").string_value != "1" ||
      Field(page, "next_cursor").string_value != "3" || !Field(page, "eof").bool_value) {
    Fail("read output should return the remaining bytes and eof");
  }

  // wait output on a session with no output times out
  const Value& waited = Field(Field(responses[5], "result"), "structuredContent");
  if (!Field(waited, "timed_out").bool_value || IntField(waited, "waited_ms") != 150 ||
      !Field(waited, "chunks").array_value.empty() || Field(waited, "eof").bool_value) {
    Fail("wait output should time out on a silent session");
  }

  // unknown tool
  const Value& unknown_tool = Field(responses[6], "error");
  if (IntField(unknown_tool, "code") != -32000) {
    Fail("unknown tool should be a tool error");
  }
  AssertContains(Field(unknown_tool, "message").string_value, "unknown tool: runtape_unknown");

  // traversal ids are rejected by the store
  AssertContains(Field(Field(responses[7], "error"), "message").string_value, "read output: ");

  if (IntField(Field(responses[8], "error"), "code") != -32601) {
    Fail("unknown method should be method not found");
  }
  if (IntField(Field(responses[9], "error"), "code") != -32700 ||
      Field(responses[9], "id").type != Value::Type::kNull) {
    Fail("malformed JSON should be a parse error with a null id");
  }
  if (!Field(Field(responses[10], "result"), "ok").bool_value) {
    Fail("ping should answer ok");
  }
  if (IntField(Field(responses[11], "error"), "code") != -32602) {
    Fail("non-object tools/call params should be invalid params");
  }
  AssertContains(Field(Field(responses[12], "error"), "message").string_value,
                 "parse state: unknown session state 'paused'");

  AssertContains(log_output.str(), "event=\"mcp_started\"");
  AssertContains(log_output.str(), "event=\"cleanup_summary\"");
  AssertContains(log_output.str(), "event=\"mcp_stopped\" clean=\"true\"");

  RemovePathBestEffort(root);
  return 0;
}

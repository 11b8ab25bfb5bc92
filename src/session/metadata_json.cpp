#include "session/metadata_json.hpp"

#include "core/base64.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <limits>
#include <sstream>

namespace runtape::session {

namespace {

using JsonValue = core::json::Value;
using JsonObject = JsonValue::Object;

bool ParseRootObject(std::string_view text, std::string_view what, JsonValue& root,
                     std::string& error) {
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    error = std::string(what) + " is not valid JSON: " + parse_error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = std::string(what) + " must be a JSON object";
    return false;
  }
  return true;
}

bool ParseRequiredStringField(const JsonObject& object, std::string_view what, std::string_view key,
                              std::string& value, std::string& error) {
  const JsonValue* field = core::json::FindObjectField(object, key);
  if (field == nullptr) {
    error = std::string(what) + " missing required field '" + std::string(key) + "'";
    return false;
  }
  if (field->type != JsonValue::Type::kString) {
    error = std::string(what) + " field '" + std::string(key) + "' must be a string";
    return false;
  }
  value = field->string_value;
  return true;
}

void ParseOptionalStringField(const JsonObject& object, std::string_view key, std::string& value) {
  value.clear();
  const JsonValue* field = core::json::FindObjectField(object, key);
  if (field != nullptr && field->type == JsonValue::Type::kString) {
    value = field->string_value;
  }
}

bool ParseRequiredIntegerField(const JsonObject& object, std::string_view what, std::string_view key,
                               std::int64_t& value, std::string& error) {
  const JsonValue* field = core::json::FindObjectField(object, key);
  if (field == nullptr) {
    error = std::string(what) + " missing required field '" + std::string(key) + "'";
    return false;
  }
  if (!core::json::AsInt64(*field, value)) {
    error = std::string(what) + " field '" + std::string(key) + "' must be an integer";
    return false;
  }
  return true;
}

bool ParseRequiredUnsignedField(const JsonObject& object, std::string_view what,
                                std::string_view key, std::uint64_t& value, std::string& error) {
  std::int64_t signed_value = 0;
  if (!ParseRequiredIntegerField(object, what, key, signed_value, error)) {
    return false;
  }
  if (signed_value < 0) {
    error = std::string(what) + " field '" + std::string(key) + "' must be non-negative";
    return false;
  }
  value = static_cast<std::uint64_t>(signed_value);
  return true;
}

bool ParseRequiredTimestampField(const JsonObject& object, std::string_view what,
                                 std::string_view key, Timestamp& value, std::string& error) {
  std::string raw;
  if (!ParseRequiredStringField(object, what, key, raw, error)) {
    return false;
  }
  std::string time_error;
  if (!core::ParseUtcTimestamp(raw, value, time_error)) {
    error = std::string(what) + " field '" + std::string(key) + "': " + time_error;
    return false;
  }
  return true;
}

bool ParseInt(std::int64_t raw, int& value) {
  if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
    return false;
  }
  value = static_cast<int>(raw);
  return true;
}

void AppendOptionalString(std::ostringstream& out, std::string_view key, const std::string& value) {
  if (!value.empty()) {
    out << ",\"" << key << "\":" << core::QuoteJson(value);
  }
}

void AppendSummaryFields(std::ostringstream& out, const SessionSummary& summary) {
  out << "\"session_id\":" << core::QuoteJson(summary.session_id)
      << ",\"state\":\"" << ToString(summary.state) << "\""
      << ",\"started_at\":\"" << core::FormatUtcTimestamp(summary.started_at) << "\"";
  if (summary.ended_at.has_value()) {
    out << ",\"ended_at\":\"" << core::FormatUtcTimestamp(*summary.ended_at) << "\"";
  }
  out << ",\"transport_mode\":\"" << ToString(summary.transport_mode) << "\""
      << ",\"tty_attached\":" << (summary.tty_attached ? "true" : "false")
      << ",\"retention_seconds\":" << summary.retention_seconds
      << ",\"pid\":" << summary.pid;
}

} // namespace

std::string ToJson(const StartMetadata& meta) {
  std::ostringstream out;
  out << "{"
      << "\"schema_version\":" << core::QuoteJson(meta.schema_version)
      << ",\"session_id\":" << core::QuoteJson(meta.session_id)
      << ",\"command\":" << core::ToJsonStringArray(meta.command)
      << ",\"working_directory\":" << core::QuoteJson(meta.working_directory)
      << ",\"started_at\":\"" << core::FormatUtcTimestamp(meta.started_at) << "\""
      << ",\"retention_seconds\":" << meta.retention_seconds
      << ",\"transport_mode\":\"" << ToString(meta.transport_mode) << "\""
      << ",\"tty_attached\":" << (meta.tty_attached ? "true" : "false")
      << ",\"pid\":" << meta.pid
      << "}";
  return out.str();
}

std::string ToJson(const FinalMetadata& final_meta) {
  std::ostringstream out;
  out << "{"
      << "\"schema_version\":" << core::QuoteJson(final_meta.schema_version)
      << ",\"session_id\":" << core::QuoteJson(final_meta.session_id)
      << ",\"state\":\"" << ToString(final_meta.state) << "\""
      << ",\"ended_at\":\"" << core::FormatUtcTimestamp(final_meta.ended_at) << "\"";
  if (final_meta.exit_code.has_value()) {
    out << ",\"exit_code\":" << *final_meta.exit_code;
  }
  AppendOptionalString(out, "signal", final_meta.signal);
  AppendOptionalString(out, "error", final_meta.error);
  out << "}";
  return out.str();
}

std::string ToJson(const IndexEntry& entry) {
  std::ostringstream out;
  out << "{\"offset\":" << entry.offset << ",\"length\":" << entry.length << ",\"channel\":\""
      << ToString(entry.channel) << "\",\"timestamp\":\""
      << core::FormatUtcTimestamp(entry.timestamp) << "\"}";
  return out.str();
}

std::string ToJson(const SessionSummary& summary) {
  std::ostringstream out;
  out << "{";
  AppendSummaryFields(out, summary);
  out << "}";
  return out.str();
}

std::string ToJson(const SessionDetail& detail) {
  std::ostringstream out;
  out << "{";
  AppendSummaryFields(out, detail.summary);
  if (detail.exit_code.has_value()) {
    out << ",\"exit_code\":" << *detail.exit_code;
  }
  AppendOptionalString(out, "signal", detail.signal);
  AppendOptionalString(out, "error", detail.error);
  out << ",\"output_bytes\":" << detail.output_bytes << ",\"chunk_count\":" << detail.chunk_count;
  if (detail.last_chunk_at.has_value()) {
    out << ",\"last_chunk_at\":\"" << core::FormatUtcTimestamp(*detail.last_chunk_at) << "\"";
  }
  out << "}";
  return out.str();
}

std::string ToJson(const OutputChunk& chunk) {
  std::ostringstream out;
  out << "{\"channel\":\"" << ToString(chunk.channel) << "\""
      << ",\"start_cursor\":\"" << chunk.start_cursor << "\""
      << ",\"end_cursor\":\"" << chunk.end_cursor << "\""
      << ",\"data_base64\":\"" << core::Base64Encode(chunk.data) << "\""
      << ",\"timestamp\":\"" << core::FormatUtcTimestamp(chunk.timestamp) << "\"}";
  return out.str();
}

bool ParseStartMetadata(std::string_view text, StartMetadata& meta, std::string& error) {
  constexpr std::string_view kWhat = "start metadata";
  JsonValue root;
  if (!ParseRootObject(text, kWhat, root, error)) {
    return false;
  }
  const JsonObject& object = root.object_value;

  StartMetadata parsed;
  if (!ParseRequiredStringField(object, kWhat, "schema_version", parsed.schema_version, error) ||
      !ParseRequiredStringField(object, kWhat, "session_id", parsed.session_id, error) ||
      !ParseRequiredTimestampField(object, kWhat, "started_at", parsed.started_at, error)) {
    return false;
  }

  const JsonValue* command = core::json::FindObjectField(object, "command");
  if (command == nullptr || command->type != JsonValue::Type::kArray) {
    error = "start metadata field 'command' must be an array of strings";
    return false;
  }
  for (const JsonValue& arg : command->array_value) {
    if (arg.type != JsonValue::Type::kString) {
      error = "start metadata field 'command' must be an array of strings";
      return false;
    }
    parsed.command.push_back(arg.string_value);
  }

  ParseOptionalStringField(object, "working_directory", parsed.working_directory);

  if (!ParseRequiredIntegerField(object, kWhat, "retention_seconds", parsed.retention_seconds,
                                 error)) {
    return false;
  }

  std::string transport;
  if (!ParseRequiredStringField(object, kWhat, "transport_mode", transport, error)) {
    return false;
  }
  if (!ParseTransportMode(transport, parsed.transport_mode)) {
    error = "start metadata has unknown transport_mode '" + transport + "'";
    return false;
  }

  const JsonValue* tty = core::json::FindObjectField(object, "tty_attached");
  if (tty != nullptr) {
    if (tty->type != JsonValue::Type::kBool) {
      error = "start metadata field 'tty_attached' must be a boolean";
      return false;
    }
    parsed.tty_attached = tty->bool_value;
  }

  std::int64_t pid = 0;
  if (!ParseRequiredIntegerField(object, kWhat, "pid", pid, error)) {
    return false;
  }
  if (!ParseInt(pid, parsed.pid) || parsed.pid < 0) {
    error = "start metadata field 'pid' is out of range";
    return false;
  }

  meta = std::move(parsed);
  return true;
}

bool ParseFinalMetadata(std::string_view text, FinalMetadata& final_meta, std::string& error) {
  constexpr std::string_view kWhat = "final metadata";
  JsonValue root;
  if (!ParseRootObject(text, kWhat, root, error)) {
    return false;
  }
  const JsonObject& object = root.object_value;

  FinalMetadata parsed;
  std::string state;
  if (!ParseRequiredStringField(object, kWhat, "schema_version", parsed.schema_version, error) ||
      !ParseRequiredStringField(object, kWhat, "session_id", parsed.session_id, error) ||
      !ParseRequiredStringField(object, kWhat, "state", state, error) ||
      !ParseRequiredTimestampField(object, kWhat, "ended_at", parsed.ended_at, error)) {
    return false;
  }
  if (!ParseSessionState(state, parsed.state)) {
    error = "final metadata has unknown state '" + state + "'";
    return false;
  }

  const JsonValue* exit_code = core::json::FindObjectField(object, "exit_code");
  if (exit_code != nullptr && exit_code->type != JsonValue::Type::kNull) {
    std::int64_t raw = 0;
    int code = 0;
    if (!core::json::AsInt64(*exit_code, raw) || !ParseInt(raw, code)) {
      error = "final metadata field 'exit_code' must be an integer";
      return false;
    }
    parsed.exit_code = code;
  }
  ParseOptionalStringField(object, "signal", parsed.signal);
  ParseOptionalStringField(object, "error", parsed.error);

  final_meta = std::move(parsed);
  return true;
}

bool ParseIndexEntry(std::string_view line, IndexEntry& entry, std::string& error) {
  constexpr std::string_view kWhat = "index entry";
  JsonValue root;
  if (!ParseRootObject(line, kWhat, root, error)) {
    return false;
  }
  const JsonObject& object = root.object_value;

  IndexEntry parsed;
  std::string channel;
  if (!ParseRequiredUnsignedField(object, kWhat, "offset", parsed.offset, error) ||
      !ParseRequiredUnsignedField(object, kWhat, "length", parsed.length, error) ||
      !ParseRequiredStringField(object, kWhat, "channel", channel, error) ||
      !ParseRequiredTimestampField(object, kWhat, "timestamp", parsed.timestamp, error)) {
    return false;
  }
  if (!ParseOutputChannel(channel, parsed.channel)) {
    error = "index entry has unknown channel '" + channel + "'";
    return false;
  }

  entry = parsed;
  return true;
}

} // namespace runtape::session

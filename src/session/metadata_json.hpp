#pragma once

#include "session/model.hpp"

#include <string>
#include <string_view>

namespace runtape::session {

// On-disk and wire JSON for session records. Writers emit compact JSON with a
// stable key order; readers tolerate unknown keys so newer writers stay
// readable.
std::string ToJson(const StartMetadata& meta);
std::string ToJson(const FinalMetadata& final_meta);
std::string ToJson(const IndexEntry& entry);
std::string ToJson(const SessionSummary& summary);
std::string ToJson(const SessionDetail& detail);

// Chunk payloads are base64 encoded and cursors rendered as decimal strings.
std::string ToJson(const OutputChunk& chunk);

bool ParseStartMetadata(std::string_view text, StartMetadata& meta, std::string& error);
bool ParseFinalMetadata(std::string_view text, FinalMetadata& final_meta, std::string& error);
bool ParseIndexEntry(std::string_view line, IndexEntry& entry, std::string& error);

} // namespace runtape::session

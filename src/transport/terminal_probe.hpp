#pragma once

namespace runtape::transport {

bool IsStdinTerminal();
bool IsStdoutTerminal();

// True when both stdin and stdout are attached to a terminal.
bool IsTerminalAttached();

} // namespace runtape::transport

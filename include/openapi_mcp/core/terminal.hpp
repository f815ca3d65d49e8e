#pragma once

namespace openapi_mcp {

bool StderrIsTerminal();

/// NO_COLOR set to a non-empty value (https://no-color.org/).
bool NoColorRequested();

/// Color is used only for log lines that go to an interactive stderr and
/// only when neither --no-color nor NO_COLOR asks otherwise. A log file or
/// a stderr captured by the MCP host always gets plain text.
bool ResolveLogColor(bool writes_to_stderr, bool no_color_flag);

} // namespace openapi_mcp

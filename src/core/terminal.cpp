#include <openapi_mcp/core/terminal.hpp>

#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#include <stdio.h>
#else
#include <unistd.h>
#endif

namespace openapi_mcp {

bool StderrIsTerminal() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(STDERR_FILENO) != 0;
#endif
}

bool NoColorRequested() {
    const char* value = std::getenv("NO_COLOR");
    return value != nullptr && value[0] != '\0';
}

bool ResolveLogColor(bool writes_to_stderr, bool no_color_flag) {
    if (!writes_to_stderr || no_color_flag) return false;
    if (NoColorRequested()) return false;
    return StderrIsTerminal();
}

} // namespace openapi_mcp

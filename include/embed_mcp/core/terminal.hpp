#pragma once

namespace embed_mcp {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether log output to stderr should be colored.
/// An explicit preference wins; otherwise NO_COLOR and TTY detection decide.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace embed_mcp

#pragma once

namespace plm_cfg {

/// True if stderr is a terminal (colored log output).
bool IsStderrTty();

/// True if stdout is a terminal (colored tables).
bool IsStdoutTty();

/// True if NO_COLOR is set (https://no-color.org/).
bool NoColorEnvSet();

/// Color decision shared by logs and tables: explicit flags win, then
/// NO_COLOR, then terminal detection.
bool ResolveColor(bool force_color, bool force_no_color, bool is_tty);

} // namespace plm_cfg

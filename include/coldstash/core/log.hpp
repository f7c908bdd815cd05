#pragma once

namespace coldstash {

/// Printf-style log helpers. Info and debug go to stdout, warnings and
/// errors to stderr. Debug lines are dropped unless verbose logging is on.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_verbose_logging(bool enabled);
bool verbose_logging();

} // namespace coldstash

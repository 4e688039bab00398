// Diagnostic output: "[DEBUG] ..." only when debug is on, "[WARN] ..." and
// "[AI] ..." always. Everything goes to the sink, std::cerr by default, so
// stdout carries only command output.
#pragma once
#include <string>
#include <iosfwd>

namespace cmdguard::log {

void set_debug(bool on);
bool debug_enabled();

// Redirect diagnostics (tests); pass nullptr to restore std::cerr.
void set_sink(std::ostream* out);

void debug(const std::string& msg);
void warn(const std::string& msg);
void ai(const std::string& msg);

} // namespace cmdguard::log

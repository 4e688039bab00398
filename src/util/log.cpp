#include <ai-cmdguard/util/log.hpp>
#include <atomic>
#include <iostream>
#include <mutex>

namespace cmdguard::log {

static std::atomic<bool> g_debug{false};
static std::ostream* g_sink = nullptr;
static std::mutex g_mutex;

void set_debug(bool on) { g_debug = on; }
bool debug_enabled() { return g_debug; }

void set_sink(std::ostream* out) { std::lock_guard<std::mutex> lk(g_mutex); g_sink = out; }

static void emit(const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_mutex);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << tag << ' ' << msg << '\n';
}

void debug(const std::string& msg) { if (g_debug) emit("[DEBUG]", msg); }
void warn(const std::string& msg) { emit("[WARN]", msg); }
void ai(const std::string& msg) { emit("[AI]", msg); }

} // namespace cmdguard::log

#include "quadrant/klog.h"

#include <cstdarg>

#include "quadrant/config.h"
#include "quadrant/kstring.h"

namespace quadrant {

namespace {

struct LogRing {
    char lines[config::LOG_RING_LINES][config::LOG_LINE_CHARS];
    int  head;
    int  count;
};

LogRing      g_log_ring = {};
LogSink      g_log_sink = nullptr;
LogLevel     g_min_level = LOG_INFO;
PanicHandler g_panic_handler = nullptr;

}

void klog_set_sink(LogSink sink) { g_log_sink = sink; }
void klog_set_min_level(LogLevel level) { g_min_level = level; }

const char* klog_level_name(LogLevel level) {
    switch (level) {
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO:  return "INFO";
        case LOG_WARN:  return "WARN";
        case LOG_ERROR: return "ERROR";
    }
    return "?";
}

void klog(LogLevel level, const char* fmt, ...) {
    if (level < g_min_level) return;

    char* line = g_log_ring.lines[g_log_ring.head];
    int n = k_snprintf(line, config::LOG_LINE_CHARS, "[%s] ", klog_level_name(level));
    va_list args;
    va_start(args, fmt);
    k_vsnprintf(line + n, config::LOG_LINE_CHARS - n, fmt, args);
    va_end(args);

    g_log_ring.head = (g_log_ring.head + 1) % config::LOG_RING_LINES;
    if (g_log_ring.count < config::LOG_RING_LINES) g_log_ring.count++;

    if (g_log_sink) g_log_sink(level, line);
}

int klog_count() { return g_log_ring.count; }

const char* klog_line(int index) {
    if (index < 0 || index >= g_log_ring.count) return "";
    int oldest = (g_log_ring.head - g_log_ring.count + config::LOG_RING_LINES) % config::LOG_RING_LINES;
    return g_log_ring.lines[(oldest + index) % config::LOG_RING_LINES];
}

void klog_clear() {
    g_log_ring.head = 0;
    g_log_ring.count = 0;
}

void kpanic_set_handler(PanicHandler handler) { g_panic_handler = handler; }

void kpanic(const char* file, int line, const char* message) {
    char text[config::LOG_LINE_CHARS];
    k_snprintf(text, sizeof(text), "PANIC %s:%d: %s", file, line, message);
    klog(LOG_ERROR, "%s", text);
    if (g_panic_handler) g_panic_handler(text);
    __builtin_trap();
}

}

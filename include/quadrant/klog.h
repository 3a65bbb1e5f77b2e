#ifndef QUADRANT_KLOG_H
#define QUADRANT_KLOG_H

namespace quadrant {

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_WARN, LOG_ERROR };

// Receives every formatted line. The kernel routes it to the serial port,
// the simulator to GLib.
typedef void (*LogSink)(LogLevel level, const char* line);

void klog_set_sink(LogSink sink);
void klog_set_min_level(LogLevel level);
void klog(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

// Recent-line ring, oldest first.
int         klog_count();
const char* klog_line(int index);
void        klog_clear();

const char* klog_level_name(LogLevel level);

// Fatal path for invariant violations. The handler must not return.
typedef void (*PanicHandler)(const char* message);

void kpanic_set_handler(PanicHandler handler);
[[noreturn]] void kpanic(const char* file, int line, const char* message);

}

#define QUADRANT_ASSERT(cond, message) \
    do { if (!(cond)) ::quadrant::kpanic(__FILE__, __LINE__, message); } while (0)

#endif

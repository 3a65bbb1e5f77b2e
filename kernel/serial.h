#ifndef QUADRANT_KERNEL_SERIAL_H
#define QUADRANT_KERNEL_SERIAL_H

#include "quadrant/klog.h"

namespace quadrant {

// COM1, 38400 baud 8N1, polled.
bool serial_init();
void serial_write(const char* s);

// klog sink: one line per record.
void serial_log_sink(LogLevel level, const char* line);

}

#endif

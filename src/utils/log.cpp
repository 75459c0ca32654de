/**
 * Copyright (c) 2026 The uavlog Authors
 */
#include "log.h"
#include <cstdio>
#include <mutex>

namespace {
std::mutex g_log_mutex;

// Transport tasks log from their own threads; one line at a time.
void vprint(FILE* f, const char* prefix, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::fputs(prefix, f);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}
}  // namespace

namespace uavlog::log {
void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stdout, "", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "[ERROR] ", fmt, args);
    va_end(args);
}
}  // namespace uavlog::log

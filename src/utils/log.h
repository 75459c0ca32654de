/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include <cstdarg>

namespace uavlog::log {
void info(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace uavlog::log

#define UAVLOG_LOG_INFO(fmt, ...) ::uavlog::log::info(fmt, ##__VA_ARGS__)
#define UAVLOG_LOG_ERROR(fmt, ...) ::uavlog::log::error(fmt, ##__VA_ARGS__)

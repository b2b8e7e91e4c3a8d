#ifndef __UTIL_H__
#define __UTIL_H__

#include <cstdint>
#include <string>
#include <vector>

#include "ddim.h"

#define SAFE_STR(s) ((s) ? (s) : "")
#define BOOL_STR(b) ((b) ? "true" : "false")

std::string format(const char* fmt, ...);

std::string ddim_basename(const std::string& path);

void pretty_progress(int step, int steps, float time);

void log_printf(ddim_log_level_t level, const char* file, int line, const char* format, ...);

#define LOG_DEBUG(format, ...) log_printf(DDIM_LOG_DEBUG, __FILE__, __LINE__, format, ##__VA_ARGS__)
#define LOG_INFO(format, ...) log_printf(DDIM_LOG_INFO, __FILE__, __LINE__, format, ##__VA_ARGS__)
#define LOG_WARN(format, ...) log_printf(DDIM_LOG_WARN, __FILE__, __LINE__, format, ##__VA_ARGS__)
#define LOG_ERROR(format, ...) log_printf(DDIM_LOG_ERROR, __FILE__, __LINE__, format, ##__VA_ARGS__)

#endif  // __UTIL_H__

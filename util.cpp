#include "util.h"

#include <stdarg.h>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <mutex>
#include <thread>
#include <unordered_set>

std::string format(const char* fmt, ...) {
    va_list ap;
    va_list ap2;
    va_start(ap, fmt);
    va_copy(ap2, ap);
    int size = vsnprintf(NULL, 0, fmt, ap);
    std::vector<char> buf(size + 1);
    int size2 = vsnprintf(buf.data(), size + 1, fmt, ap2);
    va_end(ap2);
    va_end(ap);
    return std::string(buf.data(), size2);
}

std::string ddim_basename(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos != std::string::npos) {
        return path.substr(pos + 1);
    }
    pos = path.find_last_of('\\');
    if (pos != std::string::npos) {
        return path.substr(pos + 1);
    }
    return path;
}

int32_t get_num_physical_cores() {
#ifdef __linux__
    // enumerate the set of thread siblings, num entries is num cores
    std::unordered_set<std::string> siblings;
    for (uint32_t cpu = 0; cpu < UINT32_MAX; ++cpu) {
        std::ifstream thread_siblings("/sys/devices/system/cpu/cpu" + std::to_string(cpu) + "/topology/thread_siblings");
        if (!thread_siblings.is_open()) {
            break;  // no more cpus
        }
        std::string line;
        if (std::getline(thread_siblings, line)) {
            siblings.insert(line);
        }
    }
    if (siblings.size() > 0) {
        return static_cast<int32_t>(siblings.size());
    }
#endif
    unsigned int n_threads = std::thread::hardware_concurrency();
    return n_threads > 0 ? (n_threads <= 4 ? n_threads : n_threads / 2) : 4;
}

static ddim_progress_cb_t ddim_progress_cb = NULL;
void* ddim_progress_cb_data                = NULL;

static ddim_log_cb_t ddim_log_cb = NULL;
void* ddim_log_cb_data           = NULL;

static std::mutex log_mutex;

void pretty_progress(int step, int steps, float time) {
    if (ddim_progress_cb) {
        ddim_progress_cb(step, steps, time, ddim_progress_cb_data);
        return;
    }
    if (step == 0) {
        return;
    }
    std::string progress = "  |";
    int max_progress     = 50;
    int32_t current      = (int32_t)(step * 1.f * max_progress / steps);
    for (int i = 0; i < 50; i++) {
        if (i > current) {
            progress += " ";
        } else if (i == current && i != max_progress - 1) {
            progress += ">";
        } else {
            progress += "=";
        }
    }
    progress += "|";
    printf(time > 1.0f ? "\r%s %i/%i - %.2fs/it" : "\r%s %i/%i - %.2fit/s\033[K",
           progress.c_str(), step, steps,
           time > 1.0f || time == 0 ? time : (1.0f / time));
    fflush(stdout);
    if (step == steps) {
        printf("\n");
    }
}

#define LOG_BUFFER_SIZE 4096

void log_printf(ddim_log_level_t level, const char* file, int line, const char* format, ...) {
    va_list args;
    va_start(args, format);

    char log_buffer[LOG_BUFFER_SIZE + 1];
    log_buffer[0] = '\0';
    int written   = snprintf(log_buffer, LOG_BUFFER_SIZE, "%s:%-4d - ", ddim_basename(file).c_str(), line);

    if (written >= 0 && written < LOG_BUFFER_SIZE) {
        vsnprintf(log_buffer + written, LOG_BUFFER_SIZE - written, format, args);
    }
    strncat(log_buffer, "\n", LOG_BUFFER_SIZE - strlen(log_buffer));
    va_end(args);

    std::lock_guard<std::mutex> lock(log_mutex);
    if (ddim_log_cb) {
        ddim_log_cb(level, log_buffer, ddim_log_cb_data);
        return;
    }

    const char* level_str = "DEBUG";
    if (level == DDIM_LOG_INFO) {
        level_str = "INFO ";
    } else if (level == DDIM_LOG_WARN) {
        level_str = "WARN ";
    } else if (level == DDIM_LOG_ERROR) {
        level_str = "ERROR";
    }
    FILE* out = level >= DDIM_LOG_WARN ? stderr : stdout;
    fprintf(out, "[%s] %s", level_str, log_buffer);
    fflush(out);
}

void ddim_set_log_callback(ddim_log_cb_t cb, void* data) {
    std::lock_guard<std::mutex> lock(log_mutex);
    ddim_log_cb      = cb;
    ddim_log_cb_data = data;
}

void ddim_set_progress_callback(ddim_progress_cb_t cb, void* data) {
    ddim_progress_cb      = cb;
    ddim_progress_cb_data = data;
}

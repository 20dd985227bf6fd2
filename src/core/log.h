#pragma once

#include <fmt/core.h>
#include <cstdio>
#include <ctime>
#include <string_view>
#include <utility>

enum {
    LOG_TRACE,
    LOG_DEBUG,
    LOG_INFO,
    LOG_WARN,
    LOG_ERROR,
    LOG_FATAL
};

#ifndef _WIN32
#include <csignal>
inline static void __debugbreak(void)
{
    raise(SIGTRAP);
}
#endif

struct Logger {
    const char *level_strings[6] = {
            "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"
    };
    const char *level_colors[6] = {
        "\x1b[94m", "\x1b[36m", "\x1b[32m", "\x1b[33m", "\x1b[31m", "\x1b[35m"
    };

    FILE* file = nullptr;
    int min_level = LOG_WARN;

    bool init(const char* filename) {
        release();
        file = fopen(filename, "w");
        if (file == nullptr) {
            fmt::print(stderr, "Cannot create log file {}!\n", filename);
            return false;
        }
        return true;
    }

    void release() {
        if (file) {
            fclose(file);
            file = nullptr;
        }
    }

    void set_minimum_level(int min_level) {
        this->min_level = min_level;
    }

    template <class... Args>
    void log(int level, const char *filename, int line, fmt::format_string<Args...> fmtstr, Args&&... args) {
        if (level < min_level && !file) return;
        log_raw(level, filename, line, fmt::format(fmtstr, std::forward<Args>(args)...));
    }

    void log_raw(int level, const char* filename, int line, std::string_view str) {
        time_t cur_time = time(NULL);
        tm cur_localtime;
        #ifdef _WIN32
        if (localtime_s(&cur_localtime, &cur_time) != 0) {
            return;
        }
        #else
        if (localtime_r(&cur_time, &cur_localtime) == nullptr) {
            return;
        }
        #endif
        if (level >= min_level) {
            char buf[16];
            buf[strftime(buf, sizeof(buf), "%H:%M:%S", &cur_localtime)] = '\0';
            fmt::print(stderr, "{} {}{:5s}\x1b[0m \x1b[90m{}:{}:\x1b[0m {}\n",
                       buf, level_colors[level], level_strings[level],
                       filename, line,
                       str);
            fflush(stderr);
        }
        if (file) {
            char buf_big[64];
            buf_big[strftime(buf_big, sizeof(buf_big), "%Y-%m-%d %H:%M:%S", &cur_localtime)] = '\0';
            fmt::print(file, "{} {:5s} {}:{}: {}\n", buf_big, level_strings[level], filename, line, str);
            fflush(file);
        }
    }

};

extern Logger g_logger;

#define log_helper(mode, ...) g_logger.log(mode, __FILE__, __LINE__, __VA_ARGS__)

#define log_trace(...) log_helper(LOG_TRACE, __VA_ARGS__)
#define log_debug(...) log_helper(LOG_DEBUG, __VA_ARGS__)
#define log_info(...)  log_helper(LOG_INFO, __VA_ARGS__)
#define log_warn(...)  log_helper(LOG_WARN, __VA_ARGS__)
#define log_error(...) log_helper(LOG_ERROR, __VA_ARGS__)
#define log_fatal(...) log_helper(LOG_FATAL, __VA_ARGS__)

#ifndef NDEBUG
#define log_assert(cond, ...) do { if (!(cond)) { log_helper(LOG_FATAL, __VA_ARGS__); __debugbreak(); } } while (false)
#else
#define log_assert(cond, ...) do { if (!(cond)) { log_helper(LOG_FATAL, __VA_ARGS__); } } while (false)
#endif

extern bool log_init(const char* filename);
extern void log_release();
extern void log_set_minimum_level(int min_level);
extern bool log_parse_level(std::string_view name, int* level);

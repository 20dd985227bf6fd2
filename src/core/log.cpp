#include "log.h"

Logger g_logger;

bool log_init(const char *filename) { return g_logger.init(filename); }
void log_release() { g_logger.release(); }
void log_set_minimum_level(int min_level) { g_logger.set_minimum_level(min_level); }

bool log_parse_level(std::string_view name, int* level) {
    static const char* names[6] = {
        "trace", "debug", "info", "warn", "error", "fatal"
    };
    for (int i = 0; i < 6; i++) {
        if (name == names[i]) {
            *level = i;
            return true;
        }
    }
    return false;
}

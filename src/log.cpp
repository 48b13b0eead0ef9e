#include "log.hpp"

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <vector>

namespace {

struct reloader_logger_state {
    std::mutex              mutex;
    reloader_log_level      level     = RELOADER_LOG_LEVEL_INFO;
    reloader_log_callback   callback  = reloader_log_callback_default;
    void *                  user_data = nullptr;
    FILE *                  file      = nullptr;
};

reloader_logger_state & g_logger_state() {
    static reloader_logger_state state;
    return state;
}

void reloader_log_internal_v(reloader_log_level level, const char * format, va_list args) {
    va_list args_copy;
    va_copy(args_copy, args);
    char buffer[256];
    int len = vsnprintf(buffer, sizeof(buffer), format, args);

    auto & state = g_logger_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (len < 0) {
        va_end(args_copy);
        return;
    }
    if (len < (int) sizeof(buffer)) {
        state.callback(level, buffer, state.user_data);
    } else {
        std::vector<char> buffer2(len + 1);
        vsnprintf(buffer2.data(), buffer2.size(), format, args_copy);
        state.callback(level, buffer2.data(), state.user_data);
    }
    va_end(args_copy);
}

} // namespace

void reloader_log_set(reloader_log_callback log_callback, void * user_data) {
    auto & state = g_logger_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.callback  = log_callback ? log_callback : reloader_log_callback_default;
    state.user_data = user_data;
}

void reloader_log_set_level(reloader_log_level level) {
    auto & state = g_logger_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.level = level;
}

reloader_log_level reloader_log_get_level() {
    auto & state = g_logger_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.level;
}

bool reloader_log_set_file(const std::string & path) {
    FILE * file = fopen(path.c_str(), "a");
    if (!file) {
        return false;
    }

    auto & state = g_logger_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.file) {
        fclose(state.file);
    }
    state.file = file;
    return true;
}

const char * reloader_log_level_name(reloader_log_level level) {
    switch (level) {
        case RELOADER_LOG_LEVEL_DEBUG: return "DEBUG";
        case RELOADER_LOG_LEVEL_INFO:  return "INFO";
        case RELOADER_LOG_LEVEL_WARN:  return "WARN";
        case RELOADER_LOG_LEVEL_ERROR: return "ERROR";
        case RELOADER_LOG_LEVEL_NONE:  return "NONE";
    }
    return "UNKNOWN";
}

bool reloader_log_level_parse(const std::string & name, reloader_log_level & level) {
    if (name == "debug")                                             { level = RELOADER_LOG_LEVEL_DEBUG; return true; }
    if (name == "info"    || name == "notice")                       { level = RELOADER_LOG_LEVEL_INFO;  return true; }
    if (name == "warning" || name == "warn")                         { level = RELOADER_LOG_LEVEL_WARN;  return true; }
    if (name == "error"   || name == "critical" || name == "alert" ||
        name == "emergency")                                         { level = RELOADER_LOG_LEVEL_ERROR; return true; }
    if (name == "none"    || name == "off")                          { level = RELOADER_LOG_LEVEL_NONE;  return true; }
    return false;
}

void reloader_log_internal(reloader_log_level level, const char * format, ...) {
    if (level < reloader_log_get_level()) {
        return;
    }

    va_list args;
    va_start(args, format);
    reloader_log_internal_v(level, format, args);
    va_end(args);
}

// called with the logger mutex held
void reloader_log_callback_default(reloader_log_level level, const char * text, void * /*user_data*/) {
    auto & state = g_logger_state();
    FILE * out = state.file ? state.file : stderr;

    char stamp[32];
    time_t now = time(nullptr);
    struct tm tm_now;
    localtime_r(&now, &tm_now);
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_now);

    fprintf(out, "[%s] [%-5s] %s", stamp, reloader_log_level_name(level), text);
    fflush(out);
}

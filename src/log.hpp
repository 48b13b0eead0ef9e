#pragma once

#include <string>

#ifdef __GNUC__
#define RELOADER_ATTRIBUTE_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#else
#define RELOADER_ATTRIBUTE_FORMAT(...)
#endif

//
// logging
//
// everything goes to stderr (or the log file) - stdout carries the protocol
//

enum reloader_log_level {
    RELOADER_LOG_LEVEL_DEBUG = 1,
    RELOADER_LOG_LEVEL_INFO  = 2,
    RELOADER_LOG_LEVEL_WARN  = 3,
    RELOADER_LOG_LEVEL_ERROR = 4,
    RELOADER_LOG_LEVEL_NONE  = 5,
};

typedef void (*reloader_log_callback)(enum reloader_log_level level, const char * text, void * user_data);

// replace the sink, pass nullptr to restore the default one
void reloader_log_set(reloader_log_callback log_callback, void * user_data);

void                    reloader_log_set_level(enum reloader_log_level level);
enum reloader_log_level reloader_log_get_level();

// append to a file instead of stderr, returns false if the file cannot be opened
bool reloader_log_set_file(const std::string & path);

const char * reloader_log_level_name(enum reloader_log_level level);
bool         reloader_log_level_parse(const std::string & name, enum reloader_log_level & level);

RELOADER_ATTRIBUTE_FORMAT(2, 3)
void reloader_log_internal        (enum reloader_log_level level, const char * format, ...);
void reloader_log_callback_default(enum reloader_log_level level, const char * text, void * user_data);

#define RELOADER_LOG_DEBUG(...) reloader_log_internal(RELOADER_LOG_LEVEL_DEBUG, __VA_ARGS__)
#define RELOADER_LOG_INFO(...)  reloader_log_internal(RELOADER_LOG_LEVEL_INFO , __VA_ARGS__)
#define RELOADER_LOG_WARN(...)  reloader_log_internal(RELOADER_LOG_LEVEL_WARN , __VA_ARGS__)
#define RELOADER_LOG_ERROR(...) reloader_log_internal(RELOADER_LOG_LEVEL_ERROR, __VA_ARGS__)

// Header-only logging with compile-time levels.
// - Disabled levels expand to nothing
// - Usage: LOG_SPINOR_INFO("Erasing %u bytes at 0x%06x", len, addr);
//          LOG_HAL_DEBUG("SPI clock %u Hz", hz);

#ifndef NORWORKS_LOGGING_HPP
#define NORWORKS_LOGGING_HPP

#include <stdio.h>
#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include "timing.hpp" // for get_timestamp_ns()

// Levels: 0=NONE, 1=ERROR, 2=WARN, 3=INFO, 4=DEBUG, 5=TRACE
#ifndef LOG_SPINOR_LEVEL
#define LOG_SPINOR_LEVEL 0
#endif

#ifndef LOG_HAL_LEVEL
#define LOG_HAL_LEVEL 0
#endif

static inline FILE*& logger_output_slot()
{
    static FILE* out = stderr;
    return out;
}

static inline FILE* logger_output()
{
    return logger_output_slot();
}

// Caller keeps ownership of f; nullptr restores stderr.
static inline void logger_set_output_file(FILE* f)
{
    FILE*& out = logger_output_slot();
    fflush(out);
    out = f ? f : stderr;
}

static inline void logger_vlog(const char* comp, const char* level, const char* fmt, va_list ap)
{
    uint64_t ts_us = get_timestamp_ns() / 1000;
    FILE* out = logger_output();
    flockfile(out);
    fprintf(out, "[%llu.%06llu] [%s] [%s] ",
            (unsigned long long)(ts_us / 1000000ULL),
            (unsigned long long)(ts_us % 1000000ULL),
            level, comp);
    vfprintf(out, fmt, ap);
    fputc('\n', out);
    funlockfile(out);
}

static inline void logger_log(const char* comp, const char* level, const char* fmt, ...)
{
    va_list ap; va_start(ap, fmt);
    logger_vlog(comp, level, fmt, ap);
    va_end(ap);
}

// Formats up to the first 16 bytes of a command as "9f 00 00 ..." into buf.
static inline const char* logger_format_bytes(char* buf, size_t buf_len, const uint8_t* data, size_t len)
{
    size_t pos = 0;
    buf[0] = '\0';
    const size_t shown = len < 16 ? len : 16;
    for (size_t i = 0; i < shown && pos + 4 < buf_len; ++i) {
        pos += (size_t)snprintf(buf + pos, buf_len - pos, i ? " %02x" : "%02x", data[i]);
    }
    if (shown < len && pos + 5 < buf_len) {
        snprintf(buf + pos, buf_len - pos, " ...");
    }
    return buf;
}

// SPI NOR protocol layer
#if LOG_SPINOR_LEVEL >= 5
#define LOG_SPINOR_TRACE(fmt, ...) logger_log("spinor", "TRACE", fmt, ##__VA_ARGS__)
#define LOG_SPINOR_TRACE_IF(cond, fmt, ...) do { if (cond) logger_log("spinor","TRACE",fmt, ##__VA_ARGS__); } while(0)
#else
#define LOG_SPINOR_TRACE(...) do{}while(0)
#define LOG_SPINOR_TRACE_IF(...) do{}while(0)
#endif

#if LOG_SPINOR_LEVEL >= 4
#define LOG_SPINOR_DEBUG(fmt, ...) logger_log("spinor", "DEBUG", fmt, ##__VA_ARGS__)
#define LOG_SPINOR_DEBUG_IF(cond, fmt, ...) do { if (cond) logger_log("spinor","DEBUG",fmt, ##__VA_ARGS__); } while(0)
#else
#define LOG_SPINOR_DEBUG(...) do{}while(0)
#define LOG_SPINOR_DEBUG_IF(...) do{}while(0)
#endif

#if LOG_SPINOR_LEVEL >= 3
#define LOG_SPINOR_INFO(fmt, ...)  logger_log("spinor", "INFO",  fmt, ##__VA_ARGS__)
#define LOG_SPINOR_INFO_IF(cond, fmt, ...) do { if (cond) logger_log("spinor","INFO",fmt, ##__VA_ARGS__); } while(0)
#else
#define LOG_SPINOR_INFO(...) do{}while(0)
#define LOG_SPINOR_INFO_IF(...) do{}while(0)
#endif

#if LOG_SPINOR_LEVEL >= 2
#define LOG_SPINOR_WARN(fmt, ...)  logger_log("spinor", "WARN",  fmt, ##__VA_ARGS__)
#define LOG_SPINOR_WARN_IF(cond, fmt, ...) do { if (cond) logger_log("spinor","WARN",fmt, ##__VA_ARGS__); } while(0)
#else
#define LOG_SPINOR_WARN(...) do{}while(0)
#define LOG_SPINOR_WARN_IF(...) do{}while(0)
#endif

#if LOG_SPINOR_LEVEL >= 1
#define LOG_SPINOR_ERROR(fmt, ...) logger_log("spinor", "ERROR", fmt, ##__VA_ARGS__)
#define LOG_SPINOR_ERROR_IF(cond, fmt, ...) do { if (cond) logger_log("spinor","ERROR",fmt, ##__VA_ARGS__); } while(0)
#else
#define LOG_SPINOR_ERROR(...) do{}while(0)
#define LOG_SPINOR_ERROR_IF(...) do{}while(0)
#endif

// SPI bus / GPIO
#if LOG_HAL_LEVEL >= 5
#define LOG_HAL_TRACE(fmt, ...) logger_log("hal", "TRACE", fmt, ##__VA_ARGS__)
#define LOG_HAL_TRACE_IF(cond, fmt, ...) do { if (cond) logger_log("hal","TRACE",fmt, ##__VA_ARGS__); } while(0)
#else
#define LOG_HAL_TRACE(...) do{}while(0)
#define LOG_HAL_TRACE_IF(...) do{}while(0)
#endif

#if LOG_HAL_LEVEL >= 4
#define LOG_HAL_DEBUG(fmt, ...) logger_log("hal", "DEBUG", fmt, ##__VA_ARGS__)
#define LOG_HAL_DEBUG_IF(cond, fmt, ...) do { if (cond) logger_log("hal","DEBUG",fmt, ##__VA_ARGS__); } while(0)
#else
#define LOG_HAL_DEBUG(...) do{}while(0)
#define LOG_HAL_DEBUG_IF(...) do{}while(0)
#endif

#if LOG_HAL_LEVEL >= 3
#define LOG_HAL_INFO(fmt, ...)  logger_log("hal", "INFO",  fmt, ##__VA_ARGS__)
#define LOG_HAL_INFO_IF(cond, fmt, ...) do { if (cond) logger_log("hal","INFO",fmt, ##__VA_ARGS__); } while(0)
#else
#define LOG_HAL_INFO(...) do{}while(0)
#define LOG_HAL_INFO_IF(...) do{}while(0)
#endif

#if LOG_HAL_LEVEL >= 2
#define LOG_HAL_WARN(fmt, ...)  logger_log("hal", "WARN",  fmt, ##__VA_ARGS__)
#define LOG_HAL_WARN_IF(cond, fmt, ...) do { if (cond) logger_log("hal","WARN",fmt, ##__VA_ARGS__); } while(0)
#else
#define LOG_HAL_WARN(...) do{}while(0)
#define LOG_HAL_WARN_IF(...) do{}while(0)
#endif

#if LOG_HAL_LEVEL >= 1
#define LOG_HAL_ERROR(fmt, ...) logger_log("hal", "ERROR", fmt, ##__VA_ARGS__)
#define LOG_HAL_ERROR_IF(cond, fmt, ...) do { if (cond) logger_log("hal","ERROR",fmt, ##__VA_ARGS__); } while(0)
#else
#define LOG_HAL_ERROR(...) do{}while(0)
#define LOG_HAL_ERROR_IF(...) do{}while(0)
#endif

#endif // NORWORKS_LOGGING_HPP

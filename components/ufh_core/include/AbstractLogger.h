#pragma once

#include <stdarg.h>

#define LOG_FN(c, level)                                                                           \
    void c(const char *tag, const char *fmt, ...) {                                                \
        va_list args;                                                                              \
        va_start(args, fmt);                                                                       \
        vlog(level, tag, fmt, args);                                                               \
        va_end(args);                                                                              \
    }

class AbstractLogger {
  public:
    virtual ~AbstractLogger() {}

    typedef enum {
        None,    /*!< No log output */
        Error,   /*!< A zone or the controller can not operate normally */
        Warn,    /*!< A data source failed and a fallback was used */
        Info,    /*!< Mode and health changes */
        Debug,   /*!< Per-tick values such as PID terms and durations */
        Verbose, /*!< Per-zone detail on every tick */
    } Level;

    virtual void vlog(Level level, const char *tag, const char *fmt, va_list args) = 0;
    void log(Level level, const char *tag, const char *fmt, ...) {
        va_list args;
        va_start(args, fmt);
        vlog(level, tag, fmt, args);
        va_end(args);
    }

    LOG_FN(err, Level::Error)
    LOG_FN(warn, Level::Warn)
    LOG_FN(info, Level::Info)
    LOG_FN(dbg, Level::Debug)
    LOG_FN(verbose, Level::Verbose)
};

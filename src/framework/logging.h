#ifndef FRAMEWORK__LOGGING_H
#define FRAMEWORK__LOGGING_H

#include <sparsehash/dense_hash_map>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

/* Logging functionality.
 * Loggers form a dot-separated hierarchy below the root logger. A logger
 * without an explicit level inherits the level of its parent.
 *
 * Usage example:
 *
 * // Root Logger
 * logging.info("yellow");    // prints: INFO:root:yellow
 *
 * // User-specified Logger
 * auto& log = logging.get_logger("parse");
 * log.warning("watch out!"); // prints: WARNING:parse:watch out!
 *
 * // Multi-hierarchical Logger
 * auto& parent = logging.get_logger("parse");
 * auto& child = logging.get_logger("parse.batch");
 * parent.set_level(LogLevel::warning)
 * child.info("hi") // prints nothing, parent has higher min level
 * child.warning("ho"); // prints: WARNING:parse.batch:ho
 *
 * Everything goes to stdout unless logging.set_output() redirects it.
 */

#if defined(__GNUC__) || defined(__clang__)
#define FMT_STRING_CHECK __attribute__((format(printf, 2, 3)))
#else
#define FMT_STRING_CHECK
#endif

enum class LogLevel
{
    parent = 0, // Inherit parents level
    debug = 1,
    info = 2,
    warning = 3,
    error = 4,
    critical = 5,
    ignored = 6
};

// Accepts "debug", "info", ..., or the numeric value. Returns false for
// anything else and leaves level untouched.
bool parse_log_level(const std::string& str, LogLevel& level);

class Logger
{
public:
    Logger(std::string name, Logger* parent);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void log_valist(LogLevel level, const char* fmtstr, va_list list);

    void debug(const char* fmtstr, ...) FMT_STRING_CHECK;
    void info(const char* fmtstr, ...) FMT_STRING_CHECK;
    void warning(const char* fmtstr, ...) FMT_STRING_CHECK;
    void error(const char* fmtstr, ...) FMT_STRING_CHECK;
    void critical(const char* fmtstr, ...) FMT_STRING_CHECK;

    void set_level(LogLevel level);
    LogLevel get_level();
    bool enabled_for(LogLevel level) { return get_level() <= level; }

    const std::string& name() const { return name_; }

    // Must hold _root_mutex to call
    Logger& _get_child(const std::string& identifier, std::string fullname);

protected:
    std::string name_;
    Logger* parent_;
    google::dense_hash_map<std::string, Logger*> children_;

    std::mutex level_mutex_;
    LogLevel level_;
};

class RootLogger : public Logger
{
public:
    RootLogger() : Logger("root", nullptr) { level_ = LogLevel::info; }

    Logger& get_logger(const std::string& identifier);
};

// Proxy without data of its own, so that using it from other static
// initializers can't touch a RootLogger that isn't constructed yet.
struct Logging
{
    RootLogger& get_logger();
    Logger& get_logger(const std::string& identifier);

    // Stream all loggers write to; nullptr restores stdout. The stream is not
    // owned.
    void set_output(FILE* stream);

    void debug(const char* fmtstr, ...) FMT_STRING_CHECK;
    void info(const char* fmtstr, ...) FMT_STRING_CHECK;
    void warning(const char* fmtstr, ...) FMT_STRING_CHECK;
    void error(const char* fmtstr, ...) FMT_STRING_CHECK;
    void critical(const char* fmtstr, ...) FMT_STRING_CHECK;
};

extern Logging logging;

// Debug logging not available in optimized build
#ifndef OPTIMIZED_BUILD
#define LOG_DEBUG(log, ...)     \
    do                          \
    {                           \
        log.debug(__VA_ARGS__); \
    } while (0)
#else
#define LOG_DEBUG(log, ...)
#endif

#endif

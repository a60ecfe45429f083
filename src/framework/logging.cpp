#include "logging.h"
#include <cstdlib>
#include <stdexcept>

std::mutex _printf_mutex; // Used for I/O
std::mutex _root_mutex;   // Used when creating new loggers
static FILE* _output = nullptr; // Guarded by _printf_mutex

Logging logging;

namespace
{
const char* level_names[] = {
    "PARENT", "DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL", "IGNORED"};
}

bool parse_log_level(const std::string& str, LogLevel& level)
{
    static const char* lower_names[] = {"parent", "debug", "info", "warning",
        "error", "critical", "ignored"};

    for (int i = 0; i <= static_cast<int>(LogLevel::ignored); ++i)
    {
        if (str == lower_names[i])
        {
            level = static_cast<LogLevel>(i);
            return true;
        }
    }

    if (str.size() == 1 && str[0] >= '0' && str[0] <= '6')
    {
        level = static_cast<LogLevel>(str[0] - '0');
        return true;
    }

    return false;
}

Logger::Logger(std::string name, Logger* parent)
  : name_(name), parent_(parent), level_(LogLevel::parent)
{
    children_.set_empty_key("");
}

Logger::~Logger()
{
    for (auto& c : children_)
        delete c.second;
}

void Logger::log_valist(LogLevel level, const char* fmtstr, va_list list)
{
    if (get_level() > level)
        return;

    std::string str = std::string(level_names[static_cast<int>(level)]) +
                      ":" + name_ + ":" + fmtstr + "\n";

    {
        std::lock_guard<std::mutex> guard(_printf_mutex);
        FILE* out = _output ? _output : stdout;
        vfprintf(out, str.c_str(), list);
        if (level >= LogLevel::error)
            fflush(out);
    }
}

void Logger::debug(const char* fmtstr, ...)
{
    va_list list;
    va_start(list, fmtstr);
    log_valist(LogLevel::debug, fmtstr, list);
    va_end(list);
}

void Logger::info(const char* fmtstr, ...)
{
    va_list list;
    va_start(list, fmtstr);
    log_valist(LogLevel::info, fmtstr, list);
    va_end(list);
}

void Logger::warning(const char* fmtstr, ...)
{
    va_list list;
    va_start(list, fmtstr);
    log_valist(LogLevel::warning, fmtstr, list);
    va_end(list);
}

void Logger::error(const char* fmtstr, ...)
{
    va_list list;
    va_start(list, fmtstr);
    log_valist(LogLevel::error, fmtstr, list);
    va_end(list);
}

void Logger::critical(const char* fmtstr, ...)
{
    va_list list;
    va_start(list, fmtstr);
    log_valist(LogLevel::critical, fmtstr, list);
    va_end(list);
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> guard(level_mutex_);
    level_ = level;
}

LogLevel Logger::get_level()
{
    std::lock_guard<std::mutex> guard(level_mutex_);
    if (level_ == LogLevel::parent)
        return parent_ ? parent_->get_level() : LogLevel::ignored;
    return level_;
}

Logger& Logger::_get_child(const std::string& identifier, std::string fullname)
{
    if (identifier.empty())
        throw std::length_error("Identifier cannot be empty");

    auto itr = children_.find(identifier);
    if (itr == children_.end())
    {
        Logger* child = new Logger(std::move(fullname), this);
        children_[identifier] = child;
        return *child;
    }
    return *itr->second;
}

Logger& RootLogger::get_logger(const std::string& identifier)
{
    std::lock_guard<std::mutex> guard(_root_mutex);

    Logger* logger = this;

    if (identifier == "root")
        return *logger;

    std::size_t begin = 0;

    for (auto end = identifier.find("."); end != std::string::npos;
         end = identifier.find(".", end + 1))
    {
        logger = &logger->_get_child(
            identifier.substr(begin, end - begin), identifier.substr(0, end));
        begin = end + 1;
    }

    logger = &logger->_get_child(identifier.substr(begin), identifier);

    return *logger;
}

RootLogger& Logging::get_logger()
{
    static RootLogger logger;
    return logger;
}

Logger& Logging::get_logger(const std::string& identifier)
{
    return get_logger().get_logger(identifier);
}

void Logging::set_output(FILE* stream)
{
    std::lock_guard<std::mutex> guard(_printf_mutex);
    if (_output)
        fflush(_output);
    _output = stream;
}

void Logging::debug(const char* fmtstr, ...)
{
    va_list ap;
    va_start(ap, fmtstr);
    get_logger().log_valist(LogLevel::debug, fmtstr, ap);
    va_end(ap);
}

void Logging::info(const char* fmtstr, ...)
{
    va_list ap;
    va_start(ap, fmtstr);
    get_logger().log_valist(LogLevel::info, fmtstr, ap);
    va_end(ap);
}

void Logging::warning(const char* fmtstr, ...)
{
    va_list ap;
    va_start(ap, fmtstr);
    get_logger().log_valist(LogLevel::warning, fmtstr, ap);
    va_end(ap);
}

void Logging::error(const char* fmtstr, ...)
{
    va_list ap;
    va_start(ap, fmtstr);
    get_logger().log_valist(LogLevel::error, fmtstr, ap);
    va_end(ap);
}

void Logging::critical(const char* fmtstr, ...)
{
    va_list ap;
    va_start(ap, fmtstr);
    get_logger().log_valist(LogLevel::critical, fmtstr, ap);
    va_end(ap);
}

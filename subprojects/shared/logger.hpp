#pragma once
#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <functional>
#include <cctype>
#include <climits>

// Fix Windows macro conflicts
#ifdef min
#undef min
#endif
#ifdef max
#undef max
#endif

// Usage:
//   auto logger = std::make_shared<speedwire::Logger>("discover");
//   logger->add_sink(std::make_shared<speedwire::StdoutSink>());
//   logger->info("Starting discovery");
// A logger without sinks discards every line.

namespace speedwire {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

/** \brief Parse a level name ("debug", "INFO", ...); falls back to \p fallback. */
inline LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::Info) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lower == "debug")    return LogLevel::Debug;
    if (lower == "info")     return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error")    return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    return fallback;
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(LogLevel level, const std::string& message) = 0;
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

protected:
    static std::string format(LogLevel level, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << to_string(level) << "] " << message;
        return oss.str();
    }

    LogLevel min_level_ = LogLevel::Info; // Default level set to INFO
};

class StdoutSink : public LogSink {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << format(level, message) << std::endl;
    }

private:
    std::mutex mutex_;
};

/** \brief Keeps formatted lines in memory; used by tests to observe log output. */
class VectorSink : public LogSink {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(format(level, message));
        levels_.push_back(level);
    }

    std::vector<std::string> get_lines(size_t start = 0, size_t count = SIZE_MAX, LogLevel min_level = LogLevel::Debug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> filtered;
        for (size_t i = 0; i < lines_.size(); ++i) {
            if (levels_[i] >= min_level) {
                filtered.push_back(lines_[i]);
            }
        }
        if (start >= filtered.size()) return {};
        // Use (std::min) with parentheses to avoid macro conflicts
        size_t end = (std::min)(start + count, filtered.size());
        return std::vector<std::string>(filtered.begin() + start, filtered.begin() + end);
    }

    /** \brief Number of stored lines containing \p needle. */
    size_t count_containing(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(lines_.begin(), lines_.end(),
            [&needle](const std::string& line) { return line.find(needle) != std::string::npos; }));
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::vector<LogLevel> levels_;
};

/** \brief Forwards formatted lines to a user supplied hook. */
class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const std::string&)>;

    explicit CallbackSink(Callback cb) : callback_(std::move(cb)) {}

    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        Callback cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cb = callback_;
        }
        // Invoked unlocked so the callback may log through the same Logger
        if (cb) cb(format(level, message));
    }

private:
    std::mutex mutex_;
    Callback callback_;
};

class Logger {
public:
    // Default constructor with empty name
    Logger() : name_("Default") {}

    // Constructor with logger name
    explicit Logger(const std::string& name) : name_(name) {}

    void add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.push_back(std::move(sink));
    }

    void clear_sinks() {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.clear();
    }

    void log(LogLevel level, const std::string& message) {
        std::vector<std::shared_ptr<LogSink>> sinks;
        {
            std::lock_guard<std::mutex> lock(sinks_mutex_);
            sinks = sinks_;
        }
        for (const auto& sink : sinks) {
            sink->log(level, message);
        }
    }

    void debug(const std::string& message)    { log(LogLevel::Debug, message); }
    void info(const std::string& message)     { log(LogLevel::Info, message); }
    void warning(const std::string& message)  { log(LogLevel::Warning, message); }
    void error(const std::string& message)    { log(LogLevel::Error, message); }
    void critical(const std::string& message) { log(LogLevel::Critical, message); }

    // Get the logger name
    const std::string& name() const { return name_; }

    // Set the logger name
    void set_name(const std::string& name) { name_ = name; }

private:
    std::string name_;
    mutable std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
};

/** \brief Returns \p logger, or a sink-less (discarding) logger when null. */
inline std::shared_ptr<Logger> or_null_logger(std::shared_ptr<Logger> logger) {
    if (logger) return logger;
    return std::make_shared<Logger>("speedwire");
}

} // namespace speedwire

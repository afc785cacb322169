#pragma once

#include <chrono>
#include <cstring>
#include <iomanip>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace volvelle {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

inline const char* log_level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "EROR";
        case LogLevel::OFF:   return "OFF ";
    }
    return "UNKN";
}

// Accepts debug|info|warn|error|off; anything else yields `fallback`.
inline LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info")  return LogLevel::INFO;
    if (name == "warn")  return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "off")   return LogLevel::OFF;
    return fallback;
}

struct LogRecord {
    LogLevel level;
    std::string timestamp;
    std::string location;   // file:line func()
    std::string message;
};

/**
 * Destination for log records. Hosts decide where records go; the core
 * only ever talks to a sink through a Logger.
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
};

class StreamSink : public LogSink {
public:
    explicit StreamSink(std::ostream& stream) : output_(&stream) {}

    void write(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        *output_ << "[" << record.timestamp << "] " << log_level_tag(record.level) << " "
                 << record.location << " - " << record.message << '\n';
    }

private:
    std::ostream* output_;
    std::mutex mutex_;
};

class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    std::vector<LogRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    size_t count(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& r : records_) {
            if (r.level == level) ++n;
        }
        return n;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

/**
 * Formats records and forwards them to an injected sink.
 * A Logger without a sink drops everything.
 */
class Logger {
public:
    Logger() = default;

    explicit Logger(std::shared_ptr<LogSink> sink, LogLevel level = LogLevel::INFO)
        : sink_(std::move(sink)), level_(level) {}

    // Shared do-nothing logger used when a component is given none.
    static const Logger& null() {
        static const Logger instance;
        return instance;
    }

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }

    bool enabled(LogLevel level) const {
        return sink_ && level_ != LogLevel::OFF && level >= level_;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) const {
        if (!enabled(level)) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t);
#else
        localtime_r(&time_t, &tm_buf);
#endif
        std::stringstream ts;
        ts << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count();

        // Extract filename from path
        const char* filename = std::strrchr(file, '/');
        if (!filename) filename = std::strrchr(file, '\\');
        filename = filename ? filename + 1 : file;

        std::stringstream where;
        where << filename << ":" << line << " " << func << "()";

        std::stringstream msg;
        format_message(msg, std::forward<Args>(args)...);

        sink_->write(LogRecord{level, ts.str(), where.str(), msg.str()});
    }

private:
    static void format_message(std::stringstream&) {}

    template<typename T, typename... Args>
    static void format_message(std::stringstream& ss, T&& value, Args&&... args) {
        ss << value;
        format_message(ss, std::forward<Args>(args)...);
    }

    std::shared_ptr<LogSink> sink_;
    LogLevel level_ = LogLevel::INFO;
};

#define VOLVELLE_LOG_DEBUG(logger, ...) (logger).log(volvelle::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define VOLVELLE_LOG_INFO(logger, ...)  (logger).log(volvelle::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define VOLVELLE_LOG_WARN(logger, ...)  (logger).log(volvelle::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define VOLVELLE_LOG_ERROR(logger, ...) (logger).log(volvelle::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)

} // namespace volvelle

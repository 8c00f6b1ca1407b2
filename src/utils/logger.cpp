#include "paykit/utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <utility>
#include <nlohmann/json.hpp>

namespace paykit {
namespace utils {

namespace {

const std::pair<LogLevel, const char*> LEVEL_NAMES[] = {
    {LogLevel::Fatal, "FATAL"},
    {LogLevel::Error, "ERROR"},
    {LogLevel::Warn,  "WARN"},
    {LogLevel::Info,  "INFO"},
    {LogLevel::Debug, "DEBUG"},
};

// UTC，毫秒精度，例如 2024-05-01T08:00:00.123Z
std::string UTCTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    long millis = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    size_t len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    std::snprintf(buffer + len, sizeof(buffer) - len, ".%03ldZ", millis);
    return buffer;
}

} // namespace

LogLevel ParseLogLevel(const std::string& level) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") {
        return LogLevel::Warn;
    }
    for (const auto& entry : LEVEL_NAMES) {
        if (upper == entry.second) {
            return entry.first;
        }
    }
    return LogLevel::Info;
}

std::string LogLevelToString(LogLevel level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.first == level) {
            return entry.second;
        }
    }
    return "UNKNOWN";
}

std::string JSONFormatter::Format(const LogEntry& entry) {
    nlohmann::json record = nlohmann::json::object();
    for (const auto& field : entry.fields) {
        record[field.first] = field.second;
    }
    // 固定字段不允许被上下文覆盖
    record["level"] = LogLevelToString(entry.level);
    record["time"] = entry.time;
    record["msg"] = entry.message;

    // 非法UTF-8（例如原始报文片段）替换而不是抛异常
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string TextFormatter::Format(const LogEntry& entry) {
    std::string line = "[" + entry.time + "] [" + LogLevelToString(entry.level) + "] " + entry.message;
    if (entry.fields.empty()) {
        return line;
    }

    std::string joined;
    for (const auto& field : entry.fields) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += field.first + "=" + field.second;
    }
    return line + " {" + joined + "}";
}

void ConsoleOutput::Write(const std::string& message) {
    std::cerr << message << '\n';
}

FileOutput::FileOutput(const std::string& filename) : file_(filename, std::ios::app) {
    if (!file_.is_open()) {
        std::cerr << "无法打开日志文件: " << filename << '\n';
    }
}

void FileOutput::Write(const std::string& message) {
    if (file_.is_open()) {
        file_ << message << '\n';
        file_.flush();
    }
}

void MemoryOutput::Write(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(message);
}

std::vector<std::string> MemoryOutput::Lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

void MemoryOutput::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

LogContext LogContext::With(const std::string& key, const std::string& value) const {
    LogContext next = *this;
    next.fields_[key] = value;
    return next;
}

Logger::Logger() : formatter_(std::make_unique<JSONFormatter>()) {
    outputs_.push_back(std::make_shared<ConsoleOutput>());
}

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

void Logger::Initialize(const LoggingConfig& config) {
    std::unique_ptr<LogFormatter> formatter;
    if (config.format == "text") {
        formatter = std::make_unique<TextFormatter>();
    } else {
        formatter = std::make_unique<JSONFormatter>();
    }

    std::shared_ptr<LogOutput> output;
    if (config.output == "file" && !config.file.empty()) {
        output = std::make_shared<FileOutput>(config.file);
    } else {
        output = std::make_shared<ConsoleOutput>();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    level_ = ParseLogLevel(config.level);
    formatter_ = std::move(formatter);
    outputs_.assign(1, std::move(output));
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::SetLevel(const std::string& level) {
    SetLevel(ParseLogLevel(level));
}

void Logger::AddOutput(std::shared_ptr<LogOutput> output) {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_.push_back(std::move(output));
}

void Logger::ClearOutputs() {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_.clear();
}

void Logger::SetFormatter(std::unique_ptr<LogFormatter> formatter) {
    std::lock_guard<std::mutex> lock(mutex_);
    formatter_ = std::move(formatter);
}

void Logger::Log(LogLevel level, const std::string& message, const LogContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) > static_cast<int>(level_) || !formatter_) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.message = message;
    entry.time = UTCTimestamp();
    entry.fields = ctx.Fields();

    std::string formatted = formatter_->Format(entry);
    for (const auto& output : outputs_) {
        output->Write(formatted);
    }
}

void Logger::Debug(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Debug, message, ctx);
}

void Logger::Info(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Info, message, ctx);
}

void Logger::Warn(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Warn, message, ctx);
}

void Logger::Error(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Error, message, ctx);
}

} // namespace utils
} // namespace paykit

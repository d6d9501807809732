#pragma once

#include "StringUtils.hpp"

/**
 * @brief trantor 日志输出格式化
 *
 * 原始: "20240105 08:30:12.123456 UTC 12345 INFO [func] message - file.hpp:88"
 * 输出: "2024-01-05 08:30:12 12345 INFO message"
 * 无法识别的行原样返回。
 */
namespace LogFormat {

inline std::string reformat(std::string_view line) {
    if (line.size() < 17 || line[8] != ' ') return std::string(line);
    for (size_t i = 0; i < 8; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(line[i]))) return std::string(line);
    }

    size_t timeEnd = line.find(' ', 9);
    if (timeEnd == std::string_view::npos || timeEnd <= 15) return std::string(line);

    std::string out;
    out.reserve(line.size());
    out.append(line.substr(0, 4)).append("-")
       .append(line.substr(4, 2)).append("-")
       .append(line.substr(6, 2)).append(" ")
       .append(line.substr(9, 8));

    std::string rest(line.substr(timeEnd));

    // lambda 的 [operator ()] 函数名无意义
    if (auto op = rest.find("[operator ()"); op != std::string::npos) {
        if (auto opEnd = rest.find("] ", op); opEnd != std::string::npos) {
            rest.erase(op, opEnd + 2 - op);
        }
    }

    if (auto src = rest.rfind(" - "); src != std::string::npos) {
        std::string_view suffix(rest.data() + src + 3, rest.size() - src - 3);
        if (suffix.find(".cpp:") != std::string_view::npos || suffix.find(".hpp:") != std::string_view::npos) {
            rest.erase(src);
            rest += '\n';
        }
    }

    out += rest;
    return out;
}

/** YYYYMMDD，用于日切比较 */
inline int dayKey(std::chrono::system_clock::time_point tp) {
    std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(tp)};
    return static_cast<int>(ymd.year()) * 10000
         + static_cast<int>(static_cast<unsigned>(ymd.month())) * 100
         + static_cast<int>(static_cast<unsigned>(ymd.day()));
}

inline std::string dayString(int key) {
    char buf[11];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", key / 10000, key % 10000 / 100, key % 100);
    return buf;
}

/** 大小写不敏感，未知级别返回 nullopt */
inline std::optional<trantor::Logger::LogLevel> parseLevel(const std::string& raw) {
    static const std::map<std::string, trantor::Logger::LogLevel> levels = {
        {"TRACE", trantor::Logger::kTrace},
        {"DEBUG", trantor::Logger::kDebug},
        {"INFO", trantor::Logger::kInfo},
        {"WARN", trantor::Logger::kWarn},
        {"ERROR", trantor::Logger::kError},
        {"FATAL", trantor::Logger::kFatal},
    };
    auto it = levels.find(StringUtils::toUpper(StringUtils::trim(raw)));
    if (it == levels.end()) return std::nullopt;
    return it->second;
}

}  // namespace LogFormat

/**
 * @brief 日志管理器 - trantor::AsyncFileLogger 异步写盘
 *
 * 文件: logs/plc-collector_YYYY-MM-DD*.log，日切换文件，单文件超 100MB 时由 trantor 轮转。
 * custom_config.console_log 为 true 时同时写 stdout。
 */
class LoggerManager {
public:
    static void initialize(const std::string& logDir) {
        std::filesystem::create_directories(logDir);
        {
            std::unique_lock lock(mutex_);
            logDir_ = logDir;
            int today = LogFormat::dayKey(std::chrono::system_clock::now());
            day_.store(today, std::memory_order_relaxed);
            file_ = openFile(today);
        }

        trantor::Logger::setDisplayLocalTime(true);
        trantor::Logger::setOutputFunction(output, flush);
        trantor::Logger::setLogLevel(trantor::Logger::kInfo);
    }

    static void setConsoleEcho(bool enabled) {
        echo_.store(enabled, std::memory_order_relaxed);
    }

    /** 未知级别保持当前级别并告警 */
    static void setLogLevel(const std::string& raw) {
        if (auto level = LogFormat::parseLevel(raw)) {
            trantor::Logger::setLogLevel(*level);
        } else {
            LOG_WARN << "[Config] Unknown log level '" << raw << "', keeping current level";
        }
    }

    static void close() {
        std::unique_lock lock(mutex_);
        file_.reset();
    }

private:
    static constexpr uint64_t FILE_SIZE_LIMIT = 100 * 1024 * 1024;

    inline static std::unique_ptr<trantor::AsyncFileLogger> file_;
    inline static std::shared_mutex mutex_;
    inline static std::string logDir_;
    inline static std::atomic<int> day_{0};
    inline static std::atomic<bool> echo_{false};

    static std::unique_ptr<trantor::AsyncFileLogger> openFile(int day) {
        auto logger = std::make_unique<trantor::AsyncFileLogger>();
        logger->setFileName(logDir_ + "/plc-collector_" + LogFormat::dayString(day));
        logger->setFileSizeLimit(FILE_SIZE_LIMIT);
        logger->startLogging();
        return logger;
    }

    static void rotate(int today) {
        std::unique_ptr<trantor::AsyncFileLogger> previous;
        {
            std::unique_lock lock(mutex_);
            if (today == day_.load(std::memory_order_relaxed)) return;
            previous = std::move(file_);
            file_ = openFile(today);
            day_.store(today, std::memory_order_relaxed);
        }
        // previous 在锁外析构并 flush
    }

    static void output(const char* msg, const uint64_t len) {
        auto line = LogFormat::reformat(std::string_view(msg, len));

        int today = LogFormat::dayKey(std::chrono::system_clock::now());
        if (today != day_.load(std::memory_order_relaxed)) {
            rotate(today);
        }

        if (echo_.load(std::memory_order_relaxed)) {
            std::fwrite(line.data(), 1, line.size(), stdout);
        }

        std::shared_lock lock(mutex_);
        if (file_) {
            file_->output(line.c_str(), line.size());
        }
    }

    static void flush() {
        if (echo_.load(std::memory_order_relaxed)) {
            std::fflush(stdout);
        }
        std::shared_lock lock(mutex_);
        if (file_) {
            file_->flush();
        }
    }
};

/**
 * @file logger.h
 * @brief 线程安全的日志类
 */
#pragma once
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @class Logger
 * @brief 带级别过滤的日志输出
 *
 * 输出格式：YYYY-MM-DD HH:MM:SS [LEVEL] message
 * 日志对象通过构造函数注入到需要记录日志的组件中，测试可以传入自己的输出流。
 */
class Logger {
public:
    explicit Logger(std::ostream& out = std::cerr, LogLevel level = LogLevel::INFO);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    static const char* getLevelString(LogLevel level);

    /**
     * @brief 解析日志级别名称（不区分大小写）
     * @param name DEBUG/INFO/WARNING/WARN/ERROR
     * @param[out] level 解析结果
     * @return 名称是否合法
     */
    static bool parseLevel(const std::string& name, LogLevel& level);

private:
    std::ostream& out;
    LogLevel currentLevel;
    mutable std::mutex logMutex;
};

/**
 * ************************************************************************
 *
 * @file Logger.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-02
 * @version 0.2
 * @brief 动画引擎日志系统封装
  - 基于 spdlog 实现的日志系统封装
  - 控制台彩色输出，可选的轮转文件输出
  - 支持源码位置记录，便于调试
  - 首次使用前可通过 configure 调整级别和文件路径
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <concepts>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <vector>

namespace animator::utils
{
/**
 * @brief 日志配置
 */
struct LogConfig
{
    spdlog::level::level_enum level = spdlog::level::info;
    std::string filePath;     // 为空时只输出到控制台
    bool console = true;      // 是否输出到控制台
};

/**
 * @brief 辅助结构体：用于在调用点自动捕获位置和格式化字符串
 */
struct LogLocation
{
    spdlog::string_view_t fmt;
    std::source_location loc;

    template <typename T>
        requires std::convertible_to<T, spdlog::string_view_t>
    constexpr LogLocation(const T& s, std::source_location l = std::source_location::current()) : fmt(s), loc(l)
    {
    }
};

class Logger
{
    static constexpr size_t MAX_LOG_FILE_SIZE = static_cast<size_t>(1024 * 1024 * 5); // 5MB
    static constexpr size_t MAX_LOG_FILE_COUNT = 1;

public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief 设置日志配置
     * 在第一条日志之前调用时完整生效，之后只更新日志级别
     */
    static void configure(const LogConfig& config)
    {
        {
            std::lock_guard lock(configMutex());
            pendingConfig() = config;
        }
        getInstance().m_logger->set_level(config.level);
    }

    template <typename... Args>
    static void warn(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::warn, msg, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::info, msg, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::err, msg, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::debug, msg, std::forward<Args>(args)...);
    }

private:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    Logger()
    {
        LogConfig config;
        {
            std::lock_guard lock(configMutex());
            config = pendingConfig();
        }

        std::vector<spdlog::sink_ptr> sinks;
        if (config.console)
        {
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("%^[%T] [%l] %n: %v%$");
            sinks.push_back(consoleSink);
        }
        if (!config.filePath.empty())
        {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, MAX_LOG_FILE_SIZE, MAX_LOG_FILE_COUNT);
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%# %!] %v");
            sinks.push_back(fileSink);
        }

        m_logger = std::make_shared<spdlog::logger>("SvgAnimator", sinks.begin(), sinks.end());
        m_logger->set_level(config.level);
        m_logger->flush_on(spdlog::level::warn); // 警告及以上立即刷新
    }

    ~Logger() = default;

    static LogConfig& pendingConfig()
    {
        static LogConfig config;
        return config;
    }

    static std::mutex& configMutex()
    {
        static std::mutex mutex;
        return mutex;
    }

    // 内部统一打印逻辑
    template <typename... Args>
    void log_impl(spdlog::level::level_enum lvl, const LogLocation& msg, Args&&... args)
    {
        m_logger->log(
            spdlog::source_loc{msg.loc.file_name(), static_cast<int>(msg.loc.line()), msg.loc.function_name()},
            lvl,
            fmt::runtime(msg.fmt),
            std::forward<Args>(args)...);
    }

    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace animator::utils

/**
 * ************************************************************************
 *
 * @file main.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-15
 * @version 0.1
 * @brief anim_player 演示程序
    加载动画文档，在 asio 事件循环上播放，并把每次属性写入记录到日志
    用法: anim_player <document.json> [run-ms] [--frameloop] [--log <file>]
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include <algorithm>
#include <asio.hpp>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "src/engine/Animator.h"
#include "src/engine/AsioFrameScheduler.h"
#include "src/model/DocumentParser.h"
#include "src/model/DocumentValidator.h"
#include "src/platform/SoftwareTimeline.h"
#include "src/utils/Logger.h"

namespace
{
using animator::utils::Logger;

/**
 * @brief 把属性写入打印到日志的适配器
 */
class LoggingAdapter final : public animator::engine::IPlatformAdapter
{
public:
    [[nodiscard]] bool isConnected() const override { return true; }

    void setAttribute(const std::string& targetId, const std::string& attrName, const std::string& value) override
    {
        ++m_writes;
        Logger::debug("#{} {} = {}", targetId, attrName, value);
    }

    [[nodiscard]] std::size_t writes() const { return m_writes; }

private:
    std::size_t m_writes = 0;
};

struct PlayerArgs
{
    std::string documentPath;
    std::optional<double> runMs;
    bool forceFrameLoop = false;
    std::string logFile;
};

std::optional<PlayerArgs> parseArgs(int argc, char* argv[])
{
    PlayerArgs args;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--frameloop")
        {
            args.forceFrameLoop = true;
        }
        else if (arg == "--log" && i + 1 < argc)
        {
            args.logFile = argv[++i];
        }
        else if (args.documentPath.empty())
        {
            args.documentPath = arg;
        }
        else
        {
            double value = 0.0;
            const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
            if (ec != std::errc{} || ptr != arg.data() + arg.size() || value <= 0.0)
            {
                return std::nullopt;
            }
            args.runMs = value;
        }
    }
    if (args.documentPath.empty())
    {
        return std::nullopt;
    }
    return args;
}

} // namespace

int main(int argc, char* argv[])
{
    using namespace animator;

    auto args = parseArgs(argc, argv);
    if (!args)
    {
        std::cerr << "usage: anim_player <document.json> [run-ms] [--frameloop] [--log <file>]" << std::endl;
        return EXIT_FAILURE;
    }

    Logger::configure({.level = spdlog::level::debug, .filePath = args->logFile, .console = true});

    auto json = model::loadDocumentFile(args->documentPath);
    if (!json)
    {
        Logger::error("Failed to load {}: {}", args->documentPath, model::toString(json.error()));
        return EXIT_FAILURE;
    }

    const auto validation = model::validateDocument(*json);
    for (const auto& message : validation.errors)
    {
        Logger::warn("Validation: {}", message);
    }

    asio::io_context io;
    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&io](const asio::error_code& ec, int)
                       {
                           if (!ec)
                           {
                               Logger::info("Received stop signal, shutting down player...");
                               io.stop();
                           }
                       });

    auto adapter = std::make_shared<LoggingAdapter>();
    auto scheduler = std::make_shared<engine::AsioFrameScheduler>(io.get_executor());
    auto timeline = std::make_shared<platform::SoftwareTimelinePlatform>(adapter, scheduler);

    engine::EngineOptions options;
    options.adapter = adapter;
    options.scheduler = scheduler;
    options.platform = timeline;
    if (args->forceFrameLoop)
    {
        options.overrides.engineHint = model::EngineHint::FrameLoop;
    }
    options.callbacks.onPlay = [] { Logger::info("onPlay"); };
    options.callbacks.onFinish = [&signals]
    {
        Logger::info("onFinish");
        signals.cancel();
    };
    options.callbacks.onRemove = [] { Logger::info("onRemove"); };
    options.debugRegistration = [](engine::Animator& animator, const std::string& name)
    { Logger::info("Registered animator \"{}\" ({})", name, engine::toString(animator.backend())); };

    auto created = engine::createEngine(*json, std::move(options));
    if (!created)
    {
        Logger::error("Failed to create engine: {}", engine::toString(created.error()));
        return EXIT_FAILURE;
    }
    auto& player = *created;

    const auto& config = player->config();
    const double runMs = args->runMs.value_or(
        std::isfinite(config.totalDurationMs()) ? std::max(config.delayMs, 0.0) + config.totalDurationMs() + 100.0 : 5000.0);
    Logger::info("Playing {} on {} backend for {} ms", args->documentPath, engine::toString(player->backend()), runMs);

    player->play();
    io.run_for(std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double, std::milli>(runMs)));

    Logger::info("Stopped at {} ms after {} attribute writes",
                 player->getCurrentTime().value_or(0.0),
                 adapter->writes());
    player->destroy();
    return EXIT_SUCCESS;
}

/**
 * ************************************************************************
 *
 * @file Animator.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-14
 * @version 0.1
 * @brief 生命周期外观
    选择播放后端（优先原生时间线，失败时回退到帧循环），对外提供统一控制接口
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "IAnimationEngine.h"
#include "IFrameScheduler.h"
#include "IPlatformAdapter.h"
#include "NativeTimeline.h"
#include "src/model/Document.h"
#include "src/utils/IdGenerator.h"

namespace animator::engine
{

enum class Backend : std::uint8_t
{
    NativeTimeline,
    FrameLoop
};

enum class EngineError : std::uint8_t
{
    MissingAdapter,   // 帧循环需要平台适配器
    MissingScheduler, // 帧循环需要帧调度器
    NotAnimatedDocument
};

[[nodiscard]] std::string_view toString(Backend backend);
[[nodiscard]] std::string_view toString(EngineError error);

class Animator;

struct EngineOptions
{
    AnimatorCallbacks callbacks;
    model::PlaybackOverrides overrides;
    std::shared_ptr<IPlatformAdapter> adapter;
    std::shared_ptr<IFrameScheduler> scheduler;
    std::shared_ptr<ITimelinePlatform> platform; // 为空时只使用帧循环
    bool autoplay = false;
    std::optional<double> seekTimeMs;
    utils::IdGenerator idGenerator;
    std::function<void(Animator&, const std::string&)> debugRegistration; // 配置了 debugInstName 时调用
    std::function<bool(const std::string&)> hasTarget; // 宿主查询目标元素是否存在，为空时全部写入
};

class Animator
{
public:
    Animator(std::unique_ptr<IAnimationEngine> engine,
             Backend backend,
             model::NormalizedDocument document,
             std::function<void()> onRemove);
    ~Animator();

    Animator(const Animator&) = delete;
    Animator& operator=(const Animator&) = delete;
    Animator(Animator&&) = delete;
    Animator& operator=(Animator&&) = delete;

    [[nodiscard]] bool isReady() const;
    [[nodiscard]] Backend backend() const { return m_backend; }

    /**
     * @brief 重新生成 id 之后的节点树，调用方据此渲染元素
     */
    [[nodiscard]] const model::Node& getRootReference() const { return m_document.root; }
    [[nodiscard]] const model::PlaybackConfig& config() const { return m_document.config; }
    [[nodiscard]] const std::vector<std::string>& diagnostics() const { return m_document.diagnostics; }

    [[nodiscard]] bool isPlaying() const;
    void play();
    void pause();
    void cancel();
    void finish();
    void setPlaybackRate(double rate);
    [[nodiscard]] std::optional<double> getCurrentTime() const;
    void setCurrentTime(double timeMs);

    /**
     * @brief 幂等，首次调用时取消播放、释放后端并触发一次 onRemove
     */
    void destroy();

private:
    std::unique_ptr<IAnimationEngine> m_engine;
    Backend m_backend;
    model::NormalizedDocument m_document;
    std::function<void()> m_onRemove;
    bool m_destroyed = false;
};

/**
 * @brief 创建引擎实例：规范化文档、选择后端、按需自动播放
 */
[[nodiscard]] std::expected<std::unique_ptr<Animator>, EngineError> createEngine(const model::AnimatedDocument& document,
                                                                                 EngineOptions options);

/**
 * @brief 从 JSON 文档创建
 */
[[nodiscard]] std::expected<std::unique_ptr<Animator>, EngineError> createEngine(const model::Json& document,
                                                                                 EngineOptions options);

} // namespace animator::engine

/**
 * ************************************************************************
 *
 * @file Animator.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-14
 * @version 0.1
 * @brief 生命周期外观
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "Animator.h"
#include "FrameLoopEngine.h"
#include "NativeTimelineEngine.h"
#include "WarnOnceAdapter.h"
#include "src/model/DocumentParser.h"
#include "src/model/Normalizer.h"
#include "src/utils/Logger.h"

namespace animator::engine
{
using utils::Logger;

std::string_view toString(Backend backend)
{
    switch (backend)
    {
        case Backend::NativeTimeline:
            return "native";
        case Backend::FrameLoop:
            return "frameloop";
    }
    return "unknown";
}

std::string_view toString(EngineError error)
{
    switch (error)
    {
        case EngineError::MissingAdapter:
            return "frame loop requires a platform adapter";
        case EngineError::MissingScheduler:
            return "frame loop requires a frame scheduler";
        case EngineError::NotAnimatedDocument:
            return "not an animated document";
    }
    return "unknown error";
}

// ---------------- Animator ----------------

Animator::Animator(std::unique_ptr<IAnimationEngine> engine,
                   Backend backend,
                   model::NormalizedDocument document,
                   std::function<void()> onRemove)
    : m_engine(std::move(engine)),
      m_backend(backend),
      m_document(std::move(document)),
      m_onRemove(std::move(onRemove))
{
}

Animator::~Animator() = default;

bool Animator::isReady() const
{
    return !m_destroyed && m_engine->isReady();
}

bool Animator::isPlaying() const
{
    return !m_destroyed && m_engine->isPlaying();
}

void Animator::play()
{
    if (!m_destroyed) m_engine->play();
}

void Animator::pause()
{
    if (!m_destroyed) m_engine->pause();
}

void Animator::cancel()
{
    if (!m_destroyed) m_engine->cancel();
}

void Animator::finish()
{
    if (!m_destroyed) m_engine->finish();
}

void Animator::setPlaybackRate(double rate)
{
    if (!m_destroyed) m_engine->setPlaybackRate(rate);
}

std::optional<double> Animator::getCurrentTime() const
{
    if (m_destroyed)
    {
        return std::nullopt;
    }
    return m_engine->getCurrentTime();
}

void Animator::setCurrentTime(double timeMs)
{
    if (!m_destroyed) m_engine->setCurrentTime(timeMs);
}

void Animator::destroy()
{
    if (m_destroyed)
    {
        return;
    }
    m_engine->destroy();
    m_destroyed = true;
    invokeCallback(m_onRemove);
}

// ---------------- 创建 ----------------

std::expected<std::unique_ptr<Animator>, EngineError> createEngine(const model::AnimatedDocument& document,
                                                                   EngineOptions options)
{
    auto normalized = model::normalize(document,
                                       options.overrides,
                                       model::NormalizeOptions{
                                           .autoplay = options.autoplay,
                                           .seekTimeMs = options.seekTimeMs,
                                           .idGenerator = options.idGenerator,
                                           .regenerateIds = true,
                                       });

    // onRemove 由外观在 destroy 时触发，后端只接收其余回调
    auto onRemove = std::move(options.callbacks.onRemove);
    options.callbacks.onRemove = nullptr;

    const auto hint = normalized.config.engineHint;
    std::unique_ptr<IAnimationEngine> engine;
    Backend backend = Backend::FrameLoop;

    if (hint != model::EngineHint::FrameLoop && options.platform != nullptr)
    {
        engine = NativeTimelineEngine::create(
            normalized, options.platform, options.callbacks, hint == model::EngineHint::Native);
        if (engine != nullptr)
        {
            backend = Backend::NativeTimeline;
        }
        else
        {
            Logger::info("createEngine: native timeline unavailable, falling back to frame loop");
        }
    }

    if (engine == nullptr)
    {
        if (options.adapter == nullptr)
        {
            return std::unexpected(EngineError::MissingAdapter);
        }
        if (options.scheduler == nullptr)
        {
            return std::unexpected(EngineError::MissingScheduler);
        }
        // 目标是否存在由宿主判断，缺失的目标只警告一次
        auto adapter = std::make_shared<WarnOnceAdapter>(options.adapter, std::move(options.hasTarget));
        engine = std::make_unique<FrameLoopEngine>(normalized, std::move(adapter), options.scheduler, options.callbacks);
    }

    const auto instName = normalized.config.debugInstName;
    const auto trigger = normalized.config.trigger;
    auto animator = std::make_unique<Animator>(std::move(engine), backend, std::move(normalized), std::move(onRemove));

    Logger::debug("createEngine: backend = {}", toString(backend));

    if (!instName.empty() && options.debugRegistration)
    {
        options.debugRegistration(*animator, instName);
    }

    if (options.autoplay)
    {
        if (!trigger || trigger->startOn == model::StartOn::Load)
        {
            animator->play();
        }
        else
        {
            Logger::debug("createEngine: autoplay deferred to trigger wiring");
        }
    }
    return animator;
}

std::expected<std::unique_ptr<Animator>, EngineError> createEngine(const model::Json& document, EngineOptions options)
{
    if (!model::isAnimatedDocument(document))
    {
        return std::unexpected(EngineError::NotAnimatedDocument);
    }
    return createEngine(model::parseDocument(document), std::move(options));
}

} // namespace animator::engine

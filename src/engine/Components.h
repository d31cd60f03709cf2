/**
 * ************************************************************************
 *
 * @file Components.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-12
 * @version 0.1
 * @brief 引擎内部的 ECS 组件
    每个绑定对应 registry 中的一个实体
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <memory>
#include <string>
#include "NativeTimeline.h"
#include "src/model/Document.h"

namespace animator::engine
{

/**
 * @brief 目标元素 id
 */
struct TargetComponent
{
    std::string id;
};

/**
 * @brief 帧循环使用的属性轨道
 */
struct TrackComponent
{
    model::AnimationDefinition animation;
};

/**
 * @brief 原生时间线上的一个动画
 */
struct TimelineComponent
{
    std::unique_ptr<ITimelineAnimation> animation;
    bool finished = false;
};

} // namespace animator::engine

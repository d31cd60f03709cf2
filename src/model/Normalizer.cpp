/**
 * ************************************************************************
 *
 * @file Normalizer.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-08
 * @version 0.1
 * @brief 文档规范化实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "Normalizer.h"
#include "IdRegenerator.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <fmt/format.h>
#include "src/common/AttributeNames.h"
#include "src/interpolation/ColorCodec.h"
#include "src/interpolation/CubicBezier.h"
#include "src/interpolation/Interpolate.h"
#include "src/interpolation/PathCodec.h"
#include "src/utils/Logger.h"

namespace animator::model
{
namespace
{
using Diagnostics = std::vector<std::string>;
using utils::Logger;

double numberOr(const Json& json, double fallback)
{
    return json.is_number() ? json.get<double>() : fallback;
}

Vec2 toPoint(const Json& json)
{
    if (!json.is_array()) return Vec2::Zero();
    return Vec2{json.size() > 0 ? numberOr(json[0], 0.0) : 0.0, json.size() > 1 ? numberOr(json[1], 0.0) : 0.0};
}

std::vector<Vec2> toPoints(const Json* json)
{
    std::vector<Vec2> points;
    if (json == nullptr || !json->is_array()) return points;
    points.reserve(json->size());
    for (const auto& item : *json)
    {
        points.push_back(toPoint(item));
    }
    return points;
}

const Json* member(const Json& object, const char* key)
{
    if (!object.is_object()) return nullptr;
    auto it = object.find(std::string(key));
    return it == object.end() ? nullptr : &*it;
}

/**
 * @brief {v: [[x,y]...], i?: [...], o?: [...], c?: bool}
 */
std::optional<BezierPath> toBezierPath(const Json& json)
{
    const Json* vertices = member(json, "v");
    if (vertices == nullptr || !vertices->is_array()) return std::nullopt;

    BezierPath path;
    path.vertices = toPoints(vertices);
    path.inHandles = toPoints(member(json, "i"));
    path.outHandles = toPoints(member(json, "o"));
    if (const Json* closed = member(json, "c"); closed != nullptr && closed->is_boolean())
    {
        path.closed = closed->get<bool>();
    }
    return path;
}

bool appendPathString(const std::string& text, PathSet& paths, Diagnostics* diagnostics)
{
    auto data = interpolation::extractPathData(text);
    if (!data) return false;

    auto parsed = interpolation::parseSvgPathData(*data);
    if (!parsed.ignoredCommands.empty() && diagnostics != nullptr)
    {
        diagnostics->push_back(fmt::format("path commands '{}' are not supported and were ignored",
                                           std::string(parsed.ignoredCommands.begin(), parsed.ignoredCommands.end())));
    }
    std::ranges::move(parsed.paths, std::back_inserter(paths));
    return true;
}

bool appendPathItems(const Json& items, PathSet& paths, Diagnostics* diagnostics)
{
    bool recognized = false;
    for (const auto& item : items)
    {
        if (item.is_string())
        {
            recognized |= appendPathString(item.get<std::string>(), paths, diagnostics);
        }
        else if (auto path = toBezierPath(item))
        {
            paths.push_back(std::move(*path));
            recognized = true;
        }
    }
    return recognized;
}

std::optional<CubicBezierPoints> resolveEasing(const std::optional<EasingRef>& easing,
                                               const Definitions& defs,
                                               Diagnostics& diagnostics)
{
    if (!easing) return std::nullopt;
    if (const auto* points = std::get_if<CubicBezierPoints>(&*easing)) return *points;

    const auto& name = std::get<std::string>(*easing);
    if (auto it = defs.easings.find(name); it != defs.easings.end()) return it->second;
    if (auto named = interpolation::namedEasing(name)) return named;

    diagnostics.push_back("unknown easing name: " + name);
    return std::nullopt;
}

/**
 * @brief 合并后的属性表，值指向文档中的原始定义
 */
using MergedDefinition = std::vector<std::pair<std::string, const PropertyAnimationSpec*>>;

MergedDefinition resolveAndMerge(const ElementAnimation& animate, const Definitions& defs, Diagnostics& diagnostics)
{
    MergedDefinition merged;
    auto mergeOne = [&merged](const AnimationDefinitionSpec& definition)
    {
        for (const auto& [property, animation] : definition)
        {
            auto it = std::ranges::find(merged, property, &MergedDefinition::value_type::first);
            if (it != merged.end())
            {
                it->second = &animation; // 后者覆盖，位置不变
            }
            else
            {
                merged.emplace_back(property, &animation);
            }
        }
    };

    for (const auto& ref : animate)
    {
        if (const auto* name = std::get_if<std::string>(&ref))
        {
            auto it = defs.animations.find(*name);
            if (it == defs.animations.end())
            {
                diagnostics.push_back("unknown animation name: " + *name);
                continue;
            }
            mergeOne(it->second);
        }
        else
        {
            mergeOne(std::get<AnimationDefinitionSpec>(ref));
        }
    }
    return merged;
}

std::vector<Keyframe> normalizeKeyframes(const std::string& property,
                                         const PropertyAnimationSpec& spec,
                                         const Definitions& defs,
                                         Diagnostics& diagnostics)
{
    std::vector<Keyframe> keyframes;
    keyframes.reserve(spec.keyframes.size());
    for (const auto& kf : spec.keyframes)
    {
        keyframes.push_back(Keyframe{.t = kf.timeMs,
                                     .v = toValue(property, kf.value, diagnostics),
                                     .easing = resolveEasing(kf.easing, defs, diagnostics)});
    }

    std::ranges::stable_sort(keyframes, {}, &Keyframe::t);

    // 相同时间只保留最后一个
    std::vector<Keyframe> unique;
    unique.reserve(keyframes.size());
    for (auto& kf : keyframes)
    {
        if (!unique.empty() && unique.back().t == kf.t)
        {
            unique.back() = std::move(kf);
        }
        else
        {
            unique.push_back(std::move(kf));
        }
    }
    return unique;
}

std::optional<Binding> buildBinding(const std::string& targetId,
                                    const ElementAnimation& animate,
                                    const Definitions& defs,
                                    Diagnostics& diagnostics)
{
    Binding binding{.targetId = targetId, .animation = {}};
    for (const auto& [property, spec] : resolveAndMerge(animate, defs, diagnostics))
    {
        auto keyframes = normalizeKeyframes(property, *spec, defs, diagnostics);
        if (keyframes.empty())
        {
            diagnostics.push_back(fmt::format("'{}'.{}: no keyframes, property skipped", targetId, property));
            continue;
        }
        binding.animation.push_back(PropertyAnimation{.property = property, .keyframes = std::move(keyframes)});
    }

    if (binding.animation.empty())
    {
        diagnostics.push_back(fmt::format("'{}': empty or unresolved animation, binding dropped", targetId));
        return std::nullopt;
    }
    return binding;
}

void collectNodeBindings(Node& node,
                         const Definitions& defs,
                         IdRegenerator& ids,
                         std::vector<Binding>& bindings,
                         Diagnostics& diagnostics)
{
    if (node.animate)
    {
        if (!node.id || node.id->empty())
        {
            node.id = ids.generate();
        }
        if (auto binding = buildBinding(*node.id, *node.animate, defs, diagnostics))
        {
            bindings.push_back(std::move(*binding));
        }
    }

    for (auto& child : node.children)
    {
        collectNodeBindings(child, defs, ids, bindings, diagnostics);
    }
}
} // namespace

PlaybackConfig mergeOverrides(PlaybackConfig config, const PlaybackOverrides& overrides)
{
    if (overrides.engineHint) config.engineHint = *overrides.engineHint;
    if (overrides.durationMs) config.durationMs = *overrides.durationMs;
    if (overrides.delayMs) config.delayMs = *overrides.delayMs;
    if (overrides.iterations) config.iterations = *overrides.iterations;
    if (overrides.fillMode) config.fillMode = *overrides.fillMode;
    if (overrides.direction) config.direction = *overrides.direction;
    if (overrides.frameRateCapHz) config.frameRateCapHz = *overrides.frameRateCapHz;
    if (overrides.trigger) config.trigger = *overrides.trigger;
    if (overrides.debugInstName) config.debugInstName = *overrides.debugInstName;

    if (!(config.durationMs > 0.0) || !std::isfinite(config.durationMs))
    {
        Logger::warn("Invalid duration {}ms, falling back to {}ms", config.durationMs, DEFAULT_DURATION_MS);
        config.durationMs = DEFAULT_DURATION_MS;
    }
    if (std::isnan(config.iterations) || config.iterations < 1.0)
    {
        config.iterations = 1.0;
    }
    if (!std::isfinite(config.delayMs))
    {
        config.delayMs = 0.0;
    }
    if (config.frameRateCapHz && !(*config.frameRateCapHz > 0.0))
    {
        config.frameRateCapHz.reset();
    }
    return config;
}

NormalizedDocument normalize(const AnimatedDocument& document,
                             const PlaybackOverrides& overrides,
                             const NormalizeOptions& options)
{
    NormalizedDocument result;
    result.diagnostics = document.diagnostics;
    result.config = mergeOverrides(document.config, overrides);

    if (!options.autoplay)
    {
        Trigger trigger = result.config.trigger.value_or(Trigger{});
        trigger.startOn = StartOn::Programmatic;
        result.config.trigger = trigger;
    }

    if (options.seekTimeMs)
    {
        result.config.delayMs = -*options.seekTimeMs;
    }

    IdRegenerator ids(options.idGenerator);
    result.root = options.regenerateIds ? ids.regenerate(document.root) : document.root;

    for (const auto& spec : document.bindings)
    {
        const std::string targetId = options.regenerateIds ? ids.translate(spec.targetId) : spec.targetId;
        if (auto binding = buildBinding(targetId, spec.animate, document.defs, result.diagnostics))
        {
            result.bindings.push_back(std::move(*binding));
        }
    }

    collectNodeBindings(result.root, document.defs, ids, result.bindings, result.diagnostics);

    for (const auto& message : result.diagnostics)
    {
        Logger::warn("Animation document: {}", message);
    }
    return result;
}

std::optional<PathSet> toPathSet(const Json& value, std::vector<std::string>* diagnostics)
{
    PathSet paths;

    if (value.is_string())
    {
        if (!appendPathString(value.get<std::string>(), paths, diagnostics)) return std::nullopt;
        return paths;
    }

    if (value.is_array())
    {
        if (!value.empty() && !appendPathItems(value, paths, diagnostics)) return std::nullopt;
        return paths;
    }

    if (const Json* items = member(value, "paths"))
    {
        if (!items->is_array()) return std::nullopt;
        appendPathItems(*items, paths, diagnostics);
        return paths;
    }

    if (auto path = toBezierPath(value))
    {
        paths.push_back(std::move(*path));
        return paths;
    }
    return std::nullopt;
}

Value toValue(std::string_view property, const Json& value, std::vector<std::string>& diagnostics)
{
    if (value.is_null()) return std::monostate{};

    if (property == "d" && !value.is_number())
    {
        if (auto paths = toPathSet(value, &diagnostics)) return std::move(*paths);
        diagnostics.push_back(fmt::format("d: unrecognized path value {}", value.dump()));
        return std::monostate{};
    }

    if (isColorProperty(property))
    {
        if (value.is_string())
        {
            const auto text = value.get<std::string>();
            auto color = interpolation::parseColor(text);
            if (color) return *color;
            diagnostics.push_back(
                fmt::format("{}: {} \"{}\"", property, interpolation::toString(color.error()), text));
            return text;
        }
        if (value.is_array())
        {
            std::vector<double> components;
            for (const auto& item : value)
            {
                components.push_back(numberOr(item, 0.0));
            }
            return interpolation::colorFromComponents(components);
        }
    }

    if (value.is_number()) return value.get<double>();
    if (value.is_boolean()) return value.get<bool>() ? 1.0 : 0.0;
    if (value.is_string()) return value.get<std::string>();
    if (value.is_array())
    {
        std::vector<double> components;
        components.reserve(value.size());
        for (const auto& item : value)
        {
            components.push_back(numberOr(item, 0.0));
        }
        return components;
    }

    diagnostics.push_back(fmt::format("{}: unsupported keyframe value {}", property, value.dump()));
    return std::monostate{};
}

} // namespace animator::model

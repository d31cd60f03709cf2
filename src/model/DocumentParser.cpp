/**
 * ************************************************************************
 *
 * @file DocumentParser.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-06
 * @version 0.1
 * @brief 动画文档解析实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "DocumentParser.h"
#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <system_error>
#include <fmt/format.h>

namespace animator::model
{
namespace
{
using Diagnostics = std::vector<std::string>;

const Json* member(const Json& object, std::string_view key)
{
    if (!object.is_object()) return nullptr;
    auto it = object.find(std::string(key));
    if (it == object.end() || it->is_null()) return nullptr;
    return &*it;
}

/**
 * @brief 按顺序查找第一个存在的字段，支持 "meta.animator" 形式的一级嵌套
 */
const Json* firstMember(const Json& object, std::initializer_list<std::string_view> keys, std::string* foundKey)
{
    for (auto key : keys)
    {
        const Json* found = nullptr;
        const auto dot = key.find('.');
        if (dot == std::string_view::npos)
        {
            found = member(object, key);
        }
        else if (const Json* parent = member(object, key.substr(0, dot)))
        {
            found = member(*parent, key.substr(dot + 1));
        }

        if (found != nullptr)
        {
            if (foundKey != nullptr) *foundKey = std::string(key);
            return found;
        }
    }
    return nullptr;
}

std::optional<EasingRef> parseEasing(const Json& json, const std::string& path, Diagnostics& diagnostics)
{
    if (json.is_string()) return EasingRef{json.get<std::string>()};
    if (json.is_array() && json.size() == 4)
    {
        CubicBezierPoints points{};
        for (size_t i = 0; i < 4; ++i)
        {
            if (!json[i].is_number())
            {
                diagnostics.push_back(path + ": easing control point must be a number");
                return std::nullopt;
            }
            points[i] = json[i].get<double>();
        }
        return EasingRef{points};
    }
    diagnostics.push_back(path + ": invalid easing, expected string or [x1, y1, x2, y2]");
    return std::nullopt;
}

std::optional<KeyframeSpec> parseKeyframe(const Json& json, const std::string& path, Diagnostics& diagnostics)
{
    if (!json.is_object())
    {
        diagnostics.push_back(path + ": keyframe must be an object");
        return std::nullopt;
    }

    KeyframeSpec keyframe;
    if (const Json* time = firstMember(json, {"time", "t"}, nullptr))
    {
        if (!time->is_number())
        {
            diagnostics.push_back(path + ".time: expected number, got " + time->type_name());
            return std::nullopt;
        }
        keyframe.timeMs = time->get<double>();
    }

    if (const Json* value = firstMember(json, {"value", "v"}, nullptr))
    {
        keyframe.value = *value;
    }

    if (const Json* easing = firstMember(json, {"easing", "e"}, nullptr))
    {
        keyframe.easing = parseEasing(*easing, path + ".easing", diagnostics);
    }
    return keyframe;
}

std::optional<PropertyAnimationSpec> parsePropertyAnimation(const Json& json,
                                                            const std::string& path,
                                                            Diagnostics& diagnostics)
{
    if (!json.is_object())
    {
        diagnostics.push_back(path + ": property animation must be an object");
        return std::nullopt;
    }

    std::string key;
    const Json* keyframes = firstMember(json, {"keyframes", "kfs"}, &key);
    if (keyframes == nullptr || !keyframes->is_array())
    {
        diagnostics.push_back(path + ": missing keyframes array");
        return std::nullopt;
    }

    PropertyAnimationSpec animation;
    for (size_t i = 0; i < keyframes->size(); ++i)
    {
        if (auto keyframe = parseKeyframe((*keyframes)[i], fmt::format("{}.{}[{}]", path, key, i), diagnostics))
        {
            animation.keyframes.push_back(std::move(*keyframe));
        }
    }
    return animation;
}

AnimationDefinitionSpec parseAnimationDefinition(const Json& json, const std::string& path, Diagnostics& diagnostics)
{
    AnimationDefinitionSpec definition;
    for (const auto& [property, value] : json.items())
    {
        if (auto animation = parsePropertyAnimation(value, path + "." + property, diagnostics))
        {
            definition.emplace_back(property, std::move(*animation));
        }
    }
    return definition;
}

std::optional<ElementAnimation> parseElementAnimation(const Json& json,
                                                      const std::string& path,
                                                      Diagnostics& diagnostics)
{
    if (json.is_string()) return ElementAnimation{AnimationRef{json.get<std::string>()}};
    if (json.is_object()) return ElementAnimation{AnimationRef{parseAnimationDefinition(json, path, diagnostics)}};
    if (json.is_array())
    {
        ElementAnimation animation;
        for (size_t i = 0; i < json.size(); ++i)
        {
            const Json& item = json[i];
            if (item.is_string())
            {
                animation.emplace_back(item.get<std::string>());
            }
            else if (item.is_object())
            {
                animation.emplace_back(parseAnimationDefinition(item, fmt::format("{}[{}]", path, i), diagnostics));
            }
            else
            {
                diagnostics.push_back(fmt::format("{}[{}]: expected animation name or definition", path, i));
            }
        }
        return animation;
    }

    diagnostics.push_back(path + ": expected string, array, or animation definition object");
    return std::nullopt;
}

bool isReservedKey(std::string_view key, bool isRoot)
{
    if (key == "type" || key == "id" || key == "children" || key == "animate") return true;
    return isRoot && (key == "animator" || key == "animation" || key == "defs" || key == "bindings");
}

Node parseNode(const Json& json, const std::string& path, Diagnostics& diagnostics, bool isRoot)
{
    Node node;
    if (!json.is_object())
    {
        diagnostics.push_back(path + ": node must be an object");
        return node;
    }

    if (const Json* type = member(json, "type"); type != nullptr && type->is_string())
    {
        node.type = type->get<std::string>();
    }
    else if (const Json* tagName = member(json, "tagName"); tagName != nullptr && tagName->is_string())
    {
        node.type = tagName->get<std::string>();
    }
    else
    {
        diagnostics.push_back(path + ".type: expected string");
    }

    if (const Json* id = member(json, "id"))
    {
        if (id->is_string())
        {
            node.id = id->get<std::string>();
        }
        else
        {
            diagnostics.push_back(path + ".id: expected string, got " + id->type_name());
        }
    }

    if (const Json* animate = member(json, "animate"))
    {
        node.animate = parseElementAnimation(*animate, path + ".animate", diagnostics);
    }

    if (const Json* children = member(json, "children"))
    {
        if (children->is_array())
        {
            for (size_t i = 0; i < children->size(); ++i)
            {
                node.children.push_back(
                    parseNode((*children)[i], fmt::format("{}.children[{}]", path, i), diagnostics, false));
            }
        }
        else
        {
            diagnostics.push_back(path + ".children: expected array");
        }
    }

    for (const auto& [key, value] : json.items())
    {
        if (isReservedKey(key, isRoot)) continue;
        node.attributes[key] = value;
    }
    return node;
}

std::optional<Trigger> parseTrigger(const Json& json, const std::string& path, Diagnostics& diagnostics)
{
    if (!json.is_object())
    {
        diagnostics.push_back(path + ": expected object");
        return std::nullopt;
    }

    Trigger trigger;
    const Json* startOn = member(json, "startOn");
    auto parsedStart = (startOn != nullptr && startOn->is_string()) ? parseStartOn(startOn->get<std::string>())
                                                                    : std::nullopt;
    if (!parsedStart)
    {
        diagnostics.push_back(path + ".startOn: expected load|mouseOver|click|scrollIntoView|programmatic");
        return std::nullopt;
    }
    trigger.startOn = *parsedStart;

    if (const Json* outAction = member(json, "outAction"))
    {
        trigger.outAction = outAction->is_string() ? parseOutAction(outAction->get<std::string>()) : std::nullopt;
        if (!trigger.outAction)
        {
            diagnostics.push_back(path + ".outAction: expected continue|pause|reset|reverse");
        }
    }

    if (const Json* threshold = member(json, "scrollIntoViewThreshold"))
    {
        if (threshold->is_number())
        {
            trigger.scrollIntoViewThreshold = threshold->get<double>();
        }
        else
        {
            diagnostics.push_back(path + ".scrollIntoViewThreshold: expected number");
        }
    }
    return trigger;
}

PlaybackConfig parseConfig(const Json& json, const std::string& path, Diagnostics& diagnostics)
{
    PlaybackConfig config;
    if (!json.is_object())
    {
        diagnostics.push_back(path + ": expected object");
        return config;
    }

    auto numberField = [&](std::string_view key) -> std::optional<double>
    {
        const Json* value = member(json, key);
        if (value == nullptr) return std::nullopt;
        if (!value->is_number())
        {
            diagnostics.push_back(fmt::format("{}.{}: expected number, got {}", path, key, value->type_name()));
            return std::nullopt;
        }
        return value->get<double>();
    };

    auto stringField = [&](std::string_view key) -> std::optional<std::string>
    {
        const Json* value = member(json, key);
        if (value == nullptr) return std::nullopt;
        if (!value->is_string())
        {
            diagnostics.push_back(fmt::format("{}.{}: expected string, got {}", path, key, value->type_name()));
            return std::nullopt;
        }
        return value->get<std::string>();
    };

    if (auto mode = stringField("mode"))
    {
        if (auto hint = parseEngineHint(*mode))
        {
            config.engineHint = *hint;
        }
        else
        {
            diagnostics.push_back(path + ".mode: invalid value \"" + *mode + "\"");
        }
    }

    if (auto duration = numberField("duration"))
    {
        if (*duration > 0.0)
        {
            config.durationMs = *duration;
        }
        else
        {
            diagnostics.push_back(path + ".duration: must be greater than 0");
        }
    }

    if (auto delay = numberField("delay")) config.delayMs = *delay;

    if (const Json* iterations = member(json, "iterations"))
    {
        if (iterations->is_string() && iterations->get<std::string>() == "infinite")
        {
            config.iterations = INFINITE_ITERATIONS;
        }
        else if (iterations->is_number())
        {
            config.iterations = std::max(1.0, iterations->get<double>());
        }
        else
        {
            diagnostics.push_back(path + ".iterations: expected number or 'infinite'");
        }
    }

    if (auto fill = stringField("fill"))
    {
        if (auto mode = parseFillMode(*fill))
        {
            config.fillMode = *mode;
        }
        else
        {
            diagnostics.push_back(path + ".fill: invalid FillMode \"" + *fill + "\"");
        }
    }

    if (auto direction = stringField("direction"))
    {
        if (auto parsed = parseDirection(*direction))
        {
            config.direction = *parsed;
        }
        else
        {
            diagnostics.push_back(path + ".direction: invalid PlaybackDirection \"" + *direction + "\"");
        }
    }

    if (auto frameRate = numberField("frameRate"); frameRate && *frameRate > 0.0)
    {
        config.frameRateCapHz = *frameRate;
    }

    if (const Json* trigger = member(json, "trigger"))
    {
        config.trigger = parseTrigger(*trigger, path + ".trigger", diagnostics);
    }

    if (auto name = stringField("debugInstName")) config.debugInstName = *name;

    return config;
}

Definitions parseDefinitions(const Json& json, const std::string& path, Diagnostics& diagnostics)
{
    Definitions defs;
    if (!json.is_object())
    {
        diagnostics.push_back(path + ": expected object");
        return defs;
    }

    if (const Json* easings = member(json, "easings"))
    {
        for (const auto& [name, value] : easings->items())
        {
            auto easing = parseEasing(value, path + ".easings." + name, diagnostics);
            if (easing && std::holds_alternative<CubicBezierPoints>(*easing))
            {
                defs.easings[name] = std::get<CubicBezierPoints>(*easing);
            }
        }
    }

    if (const Json* animations = member(json, "animations"))
    {
        for (const auto& [name, value] : animations->items())
        {
            if (!value.is_object())
            {
                diagnostics.push_back(path + ".animations." + name + ": expected object");
                continue;
            }
            defs.animations[name] = parseAnimationDefinition(value, path + ".animations." + name, diagnostics);
        }
    }

    if (const Json* styles = member(json, "styles"); styles != nullptr && styles->is_object())
    {
        defs.styles = *styles;
    }
    return defs;
}

std::vector<BindingSpec> parseBindings(const Json& json, const std::string& path, Diagnostics& diagnostics)
{
    std::vector<BindingSpec> bindings;
    if (!json.is_array())
    {
        diagnostics.push_back(path + ": expected array");
        return bindings;
    }

    for (size_t i = 0; i < json.size(); ++i)
    {
        const std::string itemPath = fmt::format("{}[{}]", path, i);
        const Json* id = member(json[i], "id");
        const Json* animate = member(json[i], "animate");
        if (id == nullptr || !id->is_string())
        {
            diagnostics.push_back(itemPath + ".id: expected string");
            continue;
        }
        if (animate == nullptr)
        {
            diagnostics.push_back(itemPath + ".animate: missing");
            continue;
        }
        if (auto animation = parseElementAnimation(*animate, itemPath + ".animate", diagnostics))
        {
            bindings.push_back(BindingSpec{.targetId = id->get<std::string>(), .animate = std::move(*animation)});
        }
    }
    return bindings;
}

template <typename Enum, size_t N>
std::optional<Enum> lookup(const std::pair<std::string_view, Enum> (&table)[N], std::string_view text)
{
    for (const auto& [name, value] : table)
    {
        if (name == text) return value;
    }
    return std::nullopt;
}
} // namespace

std::string_view toString(DocumentError error)
{
    switch (error)
    {
        case DocumentError::FileNotFound:
            return "document file not found";
        case DocumentError::ReadFailed:
            return "failed to read document file";
        case DocumentError::ParseFailed:
            return "document is not valid JSON";
        case DocumentError::NotAnimatedDocument:
            return "document root is not an svg node";
    }
    return "unknown document error";
}

bool isAnimatedDocument(const Json& json)
{
    if (!json.is_object()) return false;
    auto isSvg = [&](std::string_view key)
    {
        const Json* value = member(json, key);
        return value != nullptr && value->is_string() && value->get<std::string>() == "svg";
    };
    return isSvg("type") || isSvg("tagName");
}

AnimatedDocument parseDocument(const Json& json)
{
    AnimatedDocument document;
    auto& diagnostics = document.diagnostics;

    document.root = parseNode(json, "root", diagnostics, true);

    std::string key;
    if (const Json* config = firstMember(json, {"animator", "meta.animator", "animation", "meta.animation"}, &key))
    {
        document.config = parseConfig(*config, "root." + key, diagnostics);
    }

    if (const Json* defs = firstMember(json, {"defs", "meta.defs"}, &key))
    {
        document.defs = parseDefinitions(*defs, "root." + key, diagnostics);
    }

    if (const Json* bindings = firstMember(json, {"bindings", "meta.bindings"}, &key))
    {
        document.bindings = parseBindings(*bindings, "root." + key, diagnostics);
    }

    return document;
}

std::expected<Json, DocumentError> loadDocumentFile(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        return std::unexpected(DocumentError::FileNotFound);
    }

    std::ifstream file(path);
    if (!file.is_open())
    {
        return std::unexpected(DocumentError::ReadFailed);
    }

    Json json = Json::parse(file, nullptr, false);
    if (json.is_discarded())
    {
        return std::unexpected(DocumentError::ParseFailed);
    }
    if (!isAnimatedDocument(json))
    {
        return std::unexpected(DocumentError::NotAnimatedDocument);
    }
    return json;
}

std::optional<EngineHint> parseEngineHint(std::string_view text)
{
    static constexpr std::pair<std::string_view, EngineHint> TABLE[] = {
        {"auto", EngineHint::Auto},
        {"webapi", EngineHint::Native},
        {"native", EngineHint::Native},
        {"frames", EngineHint::FrameLoop},
        {"frameloop", EngineHint::FrameLoop},
    };
    return lookup(TABLE, text);
}

std::optional<FillMode> parseFillMode(std::string_view text)
{
    static constexpr std::pair<std::string_view, FillMode> TABLE[] = {
        {"none", FillMode::None},
        {"forwards", FillMode::Forwards},
        {"backwards", FillMode::Backwards},
        {"both", FillMode::Both},
    };
    return lookup(TABLE, text);
}

std::optional<Direction> parseDirection(std::string_view text)
{
    static constexpr std::pair<std::string_view, Direction> TABLE[] = {
        {"normal", Direction::Normal},
        {"reverse", Direction::Reverse},
        {"alternate", Direction::Alternate},
        {"alternate-reverse", Direction::AlternateReverse},
    };
    return lookup(TABLE, text);
}

std::optional<StartOn> parseStartOn(std::string_view text)
{
    static constexpr std::pair<std::string_view, StartOn> TABLE[] = {
        {"load", StartOn::Load},
        {"mouseOver", StartOn::MouseOver},
        {"click", StartOn::Click},
        {"scrollIntoView", StartOn::ScrollIntoView},
        {"programmatic", StartOn::Programmatic},
    };
    return lookup(TABLE, text);
}

std::optional<OutAction> parseOutAction(std::string_view text)
{
    static constexpr std::pair<std::string_view, OutAction> TABLE[] = {
        {"continue", OutAction::Continue},
        {"pause", OutAction::Pause},
        {"reset", OutAction::Reset},
        {"reverse", OutAction::Reverse},
    };
    return lookup(TABLE, text);
}

std::string_view toString(FillMode mode)
{
    switch (mode)
    {
        case FillMode::None:
            return "none";
        case FillMode::Forwards:
            return "forwards";
        case FillMode::Backwards:
            return "backwards";
        case FillMode::Both:
            return "both";
    }
    return "none";
}

std::string_view toString(Direction direction)
{
    switch (direction)
    {
        case Direction::Normal:
            return "normal";
        case Direction::Reverse:
            return "reverse";
        case Direction::Alternate:
            return "alternate";
        case Direction::AlternateReverse:
            return "alternate-reverse";
    }
    return "normal";
}

} // namespace animator::model

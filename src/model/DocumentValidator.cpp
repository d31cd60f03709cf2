/**
 * ************************************************************************
 *
 * @file DocumentValidator.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-07
 * @version 0.1
 * @brief 动画文档深度校验实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "DocumentValidator.h"
#include <algorithm>
#include <array>
#include <string_view>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace animator::model
{
namespace
{
/**
 * @brief 校验器：沿途累积错误信息，每个 check 返回该子树是否合法
 */
class Validator
{
public:
    std::vector<std::string> errors;

    bool checkSvgRoot(const Json& v, const std::string& path)
    {
        if (!checkNode(v, path)) return false;

        bool valid = true;
        if (v.at("type").get<std::string>() != "svg")
        {
            fail(path + ".type", fmt::format("expected 'svg', got '{}'", v.at("type").get<std::string>()));
            valid = false;
        }
        valid &= optionalNumber(v, path, "width");
        valid &= optionalNumber(v, path, "height");
        if (const Json* viewBox = find(v, "viewBox"); viewBox != nullptr && !viewBox->is_string())
        {
            fail(path + ".viewBox", fmt::format("expected string, got {}", viewBox->type_name()));
            valid = false;
        }

        const Json* meta = find(v, "meta");
        for (std::string_view key : {"animator", "animation"})
        {
            if (const Json* config = find(v, key)) valid &= checkConfig(*config, fmt::format("{}.{}", path, key));
            if (const Json* config = meta ? find(*meta, key) : nullptr)
            {
                valid &= checkConfig(*config, fmt::format("{}.meta.{}", path, key));
            }
        }

        if (const Json* defs = find(v, "defs")) valid &= checkDefs(*defs, path + ".defs");
        if (const Json* defs = meta ? find(*meta, "defs") : nullptr) valid &= checkDefs(*defs, path + ".meta.defs");

        if (const Json* bindings = find(v, "bindings")) valid &= checkBindings(*bindings, path + ".bindings");
        if (const Json* bindings = meta ? find(*meta, "bindings") : nullptr)
        {
            valid &= checkBindings(*bindings, path + ".meta.bindings");
        }

        if (const Json* design = find(v, "design")) valid &= checkNode(*design, path + ".design");
        return valid;
    }

private:
    void fail(const std::string& path, std::string_view message) { errors.push_back(path + ": " + std::string(message)); }

    static const Json* find(const Json& object, std::string_view key)
    {
        if (!object.is_object()) return nullptr;
        auto it = object.find(std::string(key));
        return it == object.end() ? nullptr : &*it;
    }

    bool expectObject(const Json& v, const std::string& path)
    {
        if (v.is_object()) return true;
        fail(path, "expected object");
        return false;
    }

    bool optionalNumber(const Json& object, const std::string& path, std::string_view key)
    {
        const Json* value = find(object, key);
        if (value == nullptr || value->is_number()) return true;
        fail(fmt::format("{}.{}", path, key), fmt::format("expected number, got {}", value->type_name()));
        return false;
    }

    template <size_t N>
    bool optionalEnum(const Json& object,
                      const std::string& path,
                      std::string_view key,
                      std::string_view typeName,
                      const std::array<std::string_view, N>& allowed,
                      bool required = false)
    {
        const Json* value = find(object, key);
        if (value == nullptr && !required) return true;

        if (value != nullptr && value->is_string())
        {
            const auto text = value->get<std::string>();
            if (std::ranges::find(allowed, std::string_view(text)) != allowed.end()) return true;
        }

        const std::string shown = value == nullptr ? "undefined" : (value->is_string() ? value->get<std::string>() : value->dump());
        fail(fmt::format("{}.{}", path, key),
             fmt::format("invalid {} \"{}\", expected '{}'", typeName, shown, fmt::join(allowed, "'|'")));
        return false;
    }

    bool checkEasing(const Json& v, const std::string& path)
    {
        if (v.is_string()) return true;
        if (v.is_array() && v.size() == 4 && std::all_of(v.begin(), v.end(), [](const Json& n) { return n.is_number(); }))
        {
            return true;
        }
        fail(path, "invalid easing, expected string or [number, number, number, number]");
        return false;
    }

    bool checkKeyframe(const Json& v, const std::string& path)
    {
        if (!expectObject(v, path)) return false;
        bool valid = optionalNumber(v, path, "time");
        valid &= optionalNumber(v, path, "t");
        if (const Json* easing = find(v, "easing")) valid &= checkEasing(*easing, path + ".easing");
        if (const Json* easing = find(v, "e")) valid &= checkEasing(*easing, path + ".e");
        return valid;
    }

    bool checkPropertyAnimation(const Json& v, const std::string& path)
    {
        if (!expectObject(v, path)) return false;
        bool valid = true;
        for (std::string_view key : {"keyframes", "kfs"})
        {
            const Json* keyframes = find(v, key);
            if (keyframes == nullptr) continue;
            if (!keyframes->is_array())
            {
                fail(fmt::format("{}.{}", path, key), "expected array");
                valid = false;
                continue;
            }
            for (size_t i = 0; i < keyframes->size(); ++i)
            {
                valid &= checkKeyframe((*keyframes)[i], fmt::format("{}.{}[{}]", path, key, i));
            }
        }
        return valid;
    }

    bool checkAnimationDefinition(const Json& v, const std::string& path)
    {
        if (!expectObject(v, path)) return false;
        bool valid = true;
        for (const auto& [property, animation] : v.items())
        {
            valid &= checkPropertyAnimation(animation, path + "." + property);
        }
        return valid;
    }

    bool checkElementAnimation(const Json& v, const std::string& path)
    {
        if (v.is_string()) return true;
        if (v.is_array())
        {
            bool valid = true;
            for (size_t i = 0; i < v.size(); ++i)
            {
                if (!v[i].is_string()) valid &= checkAnimationDefinition(v[i], fmt::format("{}[{}]", path, i));
            }
            return valid;
        }
        if (v.is_object()) return checkAnimationDefinition(v, path);
        fail(path, "expected string, array, or animation definition object");
        return false;
    }

    bool checkTrigger(const Json& v, const std::string& path)
    {
        if (!expectObject(v, path)) return false;
        static constexpr std::array<std::string_view, 5> START_ON = {
            "load", "mouseOver", "click", "scrollIntoView", "programmatic"};
        static constexpr std::array<std::string_view, 4> OUT_ACTION = {"continue", "pause", "reset", "reverse"};

        bool valid = optionalEnum(v, path, "startOn", "startOn", START_ON, true);
        valid &= optionalEnum(v, path, "outAction", "outAction", OUT_ACTION);
        valid &= optionalNumber(v, path, "scrollIntoViewThreshold");
        return valid;
    }

    bool checkConfig(const Json& v, const std::string& path)
    {
        if (!expectObject(v, path)) return false;
        static constexpr std::array<std::string_view, 5> MODES = {"auto", "webapi", "frames", "native", "frameloop"};
        static constexpr std::array<std::string_view, 4> FILL = {"forwards", "backwards", "both", "none"};
        static constexpr std::array<std::string_view, 4> DIRECTION = {
            "normal", "reverse", "alternate", "alternate-reverse"};

        bool valid = optionalEnum(v, path, "mode", "mode", MODES);
        valid &= optionalNumber(v, path, "duration");
        valid &= optionalNumber(v, path, "delay");
        if (const Json* iterations = find(v, "iterations");
            iterations != nullptr && !iterations->is_number() && *iterations != "infinite")
        {
            fail(path + ".iterations", fmt::format("expected number or 'infinite', got {}", iterations->type_name()));
            valid = false;
        }
        valid &= optionalEnum(v, path, "fill", "FillMode", FILL);
        valid &= optionalEnum(v, path, "direction", "PlaybackDirection", DIRECTION);
        valid &= optionalNumber(v, path, "frameRate");
        if (const Json* trigger = find(v, "trigger")) valid &= checkTrigger(*trigger, path + ".trigger");
        return valid;
    }

    bool checkDefs(const Json& v, const std::string& path)
    {
        if (!expectObject(v, path)) return false;
        bool valid = true;
        if (const Json* easings = find(v, "easings"))
        {
            if (expectObject(*easings, path + ".easings"))
            {
                for (const auto& [name, easing] : easings->items())
                {
                    valid &= checkEasing(easing, path + ".easings." + name);
                }
            }
            else
            {
                valid = false;
            }
        }
        if (const Json* animations = find(v, "animations"))
        {
            if (expectObject(*animations, path + ".animations"))
            {
                for (const auto& [name, animation] : animations->items())
                {
                    valid &= checkAnimationDefinition(animation, path + ".animations." + name);
                }
            }
            else
            {
                valid = false;
            }
        }
        if (const Json* styles = find(v, "styles"); styles != nullptr && !expectObject(*styles, path + ".styles"))
        {
            valid = false;
        }
        return valid;
    }

    bool checkBinding(const Json& v, const std::string& path)
    {
        if (!expectObject(v, path)) return false;
        bool valid = true;
        const Json* id = find(v, "id");
        if (id == nullptr || !id->is_string())
        {
            fail(path + ".id", fmt::format("expected string, got {}", id == nullptr ? "undefined" : id->type_name()));
            valid = false;
        }
        const Json* animate = find(v, "animate");
        if (animate == nullptr)
        {
            fail(path + ".animate", "expected string, array, or animation definition object");
            valid = false;
        }
        else
        {
            valid &= checkElementAnimation(*animate, path + ".animate");
        }
        return valid;
    }

    bool checkBindings(const Json& v, const std::string& path)
    {
        if (!v.is_array())
        {
            fail(path, "expected array");
            return false;
        }
        bool valid = true;
        for (size_t i = 0; i < v.size(); ++i)
        {
            valid &= checkBinding(v[i], fmt::format("{}[{}]", path, i));
        }
        return valid;
    }

    bool checkNode(const Json& v, const std::string& path)
    {
        if (!expectObject(v, path)) return false;
        bool valid = true;
        const Json* type = find(v, "type");
        if (type == nullptr || !type->is_string())
        {
            fail(path + ".type",
                 fmt::format("expected string, got {}", type == nullptr ? "undefined" : type->type_name()));
            valid = false;
        }
        if (const Json* children = find(v, "children"))
        {
            if (children->is_array())
            {
                for (size_t i = 0; i < children->size(); ++i)
                {
                    valid &= checkNode((*children)[i], fmt::format("{}.children[{}]", path, i));
                }
            }
            else
            {
                fail(path + ".children", "expected array");
                valid = false;
            }
        }
        if (const Json* animate = find(v, "animate")) valid &= checkElementAnimation(*animate, path + ".animate");
        return valid;
    }
};
} // namespace

ValidationResult validateDocument(const Json& json)
{
    Validator validator;
    const bool valid = validator.checkSvgRoot(json, "root");
    return ValidationResult{.valid = valid, .errors = std::move(validator.errors)};
}

} // namespace animator::model

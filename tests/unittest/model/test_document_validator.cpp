/**
 * ************************************************************************
 *
 * @file test_document_validator.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-17
 * @version 0.1
 * @brief 文档深度校验单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include <algorithm>
#include "src/model/DocumentValidator.h"

using namespace animator::model;

namespace
{
bool hasError(const ValidationResult& result, std::string_view prefix)
{
    return std::ranges::any_of(result.errors, [&](const std::string& error) { return error.starts_with(prefix); });
}
} // namespace

// 测试 1: 合法文档
TEST(DocumentValidatorTest, AcceptsValidDocument)
{
    const auto result = validateDocument(Json::parse(R"({
        "type": "svg",
        "width": 100,
        "viewBox": "0 0 100 100",
        "animator": {"mode": "auto", "duration": 500, "iterations": "infinite", "direction": "alternate"},
        "defs": {"easings": {"quick": [0, 0, 0.2, 1]}, "animations": {"spin": {"rotate": {"kfs": [{"t": 0, "v": 0}]}}}},
        "bindings": [{"id": "a", "animate": ["spin", {"opacity": {"keyframes": [{"time": 0, "value": 1}]}}]}],
        "children": [{"type": "rect", "id": "a"}]
    })"));
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

// 测试 2: 非法枚举值给出带路径的说明
TEST(DocumentValidatorTest, ReportsInvalidDirection)
{
    const auto result = validateDocument(Json::parse(R"({"type": "svg", "animator": {"direction": "sideways"}})"));
    EXPECT_FALSE(result.valid);
    ASSERT_EQ(result.errors.size(), 1U);
    EXPECT_EQ(result.errors.front(),
              "root.animator.direction: invalid PlaybackDirection \"sideways\", expected "
              "'normal'|'reverse'|'alternate'|'alternate-reverse'");
}

// 测试 3: 根节点类型与数值字段
TEST(DocumentValidatorTest, ReportsRootProblems)
{
    const auto result = validateDocument(Json::parse(R"({"type": "g", "width": "wide", "viewBox": 5})"));
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(hasError(result, "root.type"));
    EXPECT_TRUE(hasError(result, "root.width"));
    EXPECT_TRUE(hasError(result, "root.viewBox"));
}

// 测试 4: meta 下的配置与绑定同样被校验
TEST(DocumentValidatorTest, ValidatesMetaVariants)
{
    const auto result = validateDocument(Json::parse(R"({
        "type": "svg",
        "meta": {"animator": {"iterations": true}, "bindings": [{"animate": "x"}]}
    })"));
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(hasError(result, "root.meta.animator.iterations"));
    EXPECT_TRUE(hasError(result, "root.meta.bindings[0].id"));
}

// 测试 5: 触发器缺少 startOn
TEST(DocumentValidatorTest, TriggerRequiresStartOn)
{
    const auto result = validateDocument(Json::parse(R"({"type": "svg", "animator": {"trigger": {"outAction": "pause"}}})"));
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(hasError(result, "root.animator.trigger.startOn"));
}

// 测试 6: 子节点中的缓动定义错误
TEST(DocumentValidatorTest, ReportsNestedEasingError)
{
    const auto result = validateDocument(Json::parse(R"({
        "type": "svg",
        "children": [{"type": "g", "children": [{"type": "rect",
            "animate": {"x": {"keyframes": [{"t": 0, "v": 1, "easing": [1, 2]}]}}}]}]
    })"));
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(hasError(result, "root.children[0].children[0].animate"));
}

/**
 * ************************************************************************
 *
 * @file test_id_regenerator.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-17
 * @version 0.1
 * @brief id 重新生成与引用改写单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include <string>
#include "src/model/DocumentParser.h"
#include "src/model/IdRegenerator.h"

using namespace animator::model;

namespace
{
animator::utils::IdGenerator sequence(const std::string& prefix)
{
    return [prefix, next = 0]() mutable { return prefix + std::to_string(++next); };
}
} // namespace

class IdRegeneratorTest : public ::testing::Test
{
protected:
    AnimatedDocument m_document;

    void SetUp() override
    {
        m_document = parseDocument(Json::parse(R"json({
            "type": "svg",
            "id": "root",
            "children": [
                {"type": "linearGradient", "id": "grad"},
                {"type": "clipPath", "id": "clip"},
                {"type": "rect", "id": "box", "fill": "url(#grad)", "clip-path": "url(#clip)",
                 "style": {"stroke": "url(#grad)", "opacity": 0.5},
                 "data-note": "mask url(#clip) and url(#unknown)"},
                {"type": "use", "href": "#box", "xlink:href": "#missing"},
                {"type": "g", "targetId": "box", "extra": {"nested": ["url(#grad)"]}}
            ]
        })json"));
    }
};

// 测试 1: 所有 id 被替换，输入保持不变
TEST_F(IdRegeneratorTest, RegeneratesIdsOnCopy)
{
    IdRegenerator ids(sequence("n"));
    const Node result = ids.regenerate(m_document.root);

    EXPECT_EQ(result.id, std::optional<std::string>("n1"));
    EXPECT_EQ(result.children[0].id, std::optional<std::string>("n2"));
    EXPECT_EQ(result.children[2].id, std::optional<std::string>("n4"));
    EXPECT_EQ(m_document.root.children[2].id, std::optional<std::string>("box"));
    EXPECT_EQ(ids.mapping().size(), 4U);
    EXPECT_EQ(ids.translate("grad"), "n2");
    EXPECT_EQ(ids.translate("nope"), "nope");
}

// 测试 2: url() 与样式中的引用
TEST_F(IdRegeneratorTest, RewritesUrlReferences)
{
    IdRegenerator ids(sequence("n"));
    const Node result = ids.regenerate(m_document.root);
    const auto& box = result.children[2].attributes;

    EXPECT_EQ(box.at("fill"), "url(#n2)");
    EXPECT_EQ(box.at("clip-path"), "url(#n3)");
    EXPECT_EQ(box.at("style").at("stroke"), "url(#n2)");
    EXPECT_EQ(box.at("style").at("opacity"), 0.5);
    EXPECT_EQ(box.at("data-note"), "mask url(#n3) and url(#unknown)");
}

// 测试 3: 井号引用、直接引用与嵌套结构
TEST_F(IdRegeneratorTest, RewritesHashAndDirectReferences)
{
    IdRegenerator ids(sequence("n"));
    const Node result = ids.regenerate(m_document.root);

    const auto& use = result.children[3].attributes;
    EXPECT_EQ(use.at("href"), "#n4");
    EXPECT_EQ(use.at("xlink:href"), "#missing");

    const auto& group = result.children[4].attributes;
    EXPECT_EQ(group.at("targetId"), "n4");
    EXPECT_EQ(group.at("extra").at("nested").at(0), "url(#n2)");
}

// 测试 4: 默认生成器产生唯一 id
TEST(IdRegeneratorDefaultTest, DefaultGeneratorIsUnique)
{
    IdRegenerator ids;
    const auto first = ids.generate();
    const auto second = ids.generate();
    EXPECT_NE(first, second);
    EXPECT_FALSE(first.empty());
}

// 测试 5: replaceUrlRefs 处理多个引用与不完整的括号
TEST(ReplaceUrlRefsTest, HandlesMultipleAndMalformed)
{
    const IdMap ids{{"a", "x"}, {"b", "y"}};
    EXPECT_EQ(replaceUrlRefs("url(#a) url(#b)", ids), "url(#x) url(#y)");
    EXPECT_EQ(replaceUrlRefs("url(#a", ids), "url(#a");
    EXPECT_EQ(replaceUrlRefs("plain", ids), "plain");
}

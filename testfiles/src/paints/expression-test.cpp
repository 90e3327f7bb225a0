// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the constructor call expression reader
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "paints/expression.h"

#include <string>
#include <gtest/gtest.h>

#include "paints/errors.h"

using namespace Paintmix::Paints;

namespace {

TEST(PaintsExpression, literals)
{
    EXPECT_EQ(*expr_string(parse_expression(R"("Red")")), "Red");
    EXPECT_EQ(*expr_string(parse_expression("'Red'")), "Red");
    EXPECT_EQ(*expr_string(parse_expression(R"("Say \"hi\"")")), "Say \"hi\"");
    EXPECT_EQ(*expr_string(parse_expression(R"('it\'s')")), "it's");
    EXPECT_EQ(*expr_string(parse_expression(R"("")")), "");

    EXPECT_EQ(std::get<std::int64_t>(parse_expression("42")), 42);
    EXPECT_EQ(std::get<std::int64_t>(parse_expression("-7")), -7);
    EXPECT_EQ(std::get<std::int64_t>(parse_expression("0xFFFF")), 0xFFFF);
    EXPECT_EQ(std::get<std::int64_t>(parse_expression("0x0")), 0);
    EXPECT_EQ(std::get<double>(parse_expression("0.5")), 0.5);
    EXPECT_EQ(std::get<double>(parse_expression("1e3")), 1000.0);
    EXPECT_EQ(std::get<double>(parse_expression("  2.25  ")), 2.25);
}

TEST(PaintsExpression, numbers)
{
    EXPECT_EQ(expr_number(parse_expression("12")), 12.0);
    EXPECT_EQ(expr_number(parse_expression("0.25")), 0.25);
    EXPECT_FALSE(expr_number(parse_expression("'12'")));
    EXPECT_EQ(expr_string(parse_expression("12")), nullptr);
    EXPECT_EQ(expr_call(parse_expression("12")), nullptr);
}

TEST(PaintsExpression, call)
{
    auto value = parse_expression(R"(ModelPaint(name="Red", rgb=RGB(0xFFFF, 0x0, 0x0), transparency="O"))");
    auto call = expr_call(value);
    ASSERT_TRUE(call);
    EXPECT_EQ(call->name, "ModelPaint");
    EXPECT_TRUE(call->args.empty());
    ASSERT_EQ(call->kwargs.size(), 3u);
    EXPECT_EQ(call->kwargs[0].first, "name");
    EXPECT_EQ(call->kwargs[2].first, "transparency");

    auto rgb = expr_call(*call->argument("rgb", 1));
    ASSERT_TRUE(rgb);
    EXPECT_EQ(rgb->name, "RGB");
    ASSERT_EQ(rgb->args.size(), 3u);
    EXPECT_EQ(expr_number(rgb->args[0]), 65535.0);
    EXPECT_EQ(expr_number(rgb->args[1]), 0.0);
}

TEST(PaintsExpression, emptyCall)
{
    auto call = expr_call(parse_expression("Nothing( )"));
    ASSERT_TRUE(call);
    EXPECT_EQ(call->name, "Nothing");
    EXPECT_TRUE(call->args.empty());
    EXPECT_TRUE(call->kwargs.empty());
}

TEST(PaintsExpression, argumentLookup)
{
    auto value = parse_expression("Paint('a', 'b', finish='G')");
    auto call = expr_call(value);
    ASSERT_TRUE(call);
    EXPECT_EQ(*expr_string(*call->argument("name", 0)), "a");
    EXPECT_EQ(*expr_string(*call->argument("rgb", 1)), "b");
    EXPECT_EQ(*expr_string(*call->argument("finish", 2)), "G");
    EXPECT_EQ(call->argument("transparency", 3), nullptr);
    // Keywords win over positions
    EXPECT_EQ(*expr_string(*call->argument("finish", 0)), "G");
}

TEST(PaintsExpression, errors)
{
    EXPECT_THROW(parse_expression(""), ParseError);
    EXPECT_THROW(parse_expression("\"open"), ParseError);
    EXPECT_THROW(parse_expression("RGB(1, 2"), ParseError);
    EXPECT_THROW(parse_expression("RGB(1 2)"), ParseError);
    EXPECT_THROW(parse_expression("RGB(red=1, 2)"), ParseError);
    EXPECT_THROW(parse_expression("12 13"), ParseError);
    EXPECT_THROW(parse_expression("0xZZ"), ParseError);
    EXPECT_THROW(parse_expression("-"), ParseError);
    EXPECT_THROW(parse_expression("[1]"), ParseError);

    try {
        parse_expression("RGB(1, 2");
        FAIL() << "no error";
    } catch (ParseError const &e) {
        EXPECT_EQ(e.line(), "RGB(1, 2");
    }
}

TEST(PaintsExpression, nestingDepth)
{
    auto nested = [](unsigned depth) {
        std::string text;
        for (unsigned i = 0; i < depth; i++) {
            text += "A(";
        }
        text += "1";
        text.append(depth, ')');
        return text;
    };
    EXPECT_NO_THROW(parse_expression(nested(8)));
    EXPECT_NO_THROW(parse_expression(nested(32)));

    for (unsigned depth : {33u, 100000u}) {
        try {
            parse_expression(nested(depth));
            FAIL() << "no error at depth " << depth;
        } catch (ParseError const &e) {
            EXPECT_EQ(e.reason(), "Expression nested too deeply");
        }
    }
}

} // namespace

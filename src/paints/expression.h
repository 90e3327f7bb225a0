// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Reader for constructor call expressions found in older collection files.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PAINTS_EXPRESSION_H
#define SEEN_PAINTS_EXPRESSION_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace Paintmix::Paints {

struct ExprCall;

/**
 * A literal string, integer or real, or a nested call.
 */
using ExprValue = std::variant<std::string, std::int64_t, double, std::shared_ptr<ExprCall const>>;

/**
 * `Name(positional, ..., keyword=value, ...)`
 */
struct ExprCall
{
    std::string name;
    std::vector<ExprValue> args;
    std::vector<std::pair<std::string, ExprValue>> kwargs;

    ExprValue const *argument(std::string const &keyword, size_t position) const;
};

ExprValue parse_expression(std::string const &text);

std::optional<double> expr_number(ExprValue const &value);
std::string const *expr_string(ExprValue const &value);
ExprCall const *expr_call(ExprValue const &value);

} // namespace Paintmix::Paints

#endif // SEEN_PAINTS_EXPRESSION_H

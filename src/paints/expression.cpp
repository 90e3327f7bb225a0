// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Reader for constructor call expressions found in older collection files.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "expression.h"

#include <cctype>
#include <charconv>
#include <glibmm/i18n.h>
#include <glibmm/stringutils.h>

#include "paints/errors.h"

namespace Paintmix::Paints {

namespace {

// Calls may nest no deeper than this.
constexpr unsigned MAX_CALL_DEPTH = 32;

/**
 * Recursive descent over a single expression. Whitespace between tokens is ignored.
 */
class ExpressionReader
{
public:
    explicit ExpressionReader(std::string const &text)
        : _text(text)
    {}

    ExprValue read()
    {
        auto value = _value();
        _skip();
        if (_pos != _text.size()) {
            _fail(_("Unexpected text after expression"));
        }
        return value;
    }

private:
    [[noreturn]] void _fail(char const *reason) const { throw ParseError(_text, reason); }

    void _skip()
    {
        while (_pos < _text.size() && std::isspace(static_cast<unsigned char>(_text[_pos]))) {
            _pos++;
        }
    }

    char _peek()
    {
        _skip();
        return _pos < _text.size() ? _text[_pos] : '\0';
    }

    void _expect(char c)
    {
        if (_peek() != c) {
            _fail(_("Badly formed definition"));
        }
        _pos++;
    }

    static bool _is_ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
    static bool _is_ident(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.'; }

    std::string _identifier()
    {
        auto start = _pos;
        while (_pos < _text.size() && _is_ident(_text[_pos])) {
            _pos++;
        }
        return _text.substr(start, _pos - start);
    }

    ExprValue _value();
    ExprValue _string();
    ExprValue _number();
    ExprValue _call();

    std::string const &_text;
    std::string::size_type _pos = 0;
    unsigned _depth = 0;
};

ExprValue ExpressionReader::_value()
{
    char c = _peek();
    if (c == '"' || c == '\'') {
        return _string();
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.') {
        return _number();
    }
    if (_is_ident_start(c)) {
        return _call();
    }
    _fail(_("Expected a value"));
}

/**
 * A single or double quoted string with backslash escapes.
 */
ExprValue ExpressionReader::_string()
{
    char const quote = _text[_pos++];
    std::string result;
    while (_pos < _text.size() && _text[_pos] != quote) {
        char c = _text[_pos++];
        if (c == '\\' && _pos < _text.size()) {
            char e = _text[_pos++];
            switch (e) {
                case 'n':
                    result += '\n';
                    break;
                case 't':
                    result += '\t';
                    break;
                case '\\':
                case '"':
                case '\'':
                    result += e;
                    break;
                default:
                    result += c;
                    result += e;
            }
        } else {
            result += c;
        }
    }
    if (_pos >= _text.size()) {
        _fail(_("Unterminated string"));
    }
    _pos++;
    return result;
}

/**
 * Decimal or 0x prefixed hexadecimal integers, and reals.
 */
ExprValue ExpressionReader::_number()
{
    auto start = _pos;
    bool negative = false;
    if (_text[_pos] == '-' || _text[_pos] == '+') {
        negative = _text[_pos] == '-';
        _pos++;
    }
    if (_text.compare(_pos, 2, "0x") == 0 || _text.compare(_pos, 2, "0X") == 0) {
        _pos += 2;
        std::int64_t result = 0;
        auto first = _text.data() + _pos;
        auto [ptr, ec] = std::from_chars(first, _text.data() + _text.size(), result, 16);
        if (ec != std::errc() || ptr == first) {
            _fail(_("Bad hexadecimal number"));
        }
        _pos += ptr - first;
        return negative ? -result : result;
    }
    bool real = false;
    while (_pos < _text.size()) {
        char c = _text[_pos];
        if (c == '.' || c == 'e' || c == 'E') {
            real = true;
        } else if ((c == '-' || c == '+') && (_text[_pos - 1] == 'e' || _text[_pos - 1] == 'E')) {
            // exponent sign
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            break;
        }
        _pos++;
    }
    auto token = _text.substr(start, _pos - start);
    if (real) {
        std::string::size_type end = 0;
        double result = 0.0;
        try {
            result = Glib::Ascii::strtod(token, end);
        } catch (std::exception const &) {
            _fail(_("Bad number"));
        }
        if (end != token.size()) {
            _fail(_("Bad number"));
        }
        return result;
    }
    std::int64_t result = 0;
    auto digits = token.data() + (token[0] == '-' || token[0] == '+' ? 1 : 0);
    auto [ptr, ec] = std::from_chars(digits, token.data() + token.size(), result);
    if (ec != std::errc() || ptr != token.data() + token.size() || ptr == digits) {
        _fail(_("Bad number"));
    }
    return negative ? -result : result;
}

/**
 * `Name(args)`, keyword arguments must follow positional ones.
 */
ExprValue ExpressionReader::_call()
{
    if (++_depth > MAX_CALL_DEPTH) {
        _fail(_("Expression nested too deeply"));
    }
    auto call = std::make_shared<ExprCall>();
    call->name = _identifier();
    _expect('(');
    while (_peek() != ')') {
        auto mark = _pos;
        std::string keyword;
        if (_is_ident_start(_peek())) {
            keyword = _identifier();
            if (_peek() == '=') {
                _pos++;
            } else {
                keyword.clear();
                _pos = mark;
            }
        }
        auto value = _value();
        if (keyword.empty()) {
            if (!call->kwargs.empty()) {
                _fail(_("Positional argument follows keyword argument"));
            }
            call->args.emplace_back(std::move(value));
        } else {
            call->kwargs.emplace_back(std::move(keyword), std::move(value));
        }
        if (_peek() == ',') {
            _pos++;
        } else if (_peek() != ')') {
            _fail(_("Badly formed definition"));
        }
    }
    _pos++;
    _depth--;
    return std::shared_ptr<ExprCall const>(std::move(call));
}

} // namespace

/**
 * Find an argument by keyword, or failing that by its position.
 */
ExprValue const *ExprCall::argument(std::string const &keyword, size_t position) const
{
    for (auto const &[key, value] : kwargs) {
        if (key == keyword) {
            return &value;
        }
    }
    return position < args.size() ? &args[position] : nullptr;
}

/**
 * Parse text holding exactly one expression.
 *
 * @throws ParseError naming the text and what was wrong with it.
 */
ExprValue parse_expression(std::string const &text)
{
    return ExpressionReader(text).read();
}

std::optional<double> expr_number(ExprValue const &value)
{
    if (auto i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (auto d = std::get_if<double>(&value)) {
        return *d;
    }
    return {};
}

std::string const *expr_string(ExprValue const &value)
{
    return std::get_if<std::string>(&value);
}

ExprCall const *expr_call(ExprValue const &value)
{
    if (auto call = std::get_if<std::shared_ptr<ExprCall const>>(&value)) {
        return call->get();
    }
    return nullptr;
}

} // namespace Paintmix::Paints

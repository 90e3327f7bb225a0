// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Readers for the paint records of a collection definition, current and historical.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "record-parser.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <glibmm/i18n.h>
#include <glibmm/regex.h>
#include <glibmm/ustring.h>

#include "paints/errors.h"
#include "paints/expression.h"

namespace Paintmix::Paints {

namespace {

using namespace Colors;

// The quoted string of the current format, with backslash escapes.
char const *const QUOTED = R"re("((?:[^"\\]|\\.)*)")re";

std::string unescape(std::string const &text)
{
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            i++;
        }
        result += text[i];
    }
    return result;
}

std::string capitalized(std::string name)
{
    if (!name.empty()) {
        name[0] = std::toupper(static_cast<unsigned char>(name[0]));
    }
    return name;
}

bool is_blank(std::string const &line)
{
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
}

/**
 * Read the red, green and blue arguments of an RGB call in precision P.
 */
template <ChannelPrecision P>
RGB<P> channels(ExprCall const &call, std::string const &line)
{
    static std::array<char const *, 3> const keys = {"red", "green", "blue"};
    std::array<typename P::value_type, 3> values;
    for (unsigned i = 0; i < 3; i++) {
        auto arg = call.argument(keys[i], i);
        auto number = arg ? expr_number(*arg) : std::nullopt;
        if (!number || !RGB<P>::is_valid_channel(*number) || (P::integral && *number != std::floor(*number))) {
            throw ParseError(line, _("Bad channel value"));
        }
        values[i] = P::round(*number);
    }
    return {values[0], values[1], values[2]};
}

RGB16 rgb_from_value(ExprValue const &value, std::string const &line)
{
    auto call = expr_call(value);
    if (!call) {
        throw ParseError(line, _("RGB expected"));
    }
    if (call->name == "RGB" || call->name == "RGB16") {
        return channels<BPC16>(*call, line);
    }
    if (call->name == "RGB8") {
        return channels<BPC8>(*call, line).converted<BPC16>();
    }
    if (call->name == "RGBPN") {
        return channels<Proportion>(*call, line).converted<BPC16>();
    }
    throw ParseError(line, _("RGB expected"));
}

std::string string_from_value(ExprValue const &value, std::string const &line)
{
    if (auto text = expr_string(value)) {
        return *text;
    }
    throw ParseError(line, _("String expected"));
}

Characteristic characteristic_from_label(CharacteristicType const &type, std::string const &label,
                                         std::string const &line)
{
    try {
        return Characteristic(type, label);
    } catch (InvalidCharacteristic const &e) {
        throw ParseError(line, e.what());
    }
}

/**
 * A label, a number or a call such as `Transparency("O")`.
 */
Characteristic characteristic_from_value(CharacteristicType const &type, ExprValue const &value,
                                         std::string const &line)
{
    if (auto label = expr_string(value)) {
        return characteristic_from_label(type, *label, line);
    }
    if (auto number = expr_number(value)) {
        try {
            return Characteristic(type, *number);
        } catch (InvalidCharacteristic const &e) {
            throw ParseError(line, e.what());
        }
    }
    auto call = expr_call(value);
    if (call && capitalized(type.name()) == call->name && call->args.size() + call->kwargs.size() == 1) {
        return characteristic_from_value(type, call->args.empty() ? call->kwargs[0].second : call->args[0], line);
    }
    throw ParseError(line, Glib::ustring::compose(_("Bad %1"), type.name()));
}

} // namespace

Glib::RefPtr<Glib::Regex> const &MatcherParser::matcher(PaintKind const &kind) const
{
    auto it = _matchers.find(&kind);
    if (it == _matchers.end()) {
        it = _matchers.emplace(&kind, Glib::Regex::create(pattern(kind), Glib::Regex::CompileFlags::OPTIMIZE)).first;
    }
    return it->second;
}

std::string CurrentRecordParser::pattern(PaintKind const &kind) const
{
    std::string result = "^" + kind.name() + "\\(name=" + QUOTED +
                         ", rgb=RGB\\((0x[0-9A-Fa-f]+), (0x[0-9A-Fa-f]+), (0x[0-9A-Fa-f]+)\\)";
    for (auto const &type : kind.schema()) {
        result += ", " + type->name() + "=\"([^\"]*)\"";
    }
    for (auto const &extra : kind.extras()) {
        result += "(?:, " + extra.name + "=" + QUOTED + ")?";
    }
    return result + "\\)$";
}

bool CurrentRecordParser::detect(std::string const &line, PaintKind const &kind) const
{
    return matcher(kind)->match(line);
}

Paint CurrentRecordParser::parse(std::string const &line, PaintKind const &kind) const
{
    Glib::ustring const text = line;
    Glib::MatchInfo match;
    if (!matcher(kind)->match(text, match)) {
        throw ParseError(line, _("Badly formed definition"));
    }
    std::array<std::uint16_t, 3> rgb;
    for (int i = 0; i < 3; i++) {
        unsigned long channel = 0;
        try {
            channel = std::stoul(match.fetch(i + 2).raw(), nullptr, 16);
        } catch (std::out_of_range const &) {
            throw ParseError(line, _("Bad channel value"));
        }
        if (channel > BPC16::ONE) {
            throw ParseError(line, _("Bad channel value"));
        }
        rgb[i] = static_cast<std::uint16_t>(channel);
    }
    int group = 5;
    Characteristics characteristics(kind.schema());
    for (auto const &type : kind.schema()) {
        characteristics.set(characteristic_from_label(*type, match.fetch(group++).raw(), line));
    }
    Paint::Extras extras;
    for (auto const &extra : kind.extras()) {
        extras[extra.name] = unescape(match.fetch(group++).raw());
    }
    return Paint(kind, unescape(match.fetch(1).raw()), RGB16(rgb[0], rgb[1], rgb[2]), std::move(characteristics),
                 std::move(extras));
}

std::string NamedColourParser::pattern(PaintKind const &kind) const
{
    std::string result = R"re(^NamedColour\(name=(".+"), rgb=(.+))re";
    for (auto const &type : kind.schema()) {
        result += ", " + type->name() + "=\"(.+)\"";
    }
    return result + "\\)$";
}

bool NamedColourParser::detect(std::string const &line, PaintKind const &kind) const
{
    return matcher(kind)->match(line);
}

Paint NamedColourParser::parse(std::string const &line, PaintKind const &kind) const
{
    Glib::ustring const text = line;
    Glib::MatchInfo match;
    if (!matcher(kind)->match(text, match)) {
        throw ParseError(line, _("Badly formed definition"));
    }
    auto name = string_from_value(parse_expression(match.fetch(1).raw()), line);
    auto rgb = rgb_from_value(parse_expression(match.fetch(2).raw()), line);
    int group = 3;
    Characteristics characteristics(kind.schema());
    for (auto const &type : kind.schema()) {
        characteristics.set(characteristic_from_label(*type, match.fetch(group++).raw(), line));
    }
    return Paint(kind, std::move(name), rgb, std::move(characteristics));
}

std::string LegacyRecordParser::pattern(PaintKind const &kind) const
{
    std::string result = R"re((^[^:]+):\s+(RGB\([^)]+\)))re";
    for (auto const &type : kind.schema()) {
        result += ", (" + capitalized(type->name()) + "\\([^)]+\\))";
    }
    return result + "$";
}

bool LegacyRecordParser::detect(std::string const &line, PaintKind const &kind) const
{
    return matcher(kind)->match(line);
}

/**
 * Files of this age were written with 8 bit channels, which are promoted by shifting.
 */
Paint LegacyRecordParser::parse(std::string const &line, PaintKind const &kind) const
{
    Glib::ustring const text = line;
    Glib::MatchInfo match;
    if (!matcher(kind)->match(text, match)) {
        throw ParseError(line, _("Badly formed definition"));
    }
    auto call = expr_call(parse_expression(match.fetch(2).raw()));
    if (!call) {
        throw ParseError(line, _("RGB expected"));
    }
    auto rgb8 = channels<BPC8>(*call, line);
    RGB16 rgb(rgb8[0] << 8, rgb8[1] << 8, rgb8[2] << 8);

    int group = 3;
    Characteristics characteristics(kind.schema());
    for (auto const &type : kind.schema()) {
        characteristics.set(characteristic_from_value(*type, parse_expression(match.fetch(group++).raw()), line));
    }
    return Paint(kind, match.fetch(1).raw(), rgb, std::move(characteristics));
}

Paint ExpressionRecordParser::parse(std::string const &line, PaintKind const &kind) const
{
    auto value = parse_expression(line);
    auto call = expr_call(value);
    if (!call || (call->name != kind.name() && call->name != "NamedColour")) {
        throw ParseError(line, Glib::ustring::compose(_("Not a %1 definition"), kind.name()));
    }
    std::vector<std::string> fields = {"name", "rgb"};
    for (auto const &type : kind.schema()) {
        fields.emplace_back(type->name());
    }
    for (auto const &extra : kind.extras()) {
        fields.emplace_back(extra.name);
    }
    if (call->args.size() > fields.size()) {
        throw ParseError(line, _("Too many arguments"));
    }
    for (auto const &[keyword, arg] : call->kwargs) {
        if (std::find(fields.begin(), fields.end(), keyword) == fields.end()) {
            throw ParseError(line, Glib::ustring::compose(_("Unexpected argument %1"), keyword));
        }
    }

    auto name = call->argument("name", 0);
    auto rgb = call->argument("rgb", 1);
    if (!name || !rgb) {
        throw ParseError(line, _("Name and RGB are required"));
    }
    size_t position = 2;
    Characteristics characteristics(kind.schema());
    for (auto const &type : kind.schema()) {
        if (auto arg = call->argument(type->name(), position)) {
            characteristics.set(characteristic_from_value(*type, *arg, line));
        }
        position++;
    }
    Paint::Extras extras;
    for (auto const &extra : kind.extras()) {
        if (auto arg = call->argument(extra.name, position)) {
            extras[extra.name] = string_from_value(*arg, line);
        }
        position++;
    }
    return Paint(kind, string_from_value(*name, line), rgb_from_value(*rgb, line), std::move(characteristics),
                 std::move(extras));
}

RecordParsers::RecordParsers()
{
    addParser(new CurrentRecordParser());
    addParser(new NamedColourParser());
    addParser(new LegacyRecordParser());
    addParser(new ExpressionRecordParser());
}

/**
 * Add a parser to the end of the list tried when detecting the format of a file.
 */
void RecordParsers::addParser(RecordParser *parser)
{
    _parsers.emplace_back(parser);
}

/**
 * The first parser, in the order they were added, that recognises line.
 */
RecordParser const *RecordParsers::detect(std::string const &line, PaintKind const &kind) const
{
    for (auto const &parser : _parsers) {
        if (parser->detect(line, kind)) {
            return parser.get();
        }
    }
    return nullptr;
}

/**
 * Read the paint records of a collection. The format is chosen from the first record and
 * every record must be in it. Blank lines are skipped.
 *
 * @throws ParseError naming the first line which could not be read.
 */
std::vector<Paint> RecordParsers::parse(std::vector<std::string> const &lines, PaintKind const &kind) const
{
    std::vector<Paint> paints;
    RecordParser const *parser = nullptr;
    for (auto const &line : lines) {
        if (is_blank(line)) {
            continue;
        }
        if (!parser && !(parser = detect(line, kind))) {
            throw ParseError(line, _("Unrecognized paint definition"));
        }
        try {
            paints.emplace_back(parser->parse(line, kind));
        } catch (ParseError const &e) {
            if (e.line() == line) {
                throw;
            }
            throw ParseError(line, e.reason());
        } catch (PaintError const &e) {
            throw ParseError(line, e.what());
        }
    }
    return paints;
}

} // namespace Paintmix::Paints

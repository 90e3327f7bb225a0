// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for reading paint records in current and older formats
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "paints/record-parser.h"

#include <stdexcept>
#include <gtest/gtest.h>

#include "paints/errors.h"

using namespace Paintmix::Paints;

namespace {

auto const &model = PaintKind::model();
auto const &art = PaintKind::art();

std::string detected(std::string const &line, PaintKind const &kind = model)
{
    auto parser = RecordParsers::get().detect(line, kind);
    return parser ? parser->getName() : "";
}

Paint parse_one(std::string const &line, PaintKind const &kind = model)
{
    auto paints = RecordParsers::get().parse({line}, kind);
    if (paints.size() != 1) {
        throw std::runtime_error("expected one paint");
    }
    return paints[0];
}

std::string parse_error(std::vector<std::string> const &lines, PaintKind const &kind = model)
{
    try {
        RecordParsers::get().parse(lines, kind);
    } catch (ParseError const &e) {
        return e.line() + " | " + e.reason();
    }
    return "no error";
}

TEST(PaintsRecordParser, detectFormats)
{
    EXPECT_EQ(detected(R"(ModelPaint(name="Red", rgb=RGB(0xFFFF, 0x0, 0x0), transparency="O", finish="F", fs_number=""))"),
              "current");
    EXPECT_EQ(detected(R"(ModelPaint(name="Red", rgb=RGB(0xFFFF, 0x0, 0x0), transparency="O", finish="F"))"), "current");
    EXPECT_EQ(detected(R"(NamedColour(name="Red", rgb=RGB16(65535, 0, 0), transparency="O", finish="F"))"),
              "NamedColour");
    EXPECT_EQ(detected(R"(Red: RGB(255, 0, 0), Transparency("O"), Finish("F"))"), "legacy");
    EXPECT_EQ(detected(R"(ModelPaint("Red", RGB16(65535, 0, 0)))"), "expression");

    // A model record is not a current art record
    EXPECT_EQ(detected(R"(ModelPaint(name="Red", rgb=RGB(0xFFFF, 0x0, 0x0), transparency="O", finish="F"))", art),
              "expression");
}

TEST(PaintsRecordParser, current)
{
    auto paint = parse_one(
        R"(ModelPaint(name="Olive Drab", rgb=RGB(0x5500, 0x5500, 0x3000), transparency="SO", finish="SG", fs_number="FS34087"))");
    EXPECT_EQ(paint.name(), "Olive Drab");
    EXPECT_EQ(paint.rgb(), RGB16(0x5500, 0x5500, 0x3000));
    EXPECT_EQ(paint.characteristic("transparency").abbrev(), "SO");
    EXPECT_EQ(paint.characteristic("finish").abbrev(), "SG");
    EXPECT_EQ(paint.extra("fs_number"), "FS34087");

    auto plain = parse_one(R"(ModelPaint(name="Red", rgb=RGB(0xFFFF, 0x0, 0x0), transparency="O", finish="F"))");
    EXPECT_EQ(plain, Paint(model, "Red", RGB16::red()));
    EXPECT_TRUE(plain.extras().empty());
}

TEST(PaintsRecordParser, currentNumericCharacteristic)
{
    auto paint =
        parse_one(R"(ArtPaint(name="Mix", rgb=RGB(0x0, 0x0, 0x0), transparency="2.5", permanence="AA", pigments=""))",
                  art);
    EXPECT_EQ(paint.characteristic("transparency").value(), 2.5);
    EXPECT_EQ(paint.characteristic("permanence").value(), 4.0);
}

TEST(PaintsRecordParser, currentEscapes)
{
    Paint paint(art, R"(Payne's "Grey" \ Blue)", RGB16(0x3A00, 0x8000, 0xABCD));
    paint.set_extra("pigments", R"(PB29 "and" PBk9)");
    EXPECT_EQ(parse_one(paint.definition(), art), paint);
}

TEST(PaintsRecordParser, definitionsReadBack)
{
    Paint red(model, "Red", RGB16::red());
    red.set_characteristic("finish", "G");
    red.set_extra("fs_number", "FS11136");
    Paint grey(model, "Grey", RGB16(0x8000, 0x8000, 0x8000));
    grey.set_characteristic("transparency", "C");

    auto paints = RecordParsers::get().parse({red.definition(), "", grey.definition(), "   "}, model);
    ASSERT_EQ(paints.size(), 2u);
    EXPECT_EQ(paints[0], red);
    EXPECT_EQ(paints[1], grey);
}

TEST(PaintsRecordParser, namedColour)
{
    auto paint = parse_one(R"(NamedColour(name="Red", rgb=RGB16(65535, 0, 0), transparency="T", finish="G"))");
    EXPECT_EQ(paint.kind(), model);
    EXPECT_EQ(paint.name(), "Red");
    EXPECT_EQ(paint.rgb(), RGB16::red());
    EXPECT_EQ(paint.characteristic("transparency").abbrev(), "T");
    EXPECT_EQ(paint.characteristic("finish").abbrev(), "G");

    auto eight = parse_one(R"(NamedColour(name="Orange", rgb=RGB8(255, 128, 0), transparency="O", finish="F"))");
    EXPECT_EQ(eight.rgb(), RGB16(65535, 32896, 0));

    auto proportion =
        parse_one(R"(NamedColour(name="Orange", rgb=RGBPN(1.0, 0.5, 0.0), transparency="O", finish="F"))");
    EXPECT_EQ(proportion.rgb(), RGB16(65535, 32768, 0));

    auto keywords = parse_one(
        R"(NamedColour(name="Blue", rgb=RGB16(red=0, green=0, blue=0xFFFF), transparency="O", finish="F"))");
    EXPECT_EQ(keywords.rgb(), RGB16::blue());
}

TEST(PaintsRecordParser, legacyShiftsChannels)
{
    auto paint = parse_one(R"(Red Oxide: RGB(255, 128, 1), Transparency("SO"), Finish("F"))");
    EXPECT_EQ(paint.name(), "Red Oxide");
    EXPECT_EQ(paint.rgb(), RGB16(0xFF00, 0x8000, 0x0100));
    EXPECT_EQ(paint.characteristic("transparency").abbrev(), "SO");

    auto numeric = parse_one(R"(Ochre: RGB(red=192, green=128, blue=32), Transparency(2), Permanence('AA'))", art);
    EXPECT_EQ(numeric.rgb(), RGB16(0xC000, 0x8000, 0x2000));
    EXPECT_EQ(numeric.characteristic("transparency").abbrev(), "SO");
    EXPECT_EQ(numeric.characteristic("permanence").abbrev(), "AA");
}

TEST(PaintsRecordParser, expression)
{
    auto paint = parse_one(R"(ModelPaint("Red", RGB16(65535, 0, 0), "T", "G", "FS11136"))");
    EXPECT_EQ(paint.name(), "Red");
    EXPECT_EQ(paint.rgb(), RGB16::red());
    EXPECT_EQ(paint.characteristic("transparency").abbrev(), "T");
    EXPECT_EQ(paint.characteristic("finish").abbrev(), "G");
    EXPECT_EQ(paint.extra("fs_number"), "FS11136");

    auto keywords = parse_one(R"(ModelPaint(rgb=RGB(0, 0xFFFF, 0), name='Green', finish=Finish("SF")))");
    EXPECT_EQ(keywords.name(), "Green");
    EXPECT_EQ(keywords.rgb(), RGB16::green());
    EXPECT_EQ(keywords.characteristic("transparency").abbrev(), "O");
    EXPECT_EQ(keywords.characteristic("finish").abbrev(), "SF");

    auto named = parse_one(R"(NamedColour(name="Cyan", rgb=RGB8(0, 255, 255), transparency=3, permanence="C"))", art);
    EXPECT_EQ(named.rgb(), RGB16::cyan());
    EXPECT_EQ(named.characteristic("transparency").abbrev(), "ST");
    EXPECT_EQ(named.characteristic("permanence").abbrev(), "C");
}

TEST(PaintsRecordParser, errors)
{
    auto const bad_value = R"(ModelPaint(name="Red", rgb=RGB(0xFFFF, 0x0, 0x0), transparency="X", finish="F"))";
    EXPECT_EQ(parse_error({bad_value}), std::string(bad_value) + " | Unrecognized characteristic value: X");

    auto const bad_channel = R"(ModelPaint(name="Red", rgb=RGB(0x10000, 0x0, 0x0), transparency="O", finish="F"))";
    EXPECT_EQ(parse_error({bad_channel}), std::string(bad_channel) + " | Bad channel value");
    auto const huge_channel =
        R"(ModelPaint(name="Red", rgb=RGB(0x10000000000000000, 0x0, 0x0), transparency="O", finish="F"))";
    EXPECT_EQ(parse_error({huge_channel}), std::string(huge_channel) + " | Bad channel value");

    EXPECT_EQ(parse_error({R"(ModelPaint("Red", RGB(70000, 0, 0)))"}),
              R"(ModelPaint("Red", RGB(70000, 0, 0)) | Bad channel value)");
    EXPECT_EQ(parse_error({R"(ModelPaint("Red", RGB8(1.5, 0, 0)))"}),
              R"(ModelPaint("Red", RGB8(1.5, 0, 0)) | Bad channel value)");
    EXPECT_EQ(parse_error({R"(ModelPaint("Red", "O"))"}), R"(ModelPaint("Red", "O") | RGB expected)");
    EXPECT_EQ(parse_error({R"(ModelPaint(name="Red"))"}), R"(ModelPaint(name="Red") | Name and RGB are required)");
    EXPECT_EQ(parse_error({R"(ModelPaint("a", RGB(0, 0, 0), "O", "F", "", "x"))"}),
              R"(ModelPaint("a", RGB(0, 0, 0), "O", "F", "", "x") | Too many arguments)");
    EXPECT_EQ(parse_error({R"(ModelPaint("a", RGB(0, 0, 0), colour="red"))"}),
              R"(ModelPaint("a", RGB(0, 0, 0), colour="red") | Unexpected argument colour)");
    EXPECT_EQ(parse_error({R"(ArtPaint("a", RGB(0, 0, 0)))"}), R"(ArtPaint("a", RGB(0, 0, 0)) | Not a ModelPaint definition)");
    EXPECT_EQ(parse_error({"hello"}), "hello | Badly formed definition");
}

TEST(PaintsRecordParser, errorsNameTheWholeLine)
{
    auto const line = R"(NamedColour(name="Red", rgb=RGB16(65535, 0, 0 x), transparency="O", finish="F"))";
    EXPECT_EQ(parse_error({line}), std::string(line) + " | Badly formed definition");
}

TEST(PaintsRecordParser, formatFixedByFirstRecord)
{
    auto const current = R"(ModelPaint(name="Red", rgb=RGB(0xFFFF, 0x0, 0x0), transparency="O", finish="F"))";
    auto const legacy = R"(Blue: RGB(0, 0, 255), Transparency("O"), Finish("F"))";
    EXPECT_EQ(parse_error({"", current, legacy}), std::string(legacy) + " | Badly formed definition");
    EXPECT_NO_THROW(RecordParsers::get().parse({legacy, legacy}, model));
}

TEST(PaintsRecordParser, noRecords)
{
    EXPECT_TRUE(RecordParsers::get().parse({}, model).empty());
    EXPECT_TRUE(RecordParsers::get().parse({"", " \t"}, model).empty());
}

} // namespace

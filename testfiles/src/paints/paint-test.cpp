// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for paints and their records
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "paints/paint.h"

#include <gtest/gtest.h>

#include "paints/errors.h"
#include "paints/record-printer.h"
#include "test-utils.h"

using namespace Paintmix::Paints;

namespace {

TEST(PaintsPaint, kinds)
{
    auto const &model = PaintKind::model();
    EXPECT_EQ(model.name(), "ModelPaint");
    ASSERT_EQ(model.schema().size(), 2u);
    EXPECT_EQ(model.schema()[0]->name(), "transparency");
    EXPECT_EQ(model.schema()[1]->name(), "finish");
    EXPECT_TRUE(model.has_extra("fs_number"));
    EXPECT_FALSE(model.has_extra("pigments"));
    EXPECT_FALSE(model.has_warmth());

    auto const &art = PaintKind::art();
    EXPECT_EQ(art.schema()[1]->name(), "permanence");
    EXPECT_TRUE(art.has_extra("pigments"));
    EXPECT_TRUE(art.has_warmth());

    EXPECT_EQ(PaintKind::find("ArtPaint"), &art);
    EXPECT_EQ(PaintKind::find("Paint"), nullptr);
    EXPECT_NE(model, art);
}

TEST(PaintsPaint, colour)
{
    Paint red(PaintKind::model(), "Red", RGB16::red());
    EXPECT_EQ(red.rgb(), RGB16::red());
    EXPECT_TRUE(IsNear(red.value(), 1.0 / 3.0));
    EXPECT_TRUE(IsNear(red.chroma(), 1.0));
    EXPECT_TRUE(IsNear(red.warmth(), 1.0));

    red.set_rgb(RGB16::white());
    EXPECT_TRUE(IsNear(red.value(), 1.0));
    EXPECT_TRUE(red.hue().is_grey());
}

TEST(PaintsPaint, defaultCharacteristics)
{
    Paint paint(PaintKind::art(), "Ochre", RGB16(0xC000, 0x8000, 0x2000));
    EXPECT_EQ(paint.characteristic("transparency").abbrev(), "O");
    EXPECT_EQ(paint.characteristic("permanence").abbrev(), "A");
    EXPECT_THROW(paint.characteristic("finish"), InvalidCharacteristic);

    paint.set_characteristic("permanence", "AA");
    EXPECT_EQ(paint.characteristic("permanence").description(), "Extremely Permanent");
    EXPECT_THROW(paint.set_characteristic("permanence", "Z"), InvalidCharacteristic);
}

TEST(PaintsPaint, schemaMismatch)
{
    Characteristics art_set(PaintKind::art().schema());
    EXPECT_THROW(Paint(PaintKind::model(), "Red", RGB16::red(), art_set), InvalidCharacteristic);
}

TEST(PaintsPaint, extras)
{
    Paint paint(PaintKind::model(), "Olive Drab", RGB16(0x5500, 0x5500, 0x3000));
    EXPECT_EQ(paint.extra("fs_number"), "");
    EXPECT_TRUE(paint.extras().empty());

    paint.set_extra("fs_number", "FS34087");
    EXPECT_EQ(paint.extra("fs_number"), "FS34087");
    EXPECT_EQ(paint.extras().size(), 1u);

    paint.set_extra("fs_number", "");
    EXPECT_TRUE(paint.extras().empty());

    EXPECT_THROW(paint.extra("pigments"), PaintError);
    EXPECT_THROW(paint.set_extra("pigments", "PR101"), PaintError);
    EXPECT_THROW(Paint(PaintKind::model(), "X", RGB16::black(), Characteristics(PaintKind::model().schema()),
                       {{"notes", "nope"}}),
                 PaintError);
}

TEST(PaintsPaint, definition)
{
    Paint red(PaintKind::model(), "Red", RGB16::red());
    EXPECT_EQ(red.definition(),
              R"(ModelPaint(name="Red", rgb=RGB(0xFFFF, 0x0, 0x0), transparency="O", finish="F", fs_number=""))");

    Paint paint(PaintKind::art(), R"(Payne's "Grey")", RGB16(0x3A00, 0x8000, 0xABCD));
    paint.set_characteristic("transparency", "ST");
    paint.set_characteristic("permanence", "B");
    paint.set_extra("pigments", R"(PB29\PBk9)");
    EXPECT_EQ(paint.definition(), R"(ArtPaint(name="Payne's \"Grey\"", rgb=RGB(0x3A00, 0x8000, 0xABCD), )"
                                  R"(transparency="ST", permanence="B", pigments="PB29\\PBk9"))");
}

TEST(PaintsPaint, printer)
{
    RecordPrinter printer("Thing");
    printer.field("a", "1").field("rgb", RGB16(0x10, 0, 0xFFFF));
    EXPECT_EQ(static_cast<std::string>(printer), R"(Thing(a="1", rgb=RGB(0x10, 0x0, 0xFFFF)))");
    // Closed printers ignore further fields
    printer.field("b", "2");
    EXPECT_EQ(static_cast<std::string>(printer), R"(Thing(a="1", rgb=RGB(0x10, 0x0, 0xFFFF)))");

    EXPECT_EQ(RecordPrinter::escape(R"(a"b\c)"), R"(a\"b\\c)");
}

TEST(PaintsPaint, equality)
{
    Paint a(PaintKind::model(), "Red", RGB16::red());
    Paint b(PaintKind::model(), "Red", RGB16::red());
    EXPECT_EQ(a, b);

    b.set_extra("fs_number", "FS11136");
    EXPECT_NE(a, b);

    Paint c(PaintKind::art(), "Red", RGB16::red());
    EXPECT_NE(a, c);

    Paint d(PaintKind::model(), "Red", RGB16(0xFFFF, 0x1, 0x0));
    EXPECT_NE(a, d);
}

} // namespace

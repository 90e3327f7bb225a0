// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for mixing paints
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "paints/mixture.h"

#include <gtest/gtest.h>

#include "paints/errors.h"
#include "test-utils.h"

using namespace Paintmix::Paints;

namespace {

std::shared_ptr<Paint const> model_paint(std::string name, RGB16 const &rgb, std::string transparency = "O")
{
    auto paint = Paint(PaintKind::model(), std::move(name), rgb);
    paint.set_characteristic("transparency", transparency);
    return std::make_shared<Paint const>(std::move(paint));
}

class PaintsMixture : public ::testing::Test
{
protected:
    std::shared_ptr<Paint const> red = model_paint("Red", RGB16::red());
    std::shared_ptr<Paint const> white = model_paint("White", RGB16::white(), "T");
    std::shared_ptr<Paint const> blue = model_paint("Blue", RGB16::blue());
};

TEST_F(PaintsMixture, singlePaint)
{
    Mixture mixture({{red, 3}});
    EXPECT_EQ(mixture.rgb(), RGB16::red());
    EXPECT_EQ(mixture.total_parts(), 3u);
    EXPECT_EQ(&mixture.kind(), &PaintKind::model());
    EXPECT_EQ(mixture.characteristics(), red->characteristics());
}

TEST_F(PaintsMixture, equalParts)
{
    Mixture mixture({{red, 1}, {white, 1}});
    EXPECT_EQ(mixture.rgb(), RGB16(0xFFFF, 0x8000, 0x8000));
    EXPECT_TRUE(IsNear(mixture.value(), 2.0 / 3.0, 1e-5));
    EXPECT_EQ(mixture.characteristics().get("transparency").value(), 2.5);
    EXPECT_EQ(mixture.characteristics().get("transparency").abbrev(), "SO");
    EXPECT_EQ(mixture.characteristics().get("finish").abbrev(), "F");
}

TEST_F(PaintsMixture, weightedParts)
{
    Mixture mixture({{red, 1}, {blue, 3}});
    EXPECT_EQ(mixture.rgb(), RGB16(0x4000, 0x0, 0xBFFF));
    EXPECT_EQ(mixture.total_parts(), 4u);
}

TEST_F(PaintsMixture, blobOrder)
{
    Mixture mixture({{red, 1}, {white, 0}, {blue, 3}, {white, 2}});
    auto const &blobs = mixture.blobs();
    ASSERT_EQ(blobs.size(), 3u);
    EXPECT_EQ(blobs[0].paint, blue);
    EXPECT_EQ(blobs[1].paint, white);
    EXPECT_EQ(blobs[2].paint, red);
    EXPECT_EQ(mixture.total_parts(), 6u);
}

TEST_F(PaintsMixture, empty)
{
    EXPECT_THROW(Mixture(std::vector<Blob>{}), EmptyMixture);
    EXPECT_THROW(Mixture({{red, 0}, {blue, 0}}), EmptyMixture);
    try {
        Mixture mixture(std::vector<Blob>{});
        FAIL() << "no error";
    } catch (EmptyMixture const &e) {
        EXPECT_STREQ(e.what(), "Empty Mixture");
    }
}

TEST_F(PaintsMixture, badBlobs)
{
    EXPECT_THROW(Mixture({{nullptr, 1}}), PaintError);

    auto art = std::make_shared<Paint const>(PaintKind::art(), "Red", RGB16::red());
    EXPECT_THROW(Mixture({{red, 1}, {art, 1}}), PaintError);
}

TEST_F(PaintsMixture, containsPaint)
{
    Mixture mixture({{red, 1}, {white, 1}});
    EXPECT_TRUE(mixture.contains_paint(*red));
    EXPECT_TRUE(mixture.contains_paint(Paint(PaintKind::model(), "Red", RGB16::red())));
    EXPECT_FALSE(mixture.contains_paint(*blue));
}

TEST_F(PaintsMixture, containsPaintFromItsOwnCollection)
{
    auto tamiya_red = *red;
    tamiya_red.set_source({"Tamiya", "Acrylics"});
    auto humbrol_red = *red;
    humbrol_red.set_source({"Humbrol", "Enamels"});

    Mixture mixture({{std::make_shared<Paint const>(tamiya_red), 1}, {white, 1}});
    EXPECT_TRUE(mixture.contains_paint(tamiya_red));
    EXPECT_FALSE(mixture.contains_paint(humbrol_red));
    EXPECT_FALSE(mixture.contains_paint(*red));
}

TEST_F(PaintsMixture, mixedPaint)
{
    MixedPaint pink({{red, 1}, {white, 1}}, "Pink", "for the roses");
    EXPECT_EQ(pink.name(), "Pink");
    EXPECT_EQ(pink.notes(), "for the roses");
    EXPECT_EQ(pink.rgb(), RGB16(0xFFFF, 0x8000, 0x8000));
    pink.set_notes("");
    EXPECT_EQ(pink.notes(), "");

    EXPECT_THROW(MixedPaint({}, "Nothing"), EmptyMixture);
}

TEST_F(PaintsMixture, simplifyParts)
{
    auto blobs = simplify_parts({{red, 2}, {white, 4}, {blue, 6}});
    EXPECT_EQ(blobs[0].parts, 1u);
    EXPECT_EQ(blobs[1].parts, 2u);
    EXPECT_EQ(blobs[2].parts, 3u);

    blobs = simplify_parts({{red, 3}, {white, 5}});
    EXPECT_EQ(blobs[0].parts, 3u);
    EXPECT_EQ(blobs[1].parts, 5u);

    blobs = simplify_parts({{red, 4}, {white, 0}});
    EXPECT_EQ(blobs[0].parts, 1u);
    EXPECT_EQ(blobs[1].parts, 0u);
}

} // namespace

// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for paint collections and their definition text
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "paints/collection.h"

#include <algorithm>
#include <gtest/gtest.h>

#include "paints/errors.h"

using namespace Paintmix::Paints;

namespace {

auto const &series = CollectionKind::series();
auto const &standard = CollectionKind::standard();
auto const &model = PaintKind::model();

std::string parse_error(std::string const &text, CollectionKind const &kind = series)
{
    try {
        PaintCollection::from_definition(text, kind, model);
    } catch (ParseError const &e) {
        return e.what();
    }
    return "no error";
}

class PaintsCollection : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Paint red(model, "Flat Red", RGB16(0xFFFF, 0x0, 0x0));
        red.set_extra("fs_number", "FS31136");
        Paint blue(model, "Gloss Blue", RGB16(0x0, 0x2000, 0xC000));
        blue.set_characteristic("finish", "G");
        blue.set_characteristic("transparency", "ST");
        collection.add_paint(red);
        collection.add_paint(blue);
    }

    PaintCollection collection{series, model, "Tamiya", "Acrylics"};
};

TEST_F(PaintsCollection, contents)
{
    EXPECT_EQ(collection.owner(), "Tamiya");
    EXPECT_EQ(collection.name(), "Acrylics");
    EXPECT_EQ(collection.size(), 2u);
    EXPECT_EQ(collection.names(), (std::vector<std::string>{"Flat Red", "Gloss Blue"}));

    auto blue = collection.find("Gloss Blue");
    ASSERT_TRUE(blue);
    EXPECT_EQ(blue->characteristic("finish").abbrev(), "G");
    EXPECT_EQ(collection.find("Gloss Green"), nullptr);

    auto paints = collection.paints();
    ASSERT_EQ(paints.size(), 2u);
    EXPECT_EQ(paints[0]->name(), "Flat Red");
    EXPECT_EQ(paints[1]->name(), "Gloss Blue");
}

TEST_F(PaintsCollection, paintsKnowTheirCollection)
{
    auto red = collection.find("Flat Red");
    ASSERT_TRUE(red->source());
    EXPECT_EQ(red->source()->owner, "Tamiya");
    EXPECT_EQ(red->source()->collection, "Acrylics");
    EXPECT_EQ(red->label(), "Flat Red (Tamiya: Acrylics)");
    EXPECT_EQ(Paint(model, "Flat Red", RGB16::red()).label(), "Flat Red");

    PaintCollection enamels(series, model, "Humbrol", "Enamels");
    enamels.add_paint(*red);
    EXPECT_EQ(enamels.find("Flat Red")->label(), "Flat Red (Humbrol: Enamels)");
    EXPECT_FALSE(*enamels.find("Flat Red") == *red);
}

TEST_F(PaintsCollection, addReplacesByName)
{
    collection.add_paint(Paint(model, "Flat Red", RGB16(0xE000, 0x1000, 0x0)));
    EXPECT_EQ(collection.size(), 2u);
    EXPECT_EQ(collection.find("Flat Red")->rgb(), RGB16(0xE000, 0x1000, 0x0));

    EXPECT_THROW(collection.add_paint(Paint(PaintKind::art(), "Ochre", RGB16::black())), PaintError);
    EXPECT_EQ(collection.size(), 2u);
}

TEST_F(PaintsCollection, definitionText)
{
    EXPECT_EQ(collection.definition_text(),
              "Manufacturer: Tamiya\n"
              "Series: Acrylics\n"
              R"(ModelPaint(name="Flat Red", rgb=RGB(0xFFFF, 0x0, 0x0), transparency="O", finish="F", fs_number="FS31136"))"
              "\n"
              R"(ModelPaint(name="Gloss Blue", rgb=RGB(0x0, 0x2000, 0xC000), transparency="ST", finish="G", fs_number=""))"
              "\n");
}

TEST_F(PaintsCollection, readBack)
{
    auto copy = PaintCollection::from_definition(collection.definition_text(), series, model);
    EXPECT_TRUE(copy == collection);

    PaintCollection empty(standard, model, "Federal", "FS 595");
    EXPECT_TRUE(PaintCollection::from_definition(empty.definition_text(), standard, model) == empty);
}

TEST_F(PaintsCollection, equality)
{
    PaintCollection other(series, model, "Tamiya", "Acrylics");
    EXPECT_FALSE(other == collection);
    other.add_paint(*collection.find("Flat Red"));
    other.add_paint(*collection.find("Gloss Blue"));
    EXPECT_TRUE(other == collection);

    auto changed = *collection.find("Gloss Blue");
    changed.set_characteristic("finish", "SG");
    other.add_paint(changed);
    EXPECT_FALSE(other == collection);

    PaintCollection renamed(series, model, "Tamiya", "Enamels");
    EXPECT_FALSE(renamed == PaintCollection(series, model, "Tamiya", "Acrylics"));
    EXPECT_FALSE(PaintCollection(standard, model, "Tamiya", "Acrylics") ==
                 PaintCollection(series, model, "Tamiya", "Acrylics"));
}

TEST_F(PaintsCollection, ordering)
{
    std::vector<PaintCollection> all = {
        PaintCollection(series, model, "Vallejo", "Model Color"),
        PaintCollection(series, model, "Tamiya", "Enamels"),
        collection,
    };
    std::sort(all.begin(), all.end());
    EXPECT_EQ(all[0].name(), "Acrylics");
    EXPECT_EQ(all[1].name(), "Enamels");
    EXPECT_EQ(all[2].owner(), "Vallejo");
}

TEST(PaintsCollectionHeader, eitherOrder)
{
    auto text = "Series: Acrylics\n"
                "Manufacturer: Tamiya\n";
    auto collection = PaintCollection::from_definition(text, series, model);
    EXPECT_EQ(collection.owner(), "Tamiya");
    EXPECT_EQ(collection.name(), "Acrylics");
    EXPECT_EQ(collection.size(), 0u);
}

TEST(PaintsCollectionHeader, whitespace)
{
    auto text = "Manufacturer:   Humbrol Ltd  \r\n"
                "Series:\tEnamels\r\n"
                "\r\n"
                R"(ModelPaint(name="Red", rgb=RGB(0xFFFF, 0x0, 0x0), transparency="O", finish="F", fs_number=""))"
                "\r\n";
    auto collection = PaintCollection::from_definition(text, series, model);
    EXPECT_EQ(collection.owner(), "Humbrol Ltd");
    EXPECT_EQ(collection.name(), "Enamels");
    ASSERT_EQ(collection.size(), 1u);
    EXPECT_EQ(collection.paints()[0]->rgb(), RGB16::red());
}

TEST(PaintsCollectionHeader, standard)
{
    auto text = "Sponsor: Federal\n"
                "Standard: FS 595\n"
                R"(NamedColour(name="FS 11136", rgb=RGB16(48059, 8738, 8738), transparency="O", finish="F"))"
                "\n";
    auto collection = PaintCollection::from_definition(text, standard, model);
    EXPECT_EQ(collection.owner(), "Federal");
    EXPECT_EQ(collection.name(), "FS 595");
    ASSERT_TRUE(collection.find("FS 11136"));
    EXPECT_EQ(collection.find("FS 11136")->rgb(), RGB16(48059, 8738, 8738));
}

TEST(PaintsCollectionHeader, errors)
{
    EXPECT_EQ(parse_error(""), "Too few lines: 0.");
    EXPECT_EQ(parse_error("Manufacturer: Tamiya"), "Too few lines: 1.");
    EXPECT_EQ(parse_error("Maker: Tamiya\nRange: Acrylics\n"), "Neither manufacturer nor series name found.");
    EXPECT_EQ(parse_error("Series: Acrylics\nMaker: Tamiya\n"), "Manufacturer not found.");
    EXPECT_EQ(parse_error("Manufacturer: Tamiya\nSeries:\n"), "Series name not found.");
    EXPECT_EQ(parse_error("Manufacturer:Tamiya\nSeries: Acrylics\n"), "Manufacturer not found.");

    EXPECT_EQ(parse_error("Manufacturer: Tamiya\nSeries: Acrylics\n", standard),
              "Neither sponsor nor standard name found.");
    EXPECT_EQ(parse_error("Sponsor: Federal\nSeries: Acrylics\n", standard), "Standard name not found.");
    EXPECT_EQ(parse_error("Standard: FS 595\nfoo\n", standard), "Sponsor not found.");
}

TEST(PaintsCollectionHeader, badRecord)
{
    auto text = "Manufacturer: Tamiya\n"
                "Series: Acrylics\n"
                R"(ModelPaint(name="Red", rgb=RGB(0xFFFF, 0x0, 0x0), transparency="Q", finish="F"))"
                "\n";
    EXPECT_EQ(parse_error(text),
              R"(Unrecognized characteristic value: Q: ModelPaint(name="Red", rgb=RGB(0xFFFF, 0x0, 0x0), transparency="Q", finish="F"))");
}

} // namespace

// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for paint characteristics
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "paints/characteristic.h"

#include <cmath>
#include <gtest/gtest.h>

#include "paints/errors.h"
#include "test-utils.h"

using namespace Paintmix::Paints;

namespace {

auto const &transparency = CharacteristicType::transparency();
auto const &finish = CharacteristicType::finish();
auto const &permanence = CharacteristicType::permanence();

TEST(PaintsCharacteristic, types)
{
    EXPECT_EQ(transparency.name(), "transparency");
    EXPECT_EQ(transparency.ratings().size(), 5u);
    EXPECT_EQ(transparency.min_value(), 1.0);
    EXPECT_EQ(transparency.max_value(), 5.0);
    EXPECT_EQ(finish.ratings().size(), 4u);
    EXPECT_EQ(permanence.default_value(), 3.0);

    EXPECT_EQ(CharacteristicType::find("finish"), &finish);
    EXPECT_EQ(CharacteristicType::find("permanence"), &permanence);
    EXPECT_EQ(CharacteristicType::find("colour"), nullptr);
}

TEST(PaintsCharacteristic, defaults)
{
    EXPECT_EQ(Characteristic(transparency).abbrev(), "O");
    EXPECT_EQ(Characteristic(finish).abbrev(), "F");
    EXPECT_EQ(Characteristic(permanence).abbrev(), "A");
}

TEST(PaintsCharacteristic, fromLabel)
{
    EXPECT_EQ(Characteristic(transparency, std::string("ST")).value(), 3.0);
    EXPECT_EQ(Characteristic(transparency, std::string("Transparent")).value(), 4.0);
    EXPECT_EQ(Characteristic(finish, std::string("SG")).description(), "Semi-gloss");
    EXPECT_EQ(Characteristic(permanence, std::string("AA")).description(), "Extremely Permanent");
    EXPECT_EQ(Characteristic(transparency, std::string("2.5")).value(), 2.5);

    EXPECT_THROW(Characteristic(transparency, std::string("X")), InvalidCharacteristic);
    EXPECT_THROW(Characteristic(transparency, std::string("")), InvalidCharacteristic);
    EXPECT_THROW(Characteristic(transparency, std::string("6")), InvalidCharacteristic);
    EXPECT_THROW(Characteristic(finish, std::string("3x")), InvalidCharacteristic);
    EXPECT_THROW(Characteristic(permanence, std::string("O")), InvalidCharacteristic);
}

struct label_case : traced_data
{
    CharacteristicType const *type;
    std::string label;
    double value;
};

class characteristicLabels : public testing::TestWithParam<label_case> {};

TEST_P(characteristicLabels, values)
{
    label_case test = GetParam();
    auto scope = test.enable_scope();
    EXPECT_EQ(Characteristic(*test.type, test.label).value(), test.value);
}

INSTANTIATE_TEST_SUITE_P(PaintsCharacteristic, characteristicLabels, testing::Values(
    _P(label_case, &CharacteristicType::transparency(), "O", 1.0),
    _P(label_case, &CharacteristicType::transparency(), "Semi-opaque", 2.0),
    _P(label_case, &CharacteristicType::transparency(), "C", 5.0),
    _P(label_case, &CharacteristicType::transparency(), "4", 4.0),
    _P(label_case, &CharacteristicType::finish(), "G", 4.0),
    _P(label_case, &CharacteristicType::finish(), "Semi-flat", 2.0),
    _P(label_case, &CharacteristicType::finish(), "1.25", 1.25),
    _P(label_case, &CharacteristicType::permanence(), "B", 2.0),
    _P(label_case, &CharacteristicType::permanence(), "Fugitive", 1.0)
));

TEST(PaintsCharacteristic, fromValue)
{
    EXPECT_EQ(Characteristic(finish, 4.0).abbrev(), "G");
    EXPECT_THROW(Characteristic(finish, 0.5), InvalidCharacteristic);
    EXPECT_THROW(Characteristic(finish, 4.5), InvalidCharacteristic);
    EXPECT_THROW(Characteristic(finish, NAN), InvalidCharacteristic);
}

TEST(PaintsCharacteristic, displayRounds)
{
    EXPECT_EQ(Characteristic(transparency, 2.4).abbrev(), "SO");
    EXPECT_EQ(Characteristic(transparency, 2.6).abbrev(), "ST");
    // halves go to the even rating
    EXPECT_EQ(Characteristic(transparency, 2.5).abbrev(), "SO");
    EXPECT_EQ(Characteristic(transparency, 3.5).abbrev(), "T");
    EXPECT_EQ(Characteristic(transparency, 4.5).description(), "Transparent");
    EXPECT_THROW(Characteristic::unchecked(transparency, 7.0).abbrev(), InvalidCharacteristic);
}

TEST(PaintsCharacteristic, alpha)
{
    EXPECT_EQ(Characteristic(transparency, std::string("O")).to_alpha(), 1.0);
    EXPECT_EQ(Characteristic(transparency, std::string("ST")).to_alpha(), 0.5);
    EXPECT_EQ(Characteristic(transparency, std::string("C")).to_alpha(), 0.0);
}

TEST(PaintsCharacteristic, weightedMean)
{
    auto mean = Characteristic(transparency, 1.0) * 1;
    mean += Characteristic(transparency, 4.0) * 3;
    mean /= 4;
    EXPECT_EQ(mean.value(), 3.25);
    EXPECT_EQ(mean.abbrev(), "ST");
}

TEST(PaintsCharacteristic, ordering)
{
    auto opaque = Characteristic(transparency, std::string("O"));
    auto clear = Characteristic(transparency, std::string("C"));
    EXPECT_LT(opaque, clear);
    EXPECT_GT(clear, opaque);
    EXPECT_EQ(opaque, Characteristic(transparency));
    EXPECT_NE(opaque, clear);
}

TEST(PaintsCharacteristic, typesNeverCompareEqual)
{
    auto semi_opaque = Characteristic(transparency, 2.0);
    auto semi_flat = Characteristic(finish, 2.0);
    EXPECT_EQ(semi_opaque.value(), semi_flat.value());
    EXPECT_NE(semi_opaque, semi_flat);
    EXPECT_FALSE(semi_opaque < semi_flat);
    EXPECT_FALSE(semi_opaque > semi_flat);
}

TEST(PaintsCharacteristic, set)
{
    Characteristics set({&transparency, &finish});
    EXPECT_EQ(set.size(), 2u);
    EXPECT_TRUE(set.has("finish"));
    EXPECT_FALSE(set.has("permanence"));
    EXPECT_EQ(set.get("transparency").abbrev(), "O");
    EXPECT_THROW(set.get("permanence"), InvalidCharacteristic);

    set.set("finish", "SG");
    EXPECT_EQ(set.get("finish").abbrev(), "SG");
    set.set(Characteristic(transparency, 5.0));
    EXPECT_EQ(set.get("transparency").abbrev(), "C");
    EXPECT_THROW(set.set("finish", "Shiny"), InvalidCharacteristic);
    EXPECT_THROW(set.set(Characteristic(permanence)), InvalidCharacteristic);

    std::vector<std::string> names;
    for (auto const &item : set) {
        names.emplace_back(item.name());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"transparency", "finish"}));
}

TEST(PaintsCharacteristic, setArithmetic)
{
    Characteristics a({&transparency, &finish});
    Characteristics b({&transparency, &finish});
    b.set("transparency", "T");
    b.set("finish", "G");

    auto sum = a * 1;
    sum += b * 2;
    sum /= 3;
    EXPECT_EQ(sum.get("transparency").value(), 3.0);
    EXPECT_EQ(sum.get("finish").value(), 3.0);
    EXPECT_FALSE(sum == a);
    EXPECT_TRUE(a == Characteristics({&transparency, &finish}));
}

} // namespace

// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Rated paint characteristics which are not related to colour.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "characteristic.h"

#include <algorithm>
#include <cmath>
#include <glibmm/i18n.h>
#include <glibmm/stringutils.h>
#include <glibmm/ustring.h>

#include "paints/errors.h"

namespace Paintmix::Paints {

CharacteristicType::CharacteristicType(std::string name, std::string title, std::vector<Rating> ratings,
                                       double default_value)
    : _name(std::move(name))
    , _title(std::move(title))
    , _ratings(std::move(ratings))
    , _default(default_value)
{
    auto [min, max] = std::minmax_element(_ratings.begin(), _ratings.end(),
                                          [](Rating const &a, Rating const &b) { return a.value < b.value; });
    _min = min->value;
    _max = max->value;
}

/**
 * Find the rating with the given abbreviation or description.
 */
CharacteristicType::Rating const *CharacteristicType::find_label(std::string const &label) const
{
    for (auto const &rating : _ratings) {
        if (label == rating.abbrev || label == rating.description) {
            return &rating;
        }
    }
    return nullptr;
}

/**
 * The rating a value displays as, nullptr if the rounded value has no rating.
 *
 * Halves round to even, a 1:1 mix of ratings 2 and 3 displays as 2.
 */
CharacteristicType::Rating const *CharacteristicType::nearest(double value) const
{
    double rounded = std::nearbyint(value);
    for (auto const &rating : _ratings) {
        if (rating.value == rounded) {
            return &rating;
        }
    }
    return nullptr;
}

CharacteristicType const &CharacteristicType::transparency()
{
    static CharacteristicType const type("transparency", _("Transparency"),
                                         {
                                             {"O", _("Opaque"), 1.0},
                                             {"SO", _("Semi-opaque"), 2.0},
                                             {"ST", _("Semi-transparent"), 3.0},
                                             {"T", _("Transparent"), 4.0},
                                             {"C", _("Clear"), 5.0},
                                         },
                                         1.0);
    return type;
}

CharacteristicType const &CharacteristicType::finish()
{
    static CharacteristicType const type("finish", _("Finish"),
                                         {
                                             {"G", _("Gloss"), 4.0},
                                             {"SG", _("Semi-gloss"), 3.0},
                                             {"SF", _("Semi-flat"), 2.0},
                                             {"F", _("Flat"), 1.0},
                                         },
                                         1.0);
    return type;
}

CharacteristicType const &CharacteristicType::permanence()
{
    static CharacteristicType const type("permanence", _("Permanence"),
                                         {
                                             {"AA", _("Extremely Permanent"), 4.0},
                                             {"A", _("Permanent"), 3.0},
                                             {"B", _("Moderately Durable"), 2.0},
                                             {"C", _("Fugitive"), 1.0},
                                         },
                                         3.0);
    return type;
}

/**
 * Look up a characteristic type by its field name, nullptr if there is none.
 */
CharacteristicType const *CharacteristicType::find(std::string const &name)
{
    for (auto type : {&transparency(), &finish(), &permanence()}) {
        if (type->name() == name) {
            return type;
        }
    }
    return nullptr;
}

Characteristic::Characteristic(CharacteristicType const &type)
    : _type(&type)
    , _value(type.default_value())
{}

Characteristic::Characteristic(CharacteristicType const &type, double value)
    : _type(&type)
    , _value(value)
{
    if (!(value >= type.min_value() && value <= type.max_value())) {
        throw InvalidCharacteristic(
            Glib::ustring::compose(_("Invalid %1 value: %2"), type.name(), Glib::ustring::format(value)));
    }
}

/**
 * Build a characteristic from an abbreviation, a description or a number in the rating range.
 */
Characteristic::Characteristic(CharacteristicType const &type, std::string const &label)
    : _type(&type)
    , _value(type.default_value())
{
    if (auto rating = type.find_label(label)) {
        _value = rating->value;
        return;
    }
    std::string::size_type end = 0;
    double value = 0.0;
    try {
        value = Glib::Ascii::strtod(label, end);
    } catch (std::exception const &) {
        end = 0;
    }
    if (label.empty() || end != label.size() || !(value >= type.min_value() && value <= type.max_value())) {
        throw InvalidCharacteristic(Glib::ustring::compose(_("Unrecognized characteristic value: %1"), label));
    }
    _value = value;
}

Characteristic Characteristic::unchecked(CharacteristicType const &type, double value)
{
    Characteristic result(type);
    result._value = value;
    return result;
}

std::string Characteristic::abbrev() const
{
    if (auto rating = _type->nearest(_value)) {
        return rating->abbrev;
    }
    throw InvalidCharacteristic(Glib::ustring::compose(_("Invalid characteristic: %1"), Glib::ustring::format(_value)));
}

std::string Characteristic::description() const
{
    if (auto rating = _type->nearest(_value)) {
        return rating->description;
    }
    throw InvalidCharacteristic(Glib::ustring::compose(_("Invalid characteristic: %1"), Glib::ustring::format(_value)));
}

Characteristic Characteristic::operator*(double multiplier) const
{
    return unchecked(*_type, _value * multiplier);
}

Characteristic &Characteristic::operator+=(Characteristic const &other)
{
    _value += other._value;
    return *this;
}

Characteristic &Characteristic::operator/=(double divisor)
{
    _value /= divisor;
    return *this;
}

Characteristics::Characteristics(Schema const &schema)
{
    for (auto type : schema) {
        _items.emplace_back(*type);
    }
}

bool Characteristics::has(std::string const &name) const
{
    return std::any_of(_items.begin(), _items.end(), [&](auto const &item) { return item.name() == name; });
}

Characteristic const &Characteristics::get(std::string const &name) const
{
    for (auto const &item : _items) {
        if (item.name() == name) {
            return item;
        }
    }
    throw InvalidCharacteristic(Glib::ustring::compose(_("Unknown characteristic: %1"), name));
}

Characteristic &Characteristics::_get(std::string const &name)
{
    return const_cast<Characteristic &>(static_cast<Characteristics const &>(*this).get(name));
}

void Characteristics::set(Characteristic const &characteristic)
{
    _get(characteristic.name()) = characteristic;
}

void Characteristics::set(std::string const &name, std::string const &label)
{
    auto &item = _get(name);
    item = Characteristic(item.type(), label);
}

Characteristics Characteristics::operator*(double multiplier) const
{
    Characteristics result = *this;
    for (auto &item : result._items) {
        item = item * multiplier;
    }
    return result;
}

/**
 * Add the values of another set with the same schema.
 */
Characteristics &Characteristics::operator+=(Characteristics const &other)
{
    for (auto &item : _items) {
        item += other.get(item.name());
    }
    return *this;
}

Characteristics &Characteristics::operator/=(double divisor)
{
    for (auto &item : _items) {
        item /= divisor;
    }
    return *this;
}

bool Characteristics::operator==(Characteristics const &other) const
{
    if (_items.size() != other._items.size()) {
        return false;
    }
    for (size_t i = 0; i < _items.size(); i++) {
        if (_items[i].name() != other._items[i].name() || _items[i] != other._items[i]) {
            return false;
        }
    }
    return true;
}

} // namespace Paintmix::Paints

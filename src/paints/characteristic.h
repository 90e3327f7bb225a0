// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Rated paint characteristics which are not related to colour.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PAINTS_CHARACTERISTIC_H
#define SEEN_PAINTS_CHARACTERISTIC_H

#include <compare>
#include <string>
#include <vector>

namespace Paintmix::Paints {

/**
 * A kind of characteristic, such as transparency, with its small set of named ratings.
 */
class CharacteristicType
{
public:
    struct Rating
    {
        std::string abbrev;
        std::string description;
        double value;
    };

    CharacteristicType(std::string name, std::string title, std::vector<Rating> ratings, double default_value);
    CharacteristicType(CharacteristicType const &) = delete;

    std::string const &name() const { return _name; }
    std::string const &title() const { return _title; }
    std::vector<Rating> const &ratings() const { return _ratings; }
    double default_value() const { return _default; }
    double min_value() const { return _min; }
    double max_value() const { return _max; }

    Rating const *find_label(std::string const &label) const;
    Rating const *nearest(double value) const;

    static CharacteristicType const &transparency();
    static CharacteristicType const &finish();
    static CharacteristicType const &permanence();
    static CharacteristicType const *find(std::string const &name);

private:
    std::string _name;
    std::string _title;
    std::vector<Rating> _ratings;
    double _default;
    double _min;
    double _max;
};

/**
 * A characteristic value. Construction checks the value against the ratings, arithmetic
 * for weighted averaging does not, and display rounds to the nearest rating.
 */
class Characteristic
{
public:
    explicit Characteristic(CharacteristicType const &type);
    Characteristic(CharacteristicType const &type, double value);
    Characteristic(CharacteristicType const &type, std::string const &label);

    static Characteristic unchecked(CharacteristicType const &type, double value);

    CharacteristicType const &type() const { return *_type; }
    std::string const &name() const { return _type->name(); }
    double value() const { return _value; }

    std::string abbrev() const;
    std::string description() const;

    /// Alpha of a transparency, opaque is 1.0 and clear is 0.0.
    double to_alpha() const { return (5.0 - _value) / 4.0; }

    Characteristic operator*(double multiplier) const;
    Characteristic &operator+=(Characteristic const &other);
    Characteristic &operator/=(double divisor);

    bool operator==(Characteristic const &other) const { return _type == other._type && _value == other._value; }
    std::partial_ordering operator<=>(Characteristic const &other) const
    {
        if (_type != other._type) {
            return std::partial_ordering::unordered;
        }
        return _value <=> other._value;
    }

private:
    CharacteristicType const *_type;
    double _value;
};

/**
 * The characteristics of one paint, one of each type in the order of its schema.
 */
class Characteristics
{
public:
    using Schema = std::vector<CharacteristicType const *>;

    explicit Characteristics(Schema const &schema);

    std::vector<Characteristic>::const_iterator begin() const { return _items.begin(); }
    std::vector<Characteristic>::const_iterator end() const { return _items.end(); }
    size_t size() const { return _items.size(); }

    Characteristic const &get(std::string const &name) const;
    bool has(std::string const &name) const;
    void set(Characteristic const &characteristic);
    void set(std::string const &name, std::string const &label);

    Characteristics operator*(double multiplier) const;
    Characteristics &operator+=(Characteristics const &other);
    Characteristics &operator/=(double divisor);

    bool operator==(Characteristics const &other) const;

private:
    Characteristic &_get(std::string const &name);

    std::vector<Characteristic> _items;
};

} // namespace Paintmix::Paints

#endif // SEEN_PAINTS_CHARACTERISTIC_H

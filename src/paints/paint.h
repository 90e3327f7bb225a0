// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Named paints with a colour, characteristics and free text extras.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PAINTS_PAINT_H
#define SEEN_PAINTS_PAINT_H

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "colors/hcv.h"
#include "colors/rgb.h"
#include "paints/characteristic.h"

namespace Paintmix::Paints {

using RGB16 = Colors::RGB<Colors::BPC16>;
using PaintColour = Colors::HCVW<Colors::BPC16>;

/**
 * What sort of paint a collection holds: which characteristics it is rated by and which
 * free text fields it carries.
 */
class PaintKind
{
public:
    struct Extra
    {
        std::string name;
        std::string label;
    };

    PaintKind(std::string name, Characteristics::Schema schema, std::vector<Extra> extras, bool has_warmth);
    PaintKind(PaintKind const &) = delete;

    std::string const &name() const { return _name; }
    Characteristics::Schema const &schema() const { return _schema; }
    std::vector<Extra> const &extras() const { return _extras; }
    bool has_extra(std::string const &name) const;
    bool has_warmth() const { return _has_warmth; }

    bool operator==(PaintKind const &other) const { return this == &other; }

    static PaintKind const &model();
    static PaintKind const &art();
    static PaintKind const *find(std::string const &name);

private:
    std::string _name;
    Characteristics::Schema _schema;
    std::vector<Extra> _extras;
    bool _has_warmth;
};

class Paint
{
public:
    using Extras = std::map<std::string, std::string>;

    /// The collection a paint is listed in, paints of the same name in two collections differ.
    struct Source
    {
        std::string owner;
        std::string collection;

        bool operator==(Source const &other) const = default;
    };

    Paint(PaintKind const &kind, std::string name, RGB16 const &rgb);
    Paint(PaintKind const &kind, std::string name, RGB16 const &rgb, Characteristics characteristics,
          Extras extras = {});

    PaintKind const &kind() const { return *_kind; }
    std::string const &name() const { return _name; }

    PaintColour const &colour() const { return _colour; }
    RGB16 const &rgb() const { return _colour.rgb(); }
    double value() const { return _colour.value(); }
    double chroma() const { return _colour.chroma(); }
    Colors::Hue<Colors::BPC16> const &hue() const { return _colour.hue(); }
    double warmth() const { return _colour.warmth(); }
    void set_rgb(RGB16 const &rgb) { _colour = PaintColour(rgb); }

    Characteristics const &characteristics() const { return _characteristics; }
    Characteristic const &characteristic(std::string const &name) const { return _characteristics.get(name); }
    void set_characteristic(std::string const &name, std::string const &label);

    Extras const &extras() const { return _extras; }
    std::string extra(std::string const &name) const;
    void set_extra(std::string const &name, std::string text);

    std::optional<Source> const &source() const { return _source; }
    void set_source(Source source) { _source = std::move(source); }
    std::string label() const;

    std::string definition() const;

    bool operator==(Paint const &other) const;

private:
    PaintKind const *_kind;
    std::string _name;
    PaintColour _colour;
    Characteristics _characteristics;
    Extras _extras;
    std::optional<Source> _source;
};

} // namespace Paintmix::Paints

#endif // SEEN_PAINTS_PAINT_H

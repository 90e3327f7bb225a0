// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Named paints with a colour, characteristics and free text extras.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "paint.h"

#include <algorithm>
#include <glibmm/i18n.h>
#include <glibmm/ustring.h>

#include "paints/errors.h"
#include "paints/record-printer.h"

namespace Paintmix::Paints {

PaintKind::PaintKind(std::string name, Characteristics::Schema schema, std::vector<Extra> extras, bool has_warmth)
    : _name(std::move(name))
    , _schema(std::move(schema))
    , _extras(std::move(extras))
    , _has_warmth(has_warmth)
{}

bool PaintKind::has_extra(std::string const &name) const
{
    return std::any_of(_extras.begin(), _extras.end(), [&](Extra const &extra) { return extra.name == name; });
}

/**
 * Paints for scale models, matched against federal standard colours.
 */
PaintKind const &PaintKind::model()
{
    static PaintKind const kind("ModelPaint",
                                {&CharacteristicType::transparency(), &CharacteristicType::finish()},
                                {{"fs_number", _("FS Number:")}}, false);
    return kind;
}

/**
 * Artists' paints, rated for light fastness.
 */
PaintKind const &PaintKind::art()
{
    static PaintKind const kind("ArtPaint",
                                {&CharacteristicType::transparency(), &CharacteristicType::permanence()},
                                {{"pigments", _("Pigments:")}}, true);
    return kind;
}

PaintKind const *PaintKind::find(std::string const &name)
{
    for (auto kind : {&model(), &art()}) {
        if (kind->name() == name) {
            return kind;
        }
    }
    return nullptr;
}

Paint::Paint(PaintKind const &kind, std::string name, RGB16 const &rgb)
    : Paint(kind, std::move(name), rgb, Characteristics(kind.schema()))
{}

Paint::Paint(PaintKind const &kind, std::string name, RGB16 const &rgb, Characteristics characteristics,
             Extras extras)
    : _kind(&kind)
    , _name(std::move(name))
    , _colour(rgb)
    , _characteristics(std::move(characteristics))
{
    for (auto const &type : kind.schema()) {
        if (!_characteristics.has(type->name())) {
            throw InvalidCharacteristic(Glib::ustring::compose(_("%1 paints need a %2"), kind.name(), type->name()));
        }
    }
    for (auto &[key, text] : extras) {
        set_extra(key, std::move(text));
    }
}

void Paint::set_characteristic(std::string const &name, std::string const &label)
{
    _characteristics.set(name, label);
}

/**
 * The text of an extra field, empty if it was never set.
 */
std::string Paint::extra(std::string const &name) const
{
    if (!_kind->has_extra(name)) {
        throw PaintError(Glib::ustring::compose(_("%1 has no field %2"), _kind->name(), name));
    }
    auto it = _extras.find(name);
    return it == _extras.end() ? std::string() : it->second;
}

void Paint::set_extra(std::string const &name, std::string text)
{
    if (!_kind->has_extra(name)) {
        throw PaintError(Glib::ustring::compose(_("%1 has no field %2"), _kind->name(), name));
    }
    if (text.empty()) {
        _extras.erase(name);
    } else {
        _extras[name] = std::move(text);
    }
}

/**
 * The record written for this paint in a collection definition.
 */
std::string Paint::definition() const
{
    RecordPrinter printer(_kind->name());
    printer.field("name", _name);
    printer.field("rgb", rgb());
    for (auto const &item : _characteristics) {
        printer.field(item.name(), item.abbrev());
    }
    for (auto const &extra : _kind->extras()) {
        printer.field(extra.name, this->extra(extra.name));
    }
    return printer;
}

/**
 * The name qualified by its collection, "Flat Red (Tamiya: Acrylics)", or the bare name.
 */
std::string Paint::label() const
{
    if (!_source) {
        return _name;
    }
    return _name + " (" + _source->owner + ": " + _source->collection + ")";
}

bool Paint::operator==(Paint const &other) const
{
    return _kind == other._kind && _name == other._name && rgb() == other.rgb() &&
           _characteristics == other._characteristics && _extras == other._extras && _source == other._source;
}

} // namespace Paintmix::Paints

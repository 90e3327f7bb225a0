// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Named collections of paints: a manufacturer's series or a colour standard.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "collection.h"

#include <glibmm/i18n.h>
#include <glibmm/regex.h>
#include <glibmm/ustring.h>
#include <sstream>
#include <tuple>

#include "paints/errors.h"
#include "paints/record-parser.h"

namespace Paintmix::Paints {

// Header labels are part of the file format and are not translated.
CollectionKind const &CollectionKind::series()
{
    static CollectionKind const kind{"Manufacturer", "Series", _("Neither manufacturer nor series name found."),
                                     _("Manufacturer not found."), _("Series name not found.")};
    return kind;
}

CollectionKind const &CollectionKind::standard()
{
    static CollectionKind const kind{"Sponsor", "Standard", _("Neither sponsor nor standard name found."),
                                     _("Sponsor not found."), _("Standard name not found.")};
    return kind;
}

PaintCollection::PaintCollection(CollectionKind const &kind, PaintKind const &paint_kind, std::string owner,
                                 std::string name)
    : _kind(&kind)
    , _paint_kind(&paint_kind)
    , _owner(std::move(owner))
    , _name(std::move(name))
{}

/**
 * Add a paint, replacing any paint of the same name.
 */
void PaintCollection::add_paint(Paint paint)
{
    if (paint.kind() != *_paint_kind) {
        throw PaintError(Glib::ustring::compose(_("Cannot add %1 to a collection of %2"), paint.kind().name(),
                                                _paint_kind->name()));
    }
    paint.set_source({_owner, _name});
    auto name = paint.name();
    _paints[name] = std::make_shared<Paint const>(std::move(paint));
}

std::shared_ptr<Paint const> PaintCollection::find(std::string const &name) const
{
    auto it = _paints.find(name);
    return it == _paints.end() ? nullptr : it->second;
}

std::vector<std::string> PaintCollection::names() const
{
    std::vector<std::string> result;
    result.reserve(_paints.size());
    for (auto const &[name, paint] : _paints) {
        result.emplace_back(name);
    }
    return result;
}

/**
 * All paints sorted by name.
 */
std::vector<std::shared_ptr<Paint const>> PaintCollection::paints() const
{
    std::vector<std::shared_ptr<Paint const>> result;
    result.reserve(_paints.size());
    for (auto const &[name, paint] : _paints) {
        result.emplace_back(paint);
    }
    return result;
}

/**
 * The text of a collection file, the two header lines followed by one record per paint.
 */
std::string PaintCollection::definition_text() const
{
    std::ostringstream oss;
    oss << _kind->owner_label << ": " << _owner << "\n";
    oss << _kind->name_label << ": " << _name << "\n";
    for (auto const &[name, paint] : _paints) {
        oss << paint->definition() << "\n";
    }
    return oss.str();
}

/**
 * Read the text of a collection file. The owner and name headers are the first two lines,
 * in either order, and the paint records in any format known to RecordParsers follow.
 *
 * @throws ParseError if the headers are missing or a record can not be read.
 */
PaintCollection PaintCollection::from_definition(std::string const &text, CollectionKind const &kind,
                                                 PaintKind const &paint_kind)
{
    std::vector<std::string> lines;
    std::istringstream iss(text);
    for (std::string line; std::getline(iss, line);) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.emplace_back(std::move(line));
    }
    if (lines.size() < 2) {
        throw ParseError("", Glib::ustring::compose(_("Too few lines: %1."), lines.size()));
    }

    auto header = [](std::string const &label) {
        return Glib::Regex::create("^" + label + R"re(:\s+(\S.*\S|\S)\s*$)re");
    };
    auto owner_re = header(kind.owner_label);
    auto name_re = header(kind.name_label);

    std::string owner;
    std::string name;
    for (unsigned i = 0; i < 2; i++) {
        Glib::ustring const line = lines[i];
        Glib::MatchInfo match;
        if (owner_re->match(line, match)) {
            owner = match.fetch(1).raw();
        } else if (name_re->match(line, match)) {
            name = match.fetch(1).raw();
        }
    }
    if (owner.empty()) {
        throw ParseError("", name.empty() ? kind.neither_found : kind.owner_not_found);
    }
    if (name.empty()) {
        throw ParseError("", kind.name_not_found);
    }

    PaintCollection collection(kind, paint_kind, owner, name);
    lines.erase(lines.begin(), lines.begin() + 2);
    for (auto &paint : RecordParsers::get().parse(lines, paint_kind)) {
        collection.add_paint(std::move(paint));
    }
    return collection;
}

bool PaintCollection::operator==(PaintCollection const &other) const
{
    if (_kind != other._kind || _paint_kind != other._paint_kind || _owner != other._owner ||
        _name != other._name || _paints.size() != other._paints.size()) {
        return false;
    }
    for (auto const &[name, paint] : _paints) {
        auto theirs = other.find(name);
        if (!theirs || !(*theirs == *paint)) {
            return false;
        }
    }
    return true;
}

bool PaintCollection::operator<(PaintCollection const &other) const
{
    return std::tie(_owner, _name) < std::tie(other._owner, other._name);
}

} // namespace Paintmix::Paints

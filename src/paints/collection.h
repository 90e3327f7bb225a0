// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Named collections of paints: a manufacturer's series or a colour standard.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PAINTS_COLLECTION_H
#define SEEN_PAINTS_COLLECTION_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "paints/paint.h"

namespace Paintmix::Paints {

/**
 * The header labels of a collection definition and the errors reported when they are missing.
 */
struct CollectionKind
{
    std::string owner_label;
    std::string name_label;
    std::string neither_found;
    std::string owner_not_found;
    std::string name_not_found;

    bool operator==(CollectionKind const &other) const { return this == &other; }

    static CollectionKind const &series();
    static CollectionKind const &standard();
};

class PaintCollection
{
public:
    PaintCollection(CollectionKind const &kind, PaintKind const &paint_kind, std::string owner, std::string name);

    CollectionKind const &kind() const { return *_kind; }
    PaintKind const &paint_kind() const { return *_paint_kind; }
    std::string const &owner() const { return _owner; }
    std::string const &name() const { return _name; }

    void add_paint(Paint paint);
    std::shared_ptr<Paint const> find(std::string const &name) const;
    std::vector<std::string> names() const;
    std::vector<std::shared_ptr<Paint const>> paints() const;
    size_t size() const { return _paints.size(); }

    std::string definition_text() const;
    static PaintCollection from_definition(std::string const &text, CollectionKind const &kind,
                                           PaintKind const &paint_kind);

    bool operator==(PaintCollection const &other) const;
    bool operator<(PaintCollection const &other) const;

private:
    CollectionKind const *_kind;
    PaintKind const *_paint_kind;
    std::string _owner;
    std::string _name;
    std::map<std::string, std::shared_ptr<Paint const>> _paints;
};

} // namespace Paintmix::Paints

#endif // SEEN_PAINTS_COLLECTION_H

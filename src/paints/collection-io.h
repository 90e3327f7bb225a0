// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Reading and writing paint collection files.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PAINTS_COLLECTION_IO_H
#define SEEN_PAINTS_COLLECTION_IO_H

#include <optional>
#include <string>
#include <vector>

#include <glibmm/ustring.h>

#include "paints/collection.h"

namespace Paintmix::Paints {

// Try to load a paint collection from the file
struct CollectionResult
{
    std::optional<PaintCollection> collection;
    Glib::ustring error_message;
};

CollectionResult load_collection(std::string const &path, CollectionKind const &kind, PaintKind const &paint_kind);

bool save_collection(std::string const &path, PaintCollection const &collection);

// Collections which fail to load are reported to the log and left out.
std::vector<PaintCollection> load_collections(std::vector<std::string> const &paths, CollectionKind const &kind,
                                              PaintKind const &paint_kind);

} // namespace Paintmix::Paints

#endif // SEEN_PAINTS_COLLECTION_IO_H

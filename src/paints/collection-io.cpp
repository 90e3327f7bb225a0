// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Reading and writing paint collection files.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "collection-io.h"

#include <algorithm>
#include <glib.h>
#include <glibmm/convert.h>
#include <glibmm/fileutils.h>
#include <glibmm/i18n.h>

#include "paints/errors.h"

namespace Paintmix::Paints {

CollectionResult load_collection(std::string const &path, CollectionKind const &kind, PaintKind const &paint_kind)
{
    auto const utf8path = Glib::filename_to_utf8(path);

    auto compose_error = [&] (char const *what) {
        return Glib::ustring::compose(_("Error loading collection %1: %2"), utf8path, what);
    };

    try {
        std::string text = Glib::file_get_contents(path);
        return {PaintCollection::from_definition(text, kind, paint_kind), {}};
    } catch (Glib::Error const &e) {
        return {{}, compose_error(e.what())};
    } catch (PaintError const &e) {
        return {{}, compose_error(e.what())};
    } catch (std::exception const &e) {
        return {{}, compose_error(e.what())};
    }
}

/**
 * Write the definition text of a collection.
 *
 * @returns false, after logging why, if the file could not be written.
 */
bool save_collection(std::string const &path, PaintCollection const &collection)
{
    try {
        Glib::file_set_contents(path, collection.definition_text());
    } catch (Glib::Error const &ex) {
        g_warning("Error saving paint collection: %s", ex.what());
        return false;
    }
    return true;
}

std::vector<PaintCollection> load_collections(std::vector<std::string> const &paths, CollectionKind const &kind,
                                              PaintKind const &paint_kind)
{
    std::vector<PaintCollection> collections;
    for (auto const &path : paths) {
        auto res = load_collection(path, kind, paint_kind);
        if (res.collection) {
            collections.emplace_back(std::move(*res.collection));
        } else {
            g_warning("%s", res.error_message.c_str());
        }
    }

    // Sort by owner, then name.
    std::sort(collections.begin(), collections.end());
    return collections;
}

} // namespace Paintmix::Paints

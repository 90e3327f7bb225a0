// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for reading and writing paint collection files
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "paints/collection-io.h"

#include <glib.h>
#include <glib/gstdio.h>
#include <glibmm/fileutils.h>
#include <glibmm/miscutils.h>
#include <gtest/gtest.h>

using namespace Paintmix::Paints;

namespace {

class PaintsCollectionIO : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dir = Glib::build_filename(Glib::get_tmp_dir(), "paintmix-collection-test-XXXXXX");
        ASSERT_NE(g_mkdtemp(dir.data()), nullptr);

        Paint red(PaintKind::model(), "Red", RGB16::red());
        red.set_extra("fs_number", "FS11136");
        tamiya.add_paint(red);
        tamiya.add_paint(Paint(PaintKind::model(), "Sky", RGB16(0xA000, 0xC000, 0xFFFF)));
    }
    void TearDown() override
    {
        for (auto const &file : files) {
            g_remove(file.c_str());
        }
        g_rmdir(dir.c_str());
    }

    std::string path(std::string const &name)
    {
        files.emplace_back(Glib::build_filename(dir, name));
        return files.back();
    }

    std::string dir;
    std::vector<std::string> files;
    PaintCollection tamiya{CollectionKind::series(), PaintKind::model(), "Tamiya", "Acrylics"};
};

TEST_F(PaintsCollectionIO, saveAndLoad)
{
    auto file = path("tamiya.tsd");
    ASSERT_TRUE(save_collection(file, tamiya));
    EXPECT_EQ(Glib::file_get_contents(file), tamiya.definition_text());

    auto result = load_collection(file, CollectionKind::series(), PaintKind::model());
    ASSERT_TRUE(result.collection.has_value());
    EXPECT_TRUE(result.error_message.empty());
    EXPECT_TRUE(*result.collection == tamiya);
}

TEST_F(PaintsCollectionIO, missingFile)
{
    auto file = path("missing.tsd");
    auto result = load_collection(file, CollectionKind::series(), PaintKind::model());
    EXPECT_FALSE(result.collection.has_value());
    EXPECT_EQ(result.error_message.raw().rfind("Error loading collection " + file + ": ", 0), 0u);
}

TEST_F(PaintsCollectionIO, badContents)
{
    auto file = path("bad.tsd");
    Glib::file_set_contents(file, "Manufacturer: Tamiya\n");
    auto result = load_collection(file, CollectionKind::series(), PaintKind::model());
    EXPECT_FALSE(result.collection.has_value());
    EXPECT_EQ(result.error_message, "Error loading collection " + file + ": Too few lines: 1.");

    Glib::file_set_contents(file, "Manufacturer: Tamiya\nSeries: Acrylics\n");
    result = load_collection(file, CollectionKind::standard(), PaintKind::model());
    EXPECT_EQ(result.error_message, "Error loading collection " + file + ": Neither sponsor nor standard name found.");
}

TEST_F(PaintsCollectionIO, saveFails)
{
    auto file = Glib::build_filename(dir, "no-such-dir", "tamiya.tsd");
    EXPECT_FALSE(save_collection(file, tamiya));
}

TEST_F(PaintsCollectionIO, loadMany)
{
    PaintCollection humbrol(CollectionKind::series(), PaintKind::model(), "Humbrol", "Enamels");
    humbrol.add_paint(Paint(PaintKind::model(), "Matt White", RGB16::white()));

    auto first = path("tamiya.tsd");
    auto second = path("humbrol.tsd");
    auto broken = path("broken.tsd");
    ASSERT_TRUE(save_collection(first, tamiya));
    ASSERT_TRUE(save_collection(second, humbrol));
    Glib::file_set_contents(broken, "nothing useful\n");

    auto collections = load_collections({first, broken, second, path("absent.tsd")}, CollectionKind::series(),
                                        PaintKind::model());
    ASSERT_EQ(collections.size(), 2u);
    EXPECT_EQ(collections[0].owner(), "Humbrol");
    EXPECT_EQ(collections[1].owner(), "Tamiya");
    EXPECT_EQ(collections[1].size(), 2u);
}

} // namespace

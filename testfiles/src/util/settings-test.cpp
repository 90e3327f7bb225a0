// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the key file settings
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "util/settings.h"

#include <glib.h>
#include <glib/gstdio.h>
#include <glibmm/fileutils.h>
#include <glibmm/miscutils.h>
#include <gtest/gtest.h>

using namespace Paintmix::Util;

namespace {

class UtilSettings : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dir = Glib::build_filename(Glib::get_tmp_dir(), "paintmix-settings-test-XXXXXX");
        ASSERT_NE(g_mkdtemp(dir.data()), nullptr);
        filename = Glib::build_filename(dir, "settings.ini");
    }
    void TearDown() override
    {
        g_remove(filename.c_str());
        g_rmdir(dir.c_str());
    }

    std::string dir;
    std::string filename;
    Settings settings;
};

TEST_F(UtilSettings, defaults)
{
    EXPECT_DOUBLE_EQ(settings.value_step(StepSize::Fine), 0.0025);
    EXPECT_DOUBLE_EQ(settings.value_step(StepSize::Normal), 0.005);
    EXPECT_DOUBLE_EQ(settings.chroma_step(StepSize::Coarse), 0.01);
    EXPECT_DOUBLE_EQ(settings.hue_step(StepSize::Normal), M_PI / 100);
    EXPECT_DOUBLE_EQ(settings.reference_hue_degrees(), 90.0);
    EXPECT_DOUBLE_EQ(settings.reference_hue(), M_PI / 2);
    EXPECT_FALSE(settings.red_to_yellow_clockwise());
    EXPECT_TRUE(settings.series_files().empty());
}

TEST_F(UtilSettings, signalOnChange)
{
    int changes = 0;
    auto connection = settings.signal_changed.connect([&]() { changes++; });
    settings.set_red_to_yellow_clockwise(true);
    settings.set_hue_step_divisors({100.0, 50.0, 25.0});
    EXPECT_EQ(changes, 2);
    EXPECT_DOUBLE_EQ(settings.hue_step(StepSize::Fine), M_PI / 100);
    connection.disconnect();
}

TEST_F(UtilSettings, saveAndLoad)
{
    settings.set_chroma_steps({0.01, 0.02, 0.04});
    settings.set_reference_hue_degrees(45.0);
    settings.set_red_to_yellow_clockwise(true);
    settings.set_series_files({"/tmp/a.tsd", "/tmp/b.tsd"});
    ASSERT_TRUE(settings.save(filename));

    Settings loaded;
    ASSERT_TRUE(loaded.load(filename));
    EXPECT_DOUBLE_EQ(loaded.chroma_step(StepSize::Coarse), 0.04);
    EXPECT_DOUBLE_EQ(loaded.value_step(StepSize::Coarse), 0.01);
    EXPECT_DOUBLE_EQ(loaded.reference_hue_degrees(), 45.0);
    EXPECT_TRUE(loaded.red_to_yellow_clockwise());
    EXPECT_EQ(loaded.series_files(), (std::vector<std::string>{"/tmp/a.tsd", "/tmp/b.tsd"}));
    EXPECT_TRUE(loaded.standard_files().empty());
}

TEST_F(UtilSettings, missingKeysKeepDefaults)
{
    Glib::file_set_contents(filename, "[colour_wheel]\nred_to_yellow_clockwise=true\n"
                                      "[manipulator]\nvalue_steps=1;2;\n");
    ASSERT_TRUE(settings.load(filename));
    EXPECT_TRUE(settings.red_to_yellow_clockwise());
    EXPECT_DOUBLE_EQ(settings.value_step(StepSize::Fine), 0.0025);
    EXPECT_DOUBLE_EQ(settings.reference_hue_degrees(), 90.0);
}

TEST_F(UtilSettings, unreadableFile)
{
    EXPECT_FALSE(settings.load(Glib::build_filename(dir, "missing.ini")));
    Glib::file_set_contents(filename, "this is not a key file");
    EXPECT_FALSE(settings.load(filename));
    EXPECT_DOUBLE_EQ(settings.reference_hue_degrees(), 90.0);
}

TEST_F(UtilSettings, reset)
{
    settings.set_reference_hue_degrees(10.0);
    settings.set_standard_files({"x"});
    settings.reset();
    EXPECT_DOUBLE_EQ(settings.reference_hue_degrees(), 90.0);
    EXPECT_TRUE(settings.standard_files().empty());
}

} // namespace

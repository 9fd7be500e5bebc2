// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for shadow settings and presets
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <climits>
#include <cmath>
#include <limits>
#include <gtest/gtest.h>

#include "../test-utils.h"
#include "shadow/canvas-geometry.h"
#include "shadow/shadow-settings.h"

using namespace Umbra::Shadow;

namespace {

ShadowSettings changed_settings()
{
    ShadowSettings settings;
    settings.parameters.shadow_color = {0.1, 0.2, 0.3, 0.4};
    settings.parameters.opacity = 0.25;
    settings.parameters.angle = 300.5;
    settings.parameters.distance = -12.75;
    settings.parameters.spread = 0.6;
    settings.parameters.blur_radius = 33;
    settings.parameters.padding = 4;
    settings.output_folder = "Art/Shadows";
    settings.file_name_suffix = "-drop";
    settings.create_shadow_object = false;
    settings.preview_background = {1.0, 1.0, 1.0, 0.5};
    settings.spread_on_bake = true;
    return settings;
}

} // namespace

TEST(ShadowSettingsTest, Defaults)
{
    auto settings = ShadowSettings();
    auto const &params = settings.parameters;
    EXPECT_EQ(params.shadow_color, (Rgba{0.0, 0.0, 0.0, 0.8}));
    EXPECT_EQ(params.opacity, 0.8);
    EXPECT_EQ(params.angle, 135.0);
    EXPECT_EQ(params.distance, 10.0);
    EXPECT_EQ(params.spread, 0.0);
    EXPECT_EQ(params.blur_radius, 10);
    EXPECT_EQ(params.padding, 16);
    EXPECT_EQ(settings.output_folder, "Assets/Textures/DropShadows");
    EXPECT_EQ(settings.file_name_suffix, "_shadow");
    EXPECT_TRUE(settings.create_shadow_object);
    EXPECT_FALSE(settings.spread_on_bake);

    // An empty file changes nothing
    EXPECT_EQ(ShadowSettings::from_data(""), settings);
}

TEST(ShadowSettingsTest, RoundTrip)
{
    auto settings = changed_settings();
    ASSERT_NE(settings, ShadowSettings());
    EXPECT_EQ(ShadowSettings::from_data(settings.to_data()), settings);
}

TEST(ShadowSettingsTest, MissingKeys)
{
    auto settings = ShadowSettings::from_data("[shadow]\nopacity=0.25\nsize=3\n");
    EXPECT_EQ(settings.parameters.opacity, 0.25);
    EXPECT_EQ(settings.parameters.blur_radius, 3);

    auto expected = ShadowSettings();
    expected.parameters.opacity = 0.25;
    expected.parameters.blur_radius = 3;
    EXPECT_EQ(settings, expected);

    // Other groups are ignored
    EXPECT_EQ(ShadowSettings::from_data("[other]\nopacity=0.1\n"), ShadowSettings());
}

TEST(ShadowSettingsTest, EmptyStrings)
{
    auto settings = ShadowSettings::from_data("[shadow]\noutput-folder=\nfile-name-suffix=\n");
    EXPECT_EQ(settings.output_folder, "Assets/Textures/DropShadows");
    EXPECT_EQ(settings.file_name_suffix, "_shadow");
}

TEST(ShadowSettingsTest, BadValues)
{
    try {
        ShadowSettings::from_data("[shadow]\nopacity=abc\n");
        FAIL() << "Unreadable opacity accepted";
    } catch (SettingsError const &e) {
        EXPECT_EQ(e.key(), "opacity");
    }

    try {
        ShadowSettings::from_data("[shadow]\nshadow-color=0;0;0;\n");
        FAIL() << "Three channel color accepted";
    } catch (SettingsError const &e) {
        EXPECT_EQ(e.key(), "shadow-color");
    }

    EXPECT_THROW(ShadowSettings::from_data("[shadow]\nsize=1.5\n"), SettingsError);
    EXPECT_THROW(ShadowSettings::from_data("[shadow]\ncreate-shadow-object=maybe\n"), SettingsError);
    EXPECT_THROW(ShadowSettings::from_data("this is not a key file"), SettingsError);
}

TEST(ShadowSettingsTest, Sanitize)
{
    auto settings = changed_settings();
    auto const unchanged = settings;
    settings.sanitize();
    EXPECT_EQ(settings, unchanged);

    settings.parameters.shadow_color = {2.0, -1.0, 0.5, 1.0};
    settings.parameters.opacity = 1.5;
    settings.parameters.angle = -10.0;
    settings.parameters.distance = std::numeric_limits<double>::quiet_NaN();
    settings.parameters.spread = std::numeric_limits<double>::quiet_NaN();
    settings.parameters.blur_radius = 100;
    settings.parameters.padding = -5;
    settings.preview_background = {0.5, 0.5, 0.5, 7.0};
    settings.sanitize();

    auto const &params = settings.parameters;
    EXPECT_EQ(params.shadow_color, (Rgba{1.0, 0.0, 0.5, 1.0}));
    EXPECT_EQ(params.opacity, 1.0);
    EXPECT_EQ(params.angle, 0.0);
    EXPECT_EQ(params.distance, 0.0);
    EXPECT_EQ(params.spread, 0.0);
    EXPECT_EQ(params.blur_radius, MAX_BLUR_RADIUS);
    EXPECT_EQ(params.padding, 0);
    EXPECT_EQ(settings.preview_background, (Rgba{0.5, 0.5, 0.5, 1.0}));
}

TEST(ShadowSettingsTest, SanitizeKeepsCanvasInRange)
{
    auto settings = ShadowSettings();
    settings.parameters.padding = INT_MAX;
    settings.parameters.distance = 1e12;
    settings.sanitize();
    EXPECT_EQ(settings.parameters.padding, MAX_PADDING);
    EXPECT_EQ(settings.parameters.distance, MAX_DISTANCE);

    settings.parameters.distance = -std::numeric_limits<double>::infinity();
    settings.sanitize();
    EXPECT_EQ(settings.parameters.distance, 0.0);

    // The largest settings the editor allows still give a canvas for a large sprite
    settings.parameters.distance = -MAX_DISTANCE;
    settings.parameters.blur_radius = MAX_BLUR_RADIUS;
    settings.parameters.angle = 0.0;
    auto geom = compute_canvas_geometry({2048, 2048}, settings.parameters);
    EXPECT_EQ(geom.canvas.x(), 2048 + 4096 + 2 * (MAX_PADDING + MAX_BLUR_RADIUS));
    EXPECT_LE(geom.canvas.x(), MAX_CANVAS_SIZE);
}

TEST(ShadowSettingsTest, OutputPath)
{
    auto settings = ShadowSettings();
    EXPECT_EQ(settings.output_path("hero"), "Assets/Textures/DropShadows/hero_shadow.png");

    settings.output_folder = "Art/";
    settings.file_name_suffix = "";
    EXPECT_EQ(settings.output_path("crate"), "Art/crate.png");
}

TEST(ShadowSettingsTest, Presets)
{
    auto settings = changed_settings();
    auto preset = ShadowPreset::from_settings(settings);
    EXPECT_EQ(preset.parameters, settings.parameters);
    EXPECT_EQ(preset.preview_background, settings.preview_background);

    // Only the look is applied, not where things are saved
    auto other = ShadowSettings();
    preset.apply_to(other);
    EXPECT_EQ(other.parameters, settings.parameters);
    EXPECT_EQ(other.preview_background, settings.preview_background);
    EXPECT_EQ(other.output_folder, "Assets/Textures/DropShadows");
    EXPECT_TRUE(other.create_shadow_object);

    // Settings and a preset can share a file
    Glib::KeyFile file;
    ShadowSettings().to_keyfile(file);
    preset.to_keyfile(file);
    EXPECT_TRUE(file.has_group("shadow"));
    EXPECT_TRUE(file.has_group("preset"));

    auto read_preset = ShadowPreset();
    read_preset.from_keyfile(file);
    EXPECT_EQ(read_preset, preset);

    auto read_settings = ShadowSettings();
    read_settings.from_keyfile(file);
    EXPECT_EQ(read_settings, ShadowSettings());
}

TEST(ShadowSettingsTest, PresetBadValues)
{
    Glib::KeyFile file;
    file.set_string("preset", "angle", "north");
    try {
        ShadowPreset().from_keyfile(file);
        FAIL() << "Unreadable angle accepted";
    } catch (SettingsError const &e) {
        EXPECT_EQ(e.key(), "angle");
    }

    file.set_string("preset", "angle", "45");
    file.set_string("preset", "preview-background", "1;1");
    EXPECT_THROW(ShadowPreset().from_keyfile(file), SettingsError);
}

class ShadowSettingsLocaleTest : public GlobalLocaleTestFixture
{};

TEST_P(ShadowSettingsLocaleTest, DecimalPoint)
{
    auto settings = changed_settings();
    std::string data = settings.to_data();
    EXPECT_NE(data.find("opacity=0.25"), std::string::npos) << data;
    EXPECT_EQ(ShadowSettings::from_data(data), settings);
}

INSTANTIATE_TEST_SUITE_P(ShadowSettings, ShadowSettingsLocaleTest, testing::Values("C", "de_DE.UTF-8"));

/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0)(case-label . +))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: filetype=cpp:expandtab:shiftwidth=4:tabstop=8:softtabstop=4:fileencoding=utf-8:textwidth=99 :

// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Persisted shadow baker settings and presets.
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "shadow-settings.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <type_traits>
#include <vector>
#include <glib.h>
#include <glibmm/error.h>
#include <glibmm/miscutils.h>

namespace Umbra::Shadow {

namespace {

char const settings_group[] = "shadow";
char const preset_group[] = "preset";

bool has_key(Glib::KeyFile const &file, char const *group, char const *key)
{
    return file.has_group(group) && file.has_key(group, key);
}

void read_double(Glib::KeyFile const &file, char const *group, char const *key, double &value)
{
    if (!has_key(file, group, key)) {
        return;
    }
    try {
        value = file.get_double(group, key);
    } catch (Glib::Error const &e) {
        throw SettingsError(key, e.what());
    }
}

void read_integer(Glib::KeyFile const &file, char const *group, char const *key, int &value)
{
    if (!has_key(file, group, key)) {
        return;
    }
    try {
        value = file.get_integer(group, key);
    } catch (Glib::Error const &e) {
        throw SettingsError(key, e.what());
    }
}

void read_boolean(Glib::KeyFile const &file, char const *group, char const *key, bool &value)
{
    if (!has_key(file, group, key)) {
        return;
    }
    try {
        value = file.get_boolean(group, key);
    } catch (Glib::Error const &e) {
        throw SettingsError(key, e.what());
    }
}

/**
 * Empty strings keep the current value, a blank output folder is never useful.
 */
void read_string(Glib::KeyFile const &file, char const *group, char const *key, std::string &value)
{
    if (!has_key(file, group, key)) {
        return;
    }
    try {
        std::string read = file.get_string(group, key);
        if (!read.empty()) {
            value = read;
        }
    } catch (Glib::Error const &e) {
        throw SettingsError(key, e.what());
    }
}

void read_color(Glib::KeyFile const &file, char const *group, char const *key, Rgba &value)
{
    if (!has_key(file, group, key)) {
        return;
    }
    std::vector<double> list;
    try {
        list = file.get_double_list(group, key);
    } catch (Glib::Error const &e) {
        throw SettingsError(key, e.what());
    }
    if (list.size() != value.size()) {
        throw SettingsError(key, "expected 4 values (red, green, blue, alpha), found " + std::to_string(list.size()));
    }
    std::copy(list.begin(), list.end(), value.begin());
}

void write_color(Glib::KeyFile &file, char const *group, char const *key, Rgba const &value)
{
    file.set_double_list(group, key, std::vector<double>(value.begin(), value.end()));
}

void write_parameters(Glib::KeyFile &file, char const *group, ShadowParameters const &params)
{
    write_color(file, group, "shadow-color", params.shadow_color);
    file.set_double(group, "opacity", params.opacity);
    file.set_double(group, "angle", params.angle);
    file.set_double(group, "distance", params.distance);
    file.set_double(group, "spread", params.spread);
    file.set_integer(group, "size", params.blur_radius);
    file.set_integer(group, "padding", params.padding);
}

void read_parameters(Glib::KeyFile const &file, char const *group, ShadowParameters &params)
{
    read_color(file, group, "shadow-color", params.shadow_color);
    read_double(file, group, "opacity", params.opacity);
    read_double(file, group, "angle", params.angle);
    read_double(file, group, "distance", params.distance);
    read_double(file, group, "spread", params.spread);
    read_integer(file, group, "size", params.blur_radius);
    read_integer(file, group, "padding", params.padding);
}

template <typename T>
void clamp_setting(T &value, T low, T high, char const *name)
{
    T clamped = value;
    if constexpr (std::is_floating_point_v<T>) {
        if (std::isnan(value)) {
            clamped = low;
        }
    }
    clamped = std::clamp(clamped, low, high);
    if (clamped != value) {
        g_warning("Shadow %s of %s is out of range, using %s instead.", name, std::to_string(value).c_str(),
                  std::to_string(clamped).c_str());
        value = clamped;
    }
}

void clamp_color(Rgba &color, char const *name)
{
    for (auto &channel : color) {
        clamp_setting(channel, 0.0, 1.0, name);
    }
}

} // namespace

std::string shadow_file_name(std::string const &sprite_name, std::string const &suffix)
{
    return sprite_name + suffix + ".png";
}

std::string shadow_object_name(std::string const &target_name)
{
    return target_name + "_Shadow";
}

void ShadowSettings::sanitize()
{
    clamp_color(parameters.shadow_color, "color");
    clamp_setting(parameters.opacity, 0.0, 1.0, "opacity");
    clamp_setting(parameters.angle, 0.0, 360.0, "angle");
    if (!std::isfinite(parameters.distance)) {
        clamp_setting(parameters.distance, 0.0, 0.0, "distance");
    }
    clamp_setting(parameters.distance, -MAX_DISTANCE, MAX_DISTANCE, "distance");
    clamp_setting(parameters.spread, 0.0, 1.0, "spread");
    clamp_setting(parameters.blur_radius, 0, MAX_BLUR_RADIUS, "size");
    clamp_setting(parameters.padding, 0, MAX_PADDING, "padding");
    clamp_color(preview_background, "preview background");
}

std::string ShadowSettings::output_path(std::string const &sprite_name) const
{
    return Glib::build_filename(output_folder, shadow_file_name(sprite_name, file_name_suffix));
}

void ShadowSettings::to_keyfile(Glib::KeyFile &file) const
{
    write_parameters(file, settings_group, parameters);
    file.set_string(settings_group, "output-folder", output_folder);
    file.set_string(settings_group, "file-name-suffix", file_name_suffix);
    file.set_boolean(settings_group, "create-shadow-object", create_shadow_object);
    write_color(file, settings_group, "preview-background", preview_background);
    file.set_boolean(settings_group, "spread-on-bake", spread_on_bake);
}

void ShadowSettings::from_keyfile(Glib::KeyFile const &file)
{
    read_parameters(file, settings_group, parameters);
    read_string(file, settings_group, "output-folder", output_folder);
    read_string(file, settings_group, "file-name-suffix", file_name_suffix);
    read_boolean(file, settings_group, "create-shadow-object", create_shadow_object);
    read_color(file, settings_group, "preview-background", preview_background);
    read_boolean(file, settings_group, "spread-on-bake", spread_on_bake);
}

Glib::ustring ShadowSettings::to_data() const
{
    Glib::KeyFile file;
    to_keyfile(file);
    return file.to_data();
}

ShadowSettings ShadowSettings::from_data(Glib::ustring const &data)
{
    Glib::KeyFile file;
    try {
        file.load_from_data(data);
    } catch (Glib::Error const &e) {
        throw SettingsError(settings_group, e.what());
    }

    ShadowSettings settings;
    settings.from_keyfile(file);
    return settings;
}

ShadowPreset ShadowPreset::from_settings(ShadowSettings const &settings)
{
    return {settings.parameters, settings.preview_background};
}

void ShadowPreset::apply_to(ShadowSettings &settings) const
{
    settings.parameters = parameters;
    settings.preview_background = preview_background;
}

void ShadowPreset::to_keyfile(Glib::KeyFile &file) const
{
    write_parameters(file, preset_group, parameters);
    write_color(file, preset_group, "preview-background", preview_background);
}

void ShadowPreset::from_keyfile(Glib::KeyFile const &file)
{
    read_parameters(file, preset_group, parameters);
    read_color(file, preset_group, "preview-background", preview_background);
}

} // namespace Umbra::Shadow

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

// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * Persisted shadow baker settings and presets.
 *//*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef UMBRA_SHADOW_SETTINGS_H
#define UMBRA_SHADOW_SETTINGS_H

#include <stdexcept>
#include <string>
#include <utility>
#include <glibmm/keyfile.h>
#include <glibmm/ustring.h>

#include "shadow-parameters.h"

namespace Umbra::Shadow {

/**
 * A stored setting could not be read back.
 */
class SettingsError : public std::runtime_error
{
public:
    SettingsError(std::string key, std::string const &message)
        : std::runtime_error("Shadow setting '" + key + "': " + message)
        , _key(std::move(key))
    {}

    std::string const &key() const { return _key; }

private:
    std::string _key;
};

// Largest values the editor offers
constexpr int MAX_BLUR_RADIUS = 64;
constexpr int MAX_PADDING = 4096;
constexpr double MAX_DISTANCE = 4096.0;

/**
 * File name for the shadow of a sprite, "<sprite><suffix>.png".
 */
std::string shadow_file_name(std::string const &sprite_name, std::string const &suffix);

/**
 * Name of the scene object showing the shadow of the given object.
 */
std::string shadow_object_name(std::string const &target_name);

/**
 * Everything the editor remembers between sessions.
 */
struct ShadowSettings
{
    ShadowParameters parameters;
    std::string output_folder = "Assets/Textures/DropShadows";
    std::string file_name_suffix = "_shadow";
    bool create_shadow_object = true;
    Rgba preview_background = {0.2, 0.2, 0.2, 1.0};

    // Apply the spread to baked images as well as the preview, off to match older bakes.
    bool spread_on_bake = false;

    bool operator==(ShadowSettings const &other) const = default;

    /**
     * Pull every value back into the range the editor allows, warning about each one changed.
     */
    void sanitize();

    /**
     * Where the shadow baked for the given sprite goes, relative to the project.
     */
    std::string output_path(std::string const &sprite_name) const;

    void to_keyfile(Glib::KeyFile &file) const;

    /**
     * Read the settings, keys missing from the file keep their current value.
     *
     * @throws SettingsError when a value is present but can't be parsed.
     */
    void from_keyfile(Glib::KeyFile const &file);

    Glib::ustring to_data() const;

    /**
     * @throws SettingsError when the text isn't a key file or a value can't be parsed.
     */
    static ShadowSettings from_data(Glib::ustring const &data);
};

/**
 * The part of the settings shared through named presets.
 */
struct ShadowPreset
{
    ShadowParameters parameters;
    Rgba preview_background = {0.2, 0.2, 0.2, 1.0};

    bool operator==(ShadowPreset const &other) const = default;

    static ShadowPreset from_settings(ShadowSettings const &settings);
    void apply_to(ShadowSettings &settings) const;

    void to_keyfile(Glib::KeyFile &file) const;

    /**
     * Read the preset, keys missing from the file keep their current value.
     *
     * @throws SettingsError when a value is present but can't be parsed.
     */
    void from_keyfile(Glib::KeyFile const &file);
};

} // namespace Umbra::Shadow

#endif // UMBRA_SHADOW_SETTINGS_H

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

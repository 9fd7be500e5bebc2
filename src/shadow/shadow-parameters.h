// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * The set of values describing one drop shadow.
 *//*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef UMBRA_SHADOW_PARAMETERS_H
#define UMBRA_SHADOW_PARAMETERS_H

#include <array>
#include <cstddef>

namespace Umbra::Shadow {

// Unpremultiplied red, green, blue and alpha, each in [0,1]
using Rgba = std::array<double, 4>;

/**
 * Everything the pixel pipeline needs to know about the shadow. The pipeline never
 * modifies these, callers make a new set when anything changes.
 */
struct ShadowParameters
{
    Rgba shadow_color = {0.0, 0.0, 0.0, 0.8};
    double opacity = 0.8;    // 0..1
    double angle = 135.0;    // degrees, 0 is +x and 90 is +y (down)
    double distance = 10.0;  // pixels, may be negative
    double spread = 0.0;     // 0..1
    int blur_radius = 10;    // pixels
    int padding = 16;        // pixels of extra space around the content

    bool operator==(ShadowParameters const &other) const = default;
};

/**
 * A stable hash of all the parameters, found by boost::hash through ADL.
 */
std::size_t hash_value(ShadowParameters const &params);

} // namespace Umbra::Shadow

#endif // UMBRA_SHADOW_PARAMETERS_H

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

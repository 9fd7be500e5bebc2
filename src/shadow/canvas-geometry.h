// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * The canvas needed to hold a source image and its offset shadow.
 *//*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef UMBRA_SHADOW_CANVAS_GEOMETRY_H
#define UMBRA_SHADOW_CANVAS_GEOMETRY_H

#include <2geom/point.h>

namespace Umbra::Shadow {

struct ShadowParameters;

// Widest and tallest image Cairo will allocate
constexpr int MAX_CANVAS_SIZE = 32767;

struct CanvasGeometry
{
    Geom::IntPoint canvas;        // Size of the canvas in pixels
    Geom::IntPoint offset;        // Shadow offset from the source, in pixels
    Geom::IntPoint source_origin; // Top left of the source inside the canvas
    Geom::IntPoint shadow_origin; // Top left of the shadow inside the canvas
    int margin = 0;               // Padding plus blur radius on every side

    // Where the centre of the source falls, as a fraction of the canvas, y down
    Geom::Point pivot;

    /**
     * The pivot measured from the bottom of the canvas, for consumers with y up.
     */
    Geom::Point pivot_y_up() const { return {pivot.x(), 1.0 - pivot.y()}; }
};

/**
 * Work out the smallest canvas holding both the source and the shadow moved by the
 * rounded offset, with the margin added on every side.
 *
 * Angle 0 moves the shadow towards +x and 90 degrees towards +y, which is downwards in
 * the surfaces. Offsets are rounded to the nearest integer, ties to even.
 *
 * @arg source_size - Width and height of the source image, may be zero.
 * @arg angle       - Shadow direction in degrees.
 * @arg distance    - Shadow distance in pixels.
 * @arg padding     - Extra pixels of margin, must not be negative.
 * @arg blur_radius - Blur radius in pixels, also added to the margin, must not be negative.
 *
 * @throws std::invalid_argument for a negative padding or blur radius, a distance that isn't
 *         finite, or a canvas wider or taller than MAX_CANVAS_SIZE.
 */
CanvasGeometry compute_canvas_geometry(Geom::IntPoint const &source_size, double angle, double distance,
                                       int padding, int blur_radius);

CanvasGeometry compute_canvas_geometry(Geom::IntPoint const &source_size, ShadowParameters const &params);

} // namespace Umbra::Shadow

#endif // UMBRA_SHADOW_CANVAS_GEOMETRY_H

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

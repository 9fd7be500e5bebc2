// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * Bake a drop shadow for a source image, or render a preview of it.
 *//*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef UMBRA_SHADOW_BAKER_H
#define UMBRA_SHADOW_BAKER_H

#include <memory>
#include <2geom/point.h>

#include "canvas-geometry.h"
#include "shadow-parameters.h"

namespace Umbra::Renderer {
class Slot;
class Surface;
} // namespace Umbra::Renderer

namespace Umbra::Shadow {

struct BakeOptions
{
    // Harden the baked shadow with the spread too, the preview always does.
    bool spread_on_bake = false;
};

struct BakeResult
{
    std::shared_ptr<Renderer::Surface> shadow;
    CanvasGeometry geometry;

    // Shadow canvas size over the source size on each axis, for placing the shadow
    // so its pixels line up one to one with the source.
    Geom::Point scale;
};

/**
 * A new transparent canvas sized surface with the source alpha projected into it at the
 * shadow origin, tinted with the shadow color.
 */
std::shared_ptr<Renderer::Surface> project_shadow(Renderer::Surface const &source, CanvasGeometry const &geom,
                                                  ShadowParameters const &params);

/**
 * Blur the shadow into a new surface. A radius of zero hands back the same surface.
 *
 * @throws std::invalid_argument for a negative radius.
 */
std::shared_ptr<Renderer::Surface> blur_shadow(std::shared_ptr<Renderer::Surface> const &shadow, int radius);

/**
 * Raise the alpha of the shadow in place, spread 0 leaves it alone.
 */
void apply_spread(Renderer::Surface &shadow, double spread);

/**
 * Stack an opaque background, the finished shadow and the source at its origin.
 * Only the background color's red, green and blue are used.
 */
std::shared_ptr<Renderer::Surface> composite_preview(Renderer::Surface const &source,
                                                     Renderer::Surface const &shadow, CanvasGeometry const &geom,
                                                     Rgba const &background);

/**
 * Run projection, blur and optionally spread, leaving each stage's output in the slot.
 * The finished shadow is the last surface set.
 */
void render_shadow(Renderer::Slot &slot, Renderer::Surface const &source, CanvasGeometry const &geom,
                   ShadowParameters const &params, bool spread);

/**
 * Produce the shadow layer for export along with where it sits relative to the source.
 *
 * @throws std::invalid_argument for a negative blur radius or padding.
 */
BakeResult bake(Renderer::Surface const &source, ShadowParameters const &params, BakeOptions const &options = {});

/**
 * Render the source with its shadow over the background, as the editor shows it.
 *
 * @throws std::invalid_argument for a negative blur radius or padding.
 */
std::shared_ptr<Renderer::Surface> preview(Renderer::Surface const &source, ShadowParameters const &params,
                                           Rgba const &background);

} // namespace Umbra::Shadow

#endif // UMBRA_SHADOW_BAKER_H

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

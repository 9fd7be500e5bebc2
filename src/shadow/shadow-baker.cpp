// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Drop shadow baking.
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "shadow-baker.h"

#include <algorithm>
#include <glib.h>

#include "renderer/pixel-filters/composite.h"
#include "renderer/pixel-filters/flood.h"
#include "renderer/pixel-filters/gaussian-blur.h"
#include "renderer/pixel-filters/shadow-projection.h"
#include "renderer/pixel-filters/spread.h"
#include "renderer/slot.h"
#include "renderer/surface.h"

namespace Umbra::Shadow {

using Renderer::Slot;
using Renderer::Surface;

std::shared_ptr<Surface> project_shadow(Surface const &source, CanvasGeometry const &geom,
                                        ShadowParameters const &params)
{
    auto out = std::make_shared<Surface>(geom.canvas);
    out->run_pixel_filter(
        Renderer::PixelFilter::ShadowProjection(geom.shadow_origin, params.shadow_color, params.opacity), source);
    return out;
}

std::shared_ptr<Surface> blur_shadow(std::shared_ptr<Surface> const &shadow, int radius)
{
    auto blur = Renderer::PixelFilter::GaussianBlur(radius);

    // zero radius = no change in output
    if (radius == 0) {
        return shadow;
    }
    auto out = shadow->similar();
    out->run_pixel_filter(blur, *shadow);
    return out;
}

void apply_spread(Surface &shadow, double spread)
{
    shadow.run_pixel_filter(Renderer::PixelFilter::AlphaSpread(spread));
}

std::shared_ptr<Surface> composite_preview(Surface const &source, Surface const &shadow, CanvasGeometry const &geom,
                                           Rgba const &background)
{
    auto opaque = background;
    opaque[3] = 1.0;

    auto out = std::make_shared<Surface>(geom.canvas);
    out->run_pixel_filter(Renderer::PixelFilter::Flood(opaque));
    out->run_pixel_filter(Renderer::PixelFilter::CompositeOver(), shadow);
    out->run_pixel_filter(Renderer::PixelFilter::CompositeOver(geom.source_origin), source);
    return out;
}

void render_shadow(Slot &slot, Surface const &source, CanvasGeometry const &geom, ShadowParameters const &params,
                   bool spread)
{
    slot.set(Renderer::SLOT_SHADOW, project_shadow(source, geom, params));
    g_debug("Projected %dx%d source onto a %dx%d canvas at %d,%d.", source.width(), source.height(),
            geom.canvas.x(), geom.canvas.y(), geom.shadow_origin.x(), geom.shadow_origin.y());

    slot.set(Renderer::SLOT_BLURRED, blur_shadow(slot.get(Renderer::SLOT_SHADOW), params.blur_radius));
    g_debug("Blurred shadow with radius %d.", params.blur_radius);

    if (spread && params.spread > 0.0) {
        auto out = slot.get();
        // A skipped blur shares its surface with the projection
        if (out == slot.get(Renderer::SLOT_SHADOW)) {
            out = out->copy();
            slot.set(Renderer::SLOT_BLURRED, out);
        }
        apply_spread(*out, params.spread);
        g_debug("Spread shadow alpha by %g.", params.spread);
    }
}

BakeResult bake(Surface const &source, ShadowParameters const &params, BakeOptions const &options)
{
    auto const geom = compute_canvas_geometry(source.dimensions(), params);

    Slot slot;
    render_shadow(slot, source, geom, params, options.spread_on_bake);

    BakeResult result;
    result.shadow = slot.get();
    result.geometry = geom;
    result.scale = {static_cast<double>(geom.canvas.x()) / std::max(1, source.width()),
                    static_cast<double>(geom.canvas.y()) / std::max(1, source.height())};

    g_debug("Baked %dx%d shadow, pivot %g,%g.", geom.canvas.x(), geom.canvas.y(), geom.pivot.x(), geom.pivot.y());
    return result;
}

std::shared_ptr<Surface> preview(Surface const &source, ShadowParameters const &params, Rgba const &background)
{
    auto const geom = compute_canvas_geometry(source.dimensions(), params);

    Slot slot;
    render_shadow(slot, source, geom, params, true);

    slot.set(Renderer::SLOT_PREVIEW, composite_preview(source, *slot.get(), geom, background));
    return slot.get(Renderer::SLOT_PREVIEW);
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

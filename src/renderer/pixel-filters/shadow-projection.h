// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * Raw filter function projecting a source alpha channel into a tinted shadow layer.
 *//*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef UMBRA_RENDERER_PIXEL_FILTER_SHADOW_PROJECTION_H
#define UMBRA_RENDERER_PIXEL_FILTER_SHADOW_PROJECTION_H

#include <algorithm>
#include <array>
#include <2geom/point.h>

#include "renderer/pixel-filters/composite.h"

namespace Umbra::Renderer::PixelFilter {

/**
 * Every source pixel with some alpha writes the shadow color into the destination at
 * its own coordinates plus the origin, with its alpha scaled by the opacity and the
 * shadow color's alpha.
 *
 * Writes landing on a pixel that already has some shadow keep the larger alpha and move
 * the color towards the shadow color in proportion to the new alpha. This is not true
 * alpha compositing: it only guarantees the most opaque write dominates.
 */
struct ShadowProjection
{
    Geom::IntPoint _origin;
    std::array<double, 4> _color; // Unpremultiplied RGBA
    double _opacity;

    ShadowProjection(Geom::IntPoint const &origin, std::array<double, 4> const &color, double opacity)
        : _origin(origin)
        , _color(color)
        , _opacity(opacity)
    {}

    template <class AccessDst, class AccessSrc>
    void filter(AccessDst &dst, AccessSrc const &src) const
    {
        for (auto y = 0; y < src.height(); y++) {
            for (auto x = 0; x < src.width(); x++) {
                double const a = src.alphaAt(x, y);
                if (a <= 0.0) {
                    continue;
                }
                auto const tx = x + _origin.x();
                auto const ty = y + _origin.y();
                if (!dst.contains(tx, ty)) {
                    continue;
                }
                auto existing = dst.colorAt(tx, ty, true);
                project(existing, a * _opacity * _color[3]);
                dst.colorTo(tx, ty, existing, true);
            }
        }
    }

    /**
     * Resolve a shadow write of the given alpha against the color already in place.
     */
    template <typename Color>
    inline void project(Color &existing, double alpha) const
    {
        auto const last = existing.size() - 1;
        double const out_alpha = std::max(existing[last], alpha);
        double const blend = out_alpha < ALPHA_EPSILON ? 0.0 : alpha / out_alpha;
        for (unsigned i = 0; i < last; i++) {
            existing[i] += (_color[i] - existing[i]) * blend;
        }
        existing[last] = out_alpha;
    }
};

} // namespace Umbra::Renderer::PixelFilter

#endif // UMBRA_RENDERER_PIXEL_FILTER_SHADOW_PROJECTION_H

/*
  ;Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0)(case-label . +))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: filetype=cpp:expandtab:shiftwidth=4:tabstop=8:softtabstop=4:fileencoding=utf-8:textwidth=99 :

// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * Raw filter function for the Porter-Duff "over" operator on unpremultiplied colors.
 *//*
 * Copyright (C) 2025-2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef UMBRA_RENDERER_PIXEL_FILTER_COMPOSITE_H
#define UMBRA_RENDERER_PIXEL_FILTER_COMPOSITE_H

#include <2geom/point.h>

namespace Umbra::Renderer::PixelFilter {

// Combined alphas below this are treated as fully transparent
constexpr double ALPHA_EPSILON = 0.0001;

/**
 * Paint the source over the destination. The source's top left corner is placed at
 * the offset within the destination and anything that falls outside is dropped.
 *
 * The operator is order dependent: compositing A over B is not B over A.
 */
struct CompositeOver
{
    Geom::IntPoint _offset;

    CompositeOver() = default;
    explicit CompositeOver(Geom::IntPoint const &offset)
        : _offset(offset)
    {}

    template <class AccessDst, class AccessSrc>
    void filter(AccessDst &dst, AccessSrc const &src) const
    {
        for (auto y = 0; y < src.height(); y++) {
            for (auto x = 0; x < src.width(); x++) {
                auto const tx = x + _offset.x();
                auto const ty = y + _offset.y();
                if (!dst.contains(tx, ty)) {
                    continue;
                }
                auto c1 = src.colorAt(x, y, true);
                if (c1.back() <= 0.0) {
                    continue;
                }
                auto c2 = dst.colorAt(tx, ty, true);
                over(c1, c2);
                dst.colorTo(tx, ty, c2, true);
            }
        }
    }

    /**
     * Composite one unpremultiplied color over another, the result is written to dst.
     */
    template <typename Color>
    static inline void over(Color const &src, Color &dst)
    {
        auto const last = src.size() - 1;
        double const src_a = src[last];
        double const dst_a = dst[last];
        double const out_a = src_a + dst_a * (1.0 - src_a);

        if (out_a < ALPHA_EPSILON) {
            dst = src;
        } else {
            for (unsigned i = 0; i < last; i++) {
                dst[i] = (src[i] * src_a + dst[i] * dst_a * (1.0 - src_a)) / out_a;
            }
        }
        dst[last] = out_a;
    }
};

} // namespace Umbra::Renderer::PixelFilter

#endif // UMBRA_RENDERER_PIXEL_FILTER_COMPOSITE_H

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

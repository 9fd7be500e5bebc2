// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * Raw filter function hardening a soft shadow by raising its alpha to a power.
 *//*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef UMBRA_RENDERER_PIXEL_FILTER_SPREAD_H
#define UMBRA_RENDERER_PIXEL_FILTER_SPREAD_H

#include <algorithm>
#include <cmath>

namespace Umbra::Renderer::PixelFilter {

/**
 * A gamma transfer on the alpha channel only. Spread 0 keeps the alpha, spread 1 uses an
 * exponent of 0.2 which lifts faint alpha a long way towards opaque.
 */
struct AlphaSpread
{
    double _spread;

    explicit AlphaSpread(double spread)
        : _spread(spread)
    {}

    /**
     * The exponent applied to alpha, linear from 1.0 at spread 0 down to 0.2 at spread 1.
     * Spreads outside [0,1] are held at the nearest end.
     */
    static double exponent(double spread) { return 1.0 + (0.2 - 1.0) * std::clamp(spread, 0.0, 1.0); }

    template <class AccessDst>
    void filter(AccessDst &dst) const
    {
        if (_spread <= 0.0) {
            return;
        }
        double const e = exponent(_spread);
        for (auto y = 0; y < dst.height(); y++) {
            for (auto x = 0; x < dst.width(); x++) {
                auto color = dst.colorAt(x, y, true);
                auto &alpha = color.back();
                if (alpha <= 0.0) {
                    continue;
                }
                alpha = std::pow(alpha, e);
                dst.colorTo(x, y, color, true);
            }
        }
    }
};

} // namespace Umbra::Renderer::PixelFilter

#endif // UMBRA_RENDERER_PIXEL_FILTER_SPREAD_H

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

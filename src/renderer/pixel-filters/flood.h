// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * Fill every pixel of a surface with one color.
 *//*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef UMBRA_RENDERER_PIXEL_FILTER_FLOOD_H
#define UMBRA_RENDERER_PIXEL_FILTER_FLOOD_H

#include <array>

namespace Umbra::Renderer::PixelFilter {

struct Flood
{
    // Unpremultiplied RGBA
    std::array<double, 4> _color;

    explicit Flood(std::array<double, 4> const &color)
        : _color(color)
    {}

    template <class AccessDst>
    void filter(AccessDst &dst) const
    {
        typename AccessDst::Color color;
        for (unsigned c = 0; c < color.size(); c++) {
            color[c] = _color[c];
        }
        for (auto y = 0; y < dst.height(); y++) {
            for (auto x = 0; x < dst.width(); x++) {
                dst.colorTo(x, y, color, true);
            }
        }
    }
};

} // namespace Umbra::Renderer::PixelFilter

#endif // UMBRA_RENDERER_PIXEL_FILTER_FLOOD_H

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

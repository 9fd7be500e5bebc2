// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "canvas-geometry.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <2geom/angle.h>

#include "shadow-parameters.h"

namespace Umbra::Shadow {

namespace {

template <typename T>
std::string fmt_size(char const *what, T x, T y)
{
    std::ostringstream out;
    out << what << " of " << x << "x" << y << " is over the " << MAX_CANVAS_SIZE << " pixel limit";
    return out.str();
}

} // namespace

CanvasGeometry compute_canvas_geometry(Geom::IntPoint const &source_size, double angle, double distance,
                                       int padding, int blur_radius)
{
    if (padding < 0) {
        throw std::invalid_argument("Shadow padding can not be negative");
    }
    if (blur_radius < 0) {
        throw std::invalid_argument("Shadow blur radius can not be negative");
    }

    if (!std::isfinite(distance)) {
        throw std::invalid_argument("Shadow distance must be finite");
    }

    std::int64_t const w = source_size.x();
    std::int64_t const h = source_size.y();
    double const rad = Geom::rad_from_deg(angle);

    // nearbyint rounds halves to even in the default rounding mode
    double const ox = std::nearbyint(distance * std::cos(rad));
    double const oy = std::nearbyint(distance * std::sin(rad));
    if (std::abs(ox) > MAX_CANVAS_SIZE || std::abs(oy) > MAX_CANVAS_SIZE) {
        throw std::invalid_argument(fmt_size("Shadow offset", ox, oy));
    }
    auto const dx = static_cast<std::int64_t>(ox);
    auto const dy = static_cast<std::int64_t>(oy);

    // Bounds containing both the source and the shadow
    auto const min_x = std::min<std::int64_t>(0, dx);
    auto const min_y = std::min<std::int64_t>(0, dy);
    auto const max_x = std::max(w, w + dx);
    auto const max_y = std::max(h, h + dy);

    std::int64_t const margin = std::int64_t{padding} + blur_radius;
    std::int64_t const canvas_w = max_x - min_x + margin * 2;
    std::int64_t const canvas_h = max_y - min_y + margin * 2;
    if (canvas_w > MAX_CANVAS_SIZE || canvas_h > MAX_CANVAS_SIZE) {
        throw std::invalid_argument(fmt_size("Shadow canvas", canvas_w, canvas_h));
    }

    // Everything fits in an int from here on
    CanvasGeometry geom;
    geom.offset = {static_cast<int>(dx), static_cast<int>(dy)};
    geom.margin = static_cast<int>(margin);
    geom.canvas = {static_cast<int>(canvas_w), static_cast<int>(canvas_h)};
    geom.source_origin = {static_cast<int>(margin - min_x), static_cast<int>(margin - min_y)};
    geom.shadow_origin = geom.source_origin + geom.offset;

    // Keep the source visually centred
    geom.pivot = {(geom.source_origin.x() + w * 0.5) / std::max(1, geom.canvas.x()),
                  (geom.source_origin.y() + h * 0.5) / std::max(1, geom.canvas.y())};
    return geom;
}

CanvasGeometry compute_canvas_geometry(Geom::IntPoint const &source_size, ShadowParameters const &params)
{
    return compute_canvas_geometry(source_size, params.angle, params.distance, params.padding, params.blur_radius);
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

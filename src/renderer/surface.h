// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * A Cairo image surface holding the pixels of one layer of the shadow pipeline
 *//*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef UMBRA_RENDERER_SURFACE_H
#define UMBRA_RENDERER_SURFACE_H

#include <memory>
#include <optional>
#include <cairomm/surface.h>
#include <2geom/point.h>

#include "pixel-access.h"

namespace Umbra::Renderer {

class Surface
{
public:
    /**
     * Create a new Surface with the given dimensions. The memory is allocated on first use and
     * starts fully transparent.
     *
     * @arg dimensions - The width and height in pixels of the surface memory.
     * @arg format     - CAIRO_FORMAT_RGBA128F for float channels (the default) or
     *                   CAIRO_FORMAT_ARGB32 for 8 bit channels. Other formats are refused.
     */
    explicit Surface(Geom::IntPoint const &dimensions, cairo_format_t format = CAIRO_FORMAT_RGBA128F);

    /**
     * Wrap an existing cairo image surface, for example one the caller decoded from a file.
     * The pixels are shared, not copied.
     */
    explicit Surface(Cairo::RefPtr<Cairo::ImageSurface> image);

    /**
     * Returns true if the memory has been allocated for this surface.
     */
    bool ready() const { return static_cast<bool>(_surface); }

    /**
     * Returns the dimensional size of the surface in pixels.
     */
    Geom::IntPoint dimensions() const { return _dimensions; }
    int width() const { return _dimensions.x(); }
    int height() const { return _dimensions.y(); }

    /**
     * Returns the cairo image format type for this surface.
     */
    cairo_format_t format() const { return _format; }

    /**
     * Create an image surface formatted the same as this one.
     *
     * @arg dimensions - Optional, if provided overrides the dimensions of the new surface.
     *
     * @returns A new transparent Surface.
     */
    std::shared_ptr<Surface> similar(std::optional<Geom::IntPoint> dimensions = {}) const;

    /**
     * Create a copy of this surface with its own pixel memory.
     */
    std::shared_ptr<Surface> copy() const;

    /**
     * Returns the underlying Cairo surface, allocating it if needed.
     */
    Cairo::RefPtr<Cairo::ImageSurface> const &getCairoSurface() const;

    /**
     * Filters the contents of this surface according to the filter.
     *
     * @arg filter - The filter to run on this surface
     */
    template <typename Filter>
    auto run_pixel_filter(Filter const &filter)
    {
        return _with_access([&](auto &dst) { return filter.filter(dst); });
    }

    /**
     * Filters the contents of this surface according to the filter.
     *
     * @arg filter - The filter to run on this surface
     * @arg src    - Source image to feed to the filter function.
     */
    template <typename Filter>
    auto run_pixel_filter(Filter const &filter, Surface const &src)
    {
        return _with_access([&](auto &dst) {
            return src._with_access([&](auto const &s) { return filter.filter(dst, s); });
        });
    }

private:
    /**
     * Build the PixelAccess matching this surface's format and hand it to the function.
     */
    template <typename Func>
    auto _with_access(Func &&func) const
    {
        if (_format == CAIRO_FORMAT_ARGB32) {
            auto access = PixelAccess<CAIRO_FORMAT_ARGB32>(getCairoSurface());
            return func(access);
        }
        auto access = PixelAccess<CAIRO_FORMAT_RGBA128F>(getCairoSurface());
        return func(access);
    }

    mutable Cairo::RefPtr<Cairo::ImageSurface> _surface;
    Geom::IntPoint const _dimensions;
    cairo_format_t const _format;
};

} // namespace Umbra::Renderer

#endif // UMBRA_RENDERER_SURFACE_H

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

// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * A Cairo image surface holding the pixels of one layer of the shadow pipeline
 *//*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <cstring>
#include <stdexcept>
#include <string>
#include <cairomm/surface.h>

#include "renderer/surface.h"

namespace Umbra::Renderer {

namespace {

void check_format(cairo_format_t format)
{
    if (format != CAIRO_FORMAT_RGBA128F && format != CAIRO_FORMAT_ARGB32) {
        throw std::invalid_argument("Surface only handles RGBA128F and ARGB32 pixel formats, got " +
                                    std::to_string(static_cast<int>(format)));
    }
}

} // namespace

/**
 * Create a rendering surface
 */
Surface::Surface(Geom::IntPoint const &dimensions, cairo_format_t format)
    : _dimensions(dimensions)
    , _format(format)
{
    check_format(format);
    if (dimensions.x() < 0 || dimensions.y() < 0) {
        throw std::invalid_argument("Surface dimensions can not be negative");
    }
}

Surface::Surface(Cairo::RefPtr<Cairo::ImageSurface> image)
    : _surface(image)
    , _dimensions(image ? image->get_width() : 0, image ? image->get_height() : 0)
    , _format(image ? cairo_image_surface_get_format(image->cobj()) : CAIRO_FORMAT_RGBA128F)
{
    if (!image) {
        throw std::invalid_argument("Surface needs an image to wrap");
    }
    check_format(_format);
}

/**
 * Create or return the existing cairo surface.
 */
Cairo::RefPtr<Cairo::ImageSurface> const &Surface::getCairoSurface() const
{
    // deferred allocation
    if (!_surface) {
        // Must be created in C as CairoMM doesn't support all the needed formats yet.
        // Cairo hands back zeroed memory, which is transparent black in both formats.
        auto cobj = cairo_image_surface_create(_format, _dimensions.x(), _dimensions.y());
        if (cairo_surface_status(cobj) != CAIRO_STATUS_SUCCESS) {
            auto message = std::string(cairo_status_to_string(cairo_surface_status(cobj)));
            cairo_surface_destroy(cobj);
            throw std::runtime_error("Can't allocate image surface: " + message);
        }
        _surface = Cairo::RefPtr<Cairo::ImageSurface>(new Cairo::ImageSurface(cobj, true));
    }
    return _surface;
}

std::shared_ptr<Surface> Surface::similar(std::optional<Geom::IntPoint> dimensions) const
{
    return std::make_shared<Surface>(dimensions ? *dimensions : _dimensions, _format);
}

std::shared_ptr<Surface> Surface::copy() const
{
    auto dest = similar();
    if (ready() && _dimensions.x() > 0 && _dimensions.y() > 0) {
        auto const &from = getCairoSurface();
        auto const &to = dest->getCairoSurface();
        from->flush();
        // Same format and size, so the strides agree as well
        std::memcpy(to->get_data(), from->get_data(), static_cast<size_t>(from->get_stride()) * from->get_height());
        to->mark_dirty();
    }
    return dest;
}

} // namespace Umbra::Renderer

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

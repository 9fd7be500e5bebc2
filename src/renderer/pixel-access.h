// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * Access the memory of a surface of pixels in a predictable way.
 *//*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef UMBRA_RENDERER_PIXEL_ACCESS_H
#define UMBRA_RENDERER_PIXEL_ACCESS_H

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <vector>
#include <cairomm/surface.h>
#include <glib.h>

/**
 * Terms:
 *
 *  Color - Three color channels plus alpha, always in the order R, G, B, A.
 *  Channel - One of those color values as a double in [0,1], alpha is always the last.
 *  Surface - Is a collection of Cairo pixels in a 2d grid with a specific stride.
 *  Primary - One of the values packed into a pixel. These may be floats or bytes
 *            and are premultiplied by alpha, as Cairo expects them to be.
 *  Coordinates - Or Coords, are a pair of X,Y values within the surface image,
 *                y grows downwards from the top row.
 *  Position - A single memory address offset which a coordinate can be transformed
 *             into to locate the pixel in the surface memory.
 */
namespace Umbra::Renderer {

/**
 * Image surface memory access for the two formats the renderer handles.
 *
 * Coordinates are not checked, filters test them with contains() before reading or
 * writing anything that may fall outside.
 *
 * @template_arg format - The cairo type for this pixel access, ARGB32 or RGBA128F.
 */
template <cairo_format_t format>
class PixelAccess
{
public:
    // Is the format an integer based format
    constexpr static bool is_integer = format != CAIRO_FORMAT_RGBA128F;

    // Color channels, not counting alpha
    constexpr static int channel_count = 3;
    constexpr static int channel_total = channel_count + 1;

    // The internal type used by each primary in the format
    using PrimaryType = std::conditional_t<is_integer, unsigned char, float>;

    // Provides the size of the primary in memory as number of bytes
    constexpr static int primary_size = sizeof(PrimaryType);

    // Scale of each primary to convert to a double used in Channels
    constexpr static double primary_scale = is_integer ? 255.0 : 1.0;

    // Position of the alpha primary in this format
    constexpr static int primary_alpha = is_integer ? 0 : channel_count;

    using Color = std::array<double, channel_total>;

    /**
     * Create a pixel access object for the given cairo surface.
     *
     * @arg cairo_surface - The Cairo Surface to gain memory access to.
     */
    explicit PixelAccess(Cairo::RefPtr<Cairo::ImageSurface> cairo_surface)
        requires(format == CAIRO_FORMAT_ARGB32 || format == CAIRO_FORMAT_RGBA128F)
        : _width(cairo_surface->get_width())
        , _height(cairo_surface->get_height())
        , _stride(cairo_surface->get_stride() / primary_size)
        , _size(_height * _stride)
        , _memory(reinterpret_cast<PrimaryType *>(cairo_surface->get_data()))
        , _cairo_surface(cairo_surface)
    {
        if (cairo_image_surface_get_format(cairo_surface->cobj()) != format) {
            throw std::invalid_argument("format of the cairo surface doesn't match the PixelAccess type");
        }
        _cairo_surface->flush(); // This pairs with mark_dirty in ~PixelAccess
    }

    /**
     * Create access to a patch of memory which isn't part of a cairo surface. The memory is
     * owned by this access object, packed RGBA with no padding at the end of rows.
     */
    PixelAccess(std::vector<PrimaryType> memory, int width, int height)
        : _local_memory(std::move(memory))
        , _width(width)
        , _height(height)
        , _stride(width * channel_total)
        , _size(_height * _stride)
        , _memory(_local_memory.data())
    {
        if (_local_memory.size() != static_cast<size_t>(_size)) {
            throw std::invalid_argument("contiguous pixel memory doesn't match the given dimensions");
        }
    }

    PixelAccess(PixelAccess const &) = delete;
    PixelAccess &operator=(PixelAccess const &) = delete;

    ~PixelAccess()
    {
        if (_cairo_surface) {
            _cairo_surface->mark_dirty();
        }
    }

    /**
     * Get a color from the surface at the given coordinates.
     *
     * @arg x - The pixel x coordinate to get
     * @arg y - The pixel y coordinate to get
     * @arg unmultiply_alpha - Remove premultiplied alpha if true
     */
    inline Color colorAt(int x, int y, bool unmultiply_alpha = false) const
    {
        Color ret;
        int pos = _pixel_pos(x, y);
        double alpha = _get_alpha(pos);
        double alpha_mult = unmultiply_alpha ? _mult(alpha) : 1.0;
        for (int c = 0; c < channel_count; c++) {
            ret[c] = _get_channel(pos, c, alpha_mult);
        }
        ret[channel_count] = alpha;
        return ret;
    }

    /**
     * Set the given pixel to the color values, apply premultiplication of alpha if neccessary to
     * keep the surface in a premultiplied state for further drawing operations.
     *
     * @arg x - The x coordinate to set
     * @arg y - The y coordinate to set
     * @arg values - The color values to set
     * @arg unmultiply_alpha - If true, values are not premultiplied and will be before saving
     */
    void colorTo(int x, int y, Color const &values, bool unmultiply_alpha = false)
    {
        int pos = _pixel_pos(x, y);
        double alpha = values[channel_count];
        double mult = unmultiply_alpha ? alpha : 1.0;
        _memory[pos + _primary_pos(primary_alpha)] = _to_primary(alpha);
        for (int c = 0; c < channel_count; c++) {
            _memory[pos + _channel_to_primary(c)] = _to_primary(values[c] * mult);
        }
    }

    /**
     * Return the alpha compnent only.
     */
    double alphaAt(int x, int y) const { return _get_alpha(_pixel_pos(x, y)); }

    /**
     * Returns true when the coordinates land inside the image.
     */
    bool contains(int x, int y) const { return x >= 0 && y >= 0 && x < _width && y < _height; }

    int width() const { return _width; }
    int height() const { return _height; }

    /**
     * Create a block of contiguous memory, packed RGBA in row-major order with no row padding.
     *
     * @arg copy - If false, doesn't copy and returns a zeroed block of the right size
     * @arg unpremultiply_alpha - If true, unmultiplies the alpha on copy.
     *
     * @returns A vector or the requested memory types
     */
    template <typename T0>
    std::vector<T0> contiguousMemory(bool copy = true, bool unpremultiply_alpha = false) const
    {
        std::vector<T0> memory;
        if (!copy) {
            memory.resize(static_cast<size_t>(_width) * _height * channel_total);
            return memory;
        }
        memory.reserve(static_cast<size_t>(_width) * _height * channel_total);
        for (int y = 0; y < _height; y++) {
            for (int x = 0; x < _width; x++) {
                int pos = y * _stride + x * channel_total;
                double alpha_mult = unpremultiply_alpha ? _mult(_get_alpha(pos)) : 1.0;
                for (int c = 0; c < channel_count; c++) {
                    memory.emplace_back(static_cast<T0>(_get_channel(pos, c, alpha_mult)));
                }
                memory.emplace_back(static_cast<T0>(_get_alpha(pos)));
            }
        }
        return memory;
    }

private:
    /**
     * Get the channel value from a specific memory position
     *
     * @arg pos        - The memory position in the surface (see _pixel_pos)
     * @arg channel    - Which channel to get, NOT the primary number.
     * @arg alpha_mult - If set will unpremultiply the channel, we do it here to preserve
     *                   as much precision before possible conversion to int.
     */
    inline double _get_channel(int pos, int channel, double alpha_mult) const
    {
        return _memory[pos + _channel_to_primary(channel)] / primary_scale * alpha_mult;
    }

    /**
     * Return the primary position given the channel index.
     */
    static inline int _channel_to_primary(int channel)
    {
        return _primary_pos(channel < channel_count ? channel + is_integer : primary_alpha);
    }

    /**
     * Get the alpha primary only
     */
    inline double _get_alpha(int pos) const { return _memory[pos + _primary_pos(primary_alpha)] / primary_scale; }

    /**
     * Scale a channel value into the storage type, bytes are rounded and clamped.
     */
    static inline PrimaryType _to_primary(double value)
    {
        if constexpr (is_integer) {
            return static_cast<PrimaryType>(std::clamp(value, 0.0, 1.0) * primary_scale + 0.5);
        }
        return static_cast<PrimaryType>(value);
    }

    /**
     * Get the multiplication alpha for use in premultiplications
     */
    static inline double _mult(double alpha) { return alpha > 0 ? 1.0 / alpha : 0.0; }

    /**
     * Get the position in the memory of this pixel
     */
    inline int _pixel_pos(int x, int y) const { return y * _stride + x * channel_total; }

    /**
     * Convert the primary position into a memory location based on the endianness
     * of the uint32 Cairo stores ARGB32 pixels in. Floats are always stored RGBA.
     */
    static constexpr inline int _primary_pos(int p)
    {
        if constexpr (G_BYTE_ORDER == G_LITTLE_ENDIAN) {
            return is_integer ? channel_count - p : p;
        } else {
            return p;
        }
    }

    // This is used for temporary contiguous surfaces such as blur scratch memory.
    std::vector<PrimaryType> _local_memory;

    // Basic metrics for the surface
    int const _width;
    int const _height;
    int const _stride;
    int const _size;
    PrimaryType *_memory{};

    // Keep a copy of the cairo surface RefPtr to keep it alive while we exist (we don't use it directly)
    Cairo::RefPtr<Cairo::ImageSurface> _cairo_surface;
};

} // namespace Umbra::Renderer

#endif // UMBRA_RENDERER_PIXEL_ACCESS_H

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

// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * Raw filter functions for gaussian blur
 *
 * A separable FIR blur: one horizontal pass followed by one vertical pass over the
 * first pass's output, sampling past the image border by repeating the edge pixel.
 *
 *//*
 * Copyright (C) 2006-2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef UMBRA_RENDERER_PIXEL_FILTER_GAUSSIAN_BLUR_H
#define UMBRA_RENDERER_PIXEL_FILTER_GAUSSIAN_BLUR_H

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <vector>
#include <boost/container/small_vector.hpp>
#include <2geom/point.h>

namespace Umbra::Renderer::PixelFilter {

using FIRValue = double;

template <typename T>
static inline T sqr(T const &v)
{
    return v * v;
}

struct GaussianBlur
{
    // Channels in the packed RGBA scratch memory
    constexpr static int channels = 4;

    int _radius;

    /**
     * @arg radius - Number of pixels either side of the centre that contribute to each
     *               output pixel. The deviation is half of it. Zero means no blur at all.
     */
    explicit GaussianBlur(int radius)
        : _radius(radius)
    {
        if (radius < 0) {
            throw std::invalid_argument("Gaussian blur radius can not be negative");
        }
    }

    /**
     * Blur src into dst, both must have the same dimensions. Every channel is blurred on its
     * own with the alpha removed from the colors first. It's fine for dst and src to be the
     * same surface as src is copied out before anything is written.
     */
    template <class AccessDst, class AccessSrc>
    void filter(AccessDst &dst, AccessSrc const &src) const
    {
        int const w = src.width();
        int const h = src.height();
        if (dst.width() != w || dst.height() != h) {
            throw std::invalid_argument("Gaussian blur needs source and destination of the same size");
        }

        auto input = src.template contiguousMemory<float>(true, true);

        if (_radius > 0 && w > 0 && h > 0) {
            auto const kernel = make_kernel();
            std::vector<float> scratch(input.size());
            gaussian_pass_FIR<Geom::X>(input.data(), scratch.data(), w, h, kernel);
            gaussian_pass_FIR<Geom::Y>(scratch.data(), input.data(), w, h, kernel);
        }

        typename AccessDst::Color color;
        for (int y = 0; y < h; y++) {
            for (int x = 0; x < w; x++) {
                auto const *pixel = &input[(static_cast<size_t>(y) * w + x) * channels];
                for (int c = 0; c < channels; c++) {
                    color[c] = pixel[c];
                }
                dst.colorTo(x, y, color, true);
            }
        }
    }

    /**
     * Returns half of the symmetric kernel, entry i is the weight for the pixels i away
     * from the centre. The whole kernel sums to exactly 1.
     */
    std::vector<FIRValue> make_kernel() const
    {
        std::vector<FIRValue> kernel(_radius + 1);
        _make_kernel(&kernel[0], _radius, _radius / 2.0);
        return kernel;
    }

private:
    /**
     * Run one pass over the packed RGBA memory, reading only from `in` and writing to `out`.
     */
    template <Geom::Dim2 axis>
    static void gaussian_pass_FIR(float const *in, float *out, int width, int height,
                                  std::vector<FIRValue> const &kernel)
    {
        // Assumes kernel is symmetric
        int const scr_len = kernel.size() - 1;
        int const col_count = axis == Geom::X ? width : height;
        int const row_count = axis == Geom::X ? height : width;

        // Distance in floats to the next pixel along the line, and to the next line
        int const next_col = axis == Geom::X ? channels : width * channels;
        int const next_line = axis == Geom::X ? width * channels : channels;

        for (int row = 0; row < row_count; row++) {
            for (int c = 0; c < channels; c++) {
                auto const src_line = in + static_cast<size_t>(row) * next_line + c;
                auto const dst_line = out + static_cast<size_t>(row) * next_line + c;

                for (int c1 = 0; c1 < col_count; c1++) {
                    double sum = 0;
                    float last_in = -1;
                    int different_count = 0;

                    // go over our point's neighbours, repeating the edge pixel past the border
                    for (int i = -scr_len; i <= scr_len; i++) {
                        int const c1_in = std::clamp(c1 + i, 0, col_count - 1);
                        float const in_byte = src_line[static_cast<size_t>(c1_in) * next_col];

                        // is it the same as last one we saw?
                        if (in_byte != last_in) different_count++;
                        last_in = in_byte;

                        // sum pixels weighted by the kernel
                        sum += in_byte * kernel[std::abs(i)];
                    }
                    dst_line[static_cast<size_t>(c1) * next_col] = sum;

                    // optimization: if there was no variation within this point's neighborhood,
                    // skip ahead while we keep seeing the same last_in value:
                    // blurring flat color would not change it anyway
                    if (different_count <= 1) {
                        dst_line[static_cast<size_t>(c1) * next_col] = last_in;
                        while (c1 + 1 + scr_len < col_count &&
                               src_line[static_cast<size_t>(c1 + 1 + scr_len) * next_col] == last_in) {
                            c1++; // skip the next iter
                            dst_line[static_cast<size_t>(c1) * next_col] = last_in;
                        }
                    }
                }
            }
        }
    }

    static void _make_kernel(FIRValue *const kernel, int const scr_len, double const deviation)
    {
        if (scr_len == 0) {
            kernel[0] = 1;
            return;
        }
        double const d_sq = sqr(deviation) * 2;
        boost::container::small_vector<double, 65> k(scr_len + 1);

        // Compute kernel and sum of coefficients
        // Note that actually only half the kernel is computed, as it is symmetric
        double sum = 0;
        for (int i = scr_len; i >= 0; i--) {
            k[i] = std::exp(-sqr(i) / d_sq);
            if (i > 0)
                sum += k[i];
        }
        // the sum of the complete kernel is twice as large (plus the center element which we skipped above to prevent
        // counting it twice)
        sum = 2 * sum + k[0];

        // Normalize kernel (making sure the sum is exactly 1)
        double ksum = 0;
        FIRValue kernelsum = 0;
        for (int i = scr_len; i >= 1; i--) {
            ksum += k[i] / sum;
            kernel[i] = ksum - static_cast<double>(kernelsum);
            kernelsum += kernel[i];
        }
        kernel[0] = FIRValue(1) - 2 * kernelsum;
    }
};

} // namespace Umbra::Renderer::PixelFilter

#endif // UMBRA_RENDERER_PIXEL_FILTER_GAUSSIAN_BLUR_H

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

// SPDX-License-Identifier: GPL-2.0-or-later
/***** SHARED TEST TOOLS FOR PIXEL-ACCESS TESTS *******/

#ifndef UMBRA_TEST_RENDERER_PIXEL_ACCESS_TESTBASE_H
#define UMBRA_TEST_RENDERER_PIXEL_ACCESS_TESTBASE_H

#include <map>
#include <memory>
#include <cairomm/context.h>
#include <gtest/gtest.h>

#include "../test-utils.h"
#include "renderer/pixel-access.h"
#include "pixel-filter-testfilters.h"

using namespace Umbra::Renderer;

template <cairo_format_t format = CAIRO_FORMAT_RGBA128F>
struct TestCairoSurface
{
    using Access = PixelAccess<format>;

    TestCairoSurface(int w, int h)
        : _s(Cairo::RefPtr<Cairo::ImageSurface>(new Cairo::ImageSurface(cairo_image_surface_create(format, w, h), true)))
        , _d(std::make_shared<Access>(_s))
    {}

    /**
     * Paint an unpremultiplied color into a rectangle with cairo.
     */
    void rect(int x, int y, int w, int h, std::array<double, 4> const &c)
    {
        auto cr = Cairo::Context::create(_s);
        cr->set_operator(Cairo::Context::Operator::SOURCE);
        cr->rectangle(x, y, w, h);
        cr->set_source_rgba(c[0], c[1], c[2], c[3]);
        cr->fill();
        _s->flush();
    }

    Cairo::RefPtr<Cairo::ImageSurface> _s;
    std::shared_ptr<Access> _d;
};

/**
 * Test single pixel getter
 */
template <typename Access>
::testing::AssertionResult ColorIs(Access &d, int x, int y, typename Access::Color const &c, bool unmultiply = false,
                                   double epsilon = 0.01)
{
    auto ct = d.colorAt(x, y, unmultiply);
    return VectorIsNear(c, ct, epsilon) << "\n    X:" << x << "\n    Y:" << y << "\n\n";
}

/**
 * Test single pixel setter, the pixel is put back as it was afterwards.
 *
 * d - Surface to test
 * x,y - Coordinates to set the color to and read it back from
 * c - Color values to set
 */
template <typename Access>
::testing::AssertionResult ColorWillBe(Access &d, int x, int y, typename Access::Color const &c,
                                       bool unmultiply = false)
{
    auto before = d.colorAt(x, y, unmultiply);
    if (VectorIsNear(c, before, 0.001) == ::testing::AssertionSuccess()) {
        return ::testing::AssertionFailure() << "\n"
                                             << print_values(c) << "\n ALREADY SET at " << x << "," << y << "\n";
    }
    d.colorTo(x, y, c, unmultiply);
    auto after = d.colorAt(x, y, unmultiply);
    d.colorTo(x, y, before, unmultiply);
    // Bytes only hold 1/255 steps
    double const epsilon = Access::is_integer ? 0.01 : 0.001;
    return VectorIsNear(c, after, epsilon) << "\n    X:" << x << "\n    Y:" << y << "\n";
}

template <typename Access>
::testing::AssertionResult ImageIs(Access const &d, std::string const &test,
                                   PixelPatch::Method method = PixelPatch::Method::ALPHA, unsigned patch_x = 3)
{
    auto patch = PixelPatch{._method = method, ._patch_x = patch_x, ._patch_y = patch_x}.filter(d);
    if (test != patch) {
        return ::testing::AssertionFailure() << ::testing::PrintToString(PatchResult(test, patch._stride)) << "!=\n"
                                             << ::testing::PrintToString(patch);
    }
    return ::testing::AssertionSuccess();
}

/**
 * Test a cairo surface against a compressed example
 */
inline ::testing::AssertionResult ImageIs(Cairo::RefPtr<Cairo::ImageSurface> s, std::string const &test,
                                          PixelPatch::Method method = PixelPatch::Method::ALPHA, unsigned patch = 3)
{
    // PixelAccess is templated requiring compile time information about type formatting.
    switch (cairo_image_surface_get_format(s->cobj())) {
        case CAIRO_FORMAT_ARGB32:
            {
                auto pa1 = PixelAccess<CAIRO_FORMAT_ARGB32>(s);
                return ImageIs(pa1, test, method, patch);
            }
        case CAIRO_FORMAT_RGBA128F:
            {
                auto pa2 = PixelAccess<CAIRO_FORMAT_RGBA128F>(s);
                return ImageIs(pa2, test, method, patch);
            }
        default:
            return ::testing::AssertionFailure() << "UNHANDLED_FORMAT";
    }
}

/**
 * Get the cairo format as a printable name
 */
inline std::string get_format_name(cairo_format_t format)
{
    static const std::map<cairo_format_t, std::string> map = {
        {CAIRO_FORMAT_ARGB32, "ARGB32"},
        {CAIRO_FORMAT_RGBA128F, "RGBA128F"},
    };
    return map.at(format);
}

/**
 * Run a two input filter on flat colored surfaces and test the unpremultiplied result.
 *
 * @arg test - Expected color in the destination after filtering.
 * @arg dst  - Color the destination starts with.
 * @arg src  - Color of the source fed to the filter.
 */
template <class Filter>
::testing::AssertionResult FilterColors(Filter &&f, std::array<double, 4> const &test,
                                        std::array<double, 4> const &dst, std::array<double, 4> const &src)
{
    auto s_dst = TestCairoSurface<>(6, 6);
    auto s_src = TestCairoSurface<>(6, 6);
    s_dst.rect(0, 0, 6, 6, dst);
    s_src.rect(0, 0, 6, 6, src);
    f.filter(*s_dst._d, *s_src._d);
    auto p = s_dst._d->colorAt(1, 1, true);
    return VectorIsNear(p, test, 0.001);
}

#endif // UMBRA_TEST_RENDERER_PIXEL_ACCESS_TESTBASE_H

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

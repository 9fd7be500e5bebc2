// SPDX-License-Identifier: GPL-2.0-or-later
/***** SHARED TEST TOOLS FOR SURFACE TESTS *******/

#ifndef UMBRA_TEST_RENDERER_SURFACE_TESTBASE_H
#define UMBRA_TEST_RENDERER_SURFACE_TESTBASE_H

#include <memory>
#include <string>
#include <cairomm/context.h>

#include "../test-utils.h"

#include "renderer/surface.h"
#include "pixel-filter-testfilters.h"

using namespace Umbra;

class TestSurface : public Renderer::Surface
{
public:
    using Renderer::Surface::Surface;

    /**
     * Fill a rectangle with an unpremultiplied color, replacing what was there.
     */
    void rect(int x, int y, int w, int h, std::array<double, 4> const &c)
    {
        SetPixels pixels;
        pixels.rectWillBe(x, y, w, h, c);
        run_pixel_filter(pixels);
    }

    std::vector<double> get_pixel(int x, int y) { return run_pixel_filter(SampleColor(x, y)); }
};

template <PixelPatch::Method method = PixelPatch::Method::ALPHA>
void EXPECT_IMAGE_IS(Renderer::Surface &surface, std::string result, unsigned scale = 3)
{
    auto patch = surface.run_pixel_filter(PixelPatch{
        ._method = method,
        ._patch_x = scale,
        ._patch_y = scale,
    });
    EXPECT_EQ(patch, PatchResult(result, patch._stride));
}

#endif // UMBRA_TEST_RENDERER_SURFACE_TESTBASE_H

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

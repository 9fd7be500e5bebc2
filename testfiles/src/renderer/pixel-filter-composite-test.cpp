// SPDX-License-Identifier: GPL-2.0-or-later

#include "renderer/pixel-filters/composite.h"
#include "renderer/pixel-filters/flood.h"
#include "pixel-access-testbase.h"

using namespace Umbra::Renderer::PixelFilter;

using Rgba = std::array<double, 4>;

TEST(PixelFilterCompositeTest, CompositeOver)
{
    // Half red over opaque blue
    EXPECT_TRUE(FilterColors(CompositeOver(), {0.5, 0.0, 0.5, 1.0}, // result
                             {0.0, 0.0, 1.0, 1.0},                    // dst
                             {1.0, 0.0, 0.0, 0.5}));                  // src
    // Half red over half blue
    EXPECT_TRUE(FilterColors(CompositeOver(), {2.0 / 3.0, 0.0, 1.0 / 3.0, 0.75}, {0.0, 0.0, 1.0, 0.5},
                             {1.0, 0.0, 0.0, 0.5}));
    // Opaque source replaces the destination
    EXPECT_TRUE(FilterColors(CompositeOver(), {0.2, 0.4, 0.6, 1.0}, {1.0, 1.0, 1.0, 0.5}, {0.2, 0.4, 0.6, 1.0}));
    // Anything over a transparent destination is itself
    EXPECT_TRUE(FilterColors(CompositeOver(), {0.2, 0.4, 0.6, 0.3}, {0.0, 0.0, 0.0, 0.0}, {0.2, 0.4, 0.6, 0.3}));
}

TEST(PixelFilterCompositeTest, TransparentSourceIsSkipped)
{
    EXPECT_TRUE(FilterColors(CompositeOver(), {0.0, 0.0, 1.0, 0.5}, {0.0, 0.0, 1.0, 0.5}, {1.0, 0.0, 0.0, 0.0}));
}

TEST(PixelFilterCompositeTest, NearlyTransparentResult)
{
    // Below the threshold the source color is kept as it is
    Rgba dst = {0.0, 0.0, 1.0, 0.0};
    CompositeOver::over(Rgba{1.0, 0.5, 0.0, 0.00005}, dst);
    EXPECT_TRUE(VectorIsNear(dst, Rgba{1.0, 0.5, 0.0, 0.00005}, 1e-9));

    dst = {0.0, 0.0, 1.0, 0.0};
    CompositeOver::over(Rgba{1.0, 0.5, 0.0, 0.0}, dst);
    EXPECT_TRUE(VectorIsNear(dst, Rgba{1.0, 0.5, 0.0, 0.0}, 1e-9));
}

TEST(PixelFilterCompositeTest, OrderMatters)
{
    Rgba const back = {0.2, 0.2, 0.2, 1.0};
    Rgba const shadow = {0.0, 0.0, 0.0, 0.5};
    Rgba const top = {1.0, 0.0, 0.0, 0.5};

    // back, then shadow, then top
    auto a = back;
    CompositeOver::over(shadow, a);
    CompositeOver::over(top, a);
    EXPECT_TRUE(VectorIsNear(a, Rgba{0.55, 0.05, 0.05, 1.0}, 1e-9));

    // back, then top, then shadow
    auto b = back;
    CompositeOver::over(top, b);
    CompositeOver::over(shadow, b);
    EXPECT_TRUE(VectorIsNear(b, Rgba{0.3, 0.05, 0.05, 1.0}, 1e-9));

    EXPECT_FALSE(VectorIsNear(a, b, 0.01));
}

TEST(PixelFilterCompositeTest, Offset)
{
    auto dst = TestCairoSurface<>(6, 6);
    auto src = TestCairoSurface<>(2, 2);
    src.rect(0, 0, 2, 2, {1.0, 1.0, 1.0, 1.0});

    CompositeOver({4, 4}).filter(*dst._d, *src._d);
    // Partly outside, only the top left pixel lands
    CompositeOver({-1, -1}).filter(*dst._d, *src._d);
    // Entirely outside
    CompositeOver({6, 0}).filter(*dst._d, *src._d);

    EXPECT_TRUE(ImageIs(*dst._d,
                        "&     "
                        "      "
                        "      "
                        "      "
                        "    &&"
                        "    &&",
                        PixelPatch::Method::ALPHA, 1));
}

TEST(PixelFilterFloodTest, Flood)
{
    auto dst = TestCairoSurface<>(4, 4);
    Flood({0.2, 0.4, 0.6, 0.5}).filter(*dst._d);
    for (int y = 0; y < 4; y++) {
        for (int x = 0; x < 4; x++) {
            ASSERT_TRUE(ColorIs(*dst._d, x, y, {0.2, 0.4, 0.6, 0.5}, true, 1e-6));
        }
    }

    // Flooding replaces what was there, it doesn't composite
    Flood({1.0, 0.0, 0.0, 1.0}).filter(*dst._d);
    EXPECT_TRUE(ColorIs(*dst._d, 2, 2, {1.0, 0.0, 0.0, 1.0}, true, 1e-6));
}

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

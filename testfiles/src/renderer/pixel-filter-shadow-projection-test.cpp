// SPDX-License-Identifier: GPL-2.0-or-later

#include "renderer/pixel-filters/shadow-projection.h"
#include "pixel-access-testbase.h"

using namespace Umbra::Renderer::PixelFilter;

using Rgba = std::array<double, 4>;

TEST(PixelShadowProjectionTest, ProjectsAlpha)
{
    auto src = TestCairoSurface<>(4, 4);
    src.rect(0, 0, 4, 4, {1.0, 1.0, 1.0, 1.0});
    auto dst = TestCairoSurface<>(6, 6);

    ShadowProjection({1, 1}, {0.0, 0.0, 0.0, 1.0}, 0.5).filter(*dst._d, *src._d);

    EXPECT_TRUE(ImageIs(*dst._d,
                        "      "
                        " ---- "
                        " ---- "
                        " ---- "
                        " ---- "
                        "      ",
                        PixelPatch::Method::ALPHA, 1));
    EXPECT_TRUE(ColorIs(*dst._d, 2, 2, {0.0, 0.0, 0.0, 0.5}, true, 1e-6));
}

TEST(PixelShadowProjectionTest, AlphaScaling)
{
    auto src = TestCairoSurface<>(2, 2);
    src.rect(0, 0, 1, 1, {0.3, 0.3, 0.3, 0.5});
    auto dst = TestCairoSurface<>(2, 2);

    // Source alpha, opacity and the color's own alpha all multiply
    ShadowProjection({0, 0}, {0.0, 0.0, 1.0, 0.5}, 0.8).filter(*dst._d, *src._d);

    EXPECT_TRUE(ColorIs(*dst._d, 0, 0, {0.0, 0.0, 1.0, 0.2}, true, 1e-6));
    // Transparent source pixels leave nothing behind
    EXPECT_TRUE(ColorIs(*dst._d, 1, 1, {0.0, 0.0, 0.0, 0.0}, true, 1e-6));
}

TEST(PixelShadowProjectionTest, OutsideCanvasIsSkipped)
{
    auto src = TestCairoSurface<>(4, 4);
    src.rect(0, 0, 4, 4, {1.0, 1.0, 1.0, 1.0});
    auto dst = TestCairoSurface<>(6, 6);

    ShadowProjection({5, 5}, {0.0, 0.0, 0.0, 1.0}, 1.0).filter(*dst._d, *src._d);
    ShadowProjection({-3, -3}, {0.0, 0.0, 0.0, 1.0}, 1.0).filter(*dst._d, *src._d);

    EXPECT_TRUE(ImageIs(*dst._d,
                        "&     "
                        "      "
                        "      "
                        "      "
                        "      "
                        "     &",
                        PixelPatch::Method::ALPHA, 1));
}

TEST(PixelShadowProjectionTest, MaxAlphaWins)
{
    auto projection = ShadowProjection({0, 0}, {0.0, 0.0, 0.0, 1.0}, 1.0);

    // A weaker write keeps the alpha and moves the color half way
    Rgba existing = {1.0, 0.0, 0.0, 0.8};
    projection.project(existing, 0.4);
    EXPECT_TRUE(VectorIsNear(existing, Rgba{0.5, 0.0, 0.0, 0.8}, 1e-9));

    // A stronger write takes over completely
    existing = {1.0, 0.0, 0.0, 0.3};
    projection.project(existing, 0.6);
    EXPECT_TRUE(VectorIsNear(existing, Rgba{0.0, 0.0, 0.0, 0.6}, 1e-9));

    // Writing the same thing twice changes nothing
    auto again = existing;
    projection.project(again, 0.6);
    EXPECT_TRUE(VectorIsNear(again, existing, 1e-12));
}

TEST(PixelShadowProjectionTest, EmptyPixel)
{
    auto projection = ShadowProjection({0, 0}, {0.0, 0.0, 1.0, 1.0}, 1.0);

    Rgba existing = {0.0, 0.0, 0.0, 0.0};
    projection.project(existing, 0.3);
    EXPECT_TRUE(VectorIsNear(existing, Rgba{0.0, 0.0, 1.0, 0.3}, 1e-9));

    // Too faint to blend, the color stays but the alpha is still taken
    existing = {1.0, 1.0, 1.0, 0.0};
    projection.project(existing, 0.00001);
    EXPECT_TRUE(VectorIsNear(existing, Rgba{1.0, 1.0, 1.0, 0.00001}, 1e-9));
}

TEST(PixelShadowProjectionTest, ByteSurfaces)
{
    auto src = TestCairoSurface<CAIRO_FORMAT_ARGB32>(3, 3);
    src.rect(0, 0, 3, 3, {1.0, 0.0, 0.0, 1.0});
    auto dst = TestCairoSurface<>(3, 3);

    ShadowProjection({0, 0}, {0.2, 0.4, 0.6, 1.0}, 1.0).filter(*dst._d, *src._d);
    EXPECT_TRUE(ColorIs(*dst._d, 1, 1, {0.2, 0.4, 0.6, 1.0}, true, 1e-6));
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

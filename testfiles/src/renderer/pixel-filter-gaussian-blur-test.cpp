// SPDX-License-Identifier: GPL-2.0-or-later

#include <numeric>

#include "renderer/pixel-filters/gaussian-blur.h"
#include "pixel-access-testbase.h"

using namespace Umbra::Renderer::PixelFilter;

namespace {

double kernel_sum(std::vector<FIRValue> const &kernel)
{
    return kernel[0] + 2 * std::accumulate(kernel.begin() + 1, kernel.end(), 0.0);
}

} // namespace

TEST(PixelGaussianBlurTest, KernelIsNormalized)
{
    for (int radius = 0; radius <= 64; radius++) {
        auto kernel = GaussianBlur(radius).make_kernel();
        ASSERT_EQ(kernel.size(), static_cast<size_t>(radius + 1));
        EXPECT_TRUE(IsNear(kernel_sum(kernel), 1.0, 1e-12)) << "Radius: " << radius;
        for (int i = 1; i <= radius; i++) {
            EXPECT_LT(kernel[i], kernel[i - 1]) << "Radius: " << radius << " tap " << i;
        }
    }
}

TEST(PixelGaussianBlurTest, KernelWeights)
{
    // Deviation 1: weights 1, e^-0.5 and e^-2 before normalizing
    auto kernel = GaussianBlur(2).make_kernel();
    EXPECT_TRUE(VectorIsNear(kernel, {0.402620, 0.244201, 0.054489}, 1e-5));

    EXPECT_TRUE(VectorIsNear(GaussianBlur(0).make_kernel(), {1.0}, 1e-12));
}

TEST(PixelGaussianBlurTest, NegativeRadius)
{
    EXPECT_THROW(GaussianBlur(-1), std::invalid_argument);
}

TEST(PixelGaussianBlurTest, SizeMismatch)
{
    auto src = TestCairoSurface<>(4, 4);
    auto dst = TestCairoSurface<>(5, 4);
    EXPECT_THROW(GaussianBlur(1).filter(*dst._d, *src._d), std::invalid_argument);
}

TEST(PixelGaussianBlurTest, ZeroRadiusIsIdentity)
{
    auto src = TestCairoSurface<>(6, 6);
    src.rect(1, 1, 2, 3, {0.2, 0.4, 0.6, 0.5});
    src.rect(3, 2, 2, 2, {1.0, 0.0, 0.0, 1.0});

    auto dst = TestCairoSurface<>(6, 6);
    GaussianBlur(0).filter(*dst._d, *src._d);

    for (int y = 0; y < 6; y++) {
        for (int x = 0; x < 6; x++) {
            ASSERT_TRUE(ColorIs(*dst._d, x, y, src._d->colorAt(x, y), false, 1e-6));
        }
    }
}

TEST(PixelGaussianBlurTest, SinglePixelIsSeparable)
{
    auto src = TestCairoSurface<>(11, 11);
    src._d->colorTo(5, 5, {0.0, 0.0, 0.0, 1.0});
    auto dst = TestCairoSurface<>(11, 11);

    GaussianBlur(2).filter(*dst._d, *src._d);
    auto k = GaussianBlur(2).make_kernel();

    // Each output is the product of the horizontal and vertical weights
    for (int dy = -3; dy <= 3; dy++) {
        for (int dx = -3; dx <= 3; dx++) {
            double kx = std::abs(dx) <= 2 ? k[std::abs(dx)] : 0.0;
            double ky = std::abs(dy) <= 2 ? k[std::abs(dy)] : 0.0;
            EXPECT_TRUE(IsNear(dst._d->alphaAt(5 + dx, 5 + dy), kx * ky, 1e-6)) << dx << "," << dy;
        }
    }

    // Symmetric in both directions
    EXPECT_EQ(dst._d->alphaAt(4, 5), dst._d->alphaAt(6, 5));
    EXPECT_EQ(dst._d->alphaAt(5, 3), dst._d->alphaAt(5, 7));
    EXPECT_TRUE(IsNear(dst._d->alphaAt(3, 5), dst._d->alphaAt(5, 3), 1e-7));
}

TEST(PixelGaussianBlurTest, PreservesAlphaTotal)
{
    auto src = TestCairoSurface<>(21, 21);
    src.rect(8, 8, 5, 5, {0.0, 0.0, 0.0, 1.0});
    auto dst = TestCairoSurface<>(21, 21);

    GaussianBlur(3).filter(*dst._d, *src._d);

    EXPECT_TRUE(IsNear(AlphaTotal().filter(*src._d), 25.0, 1e-4));
    EXPECT_TRUE(IsNear(AlphaTotal().filter(*dst._d), 25.0, 1e-3));
    EXPECT_LT(dst._d->alphaAt(10, 10), 1.0);
    EXPECT_GT(dst._d->alphaAt(6, 10), 0.0);
}

TEST(PixelGaussianBlurTest, EdgePixelsExtend)
{
    // Samples past the border repeat the edge, so a flat image stays flat
    auto src = TestCairoSurface<>(5, 5);
    src.rect(0, 0, 5, 5, {0.2, 0.4, 0.6, 1.0});
    auto dst = TestCairoSurface<>(5, 5);

    GaussianBlur(4).filter(*dst._d, *src._d);

    for (int y = 0; y < 5; y++) {
        for (int x = 0; x < 5; x++) {
            ASSERT_TRUE(ColorIs(*dst._d, x, y, {0.2, 0.4, 0.6, 1.0}, true, 1e-5));
        }
    }
}

TEST(PixelGaussianBlurTest, ChannelsBlurIndependently)
{
    auto src = TestCairoSurface<>(2, 1);
    src.rect(0, 0, 1, 1, {1.0, 0.0, 0.0, 1.0});
    src.rect(1, 0, 1, 1, {0.0, 0.0, 1.0, 1.0});
    auto dst = TestCairoSurface<>(2, 1);

    // Deviation 0.5: the neighbour weighs e^-2 against 1 for the centre
    GaussianBlur(1).filter(*dst._d, *src._d);

    EXPECT_TRUE(ColorIs(*dst._d, 0, 0, {0.893493, 0.0, 0.106507, 1.0}, true, 1e-5));
    EXPECT_TRUE(ColorIs(*dst._d, 1, 0, {0.106507, 0.0, 0.893493, 1.0}, true, 1e-5));
}

TEST(PixelGaussianBlurTest, InPlace)
{
    auto src = TestCairoSurface<>(11, 11);
    src._d->colorTo(5, 5, {0.0, 0.0, 0.0, 1.0});
    auto copy = TestCairoSurface<>(11, 11);
    copy._d->colorTo(5, 5, {0.0, 0.0, 0.0, 1.0});
    auto dst = TestCairoSurface<>(11, 11);

    GaussianBlur(2).filter(*dst._d, *src._d);
    GaussianBlur(2).filter(*copy._d, *copy._d);

    for (int y = 0; y < 11; y++) {
        for (int x = 0; x < 11; x++) {
            ASSERT_TRUE(IsNear(copy._d->alphaAt(x, y), dst._d->alphaAt(x, y), 1e-7));
        }
    }
}

TEST(PixelGaussianBlurTest, ByteSurface)
{
    auto src = TestCairoSurface<CAIRO_FORMAT_ARGB32>(21, 21);
    src.rect(3, 3, 15, 15, {0.5, 0.75, 1.0, 1.0});
    auto dst = TestCairoSurface<CAIRO_FORMAT_ARGB32>(21, 21);

    GaussianBlur(2).filter(*dst._d, *src._d);

    // Only the corners and outer ring soften
    EXPECT_TRUE(ColorIs(*dst._d, 10, 10, {0.5, 0.75, 1.0, 1.0}, true, 0.01));
    EXPECT_TRUE(IsNear(dst._d->alphaAt(3, 10), 0.701, 0.01));
    EXPECT_TRUE(IsNear(dst._d->alphaAt(2, 10), 0.299, 0.01));
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

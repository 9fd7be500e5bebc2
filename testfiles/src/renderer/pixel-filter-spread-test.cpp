// SPDX-License-Identifier: GPL-2.0-or-later

#include "renderer/pixel-filters/spread.h"
#include "pixel-access-testbase.h"

using namespace Umbra::Renderer::PixelFilter;

TEST(PixelSpreadTest, Exponent)
{
    EXPECT_TRUE(IsNear(AlphaSpread::exponent(0.0), 1.0, 1e-12));
    EXPECT_TRUE(IsNear(AlphaSpread::exponent(0.5), 0.6, 1e-12));
    EXPECT_TRUE(IsNear(AlphaSpread::exponent(1.0), 0.2, 1e-12));
}

TEST(PixelSpreadTest, SpreadAboveOne)
{
    // Held at the full spread, alpha can't pass 1
    EXPECT_TRUE(IsNear(AlphaSpread::exponent(1.5), 0.2, 1e-12));
    EXPECT_TRUE(IsNear(AlphaSpread::exponent(-0.5), 1.0, 1e-12));

    for (double spread : {1.5, 2.0, 10.0}) {
        auto dst = TestCairoSurface<>(1, 1);
        dst._d->colorTo(0, 0, {0.0, 0.0, 0.0, 0.5});
        AlphaSpread(spread).filter(*dst._d);
        EXPECT_TRUE(IsNear(dst._d->alphaAt(0, 0), 0.870551, 1e-5)) << "Spread: " << spread;
    }
}

TEST(PixelSpreadTest, ZeroSpreadIsIdentity)
{
    auto dst = TestCairoSurface<>(4, 4);
    dst.rect(0, 0, 2, 4, {0.2, 0.4, 0.6, 0.25});

    AlphaSpread(0.0).filter(*dst._d);
    AlphaSpread(-1.0).filter(*dst._d);

    EXPECT_TRUE(ColorIs(*dst._d, 1, 1, {0.2, 0.4, 0.6, 0.25}, true, 1e-6));
    EXPECT_TRUE(ColorIs(*dst._d, 3, 3, {0.0, 0.0, 0.0, 0.0}, true, 1e-6));
}

TEST(PixelSpreadTest, RaisesAlphaOnly)
{
    auto dst = TestCairoSurface<>(4, 4);
    dst.rect(0, 0, 2, 4, {0.2, 0.4, 0.6, 0.5});

    AlphaSpread(1.0).filter(*dst._d);

    // 0.5 ^ 0.2
    EXPECT_TRUE(ColorIs(*dst._d, 1, 1, {0.2, 0.4, 0.6, 0.870551}, true, 1e-5));
    // Empty pixels stay empty
    EXPECT_TRUE(ColorIs(*dst._d, 3, 3, {0.0, 0.0, 0.0, 0.0}, true, 1e-6));
}

TEST(PixelSpreadTest, FullAlphaUnchanged)
{
    auto dst = TestCairoSurface<>(2, 2);
    dst.rect(0, 0, 2, 2, {1.0, 1.0, 1.0, 1.0});
    AlphaSpread(0.7).filter(*dst._d);
    EXPECT_TRUE(ColorIs(*dst._d, 0, 0, {1.0, 1.0, 1.0, 1.0}, true, 1e-6));
}

TEST(PixelSpreadTest, Monotonic)
{
    double last = 0.3;
    for (double spread = 0.1; spread <= 1.0; spread += 0.1) {
        auto dst = TestCairoSurface<>(1, 1);
        dst._d->colorTo(0, 0, {0.0, 0.0, 0.0, 0.3});
        AlphaSpread(spread).filter(*dst._d);
        double alpha = dst._d->alphaAt(0, 0);
        EXPECT_GT(alpha, last) << "Spread: " << spread;
        EXPECT_LE(alpha, 1.0);
        last = alpha;
    }
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

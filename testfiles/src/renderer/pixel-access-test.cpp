// SPDX-License-Identifier: GPL-2.0-or-later

#include "pixel-access-testbase.h"

/**** TESTS *****/

TEST(PixelAccessTest, AlphaIs)
{
    for (auto format : {CAIRO_FORMAT_ARGB32, CAIRO_FORMAT_RGBA128F}) {
        auto cobj = cairo_image_surface_create(format, 21, 21);
        auto s = Cairo::RefPtr<Cairo::ImageSurface>(new Cairo::ImageSurface(cobj, true));

        // Draw something here
        {
            auto c = cairo_create(cobj);
            cairo_rectangle(c, 3, 3, 15, 15);
            cairo_set_source_rgba(c, 0.0, 0.0, 0.0, 1.0);
            cairo_fill(c);
            cairo_destroy(c);
        }
        s->flush();

        ASSERT_TRUE(ImageIs(s,
                            "       "
                            " &&&&& "
                            " &&&&& "
                            " &&&&& "
                            " &&&&& "
                            " &&&&& "
                            "       "))
            << "Format: " << get_format_name(format) << "\n";
    }
}

TEST(PixelAccessTest, ColorIs)
{
    auto src = TestCairoSurface<>(21, 21);
    src.rect(3, 3, 6, 6, {1.0, 0.0, 0.0, 1.0});
    src.rect(12, 12, 6, 6, {0.0, 0.0, 1.0, 1.0});

    EXPECT_TRUE(ImageIs(*src._d,
                        "       "
                        " 33    "
                        " 33    "
                        "       "
                        "    `` "
                        "    `` "
                        "       ",
                        PixelPatch::Method::COLORS));
}

TEST(PixelAccessTest, UnmultiplyColor)
{
    auto src = TestCairoSurface<>(4, 4);
    src.rect(1, 1, 2, 2, {1.0, 0.0, 1.0, 0.5});

    ASSERT_TRUE(ColorIs(*src._d, 1, 1, {0.5, 0.0, 0.5, 0.5}, false));
    ASSERT_TRUE(ColorWillBe(*src._d, 2, 2, {0.5, 0.5, 0.5, 0.5}, false));

    ASSERT_TRUE(ColorIs(*src._d, 1, 1, {1.0, 0.0, 1.0, 0.5}, true));
    ASSERT_TRUE(ColorWillBe(*src._d, 2, 2, {0.2, 0.4, 0.6, 0.5}, true));

    auto src2 = TestCairoSurface<CAIRO_FORMAT_ARGB32>(4, 4);
    src2.rect(1, 1, 2, 2, {1.0, 0.0, 1.0, 0.5});

    ASSERT_TRUE(ColorIs(*src2._d, 1, 1, {0.5, 0.0, 0.5, 0.5}, false));
    ASSERT_TRUE(ColorIs(*src2._d, 1, 1, {1.0, 0.0, 1.0, 0.5}, true));
    ASSERT_TRUE(ColorWillBe(*src2._d, 2, 2, {0.2, 0.4, 0.6, 0.5}, true));
}

TEST(PixelAccessTest, TransparentReadsAsZero)
{
    auto src = TestCairoSurface<>(4, 4);
    src._d->colorTo(1, 1, {1.0, 1.0, 1.0, 0.0}, true);
    ASSERT_TRUE(ColorIs(*src._d, 1, 1, {0.0, 0.0, 0.0, 0.0}, true));
    ASSERT_TRUE(ColorIs(*src._d, 0, 0, {0.0, 0.0, 0.0, 0.0}, true));
}

TEST(PixelAccessTest, ByteChannelsRound)
{
    auto src = TestCairoSurface<CAIRO_FORMAT_ARGB32>(2, 2);
    src._d->colorTo(0, 0, {0.2, 0.4, 0.6, 1.0});
    // Red is the third byte of a little endian ARGB32 pixel
    EXPECT_EQ(src._s->get_data()[G_BYTE_ORDER == G_LITTLE_ENDIAN ? 2 : 1], 51);
    ASSERT_TRUE(ColorIs(*src._d, 0, 0, {0.2, 0.4, 0.6, 1.0}, false, 0.002));

    // Out of range values are clamped instead of wrapping around
    src._d->colorTo(1, 1, {1.5, -0.5, 0.5, 1.0});
    ASSERT_TRUE(ColorIs(*src._d, 1, 1, {1.0, 0.0, 0.5, 1.0}, false, 0.003));
}

TEST(PixelAccessTest, contains)
{
    auto src = TestCairoSurface<>(4, 3);
    EXPECT_TRUE(src._d->contains(0, 0));
    EXPECT_TRUE(src._d->contains(3, 2));
    EXPECT_FALSE(src._d->contains(-1, 0));
    EXPECT_FALSE(src._d->contains(0, -1));
    EXPECT_FALSE(src._d->contains(4, 0));
    EXPECT_FALSE(src._d->contains(0, 3));
}

TEST(PixelAccessTest, FormatMismatch)
{
    auto s = Cairo::RefPtr<Cairo::ImageSurface>(
        new Cairo::ImageSurface(cairo_image_surface_create(CAIRO_FORMAT_RGBA128F, 4, 4), true));
    EXPECT_THROW(PixelAccess<CAIRO_FORMAT_ARGB32>{s}, std::invalid_argument);
    EXPECT_NO_THROW(PixelAccess<CAIRO_FORMAT_RGBA128F>{s});
}

TEST(PixelAccessTest, nonCairoMemoryAccess)
{
    auto d = PixelAccess<CAIRO_FORMAT_RGBA128F>(std::vector<float>(4 * 21 * 21), 21, 21);
    for (int y = 6; y < 15; y++) {
        for (int x = 6; x < 15; x++) {
            d.colorTo(x, y, {1.0, 0.0, 1.0, 1.0});
        }
    }

    EXPECT_TRUE(ImageIs(d,
                        "       "
                        "       "
                        "  &&&  "
                        "  &&&  "
                        "  &&&  "
                        "       "
                        "       "));

    EXPECT_THROW(PixelAccess<CAIRO_FORMAT_RGBA128F>(std::vector<float>(10), 21, 21), std::invalid_argument);
}

TEST(PixelAccessTest, contiguousMemory)
{
    int w = 21;
    int h = 21;
    auto src = TestCairoSurface<>(w, h);
    src.rect(6, 6, 9, 9, {1.0, 0.0, 1.0, 0.5});

    auto copy = src._d->contiguousMemory<float>(true, false);
    ASSERT_EQ(copy.size(), static_cast<size_t>(w * h * 4));
    std::array<float, 4> mid;
    std::array<float, 4> first;
    for (auto i = 0; i < 4; i++) {
        first[i] = copy[i];
        mid[i] = copy[(10 * w + 10) * 4 + i];
    }
    EXPECT_TRUE(VectorIsNear(first, std::array<float, 4>{0.0, 0.0, 0.0, 0.0}, 0.005));
    EXPECT_TRUE(VectorIsNear(mid, std::array<float, 4>{0.5, 0.0, 0.5, 0.5}, 0.005));

    auto unmult = src._d->contiguousMemory<double>(true, true);
    std::array<double, 4> mid2;
    for (auto i = 0; i < 4; i++) {
        mid2[i] = unmult[(10 * w + 10) * 4 + i];
    }
    EXPECT_TRUE(VectorIsNear(mid2, std::array<double, 4>{1.0, 0.0, 1.0, 0.5}, 0.005));

    // No copy gives blank memory of the same size
    auto blank = src._d->contiguousMemory<float>(false);
    ASSERT_EQ(blank.size(), static_cast<size_t>(w * h * 4));
    EXPECT_EQ(*std::max_element(blank.begin(), blank.end()), 0.0f);
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

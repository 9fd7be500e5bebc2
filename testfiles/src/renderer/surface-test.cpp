// SPDX-License-Identifier: GPL-2.0-or-later

#include <gtest/gtest.h>

#include "surface-testbase.h"

TEST(SurfaceTest, FloatSurface)
{
    auto surface = TestSurface({10, 8});

    ASSERT_FALSE(surface.ready());
    ASSERT_EQ(surface.dimensions(), Geom::IntPoint(10, 8));
    ASSERT_EQ(surface.width(), 10);
    ASSERT_EQ(surface.height(), 8);
    ASSERT_EQ(surface.format(), CAIRO_FORMAT_RGBA128F);

    auto cs = surface.getCairoSurface();
    ASSERT_TRUE(surface.ready());
    ASSERT_EQ(cairo_image_surface_get_format(cs->cobj()), CAIRO_FORMAT_RGBA128F);
    // Four floats for every pixel, no padding
    ASSERT_EQ(cs->get_stride(), 16 * 10);

    // New surfaces start fully transparent
    EXPECT_TRUE(VectorIsNear(surface.get_pixel(3, 3), {0.0, 0.0, 0.0, 0.0}, 0.0001));
}

TEST(SurfaceTest, IntegerSurface)
{
    auto surface = TestSurface({10, 10}, CAIRO_FORMAT_ARGB32);

    auto cs = surface.getCairoSurface();
    ASSERT_TRUE(surface.ready());
    ASSERT_EQ(cairo_image_surface_get_format(cs->cobj()), CAIRO_FORMAT_ARGB32);

    auto similar = surface.similar(Geom::IntPoint(20, 20));
    ASSERT_EQ(similar->dimensions(), Geom::IntPoint(20, 20));
    ASSERT_EQ(similar->format(), surface.format());
    ASSERT_FALSE(similar->ready());
}

TEST(SurfaceTest, RefusedSurfaces)
{
    EXPECT_THROW(Renderer::Surface({10, 10}, CAIRO_FORMAT_A8), std::invalid_argument);
    EXPECT_THROW(Renderer::Surface({-1, 10}), std::invalid_argument);
    EXPECT_THROW(Renderer::Surface{Cairo::RefPtr<Cairo::ImageSurface>{}}, std::invalid_argument);

    auto a8 = Cairo::ImageSurface::create(Cairo::ImageSurface::Format::A8, 4, 4);
    EXPECT_THROW(Renderer::Surface{a8}, std::invalid_argument);
}

TEST(SurfaceTest, WrapImageSurface)
{
    auto image = Cairo::ImageSurface::create(Cairo::ImageSurface::Format::ARGB32, 12, 12);
    {
        auto cr = Cairo::Context::create(image);
        cr->rectangle(3, 3, 6, 6);
        cr->set_source_rgba(1.0, 0.0, 0.0, 1.0);
        cr->fill();
    }
    image->flush();

    auto surface = TestSurface(image);
    ASSERT_TRUE(surface.ready());
    ASSERT_EQ(surface.dimensions(), Geom::IntPoint(12, 12));
    ASSERT_EQ(surface.format(), CAIRO_FORMAT_ARGB32);
    ASSERT_EQ(surface.getCairoSurface(), image);

    EXPECT_IMAGE_IS(surface,
                    "    "
                    " && "
                    " && "
                    "    ");
    EXPECT_TRUE(VectorIsNear(surface.get_pixel(4, 4), {1.0, 0.0, 0.0, 1.0}, 0.01));
}

TEST(SurfaceTest, CopyIsIndependent)
{
    auto surface = TestSurface({6, 6});
    surface.rect(0, 0, 3, 3, {0.2, 0.4, 0.6, 0.5});

    auto copy = surface.copy();
    ASSERT_EQ(copy->dimensions(), surface.dimensions());
    ASSERT_EQ(copy->format(), surface.format());
    EXPECT_TRUE(VectorIsNear(copy->run_pixel_filter(SampleColor(1, 1)), {0.2, 0.4, 0.6, 0.5}, 0.0001));

    surface.rect(0, 0, 6, 6, {1.0, 1.0, 1.0, 1.0});
    EXPECT_TRUE(VectorIsNear(copy->run_pixel_filter(SampleColor(1, 1)), {0.2, 0.4, 0.6, 0.5}, 0.0001));
    EXPECT_TRUE(VectorIsNear(copy->run_pixel_filter(SampleColor(4, 4)), {0.0, 0.0, 0.0, 0.0}, 0.0001));

    // An untouched surface copies to another untouched surface
    auto blank = TestSurface({4, 4});
    EXPECT_FALSE(blank.copy()->ready());
}

struct TestPixelFilter
{
    template <typename AccessDst>
    std::vector<double> filter(AccessDst &dst) const
    {
        typename AccessDst::Color color;
        for (unsigned c = 0; c < color.size(); c++) {
            color[c] = 1.0;
        }
        dst.colorTo(0, 0, color);
        return {color.begin(), color.end()};
    }

    template <typename AccessDst, typename AccessSrc>
    std::vector<double> filter(AccessDst &dst, AccessSrc const &src) const
    {
        auto color1 = src.colorAt(0, 0);
        typename AccessDst::Color color;
        for (unsigned c = 0; c < color.size() && c < color1.size(); c++) {
            color[c] = color1[c] * 0.5;
        }
        dst.colorTo(0, 0, color);
        return {color.begin(), color.end()};
    }
};

TEST(SurfaceTest, RunPixelFilter)
{
    auto filter1 = TestPixelFilter();

    auto rgb32_surface = TestSurface({10, 10}, CAIRO_FORMAT_ARGB32);
    { // Int RGB
        auto color = rgb32_surface.run_pixel_filter(filter1);
        ASSERT_TRUE(VectorIsNear(color, {1.0, 1.0, 1.0, 1.0}, 0.01));
    }

    auto float_surface = TestSurface({10, 10});
    { // Float RGB
        auto color = float_surface.run_pixel_filter(filter1);
        ASSERT_TRUE(VectorIsNear(color, {1.0, 1.0, 1.0, 1.0}, 0.01));
    }

    { // Src and Dst in different formats
        auto color = float_surface.run_pixel_filter(filter1, rgb32_surface);
        ASSERT_TRUE(VectorIsNear(color, {0.5, 0.5, 0.5, 0.5}, 0.01));
        ASSERT_TRUE(VectorIsNear(float_surface.get_pixel(0, 0), {1.0, 1.0, 1.0, 0.5}, 0.01));
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

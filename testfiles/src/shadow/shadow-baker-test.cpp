// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for baking and previewing drop shadows
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <gtest/gtest.h>

#include "../renderer/surface-testbase.h"
#include "renderer/slot.h"
#include "shadow/shadow-baker.h"
#include "shadow/shadow-settings.h"

using namespace Umbra::Shadow;

namespace {

ShadowParameters hard_shadow()
{
    ShadowParameters params;
    params.shadow_color = {0.0, 0.0, 0.0, 1.0};
    params.opacity = 1.0;
    params.distance = 0.0;
    params.padding = 1;
    params.blur_radius = 0;
    return params;
}

std::vector<double> pixel(Renderer::Surface &surface, int x, int y)
{
    return surface.run_pixel_filter(SampleColor(x, y));
}

} // namespace

TEST(ShadowBakerTest, BakeUnblurred)
{
    auto source = TestSurface(Geom::IntPoint(4, 4));
    source.rect(0, 0, 4, 4, {1.0, 1.0, 1.0, 1.0});

    auto result = bake(source, hard_shadow());
    ASSERT_TRUE(result.shadow);
    EXPECT_EQ(result.shadow->dimensions(), Geom::IntPoint(6, 6));
    EXPECT_EQ(result.geometry.canvas, Geom::IntPoint(6, 6));
    EXPECT_IMAGE_IS(*result.shadow,
                    "      "
                    " &&&& "
                    " &&&& "
                    " &&&& "
                    " &&&& "
                    "      ",
                    1);
    EXPECT_TRUE(IsNear(result.scale.x(), 1.5, 1e-12));
    EXPECT_TRUE(IsNear(result.scale.y(), 1.5, 1e-12));
    EXPECT_TRUE(IsNear(result.geometry.pivot.x(), 0.5, 1e-12));

    // Baked shadows keep the shadow color, not the source's
    EXPECT_TRUE(VectorIsNear(pixel(*result.shadow, 2, 2), {0.0, 0.0, 0.0, 1.0}, 1e-6));
}

TEST(ShadowBakerTest, BakeOpacity)
{
    auto source = TestSurface(Geom::IntPoint(4, 4));
    source.rect(0, 0, 4, 4, {1.0, 1.0, 1.0, 1.0});

    auto params = hard_shadow();
    params.opacity = 0.5;
    auto result = bake(source, params);
    EXPECT_IMAGE_IS(*result.shadow,
                    "      "
                    " ---- "
                    " ---- "
                    " ---- "
                    " ---- "
                    "      ",
                    1);
}

TEST(ShadowBakerTest, BakeOffset)
{
    auto source = TestSurface(Geom::IntPoint(4, 4));
    source.rect(0, 0, 4, 4, {1.0, 1.0, 1.0, 1.0});

    auto params = hard_shadow();
    params.angle = 0.0;
    params.distance = 10.0;
    params.padding = 0;
    auto result = bake(source, params);

    EXPECT_EQ(result.geometry.offset, Geom::IntPoint(10, 0));
    EXPECT_EQ(result.geometry.shadow_origin - result.geometry.source_origin, Geom::IntPoint(10, 0));
    // The source itself is never part of the baked layer
    EXPECT_IMAGE_IS(*result.shadow,
                    "          &&&&"
                    "          &&&&"
                    "          &&&&"
                    "          &&&&",
                    1);
    EXPECT_TRUE(IsNear(result.scale.x(), 3.5, 1e-12));
    EXPECT_TRUE(IsNear(result.scale.y(), 1.0, 1e-12));
}

TEST(ShadowBakerTest, BakeBlurred)
{
    auto source = TestSurface(Geom::IntPoint(1, 1));
    source.rect(0, 0, 1, 1, {1.0, 1.0, 1.0, 1.0});

    auto params = hard_shadow();
    params.padding = 0;
    params.blur_radius = 1;
    auto result = bake(source, params);

    ASSERT_EQ(result.shadow->dimensions(), Geom::IntPoint(3, 3));
    // Centre tap 0.786986 squared
    EXPECT_TRUE(IsNear(pixel(*result.shadow, 1, 1)[3], 0.619347, 1e-4));
    EXPECT_TRUE(IsNear(pixel(*result.shadow, 0, 1)[3], 0.083820, 1e-4));
    EXPECT_TRUE(IsNear(pixel(*result.shadow, 0, 0)[3], 0.011344, 1e-4));
    EXPECT_TRUE(IsNear(result.scale.x(), 3.0, 1e-12));
}

TEST(ShadowBakerTest, SpreadOnBake)
{
    auto source = TestSurface(Geom::IntPoint(4, 4));
    source.rect(0, 0, 4, 4, {1.0, 1.0, 1.0, 1.0});

    auto params = hard_shadow();
    params.opacity = 0.5;
    params.spread = 1.0;

    // Off unless asked for
    auto plain = bake(source, params);
    EXPECT_TRUE(IsNear(pixel(*plain.shadow, 2, 2)[3], 0.5, 1e-6));

    auto spread = bake(source, params, {.spread_on_bake = true});
    EXPECT_IMAGE_IS(*spread.shadow,
                    "      "
                    " xxxx "
                    " xxxx "
                    " xxxx "
                    " xxxx "
                    "      ",
                    1);
}

TEST(ShadowBakerTest, RenderStages)
{
    auto source = TestSurface(Geom::IntPoint(4, 4));
    source.rect(0, 0, 4, 4, {1.0, 1.0, 1.0, 1.0});
    auto params = hard_shadow();
    auto geom = compute_canvas_geometry(source.dimensions(), params);

    // Nothing to blur, both stages share the projection
    auto unblurred = Renderer::Slot();
    render_shadow(unblurred, source, geom, params, true);
    EXPECT_EQ(unblurred.get(Renderer::SLOT_SHADOW), unblurred.get(Renderer::SLOT_BLURRED));

    // Spreading must not touch the projection
    params.opacity = 0.5;
    params.spread = 1.0;
    auto slot = Renderer::Slot();
    render_shadow(slot, source, geom, params, true);
    ASSERT_NE(slot.get(Renderer::SLOT_SHADOW), slot.get(Renderer::SLOT_BLURRED));
    EXPECT_TRUE(IsNear(pixel(*slot.get(Renderer::SLOT_SHADOW), 2, 2)[3], 0.5, 1e-6));
    EXPECT_TRUE(IsNear(pixel(*slot.get(Renderer::SLOT_BLURRED), 2, 2)[3], 0.870551, 1e-5));
    EXPECT_EQ(slot.get(), slot.get(Renderer::SLOT_BLURRED));
}

TEST(ShadowBakerTest, BlurShadow)
{
    auto shadow = std::make_shared<Renderer::Surface>(Geom::IntPoint(5, 5));
    EXPECT_EQ(blur_shadow(shadow, 0), shadow);
    EXPECT_NE(blur_shadow(shadow, 2), shadow);
    EXPECT_THROW(blur_shadow(shadow, -1), std::invalid_argument);
}

TEST(ShadowBakerTest, Preview)
{
    auto source = TestSurface(Geom::IntPoint(4, 4));
    source.rect(0, 0, 4, 4, {1.0, 0.0, 0.0, 1.0});

    auto params = hard_shadow();
    params.angle = 0.0;
    params.distance = 2.0;
    params.opacity = 0.5;
    Rgba const background = {0.0, 0.0, 1.0, 0.3};

    auto out = preview(source, params, background);
    ASSERT_TRUE(out);
    ASSERT_EQ(out->dimensions(), Geom::IntPoint(8, 6));

    // Background is always opaque
    EXPECT_TRUE(VectorIsNear(pixel(*out, 0, 0), {0.0, 0.0, 1.0, 1.0}, 1e-6));
    // Source on top of everything
    EXPECT_TRUE(VectorIsNear(pixel(*out, 1, 1), {1.0, 0.0, 0.0, 1.0}, 1e-6));
    EXPECT_TRUE(VectorIsNear(pixel(*out, 4, 4), {1.0, 0.0, 0.0, 1.0}, 1e-6));
    // Half black shadow showing past the source
    EXPECT_TRUE(VectorIsNear(pixel(*out, 6, 1), {0.0, 0.0, 0.5, 1.0}, 1e-6));
    EXPECT_TRUE(VectorIsNear(pixel(*out, 7, 1), {0.0, 0.0, 1.0, 1.0}, 1e-6));

    // The preview always spreads
    params.spread = 1.0;
    out = preview(source, params, background);
    EXPECT_TRUE(VectorIsNear(pixel(*out, 6, 1), {0.0, 0.0, 0.129449, 1.0}, 1e-5));
}

TEST(ShadowBakerTest, CompositePreviewOrder)
{
    auto source = TestSurface(Geom::IntPoint(2, 2));
    source.rect(0, 0, 2, 2, {1.0, 0.0, 0.0, 0.5});
    auto shadow = TestSurface(Geom::IntPoint(4, 4));
    shadow.rect(0, 0, 4, 4, {0.0, 0.0, 0.0, 0.5});
    auto geom = compute_canvas_geometry({2, 2}, 0.0, 0.0, 1, 0);

    auto out = composite_preview(source, shadow, geom, {0.2, 0.2, 0.2, 1.0});
    // Background, then shadow, then source
    EXPECT_TRUE(VectorIsNear(pixel(*out, 1, 1), {0.55, 0.05, 0.05, 1.0}, 1e-6));
    EXPECT_TRUE(VectorIsNear(pixel(*out, 0, 0), {0.1, 0.1, 0.1, 1.0}, 1e-6));
}

TEST(ShadowBakerTest, ByteSource)
{
    auto image = Cairo::ImageSurface::create(Cairo::ImageSurface::Format::ARGB32, 4, 4);
    auto cr = Cairo::Context::create(image);
    cr->set_source_rgba(0.0, 1.0, 0.0, 1.0);
    cr->paint();
    image->flush();

    auto source = Renderer::Surface(image);
    auto result = bake(source, hard_shadow());
    EXPECT_EQ(result.shadow->format(), CAIRO_FORMAT_RGBA128F);
    EXPECT_IMAGE_IS(*result.shadow,
                    "      "
                    " &&&& "
                    " &&&& "
                    " &&&& "
                    " &&&& "
                    "      ",
                    1);
}

TEST(ShadowBakerTest, NegativeValues)
{
    auto source = TestSurface(Geom::IntPoint(4, 4));
    auto params = hard_shadow();
    params.blur_radius = -1;
    EXPECT_THROW(bake(source, params), std::invalid_argument);
    EXPECT_THROW(preview(source, params, {0.0, 0.0, 0.0, 1.0}), std::invalid_argument);

    params = hard_shadow();
    params.padding = -3;
    EXPECT_THROW(bake(source, params), std::invalid_argument);
}

TEST(ShadowBakerTest, Names)
{
    EXPECT_EQ(shadow_file_name("hero", "_shadow"), "hero_shadow.png");
    EXPECT_EQ(shadow_file_name("hero", ""), "hero.png");
    EXPECT_EQ(shadow_object_name("Crate"), "Crate_Shadow");
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

// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for the shadow preview cache
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <type_traits>
#include <gtest/gtest.h>

#include "../renderer/surface-testbase.h"
#include "shadow/preview-cache.h"

using namespace Umbra::Shadow;

namespace {

std::shared_ptr<Renderer::Surface const> make_source()
{
    auto source = std::make_shared<TestSurface>(Geom::IntPoint(4, 4));
    source->rect(0, 0, 4, 4, {1.0, 0.0, 0.0, 1.0});
    return source;
}

ShadowParameters small_shadow()
{
    ShadowParameters params;
    params.blur_radius = 1;
    params.padding = 1;
    params.distance = 2.0;
    return params;
}

Rgba const background = {0.2, 0.2, 0.2, 1.0};

} // namespace

class PreviewCacheTest : public ::testing::Test
{
protected:
    PreviewCache cache;
    std::shared_ptr<Renderer::Surface const> source = make_source();
    ShadowParameters params = small_shadow();
};

TEST_F(PreviewCacheTest, Hit)
{
    EXPECT_FALSE(cache.valid());
    auto first = cache.get(source, params, background);
    ASSERT_TRUE(first);
    EXPECT_TRUE(cache.valid());

    auto second = cache.get(source, params, background);
    EXPECT_EQ(first, second);
}

TEST_F(PreviewCacheTest, ReadOnly)
{
    static_assert(std::is_same_v<decltype(cache.get(source, params, background)),
                                 std::shared_ptr<Renderer::Surface const>>);

    // Reading pixels still works on the shared preview
    auto preview = cache.get(source, params, background);
    auto &image = *preview->getCairoSurface();
    EXPECT_EQ(image.get_width(), preview->width());
}

TEST_F(PreviewCacheTest, ParameterChange)
{
    auto first = cache.get(source, params, background);

    params.opacity = 0.3;
    auto second = cache.get(source, params, background);
    EXPECT_NE(first, second);
    EXPECT_EQ(cache.get(source, params, background), second);

    // Going back renders again, only the latest is kept
    params = small_shadow();
    EXPECT_NE(cache.get(source, params, background), first);
}

TEST_F(PreviewCacheTest, BackgroundChange)
{
    auto first = cache.get(source, params, background);
    auto second = cache.get(source, params, {1.0, 1.0, 1.0, 1.0});
    EXPECT_NE(first, second);
}

TEST_F(PreviewCacheTest, SourceChange)
{
    auto first = cache.get(source, params, background);
    auto other = make_source();
    auto second = cache.get(other, params, background);
    EXPECT_NE(first, second);
    EXPECT_EQ(cache.get(other, params, background), second);
}

TEST_F(PreviewCacheTest, ExpiredSource)
{
    auto first = cache.get(source, params, background);
    source.reset();

    // A new source may reuse the old address, it still has to render
    source = make_source();
    EXPECT_NE(cache.get(source, params, background), first);
}

TEST_F(PreviewCacheTest, Invalidate)
{
    auto first = cache.get(source, params, background);
    cache.invalidate();
    EXPECT_FALSE(cache.valid());

    auto second = cache.get(source, params, background);
    EXPECT_TRUE(cache.valid());
    EXPECT_NE(first, second);
}

TEST_F(PreviewCacheTest, Errors)
{
    EXPECT_THROW(cache.get(nullptr, params, background), std::invalid_argument);

    params.blur_radius = -2;
    EXPECT_THROW(cache.get(source, params, background), std::invalid_argument);
    EXPECT_FALSE(cache.valid());
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

// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for shadow canvas geometry
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <climits>
#include <cmath>
#include <stdexcept>
#include <gtest/gtest.h>

#include "../test-utils.h"
#include "shadow/canvas-geometry.h"
#include "shadow/shadow-parameters.h"

using namespace Umbra::Shadow;

TEST(CanvasGeometryTest, NoOffset)
{
    auto geom = compute_canvas_geometry({4, 4}, 135.0, 0.0, 1, 0);
    EXPECT_EQ(geom.canvas, Geom::IntPoint(6, 6));
    EXPECT_EQ(geom.offset, Geom::IntPoint(0, 0));
    EXPECT_EQ(geom.source_origin, Geom::IntPoint(1, 1));
    EXPECT_EQ(geom.shadow_origin, Geom::IntPoint(1, 1));
    EXPECT_EQ(geom.margin, 1);
    EXPECT_TRUE(IsNear(geom.pivot.x(), 0.5, 1e-12));
    EXPECT_TRUE(IsNear(geom.pivot.y(), 0.5, 1e-12));
}

TEST(CanvasGeometryTest, AngleZero)
{
    auto geom = compute_canvas_geometry({20, 10}, 0.0, 10.0, 0, 0);
    EXPECT_EQ(geom.offset, Geom::IntPoint(10, 0));
    EXPECT_EQ(geom.canvas, Geom::IntPoint(30, 10));
    EXPECT_EQ(geom.source_origin, Geom::IntPoint(0, 0));
    EXPECT_EQ(geom.shadow_origin, Geom::IntPoint(10, 0));
    EXPECT_TRUE(IsNear(geom.pivot.x(), 1.0 / 3.0, 1e-12));
    EXPECT_TRUE(IsNear(geom.pivot.y(), 0.5, 1e-12));
}

TEST(CanvasGeometryTest, AngleBackwards)
{
    // The source moves over to make room for a shadow to its left
    auto geom = compute_canvas_geometry({20, 10}, 180.0, 10.0, 0, 0);
    EXPECT_EQ(geom.offset, Geom::IntPoint(-10, 0));
    EXPECT_EQ(geom.canvas, Geom::IntPoint(30, 10));
    EXPECT_EQ(geom.source_origin, Geom::IntPoint(10, 0));
    EXPECT_EQ(geom.shadow_origin, Geom::IntPoint(0, 0));
    EXPECT_TRUE(IsNear(geom.pivot.x(), 2.0 / 3.0, 1e-12));
}

TEST(CanvasGeometryTest, AngleDown)
{
    auto geom = compute_canvas_geometry({10, 10}, 90.0, 5.0, 0, 0);
    EXPECT_EQ(geom.offset, Geom::IntPoint(0, 5));
    EXPECT_EQ(geom.canvas, Geom::IntPoint(10, 15));
    EXPECT_EQ(geom.source_origin, Geom::IntPoint(0, 0));
    EXPECT_EQ(geom.shadow_origin, Geom::IntPoint(0, 5));
    EXPECT_TRUE(IsNear(geom.pivot.y(), 1.0 / 3.0, 1e-12));
    EXPECT_TRUE(IsNear(geom.pivot_y_up().y(), 2.0 / 3.0, 1e-12));
}

TEST(CanvasGeometryTest, Defaults)
{
    auto geom = compute_canvas_geometry({4, 4}, 135.0, 10.0, 16, 10);
    EXPECT_EQ(geom.offset, Geom::IntPoint(-7, 7));
    EXPECT_EQ(geom.margin, 26);
    EXPECT_EQ(geom.canvas, Geom::IntPoint(63, 63));
    EXPECT_EQ(geom.source_origin, Geom::IntPoint(33, 26));
    EXPECT_EQ(geom.shadow_origin, Geom::IntPoint(26, 33));
    EXPECT_TRUE(IsNear(geom.pivot.x(), 35.0 / 63.0, 1e-12));
    EXPECT_TRUE(IsNear(geom.pivot.y(), 28.0 / 63.0, 1e-12));

    // The same through the parameters
    auto params = ShadowParameters();
    params.shadow_color = {1.0, 0.0, 0.0, 1.0};
    auto other = compute_canvas_geometry({4, 4}, params);
    EXPECT_EQ(other.canvas, geom.canvas);
    EXPECT_EQ(other.source_origin, geom.source_origin);
    EXPECT_EQ(other.shadow_origin, geom.shadow_origin);
}

TEST(CanvasGeometryTest, RoundHalfToEven)
{
    EXPECT_EQ(compute_canvas_geometry({1, 1}, 0.0, 2.5, 0, 0).offset.x(), 2);
    EXPECT_EQ(compute_canvas_geometry({1, 1}, 0.0, 3.5, 0, 0).offset.x(), 4);
    EXPECT_EQ(compute_canvas_geometry({1, 1}, 0.0, -2.5, 0, 0).offset.x(), -2);
    EXPECT_EQ(compute_canvas_geometry({1, 1}, 0.0, 2.6, 0, 0).offset.x(), 3);
}

TEST(CanvasGeometryTest, NegativeDistance)
{
    // Same as pointing the other way
    auto a = compute_canvas_geometry({8, 8}, 45.0, -6.0, 2, 1);
    auto b = compute_canvas_geometry({8, 8}, 225.0, 6.0, 2, 1);
    EXPECT_EQ(a.offset, b.offset);
    EXPECT_EQ(a.canvas, b.canvas);
    EXPECT_EQ(a.source_origin, b.source_origin);
}

TEST(CanvasGeometryTest, EmptySource)
{
    auto geom = compute_canvas_geometry({0, 0}, 0.0, 0.0, 0, 0);
    EXPECT_EQ(geom.canvas, Geom::IntPoint(0, 0));
    EXPECT_TRUE(std::isfinite(geom.pivot.x()));
    EXPECT_TRUE(std::isfinite(geom.pivot.y()));
}

TEST(CanvasGeometryTest, NegativeValues)
{
    EXPECT_THROW(compute_canvas_geometry({4, 4}, 0.0, 0.0, -1, 0), std::invalid_argument);
    EXPECT_THROW(compute_canvas_geometry({4, 4}, 0.0, 0.0, 0, -1), std::invalid_argument);
}

TEST(CanvasGeometryTest, TooLarge)
{
    // Huge but valid integers must not wrap around into a small or negative canvas
    EXPECT_THROW(compute_canvas_geometry({4, 4}, 0.0, 0.0, INT_MAX, 10), std::invalid_argument);
    EXPECT_THROW(compute_canvas_geometry({4, 4}, 0.0, 0.0, 10, INT_MAX), std::invalid_argument);
    EXPECT_THROW(compute_canvas_geometry({4, 4}, 135.0, 1e12, 0, 0), std::invalid_argument);
    EXPECT_THROW(compute_canvas_geometry({4, 4}, 0.0, -1e12, 0, 0), std::invalid_argument);
    EXPECT_THROW(compute_canvas_geometry({INT_MAX, 4}, 0.0, 10.0, 0, 0), std::invalid_argument);
    EXPECT_THROW(compute_canvas_geometry({4, 4}, 0.0, std::nan(""), 0, 0), std::invalid_argument);
    EXPECT_THROW(compute_canvas_geometry({4, 4}, 0.0, INFINITY, 0, 0), std::invalid_argument);

    // Right at the limit is still fine
    auto geom = compute_canvas_geometry({MAX_CANVAS_SIZE - 2, 1}, 0.0, 0.0, 1, 0);
    EXPECT_EQ(geom.canvas, Geom::IntPoint(MAX_CANVAS_SIZE, 3));
    EXPECT_THROW(compute_canvas_geometry({MAX_CANVAS_SIZE - 1, 1}, 0.0, 0.0, 1, 0), std::invalid_argument);
}

TEST(CanvasGeometryTest, ContainsBothAndNoMore)
{
    for (double angle = 0.0; angle < 360.0; angle += 22.5) {
        for (double distance : {0.0, 1.0, 7.3, 25.0}) {
            int const w = 13;
            int const h = 7;
            int const margin = 3;
            auto geom = compute_canvas_geometry({w, h}, angle, distance, 2, 1);

            auto const &s = geom.source_origin;
            auto const &d = geom.shadow_origin;
            EXPECT_EQ(geom.margin, margin);
            EXPECT_EQ(d, s + geom.offset);

            // Everything at least a margin from the edges
            EXPECT_GE(std::min(s.x(), d.x()), margin);
            EXPECT_GE(std::min(s.y(), d.y()), margin);
            EXPECT_LE(std::max(s.x(), d.x()) + w, geom.canvas.x() - margin);
            EXPECT_LE(std::max(s.y(), d.y()) + h, geom.canvas.y() - margin);

            // And no bigger than it has to be
            EXPECT_EQ(geom.canvas.x(), w + std::abs(geom.offset.x()) + margin * 2) << angle << " " << distance;
            EXPECT_EQ(geom.canvas.y(), h + std::abs(geom.offset.y()) + margin * 2) << angle << " " << distance;
        }
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

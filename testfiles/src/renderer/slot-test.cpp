// SPDX-License-Identifier: GPL-2.0-or-later

#include "renderer/slot.h"
#include "surface-testbase.h"

using namespace Umbra::Renderer;

TEST(SlotTest, setGetSlot)
{
    auto slot = Slot();
    auto surface = std::make_shared<Surface>(Geom::IntPoint(4, 4));
    EXPECT_EQ(slot.get_slot_count(), 0);
    EXPECT_FALSE(slot.get());

    slot.set(SLOT_SHADOW, surface);
    EXPECT_EQ(slot.get_slot_count(), 1);
    EXPECT_EQ(slot.get(SLOT_SHADOW)->dimensions(), Geom::IntPoint(4, 4));
    ASSERT_EQ(slot.get(), surface);

    // Nothing there yet
    EXPECT_FALSE(slot.get(SLOT_PREVIEW));
}

TEST(SlotTest, setSetLast)
{
    auto slot = Slot();
    auto surface1 = std::make_shared<Surface>(Geom::IntPoint(4, 4));
    auto surface2 = std::make_shared<Surface>(Geom::IntPoint(4, 4));

    slot.set(SLOT_SHADOW, surface1);
    EXPECT_EQ(slot.get(), surface1);
    slot.set(SLOT_BLURRED, surface2);
    EXPECT_EQ(slot.get(), surface2);
    EXPECT_EQ(slot.get(SLOT_SHADOW), surface1);
    slot.set(2, surface1);
    EXPECT_EQ(slot.get(), surface1);
    EXPECT_EQ(slot.get(2), surface1);

    slot.set(2, surface2);
    EXPECT_EQ(slot.get(2), surface2);
    EXPECT_EQ(slot.get_slot_count(), 3);
}

TEST(SlotTest, sharedSurface)
{
    auto slot = Slot();
    auto surface = std::make_shared<Surface>(Geom::IntPoint(4, 4));

    // One surface may sit in two slots when a stage had nothing to do
    slot.set(SLOT_SHADOW, surface);
    slot.set(SLOT_BLURRED, slot.get(SLOT_SHADOW));
    EXPECT_EQ(slot.get(SLOT_SHADOW), slot.get(SLOT_BLURRED));
    EXPECT_EQ(surface.use_count(), 3);
}

TEST(SlotTest, slotNotSet)
{
    auto slot = Slot();
    auto surface = std::make_shared<Surface>(Geom::IntPoint(4, 4));
    slot.set(SLOT_SHADOW, surface);

    // Refused with a warning, the last surface stays as it was
    slot.set(SLOT_NOT_SET, std::make_shared<Surface>(Geom::IntPoint(2, 2)));
    EXPECT_EQ(slot.get_slot_count(), 1);
    EXPECT_EQ(slot.get(), surface);
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

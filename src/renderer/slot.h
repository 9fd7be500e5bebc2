// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * A container class for the intermediate surfaces of one shadow render. Allows for
 * simple getting and setting images in slots without having to bother with
 * table indexes and such.
 *
 * Copyright (C) 2006-2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef UMBRA_RENDERER_SLOT_H
#define UMBRA_RENDERER_SLOT_H

#include <map>
#include <memory>

namespace Umbra::Renderer {

class Surface;

enum SlotType // implicit integer, positive numbers are actual slots
{
    SLOT_NOT_SET = -1,
    SLOT_SHADOW = -2,
    SLOT_BLURRED = -3,
    SLOT_PREVIEW = -4,
};

class Slot final
{
public:
    Slot() = default;
    ~Slot() = default;

    Slot(Slot const &) = delete;
    Slot &operator=(Slot const &) = delete;

    /** Returns the Surface in specified slot.
     *
     * @param slot - May be either an positive integer or one of pre-defined types,
     *               SLOT_NOT_SET returns the surface set last.
     */
    std::shared_ptr<Surface> get(int slot = SLOT_NOT_SET) const;

    /**
     * Set the surface for this slot and free any previous surface, then set
     * the last slot to this slot indicating this is the last in the stack.
     */
    void set(int slot, std::shared_ptr<Surface> surface);

    /** Returns the number of slots in use. */
    int get_slot_count() const { return _slots.size(); }

private:
    std::map<int, std::shared_ptr<Surface>> _slots;
    int _last_out = SLOT_NOT_SET;
};

} // namespace Umbra::Renderer

#endif // UMBRA_RENDERER_SLOT_H
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

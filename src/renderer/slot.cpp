// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * A container class for the intermediate surfaces of one shadow render.
 *
 * Copyright (C) 2006-2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "slot.h"

#include <glib.h>

#include "renderer/surface.h"

namespace Umbra::Renderer {

std::shared_ptr<Surface> Slot::get(int slot) const
{
    if (slot == SLOT_NOT_SET) {
        slot = _last_out;
    }

    auto found = _slots.find(slot);
    if (found == _slots.end()) {
        return {};
    }
    return found->second;
}

void Slot::set(int slot, std::shared_ptr<Surface> surface)
{
    if (slot == SLOT_NOT_SET) {
        g_warning("Refusing to store a surface without a slot number.");
        return;
    }

    auto found = _slots.find(slot);
    if (found == _slots.end() || found->second != surface) {
        _slots[slot] = std::move(surface);
    }
    _last_out = slot;
}

} // namespace Umbra::Renderer

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

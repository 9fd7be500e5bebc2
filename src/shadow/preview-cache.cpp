// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "preview-cache.h"

#include <stdexcept>
#include <glib.h>

#include "renderer/surface.h"
#include "shadow-baker.h"

namespace Umbra::Shadow {

bool PreviewCache::_matches(std::shared_ptr<Renderer::Surface const> const &source, std::size_t hash,
                            ShadowParameters const &params, Rgba const &background) const
{
    // The hash only narrows it down, equal hashes still need equal parameters
    return _preview && _source.lock() == source && _hash == hash && _params == params && _background == background;
}

std::shared_ptr<Renderer::Surface const> PreviewCache::get(std::shared_ptr<Renderer::Surface const> const &source,
                                                     ShadowParameters const &params, Rgba const &background)
{
    if (!source) {
        throw std::invalid_argument("Shadow preview needs a source surface");
    }

    auto const hash = hash_value(params);
    if (_matches(source, hash, params, background)) {
        return _preview;
    }

    g_debug("Shadow preview out of date, rendering.");
    _preview = preview(*source, params, background);
    _source = source;
    _hash = hash;
    _params = params;
    _background = background;
    return _preview;
}

void PreviewCache::invalidate()
{
    _preview.reset();
    _source.reset();
}

} // namespace Umbra::Shadow

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

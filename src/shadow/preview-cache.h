// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * Remembers the last shadow preview so an unchanged editor doesn't render it again.
 *//*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef UMBRA_SHADOW_PREVIEW_CACHE_H
#define UMBRA_SHADOW_PREVIEW_CACHE_H

#include <cstddef>
#include <memory>

#include "shadow-parameters.h"

namespace Umbra::Renderer {
class Surface;
} // namespace Umbra::Renderer

namespace Umbra::Shadow {

/**
 * A single entry cache keyed on the identity of the source surface, the shadow parameters
 * and the background color. Editing the source pixels in place doesn't change its identity,
 * call invalidate() after doing so.
 */
class PreviewCache
{
public:
    /**
     * Returns the preview for these inputs, rendering it only when something changed.
     * The preview is shared with the cache, so it is handed out read only.
     *
     * @throws std::invalid_argument for a missing source, or a negative blur radius or padding.
     */
    std::shared_ptr<Renderer::Surface const> get(std::shared_ptr<Renderer::Surface const> const &source,
                                           ShadowParameters const &params, Rgba const &background);

    void invalidate();
    bool valid() const { return static_cast<bool>(_preview); }

private:
    bool _matches(std::shared_ptr<Renderer::Surface const> const &source, std::size_t hash,
                  ShadowParameters const &params, Rgba const &background) const;

    std::weak_ptr<Renderer::Surface const> _source;
    std::size_t _hash = 0;
    ShadowParameters _params;
    Rgba _background = {};
    std::shared_ptr<Renderer::Surface const> _preview;
};

} // namespace Umbra::Shadow

#endif // UMBRA_SHADOW_PREVIEW_CACHE_H

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

// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "shadow-parameters.h"

#include <boost/container_hash/hash.hpp>

namespace Umbra::Shadow {

std::size_t hash_value(ShadowParameters const &params)
{
    std::size_t seed = 0;
    boost::hash_combine(seed, params.shadow_color);
    boost::hash_combine(seed, params.opacity);
    boost::hash_combine(seed, params.angle);
    boost::hash_combine(seed, params.distance);
    boost::hash_combine(seed, params.spread);
    boost::hash_combine(seed, params.blur_radius);
    boost::hash_combine(seed, params.padding);
    return seed;
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

// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_UTIL_LOOP_CONTROL_HPP
#define QUIVER_UTIL_LOOP_CONTROL_HPP

namespace quiver::util
{
    /** Returned by visitor callbacks to stop or continue a walk over cached entries. */
    enum class LoopControl
    {
        Break,
        Continue,
    };
}
#endif

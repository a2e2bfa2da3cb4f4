// include/decfix/decfix.hpp — Umbrella header that exposes the decfix components.

#pragma once

// Umbrella header for decfix.
// Users should generally include only this file.

#include <decfix/core/detail/int_ops.hpp>
#include <decfix/core/fixed_point.hpp>
#include <decfix/core/per_thing.hpp>
#include <decfix/core/traits.hpp>
#include <decfix/core/wide.hpp>
#include <decfix/io/format.hpp>
#include <decfix/io/parse.hpp>
#include <decfix/util/debug.hpp>
#include <decfix/util/random.hpp>

namespace decfix {

    using FixedI32 = core::fixed_i32;
    using FixedI64 = core::fixed_i64;
    using FixedI128 = core::fixed_i128;

    using Percent = core::percent;
    using Permyriad = core::permyriad;
    using Permill = core::permill;
    using Perbill = core::perbill;
    using Perquintill = core::perquintill;

    inline constexpr int DECFIX_VERSION_MAJOR = 0;
    inline constexpr int DECFIX_VERSION_MINOR = 1;
    inline constexpr int DECFIX_VERSION_PATCH = 0;

} // namespace decfix

#ifndef VIDSET_COMMON_HPP
#define VIDSET_COMMON_HPP

#include <climits>
#include <cstdint>

#include <gsl/gsl_assert>

namespace vidset {

static_assert(CHAR_BIT == 8, "Byte width sanity check.");

using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

/// Type of the temporal coordinate (frames or seconds).
using time_type = double;

/// Type of the spatial coordinates (usually normalized to [0, 1]).
using spatial_type = double;

#ifndef NDEBUG

/// Similar to standard assert, but allows for a custom message.
#define vidset_assert(condition, message)                       \
    do {                                                        \
        if (!(condition)) {                                     \
            ::vidset::assertion_failed_impl(__FILE__, __LINE__, \
                #condition, message);                           \
        }                                                       \
    } while (0)

#else

#define vidset_assert(condition, message) do { } while(0)

#endif

// Do not call directly.
[[noreturn]]
void assertion_failed_impl(const char* file, int line,
                           const char* condition, const char* message);

} // namespace vidset

#endif // VIDSET_COMMON_HPP

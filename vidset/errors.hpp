#ifndef VIDSET_ERRORS_HPP
#define VIDSET_ERRORS_HPP

#include "vidset/common.hpp"

#include <stdexcept>

/// \file
/// Exception types raised by the interval algebra.

namespace vidset {

/// Thrown when a range or a bounding box is constructed with
/// malformed coordinates, e.g. `t1 > t2`.
class invalid_bounds_error : public std::invalid_argument {
public:
    using invalid_argument::invalid_argument;
};

/// Thrown by \ref interval_set_mapping::get() if the key is not present.
class key_not_found_error : public std::out_of_range {
public:
    using out_of_range::out_of_range;
};

/// Thrown when a user supplied callback (predicate, merge function, ...)
/// fails. The original exception is available through `std::rethrow_if_nested`.
class evaluation_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

} // namespace vidset

#endif // VIDSET_ERRORS_HPP

#ifndef COMMON_COMMON_HPP
#define COMMON_COMMON_HPP

#include "vidset/common.hpp"

#include <tpie/tpie.h>
#include <gsl/gsl_util>

class exit_main {
public:
    int code = 0;

    exit_main(int code = 0): code(code) {}
};

/// Initializes the tpie library, calls the function f and deinitializes tpie.
/// Returns the value returned by `f`, which should be an int.
template<typename Func>
int tpie_main(Func&& f) {
    tpie::tpie_init();
    auto cleanup = gsl::finally([]{ tpie::tpie_finish(); });

    try {
        return f();
    } catch (const exit_main& e) {
        return e.code;
    }
}

#endif // COMMON_COMMON_HPP

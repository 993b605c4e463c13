#include "vidset/common.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace vidset {

void assertion_failed_impl(const char* file, int line,
                           const char* condition, const char* message)
{
    std::cerr << "Assertion `" << condition << "` failed";
    if (message && std::strlen(message) > 0) {
        std::cerr << ": " << message;
    }
    std::cerr << ".\n";
    std::cerr << "    (in " << file << ":" << line << ")"
              << std::endl;
    std::abort();
}

} // namespace vidset

#pragma once

/**
 * @file assert.hpp
 * @brief Macro for fmsave specific ASSERT.
 */

#ifdef FMSAVE_ASSERTIONS

#include <string>

namespace base {

[[noreturn]] void abort(const std::string& message);

}

#define ASSERT_MESSAGE(expression, message)                                                                            \
    if (!(expression))                                                                                                 \
    base::abort(std::string("Assertion Failed: ") + #expression + "\nMessage: " + message + "\nFile: " + __FILE__ +    \
                ":" + std::to_string(__LINE__))

#else // FMSAVE_ASSERTIONS

#define ASSERT_MESSAGE(expression, message) ((void)0)

#endif // FMSAVE_ASSERTIONS

#define ASSERT(expression) ASSERT_MESSAGE((expression), #expression)

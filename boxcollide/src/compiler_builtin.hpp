#pragma once

// Portable unreachable statement

#if defined(__clang__) || defined(__GNUC__)
#define BOXCOLLIDE_UNREACHABLE() __builtin_unreachable()
#elif defined(_MSC_VER)
#define BOXCOLLIDE_UNREACHABLE() __assume(0)
#else
#include <cstdlib>
#define BOXCOLLIDE_UNREACHABLE() std::abort()
#endif

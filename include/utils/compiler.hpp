#pragma once

#include <cstdlib>

#include "utils/logger.hpp"

#if defined(__GNUC__) || defined(__clang__)
#define YYID_BUILTIN_UNREACHABLE() __builtin_unreachable()
#elif defined(_MSC_VER)
#define YYID_BUILTIN_UNREACHABLE() __assume(false)
#else
#define YYID_BUILTIN_UNREACHABLE() ((void)0)
#endif

// Макрос для недостижимых веток кода
#define UNREACHABLE(reason)                                                                        \
    do {                                                                                           \
        LOG_CRITICAL << "UNREACHABLE code reached: " << reason;                                    \
        std::abort();                                                                              \
        YYID_BUILTIN_UNREACHABLE();                                                                \
    } while (0)

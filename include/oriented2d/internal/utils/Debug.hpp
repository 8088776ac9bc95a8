#pragma once

#include <stdexcept>
#include <string>

#if defined(DBG) || defined(ENABLE_ASSERT)

#define _O2D_DEBUG_ASSERT_2_ARGS(condition, message)                                                                   \
    do                                                                                                                 \
    {                                                                                                                  \
        if (!(condition))                                                                                              \
        {                                                                                                              \
            throw std::runtime_error("Assertion failed: " + std::string(message));                                     \
        }                                                                                                              \
    } while (0)

#define _O2D_DEBUG_ASSERT_1_ARG(condition)                                                                             \
    do                                                                                                                 \
    {                                                                                                                  \
        if (!(condition))                                                                                              \
        {                                                                                                              \
            throw std::runtime_error("Assertion failed: " #condition);                                                 \
        }                                                                                                              \
    } while (0)

#define _O2D_DEBUG_ASSERT_GET_MACRO(_1, _2, NAME, ...) NAME
#define O2D_DEBUG_ASSERT(...)                                                                                          \
    _O2D_DEBUG_ASSERT_GET_MACRO(__VA_ARGS__, _O2D_DEBUG_ASSERT_2_ARGS, _O2D_DEBUG_ASSERT_1_ARG)(__VA_ARGS__)

#else
#define O2D_DEBUG_ASSERT(...)
#endif

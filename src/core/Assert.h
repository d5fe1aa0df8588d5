// =============================================================================
// NeuroField - Assert Macros
// =============================================================================
// Debug checks on solver invariants (buffer sizes, kernel shape). Anything a
// caller can get wrong is validated with an exception instead.
// =============================================================================

#pragma once

#include "Types.h"
#include "Log.h"
#include <cstdlib>

namespace NeuroField {

using AssertHandler = void(*)(const char* expression, const char* message,
                               const char* file, int line);

inline AssertHandler g_assertHandler = nullptr;

// Returns the previously installed handler (nullptr for the default)
inline AssertHandler setAssertHandler(AssertHandler handler) {
    AssertHandler previous = g_assertHandler;
    g_assertHandler = handler;
    return previous;
}

inline AssertHandler getAssertHandler() { return g_assertHandler; }

// Reports through the Logger so the failure lands beside the solver's own output
inline void defaultAssertHandler(const char* expression, const char* message,
                                 const char* file, int line) {
    Logger::instance().log(LogLevel::Fatal, "Assert", file, line,
        "Solver invariant broken: %s%s%s",
        expression, message ? " - " : "", message ? message : "");
}

[[noreturn]] inline void assertFailed(const char* expression, const char* message,
                                      const char* file, int line) {
    if (g_assertHandler) {
        g_assertHandler(expression, message, file, line);
    } else {
        defaultAssertHandler(expression, message, file, line);
    }

    NEUROFIELD_DEBUGBREAK();
    std::abort();
}

} // namespace NeuroField

#if defined(NDEBUG) || defined(NEUROFIELD_DISABLE_ASSERTS)
    #define NEUROFIELD_ASSERT(expr) ((void)0)
    #define NEUROFIELD_ASSERT_MSG(expr, msg) ((void)0)
#else
    #define NEUROFIELD_ASSERT(expr) \
        do { \
            if (NEUROFIELD_UNLIKELY(!(expr))) { \
                ::NeuroField::assertFailed(#expr, nullptr, __FILE__, __LINE__); \
            } \
        } while (0)

    #define NEUROFIELD_ASSERT_MSG(expr, msg) \
        do { \
            if (NEUROFIELD_UNLIKELY(!(expr))) { \
                ::NeuroField::assertFailed(#expr, msg, __FILE__, __LINE__); \
            } \
        } while (0)
#endif

#pragma once

#if defined(__clang__)
#   define DUO_PRAGMA(x) _Pragma(#x)
#   define DUO_DIAGNOSTIC_PUSH() _Pragma("clang diagnostic push")
#   define DUO_DIAGNOSTIC_POP() _Pragma("clang diagnostic pop")
#   define DUO_DIAGNOSTIC_IGNORE(name) DUO_PRAGMA(clang diagnostic ignored name)
#elif defined(__GNUC__)
#   define DUO_PRAGMA(x) _Pragma(#x)
#   define DUO_DIAGNOSTIC_PUSH() _Pragma("GCC diagnostic push")
#   define DUO_DIAGNOSTIC_POP() _Pragma("GCC diagnostic pop")
#   define DUO_DIAGNOSTIC_IGNORE(name) DUO_PRAGMA(GCC diagnostic ignored name)
#else
#   error "Unsupported compiler"
#endif

#if defined(__clang__)
#   define CLANG_DIAGNOSTIC_PUSH() DUO_DIAGNOSTIC_PUSH()
#   define CLANG_DIAGNOSTIC_POP() DUO_DIAGNOSTIC_POP()
#   define CLANG_DIAGNOSTIC_IGNORE(name) DUO_DIAGNOSTIC_IGNORE(name)
#else
#   define CLANG_DIAGNOSTIC_PUSH()
#   define CLANG_DIAGNOSTIC_POP()
#   define CLANG_DIAGNOSTIC_IGNORE(name)
#endif

#ifndef DUO_LOCK_CHECKS
#   define DUO_LOCK_CHECKS 0
#endif

#if defined(__x86_64__) || defined(__i386__)
#   include <emmintrin.h>
#endif

namespace duo::arch {
    /// @brief Hint to the processor that we are in a spin wait loop.
    inline void pause() noexcept {
#if defined(__x86_64__) || defined(__i386__)
        _mm_pause();
#elif defined(__aarch64__) || defined(__arm__)
        __asm__ volatile("yield" ::: "memory");
#else
        __asm__ volatile("" ::: "memory");
#endif
    }
}

#pragma once

// clang thread safety analysis attributes, see
// https://clang.llvm.org/docs/ThreadSafetyAnalysis.html

#if defined(__clang__)
#   define DUO_THREAD_ANNOTATION(x) __attribute__((x))
#else
#   define DUO_THREAD_ANNOTATION(x)
#endif

#define DUO_CAPABILITY(x) DUO_THREAD_ANNOTATION(capability(x))
#define DUO_SCOPED_CAPABILITY DUO_THREAD_ANNOTATION(scoped_lockable)
#define DUO_GUARDED_BY(x) DUO_THREAD_ANNOTATION(guarded_by(x))
#define DUO_REQUIRES(...) DUO_THREAD_ANNOTATION(requires_capability(__VA_ARGS__))
#define DUO_REQUIRES_SHARED(...) DUO_THREAD_ANNOTATION(requires_shared_capability(__VA_ARGS__))
#define DUO_ACQUIRE(...) DUO_THREAD_ANNOTATION(acquire_capability(__VA_ARGS__))
#define DUO_ACQUIRE_SHARED(...) DUO_THREAD_ANNOTATION(acquire_shared_capability(__VA_ARGS__))
#define DUO_RELEASE(...) DUO_THREAD_ANNOTATION(release_capability(__VA_ARGS__))
#define DUO_RELEASE_SHARED(...) DUO_THREAD_ANNOTATION(release_shared_capability(__VA_ARGS__))
#define DUO_RELEASE_GENERIC(...) DUO_THREAD_ANNOTATION(release_generic_capability(__VA_ARGS__))
#define DUO_TRY_ACQUIRE(...) DUO_THREAD_ANNOTATION(try_acquire_capability(__VA_ARGS__))
#define DUO_TRY_ACQUIRE_SHARED(...) DUO_THREAD_ANNOTATION(try_acquire_shared_capability(__VA_ARGS__))
#define DUO_NO_THREAD_SAFETY_ANALYSIS DUO_THREAD_ANNOTATION(no_thread_safety_analysis)

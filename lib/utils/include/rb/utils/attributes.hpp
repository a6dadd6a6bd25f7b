/*
Module Name:
- attributes.hpp

Abstract:
- Cross-compiler wrappers for the inlining hint used on lookup hot paths and the
  lifetimebound annotation on functions that return views of their arguments.
- Unifies spelling across MSVC, Clang, and GCC so call sites stay portable.

Provided Macros:
- RB_FORCE_INLINE
- RB_LIFETIMEBOUND

Notes:
- Define RB_NO_FORCE_INLINE to fall back to plain inline (useful when profiling).
*/
#pragma once

#ifndef __has_attribute
#define __has_attribute(x) 0
#endif

#ifndef __has_cpp_attribute
#define __has_cpp_attribute(x) 0
#endif

// RB_FORCE_INLINE
#if !defined(RB_NO_FORCE_INLINE)
#if defined(_MSC_VER)
#define RB_FORCE_INLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
#if __has_attribute(always_inline) || defined(__GNUC__)
#define RB_FORCE_INLINE inline __attribute__((always_inline))
#else
#define RB_FORCE_INLINE inline
#endif
#else
#define RB_FORCE_INLINE inline
#endif
#else
#define RB_FORCE_INLINE inline
#endif


// RB_LIFETIMEBOUND
#if defined(__clang__) && __has_cpp_attribute(clang::lifetimebound)
#define RB_LIFETIMEBOUND [[clang::lifetimebound]]
#elif defined(_MSC_VER) && __has_cpp_attribute(msvc::lifetimebound)
#define RB_LIFETIMEBOUND [[msvc::lifetimebound]]
#else
#define RB_LIFETIMEBOUND
#endif

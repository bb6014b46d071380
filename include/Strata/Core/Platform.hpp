#pragma once

// Platform Detection
#if defined(_WIN32) || defined(_WIN64)
    #define STRATA_PLATFORM_WINDOWS 1
#elif defined(__APPLE__) && defined(__MACH__)
    #define STRATA_PLATFORM_APPLE 1
#elif defined(__linux__)
    #define STRATA_PLATFORM_LINUX 1
#elif defined(__unix__)
    #define STRATA_PLATFORM_UNIX 1
#else
    #error "Unknown platform"
#endif

// Compiler Detection
#if defined(_MSC_VER)
    #define STRATA_COMPILER_MSVC 1
    #define STRATA_COMPILER_VERSION _MSC_VER
#elif defined(__clang__)
    #define STRATA_COMPILER_CLANG 1
    #define STRATA_COMPILER_VERSION (__clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__)
#elif defined(__GNUC__) || defined(__GNUG__)
    #define STRATA_COMPILER_GCC 1
    #define STRATA_COMPILER_VERSION (__GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__)
#else
    #error "Unknown compiler"
#endif

// Debug/Release Detection
#if defined(DEBUG) || defined(_DEBUG) || defined(STRATA_DEBUG)
    #define STRATA_BUILD_DEBUG 1
    #define STRATA_BUILD_TYPE "Debug"
#elif defined(NDEBUG) || defined(STRATA_RELEASE)
    #define STRATA_BUILD_RELEASE 1
    #define STRATA_BUILD_TYPE "Release"
#else
    #define STRATA_BUILD_UNKNOWN 1
    #define STRATA_BUILD_TYPE "Unknown"
#endif

// C++ Standard Detection
#if defined(_MSVC_LANG)
    #define STRATA_CPLUSPLUS _MSVC_LANG
#else
    #define STRATA_CPLUSPLUS __cplusplus
#endif

#if STRATA_CPLUSPLUS >= 202002L
    #define STRATA_CPP20 1
#else
    #error "Strata requires C++20 or later"
#endif

// Cache line size (can be overridden)
#ifndef STRATA_CACHE_LINE_SIZE
    #define STRATA_CACHE_LINE_SIZE 64
#endif

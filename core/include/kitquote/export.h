#pragma once

/// \file export.h
/// \brief Visibility/export macros for shared library builds.

#ifdef KITQUOTE_STATIC
    #define KITQUOTE_API
#elif defined(KITQUOTE_BUILDING)
    #if defined(_MSC_VER)
        #define KITQUOTE_API __declspec(dllexport)
    #elif defined(__GNUC__) || defined(__clang__)
        #define KITQUOTE_API __attribute__((visibility("default")))
    #else
        #define KITQUOTE_API
    #endif
#else
    #if defined(_MSC_VER)
        #define KITQUOTE_API __declspec(dllimport)
    #else
        #define KITQUOTE_API
    #endif
#endif

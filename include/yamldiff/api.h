// api.h - symbol visibility for yamldiff

#pragma once

/// @file api.h
/// @brief YAMLDIFF_API marks the public classes and functions of yamldiff.
///
/// The CMake target defines YAMLDIFF_EXPORTS and YAMLDIFF_SHARED when
/// YAMLDIFF_BUILD_SHARED is on. Static builds define neither and the macro
/// expands to nothing.

#if defined(_WIN32) || defined(_WIN64)
    #ifdef YAMLDIFF_SHARED
        #ifdef YAMLDIFF_EXPORTS
            // Building the DLL
            #define YAMLDIFF_API __declspec(dllexport)
        #else
            // Linking against the DLL
            #define YAMLDIFF_API __declspec(dllimport)
        #endif
    #else
        #define YAMLDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    // Built with -fvisibility=hidden; only marked symbols leave the .so
    #if defined(YAMLDIFF_SHARED) && defined(YAMLDIFF_EXPORTS)
        #define YAMLDIFF_API __attribute__((visibility("default")))
    #else
        #define YAMLDIFF_API
    #endif
#else
    #define YAMLDIFF_API
#endif

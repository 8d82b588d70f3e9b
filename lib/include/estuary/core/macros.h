#pragma once

#if defined(_MSC_VER)
    #define ESTUARY_API_IMPORT __declspec(dllimport)
    #define ESTUARY_API_EXPORT __declspec(dllexport)
    #define ESTUARY_SUPPRESS_EXPORT_WARNING __pragma(warning(push)) __pragma(warning(disable: 4251 4275))
    #define ESTUARY_RESTORE_EXPORT_WARNING __pragma(warning(pop))
#elif defined(__GNUC__)
    #define ESTUARY_API_IMPORT
    #define ESTUARY_API_EXPORT __attribute__((visibility("default")))
    #define ESTUARY_SUPPRESS_EXPORT_WARNING
    #define ESTUARY_RESTORE_EXPORT_WARNING
#else
    #define ESTUARY_API_IMPORT
    #define ESTUARY_API_EXPORT
    #define ESTUARY_SUPPRESS_EXPORT_WARNING
    #define ESTUARY_RESTORE_EXPORT_WARNING
#endif

#if defined(ESTUARY_BUILD_SHARED)
    #ifdef ESTUARY_EXPORT_SHARED
        #define ESTUARY_API ESTUARY_API_EXPORT
    #else
        #define ESTUARY_API ESTUARY_API_IMPORT
    #endif
#else
    #define ESTUARY_API
#endif

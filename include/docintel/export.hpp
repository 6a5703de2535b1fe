#pragma once

#ifdef _WIN32
// Suppress C4251 warnings for STL containers in exported classes
#pragma warning(push)
#pragma warning(disable: 4251)
#endif

#ifdef DOCINTEL_STATIC
    // For static library linking, no import/export needed
    #define DOCINTEL_API
#elif defined(_WIN32)
    #ifdef DOCINTEL_BUILD
        #define DOCINTEL_API __declspec(dllexport)
    #else
        #define DOCINTEL_API __declspec(dllimport)
    #endif
#else
    #ifdef DOCINTEL_BUILD
        #define DOCINTEL_API __attribute__((visibility("default")))
    #else
        #define DOCINTEL_API
    #endif
#endif

#ifdef _WIN32
#pragma warning(pop)
#endif

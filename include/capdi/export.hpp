#pragma once

/// @file export.hpp
/// Cross-platform shared-library symbol visibility macro.
///
/// Build-system defines (set automatically by CMake):
///   CAPDI_BUILDING  — defined when compiling the capdi library itself
///   CAPDI_STATIC    — define when building/linking capdi as a static lib

#if defined(CAPDI_STATIC)
  #define CAPDI_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef CAPDI_BUILDING
    #define CAPDI_EXPORT __declspec(dllexport)
  #else
    #define CAPDI_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define CAPDI_EXPORT __attribute__((visibility("default")))
#else
  #define CAPDI_EXPORT
#endif

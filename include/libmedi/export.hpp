#pragma once

/// @file export.hpp
/// LIBMEDI_EXPORT marks the symbols that make up the shared library's ABI.
/// The library builds with hidden visibility, so everything else stays
/// internal.
///
/// CMake defines LIBMEDI_BUILDING while compiling libmedi, and exports
/// LIBMEDI_STATIC to consumers when BUILD_SHARED_LIBS is OFF.

#if defined(LIBMEDI_STATIC)
  #define LIBMEDI_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #if defined(LIBMEDI_BUILDING)
    #define LIBMEDI_EXPORT __declspec(dllexport)
  #else
    #define LIBMEDI_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define LIBMEDI_EXPORT __attribute__((visibility("default")))
#else
  #define LIBMEDI_EXPORT
#endif

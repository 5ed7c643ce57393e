#pragma once

// Symbol visibility for the safeio library. CMake defines safeio_EXPORTS while building a shared safeio, and
// SAFEIO_STATIC for the static build and everything linking it.
#if defined SAFEIO_STATIC
#  define SAFEIO_EXPORT
#elif defined _WIN32 || defined __CYGWIN__
#  ifdef safeio_EXPORTS
#    define SAFEIO_EXPORT __declspec(dllexport)
#  else
#    define SAFEIO_EXPORT __declspec(dllimport)
#  endif
#elif __GNUC__ >= 4
#  define SAFEIO_EXPORT __attribute__ ((visibility ("default")))
#else
#  define SAFEIO_EXPORT
#endif

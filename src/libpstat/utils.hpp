#ifndef UTILS_H
#define UTILS_H

#include <cstdio>
#include <cstdlib>

/// @def FORCE_INLINE
/// Macro used to strongly suggest that the compiler inlines a function
#if defined(__GNUC__)
#define FORCE_INLINE inline __attribute__((always_inline))
#else
#define FORCE_INLINE inline
#endif

/// @def OMP_PRAGMA
/// Macro used to wrap OpenMP's pragma directives.
///
/// When the program:
///  * is compiled with OpenMP, the pragma contents are honored.
///  * is NOT compiled with OpenMP, the pragma contents are ignored.
#ifdef _OPENMP
#define OMP_PRAGMA(x) _Pragma(#x)
#else
#define OMP_PRAGMA(x) /* ... */
#endif

[[noreturn]] inline void error(const char* message) {
  if (message == nullptr) {
    std::printf("ERROR\n");
  } else {
    std::printf("ERROR: %s\n", message);
  }
  std::fflush(stdout);
  std::exit(1);
}

/// aborts the program with an error message when condition is false
inline void require(bool condition, const char* message) {
  if (!condition) error(message);
}

#endif /* UTILS_H */

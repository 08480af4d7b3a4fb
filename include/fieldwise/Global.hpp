#pragma once

namespace fieldwise {


#define FIELDWISE_DISABLE_COPY(T)                                                                                      \
    T(const T&)            = delete;                                                                                   \
    T& operator=(const T&) = delete

#define FIELDWISE_DISABLE_MOVE(T)                                                                                      \
    T(T&&)            = delete;                                                                                        \
    T& operator=(T&&) = delete

#define FIELDWISE_DISABLE_COPY_MOVE(T)                                                                                 \
    FIELDWISE_DISABLE_COPY(T);                                                                                         \
    FIELDWISE_DISABLE_MOVE(T)


} // namespace fieldwise


// clang-format off
#if defined(_WIN32) && defined(FIELDWISE_SHARED) // Windows DLL
  #ifdef FIELDWISE_EXPORTS
    #define FIELDWISE_EXTERN __declspec(dllexport)
  #else
    #define FIELDWISE_EXTERN __declspec(dllimport)
  #endif
#elif defined(__GNUC__) && defined(FIELDWISE_SHARED) // POSIX shared library
  #define FIELDWISE_EXTERN __attribute__((visibility("default")))
#else // static library
  #define FIELDWISE_EXTERN
#endif
// clang-format on

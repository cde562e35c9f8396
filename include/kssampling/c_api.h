#ifndef KSSAMPLING_C_API_H
#define KSSAMPLING_C_API_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32)
  #if defined(KSSAMPLING_C_API_EXPORTS)
    #define KSSAMPLING_C_API __declspec(dllexport)
  #else
    #define KSSAMPLING_C_API __declspec(dllimport)
  #endif
#else
  #define KSSAMPLING_C_API __attribute__((visibility("default")))
#endif

typedef enum kssampling_status_e {
  KSSAMPLING_OK = 0,
  KSSAMPLING_ERROR_PRECONDITION = 1,
  KSSAMPLING_ERROR_INVALID_ARGUMENT = 2,
  KSSAMPLING_ERROR_INTERNAL = 3
} kssampling_status_t;

/* Row-major n_sample x n_sample distances; n_seed == 0 searches the farthest pair first. */
KSSAMPLING_C_API kssampling_status_t kssampling_kennard_stone(
    const double* dist, const size_t* seed, size_t* result_out, double* vdist_out,
    size_t n_sample, size_t n_seed, size_t n_result);

/* Row-major n_sample x n_feature features; n_seed must be at least 1. */
KSSAMPLING_C_API kssampling_status_t kssampling_kennard_stone_bounded(
    const double* X, const size_t* seed, size_t* result_out, double* vdist_out,
    size_t n_sample, size_t n_feature, size_t n_seed, size_t n_result);

/* Message of the last failed call on this thread, or "" */
KSSAMPLING_C_API const char* kssampling_last_error(void);

#ifdef __cplusplus
}
#endif

#endif /* KSSAMPLING_C_API_H */

#ifndef KSSAMPLING_PERFORMANCE_H
#define KSSAMPLING_PERFORMANCE_H

#include <cstddef>

#include "utility.h"

namespace KSSampling::performance {

    /**
     * Greedy max-min selection over a row-major n_sample x n_sample distance buffer.
     *
     * Writes n_result indices to result_out and n_result dispersion distances to vdist_out,
     * with the same meaning as reference::kennardStone().
     * With n_seed == 0 the farthest pair of the matrix is found first and used as the seed.
     * The update of the nearest-selected distances runs on the OpenMP thread pool.
     */
    void kennardStone(
        const double* dist, const std::size_t* seed,
        std::size_t* result_out, double* vdist_out,
        std::size_t n_sample, std::size_t n_seed, std::size_t n_result
    );

    /**
     * Greedy max-min selection over a row-major n_sample x n_feature feature buffer.
     *
     * Euclidean distances are recomputed for each newly selected sample, so memory stays
     * linear in n_sample. Unlike kennardStone(), the seed must not be empty.
     */
    void kennardStoneBounded(
        const double* X, const std::size_t* seed,
        std::size_t* result_out, double* vdist_out,
        std::size_t n_sample, std::size_t n_feature, std::size_t n_seed, std::size_t n_result
    );

}

#endif //KSSAMPLING_PERFORMANCE_H

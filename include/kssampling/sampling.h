#ifndef KSSAMPLING_SAMPLING_H
#define KSSAMPLING_SAMPLING_H

#include <optional>

#include "utility.h"
#include "distance.h"

namespace KSSampling {

    /**
     * Kennard-Stone sampling with a full distance matrix.
     *
     * Selects n_result samples (all of them by default) from the rows of X,
     * starting from seed, or from the farthest pair of samples when seed is empty.
     * Returns the ordered indices and their dispersion distances.
     *
     * The distance function must return a symmetric n_sample x n_sample matrix
     * with a zero diagonal.
     */
    SamplingResult sample(
        const FeatureMatrix& X,
        const Selection& seed = {},
        std::optional<Index> n_result = {},
        const DistanceFunction& distance = euclideanDistances,
        Backend backend = Backend::PERFORMANCE
    );

    /**
     * Kennard-Stone sampling without a distance matrix (Euclidean distances only).
     *
     * Memory stays O(n_sample * n_feature), at the cost of recomputing distances for every pick.
     * When seed is empty the farthest pair is found by farthestPairBatched(),
     * using worker_count threads over batches of batch_size samples.
     * Prefer sample() whenever the full matrix fits in memory.
     */
    SamplingResult sampleBounded(
        const FeatureMatrix& X,
        const Selection& seed = {},
        std::optional<Index> n_result = {},
        Backend backend = Backend::PERFORMANCE,
        Index worker_count = 4,
        Index batch_size = 1000
    );

}

#endif //KSSAMPLING_SAMPLING_H

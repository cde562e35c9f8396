#ifndef KSSAMPLING_SEEDING_H
#define KSSAMPLING_SEEDING_H

#include <array>
#include <functional>

#include "utility.h"

namespace KSSampling {

    struct FarthestPair {
        std::array<Index, 2> indices;
        double distance;
    };

    /**
     * The pair of samples with the largest entry in a distance matrix.
     *
     * Only pairs i < j are considered; ties resolve to the first pair in row-major order.
     * Requires a square matrix with at least two samples.
     */
    FarthestPair farthestPair(const DistanceMatrix& dist);

    // First sample and length of a contiguous batch
    using BatchRange = std::array<Index, 2>;

    // Farthest pair between two batches, given the squared norms of every sample
    using BlockSearch = std::function<FarthestPair(
            const FeatureMatrix&, const Eigen::VectorXd&, const BatchRange&, const BatchRange&
    )>;

    /**
     * The farthest pair between the samples of two batches, computed with the Gram identity.
     *
     * When rows and cols are the same batch, only its distinct pairs are searched.
     * Returns a pair of -1 indices at negative infinity when the blocks hold no pair.
     */
    FarthestPair blockFarthestPair(
            const FeatureMatrix& X, const Eigen::VectorXd& norms, const BatchRange& rows, const BatchRange& cols
    );

    /**
     * The pair of samples with the largest Euclidean distance, without a distance matrix.
     *
     * The samples are split into contiguous batches of batch_size (the last may be shorter),
     * and every unordered pair of batches (including each batch with itself) is searched
     * by one of worker_count threads. Blocks are computed with the Gram identity,
     * so ties between nearly equal distances may resolve differently for different batch sizes.
     * A failure in any worker is rethrown here once all workers have finished.
     * worker_count must fit in an int.
     */
    FarthestPair farthestPairBatched(const FeatureMatrix& X, Index worker_count = 4, Index batch_size = 1000);

    // As above, with every batch pair searched by search instead of blockFarthestPair
    FarthestPair farthestPairBatched(
            const FeatureMatrix& X, Index worker_count, Index batch_size, const BlockSearch& search
    );

}

#endif //KSSAMPLING_SEEDING_H

#ifndef KSSAMPLING_REFERENCE_H
#define KSSAMPLING_REFERENCE_H

#include "utility.h"

namespace KSSampling::reference {

    /**
     * Greedy max-min selection over a precomputed distance matrix.
     *
     * The result starts with the seed (in seed order) followed by n_result - n_seed greedy picks.
     * v_dist[k] is the nearest-selected distance that justified result[k + 1];
     * with exactly two seeds v_dist[0] is the seed-to-seed distance.
     * The seed must be non-empty; use farthestPair() to find one.
     */
    SamplingResult kennardStone(const DistanceMatrix& dist, const Selection& seed, Index n_result);

    // Same selection as kennardStone(), recomputing Euclidean distances from the features as needed
    SamplingResult kennardStoneBounded(const FeatureMatrix& X, const Selection& seed, Index n_result);

}

#endif //KSSAMPLING_REFERENCE_H

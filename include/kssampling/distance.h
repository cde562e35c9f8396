#ifndef KSSAMPLING_DISTANCE_H
#define KSSAMPLING_DISTANCE_H

#include <span>

#include "utility.h"

namespace KSSampling {

    /**
     * Euclidean distance between two contiguous feature rows of length n_feature.
     *
     * Every selector measures samples through this one kernel, so equal inputs give
     * bit-identical distances (and identical tie-breaks) in every backend and mode.
     */
    inline double sampleDistance(const double* a, const double* b, Index n_feature) {
        using FeatureRow = Eigen::Map<const Eigen::RowVectorXd>;
        return (FeatureRow(a, n_feature) - FeatureRow(b, n_feature)).norm();
    }

    // Exact pairwise Euclidean distances, computed row against row
    DistanceMatrix euclideanDistances(const FeatureMatrix& X);

    /**
     * Pairwise Euclidean distances through the Gram identity |a|^2 - 2a.b + |b|^2.
     *
     * Much faster than euclideanDistances for wide features,
     * but the result can differ from the exact distances by rounding.
     * Negative squared distances produced by cancellation are clamped to zero,
     * and the diagonal is zero.
     */
    DistanceMatrix gramDistances(const FeatureMatrix& X);

    Eigen::VectorXd pointDistances(const FeatureMatrix& X, std::span<const Index> indices, Index point);

}

#endif //KSSAMPLING_DISTANCE_H

#include "kssampling/distance.h"

namespace KSSampling {

    DistanceMatrix euclideanDistances(const FeatureMatrix &X) {
        const Index n_sample = X.rows();
        DistanceMatrix dist = DistanceMatrix::Zero(n_sample, n_sample);

        // Each row only fills its upper triangle and the mirrored entries, so rows never overlap
        #pragma omp parallel for schedule(dynamic)
        for (Index i = 0; i < n_sample; ++i) {
            for (Index j = i + 1; j < n_sample; ++j) {
                const double d = sampleDistance(X.row(i).data(), X.row(j).data(), X.cols());
                dist(i, j) = d;
                dist(j, i) = d;
            }
        }

        return dist;
    }

    DistanceMatrix gramDistances(const FeatureMatrix &X) {
        const Eigen::VectorXd norms = X.rowwise().squaredNorm();

        DistanceMatrix dist = -2.0 * (X * X.transpose());
        dist.colwise() += norms;
        dist.rowwise() += norms.transpose();
        dist.diagonal().setZero();

        return dist.cwiseMax(0.0).cwiseSqrt();
    }

    Eigen::VectorXd pointDistances(const FeatureMatrix &X, std::span<const Index> indices, Index point) {
        Eigen::VectorXd distances(Index(indices.size()));
        const double* source = X.row(point).data();
        for (std::size_t k = 0; k < indices.size(); ++k)
            distances[Index(k)] = sampleDistance(X.row(indices[k]).data(), source, X.cols());
        return distances;
    }

}

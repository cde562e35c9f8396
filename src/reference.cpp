#include "kssampling/reference.h"
#include "kssampling/distance.h"
#include "kssampling/remaining.h"

#include <algorithm>

namespace KSSampling::reference {

    namespace {
        void requireSeed(const Selection &seed) {
            if (seed.empty())
                throw PreconditionError("Reference selection requires at least one seed index");
        }
    }

    SamplingResult kennardStone(const DistanceMatrix &dist, const Selection &seed, Index n_result) {
        if (dist.rows() != dist.cols())
            throw PreconditionError(fmt::format(
                    "Distance matrix must be square, got {}x{}", dist.rows(), dist.cols()
            ));
        const Index n_sample = dist.rows();
        requireSeed(seed);
        validateSelection(n_sample, seed, n_result);

        Selection result{seed};
        result.reserve(n_result);
        Eigen::VectorXd v_dist = Eigen::VectorXd::Zero(n_result);
        if (seed.size() == 2) v_dist[0] = dist(seed[0], seed[1]);

        std::vector<bool> selected(n_sample);
        for (const auto s: seed) selected[s] = true;

        // Distance to the nearest seed; entries of selected samples are never read
        Eigen::VectorXd min_vals = dist.row(seed[0]).transpose();
        for (auto s = seed.begin() + 1; s != seed.end(); ++s)
            min_vals = min_vals.cwiseMin(dist.row(*s).transpose());

        for (Index n = Index(seed.size()); n < n_result; ++n) {

            // Masked argmax, the first unselected maximum wins
            Index sup = -1;
            for (Index i = 0; i < n_sample; ++i) {
                if (selected[i]) continue;
                if (sup < 0 || min_vals[i] > min_vals[sup]) sup = i;
            }

            result.push_back(sup);
            v_dist[n - 1] = min_vals[sup];
            selected[sup] = true;

            // Fold the new sample's distances into the unselected entries
            for (Index i = 0; i < n_sample; ++i)
                if (!selected[i]) min_vals[i] = std::min(min_vals[i], dist(sup, i));
        }

        return {result, v_dist};
    }

    SamplingResult kennardStoneBounded(const FeatureMatrix &X, const Selection &seed, Index n_result) {
        const Index n_sample = X.rows();
        requireSeed(seed);
        validateSelection(n_sample, seed, n_result);

        Selection result{seed};
        result.reserve(n_result);
        Eigen::VectorXd v_dist = Eigen::VectorXd::Zero(n_result);
        if (seed.size() == 2) v_dist[0] = sampleDistance(X.row(seed[0]).data(), X.row(seed[1]).data(), X.cols());

        RemainingSet remains{n_sample, seed};
        for (const auto s: seed)
            remains.fold(pointDistances(X, remains.indices(), s));

        for (Index n = Index(seed.size()); n < n_result; ++n) {
            const Index position = remains.argmax();
            v_dist[n - 1] = remains.value(position);

            const Index sup = remains.remove(position);
            result.push_back(sup);

            // Only distances to the newly selected sample are computed
            remains.fold(pointDistances(X, remains.indices(), sup));
        }

        return {result, v_dist};
    }

}

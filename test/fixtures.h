#ifndef KSSAMPLING_TEST_FIXTURES_H
#define KSSAMPLING_TEST_FIXTURES_H

#include <algorithm>
#include <random>

#include <catch2/catch.hpp>

#include <kssampling/utility.h>

namespace KSSampling::testing {

    inline FeatureMatrix randomFeatures(Index n_sample, Index n_feature, unsigned int seed = 0) {
        std::mt19937 generator{seed};
        std::normal_distribution<double> normal{0.0, 100.0};
        FeatureMatrix X{n_sample, n_feature};
        for (Index i = 0; i < n_sample; ++i)
            for (Index f = 0; f < n_feature; ++f)
                X(i, f) = normal(generator);
        return X;
    }

    // Seven 1-D samples in three groups of equal values
    inline FeatureMatrix duplicateFeatures() {
        FeatureMatrix X{7, 1};
        X << 1, 1, 2, 2, 2, 3, 3;
        return X;
    }

    inline double bruteForceMaxDistance(const FeatureMatrix& X) {
        double best = 0.0;
        for (Index i = 0; i < X.rows(); ++i)
            for (Index j = i + 1; j < X.rows(); ++j)
                best = std::max(best, (X.row(i) - X.row(j)).norm());
        return best;
    }

    inline void requireValidSelection(const SamplingResult& sampling, Index n_sample, Index n_result) {
        const auto& [indices, v_dist] = sampling;
        REQUIRE(Index(indices.size()) == n_result);
        REQUIRE(v_dist.size() == n_result);

        std::vector<bool> seen(n_sample);
        for (const auto index: indices) {
            REQUIRE(index >= 0);
            REQUIRE(index < n_sample);
            REQUIRE_FALSE(seen[index]);
            seen[index] = true;
        }
    }

    inline void requireSameSampling(const SamplingResult& a, const SamplingResult& b) {
        REQUIRE(a.first == b.first);
        REQUIRE(a.second.size() == b.second.size());
        for (Index k = 0; k < a.second.size(); ++k)
            REQUIRE(a.second[k] == Approx(b.second[k]).epsilon(1e-9).margin(1e-12));
    }

}

#endif //KSSAMPLING_TEST_FIXTURES_H

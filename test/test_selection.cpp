#include "fixtures.h"

#include <kssampling/distance.h>
#include <kssampling/reference.h>
#include <kssampling/sampling.h>

#include <limits>

using namespace KSSampling;
using namespace KSSampling::testing;

namespace {

    // Runs either selector mode through the public entry points
    SamplingResult runSampling(
            bool bounded, Backend backend,
            const FeatureMatrix &X, const Selection &seed, std::optional<Index> n_result
    ) {
        if (bounded) return sampleBounded(X, seed, n_result, backend, 2, 16);
        return sample(X, seed, n_result, euclideanDistances, backend);
    }

}

TEST_CASE("selecting every sample yields a permutation", "[selection]") {
    const auto X = randomFeatures(60, 5, 1);
    const auto bounded = GENERATE(false, true);
    const auto backend = GENERATE(Backend::REFERENCE, Backend::PERFORMANCE);

    const auto sampling = runSampling(bounded, backend, X, {}, {});
    requireValidSelection(sampling, 60, 60);

    const auto& [indices, v_dist] = sampling;
    REQUIRE(v_dist[59] == 0.0);
    for (Index k = 1; k + 1 < v_dist.size(); ++k)
        REQUIRE(v_dist[k] <= v_dist[k - 1]);
}

TEST_CASE("the seed is the prefix of the result", "[selection]") {
    const auto X = randomFeatures(80, 4, 2);
    const Selection seed{7, 3, 11};
    const auto bounded = GENERATE(false, true);
    const auto backend = GENERATE(Backend::REFERENCE, Backend::PERFORMANCE);

    const auto sampling = runSampling(bounded, backend, X, seed, 20);
    requireValidSelection(sampling, 80, 20);

    const auto& [indices, v_dist] = sampling;
    REQUIRE(Selection(indices.begin(), indices.begin() + 3) == seed);

    // With more than two seeds the slots before the first greedy pick stay empty
    REQUIRE(v_dist[0] == 0.0);
    REQUIRE(v_dist[1] == 0.0);
    REQUIRE(v_dist[2] > 0.0);
    REQUIRE(v_dist[19] == 0.0);
}

TEST_CASE("dispersion distances lag one step behind the indices", "[selection]") {
    const auto X = randomFeatures(25, 3, 4);
    const auto dist = euclideanDistances(X);
    const auto [indices, v_dist] = reference::kennardStone(dist, {4, 9}, 10);

    REQUIRE(v_dist[0] == dist(4, 9));
    for (Index n = 2; n < 10; ++n) {
        double nearest = std::numeric_limits<double>::infinity();
        for (Index s = 0; s < n; ++s)
            nearest = std::min(nearest, dist(indices[n], indices[s]));
        REQUIRE(v_dist[n - 1] == nearest);
    }
    REQUIRE(v_dist[9] == 0.0);
}

TEST_CASE("a single seed reports the first greedy pick in the first slot", "[selection]") {
    const auto X = randomFeatures(15, 2, 8);
    const auto dist = euclideanDistances(X);
    const auto [indices, v_dist] = reference::kennardStone(dist, {6}, 4);

    REQUIRE(indices[0] == 6);
    Index farthest;
    dist.row(6).maxCoeff(&farthest);
    REQUIRE(indices[1] == farthest);
    REQUIRE(v_dist[0] == dist(6, farthest));
}

TEST_CASE("two seeds with two results keep the seed distance", "[selection]") {
    const auto X = randomFeatures(10, 2, 9);
    const auto bounded = GENERATE(false, true);
    const auto backend = GENERATE(Backend::REFERENCE, Backend::PERFORMANCE);

    const auto [indices, v_dist] = runSampling(bounded, backend, X, {2, 8}, 2);
    REQUIRE(indices == Selection{2, 8});
    REQUIRE(v_dist[0] == Approx((X.row(2) - X.row(8)).norm()));
}

TEST_CASE("duplicate samples are each selected exactly once", "[selection][duplicates]") {
    const auto X = duplicateFeatures();
    const auto bounded = GENERATE(false, true);
    const auto backend = GENERATE(Backend::REFERENCE, Backend::PERFORMANCE);

    const auto sampling = runSampling(bounded, backend, X, {}, {});
    requireValidSelection(sampling, 7, 7);

    const auto& [indices, v_dist] = sampling;
    REQUIRE(indices == Selection{0, 5, 2, 1, 3, 4, 6});
    REQUIRE(v_dist[0] == 2.0);
    REQUIRE(v_dist[1] == 1.0);
    REQUIRE(v_dist.tail(5).isZero(0.0));
}

TEST_CASE("reference selectors reject invalid selections", "[selection][errors]") {
    const auto X = randomFeatures(6, 2);
    const auto dist = euclideanDistances(X);

    REQUIRE_THROWS_AS(reference::kennardStone(DistanceMatrix::Zero(6, 5), {0}, 3), PreconditionError);
    REQUIRE_THROWS_AS(reference::kennardStone(dist, {}, 3), PreconditionError);
    REQUIRE_THROWS_AS(reference::kennardStone(dist, {0}, 7), PreconditionError);
    REQUIRE_THROWS_AS(reference::kennardStone(dist, {0, 6}, 3), PreconditionError);
    REQUIRE_THROWS_AS(reference::kennardStone(dist, {-1, 2}, 3), PreconditionError);
    REQUIRE_THROWS_AS(reference::kennardStone(dist, {2, 2}, 3), PreconditionError);
    REQUIRE_THROWS_AS(reference::kennardStone(dist, {0, 1, 2}, 2), PreconditionError);

    REQUIRE_THROWS_AS(reference::kennardStoneBounded(X, {}, 3), PreconditionError);
    REQUIRE_THROWS_AS(reference::kennardStoneBounded(X, {1, 1}, 3), PreconditionError);
    REQUIRE_THROWS_AS(reference::kennardStoneBounded(X, {0}, 7), PreconditionError);
    REQUIRE_THROWS_AS(reference::kennardStoneBounded(X, {0}, -1), PreconditionError);
}

#include "kssampling/sampling.h"
#include "kssampling/performance.h"
#include "kssampling/reference.h"
#include "kssampling/seeding.h"

#include <limits>

namespace KSSampling {

    namespace {

        void requireDiscoverableSeed(Index n_sample, Index n_result) {
            if (n_sample < 2 || n_result < 2)
                throw PreconditionError(fmt::format(
                        "Finding a seed requires at least 2 samples and 2 results, got {} and {}",
                        n_sample, n_result
                ));
        }

        SamplingResult fromBuffers(const std::vector<std::size_t>& result, Eigen::VectorXd v_dist) {
            return {Selection(result.begin(), result.end()), std::move(v_dist)};
        }

    }

    SamplingResult sample(
            const FeatureMatrix &X,
            const Selection &seed,
            std::optional<Index> n_result,
            const DistanceFunction &distance,
            Backend backend
    ) {
        const auto backend_name = backendName(backend);
        const Index n_sample = X.rows();
        const Index count = n_result.value_or(n_sample);

        if (seed.empty())
            requireDiscoverableSeed(n_sample, count);
        validateSelection(n_sample, seed, count);

        const DistanceMatrix dist = distance(X);
        if (dist.rows() != n_sample || dist.cols() != n_sample)
            throw PreconditionError(fmt::format(
                    "Distance function returned a {}x{} matrix for {} samples", dist.rows(), dist.cols(), n_sample
            ));
        logProgress("Sampling {} of {} samples with the {} backend", count, n_sample, backend_name);

        switch (backend) {
            case Backend::REFERENCE: {
                Selection resolved_seed{seed};
                if (resolved_seed.empty()) {
                    const auto [indices, _] = farthestPair(dist);
                    resolved_seed = {indices[0], indices[1]};
                }
                return reference::kennardStone(dist, resolved_seed, count);
            }
            case Backend::PERFORMANCE: {
                // An empty seed lets the performance backend search the matrix itself
                const std::vector<std::size_t> raw_seed(seed.begin(), seed.end());
                std::vector<std::size_t> result(count);
                Eigen::VectorXd v_dist(count);
                performance::kennardStone(
                        dist.data(), raw_seed.data(), result.data(), v_dist.data(),
                        std::size_t(n_sample), raw_seed.size(), std::size_t(count)
                );
                return fromBuffers(result, std::move(v_dist));
            }
        }
        throw ConfigurationError(fmt::format("Unrecognized backend value {}", static_cast<int>(backend)));
    }

    SamplingResult sampleBounded(
            const FeatureMatrix &X,
            const Selection &seed,
            std::optional<Index> n_result,
            Backend backend,
            Index worker_count,
            Index batch_size
    ) {
        const auto backend_name = backendName(backend);
        if (worker_count < 1)
            throw ConfigurationError(fmt::format("Worker count must be at least 1, got {}", worker_count));
        if (worker_count > std::numeric_limits<int>::max())
            throw ConfigurationError(fmt::format(
                    "Worker count must be at most {}, got {}", std::numeric_limits<int>::max(), worker_count
            ));
        if (batch_size < 1)
            throw ConfigurationError(fmt::format("Batch size must be at least 1, got {}", batch_size));

        const Index n_sample = X.rows();
        const Index count = n_result.value_or(n_sample);

        if (seed.empty())
            requireDiscoverableSeed(n_sample, count);
        validateSelection(n_sample, seed, count);

        // Neither bounded backend searches for a seed, so resolve it here
        Selection resolved_seed{seed};
        if (resolved_seed.empty()) {
            const auto [indices, _] = farthestPairBatched(X, worker_count, batch_size);
            resolved_seed = {indices[0], indices[1]};
        }
        logProgress("Sampling {} of {} samples with the bounded {} backend", count, n_sample, backend_name);

        switch (backend) {
            case Backend::REFERENCE:
                return reference::kennardStoneBounded(X, resolved_seed, count);
            case Backend::PERFORMANCE: {
                const std::vector<std::size_t> raw_seed(resolved_seed.begin(), resolved_seed.end());
                std::vector<std::size_t> result(count);
                Eigen::VectorXd v_dist(count);
                performance::kennardStoneBounded(
                        X.data(), raw_seed.data(), result.data(), v_dist.data(),
                        std::size_t(n_sample), std::size_t(X.cols()), raw_seed.size(), std::size_t(count)
                );
                return fromBuffers(result, std::move(v_dist));
            }
        }
        throw ConfigurationError(fmt::format("Unrecognized backend value {}", static_cast<int>(backend)));
    }

}

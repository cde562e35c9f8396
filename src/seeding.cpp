#include "kssampling/seeding.h"

#include <algorithm>
#include <exception>
#include <limits>

namespace KSSampling {

    namespace {

        FarthestPair noPair() {
            return {{-1, -1}, -std::numeric_limits<double>::infinity()};
        }

    }

    FarthestPair blockFarthestPair(
            const FeatureMatrix &X, const Eigen::VectorXd &norms,
            const BatchRange &rows, const BatchRange &cols
    ) {
        const bool self_pair = rows[0] == cols[0];

        // Squared distances of the block, |a|^2 - 2a.b + |b|^2
        Eigen::MatrixXd block = -2.0 * (X.middleRows(rows[0], rows[1]) * X.middleRows(cols[0], cols[1]).transpose());
        block.colwise() += norms.segment(rows[0], rows[1]);
        block.rowwise() += norms.segment(cols[0], cols[1]).transpose();
        if (self_pair) block.diagonal().setZero();
        block = block.cwiseMax(0.0).cwiseSqrt();

        // Within a batch paired with itself, only the strict upper triangle holds distinct pairs
        auto best = noPair();
        for (Index r = 0; r < block.rows(); ++r) {
            for (Index c = self_pair ? r + 1 : 0; c < block.cols(); ++c) {
                if (block(r, c) > best.distance)
                    best = {{rows[0] + r, cols[0] + c}, block(r, c)};
            }
        }
        return best;
    }

    FarthestPair farthestPair(const DistanceMatrix &dist) {
        if (dist.rows() != dist.cols())
            throw PreconditionError(fmt::format(
                    "Distance matrix must be square, got {}x{}", dist.rows(), dist.cols()
            ));
        if (dist.rows() < 2)
            throw PreconditionError(fmt::format(
                    "Finding a farthest pair requires at least 2 samples, got {}", dist.rows()
            ));

        FarthestPair best{{0, 1}, dist(0, 1)};
        for (Index i = 0; i < dist.rows(); ++i) {
            for (Index j = i + 1; j < dist.cols(); ++j) {
                if (dist(i, j) > best.distance)
                    best = {{i, j}, dist(i, j)};
            }
        }

        logProgress("Found farthest pair ({}, {}) at distance {}", best.indices[0], best.indices[1], best.distance);
        return best;
    }

    FarthestPair farthestPairBatched(const FeatureMatrix &X, Index worker_count, Index batch_size) {
        return farthestPairBatched(X, worker_count, batch_size, blockFarthestPair);
    }

    FarthestPair farthestPairBatched(
            const FeatureMatrix &X, Index worker_count, Index batch_size, const BlockSearch &search
    ) {
        if (worker_count < 1)
            throw ConfigurationError(fmt::format("Worker count must be at least 1, got {}", worker_count));
        if (worker_count > std::numeric_limits<int>::max())
            throw ConfigurationError(fmt::format(
                    "Worker count must be at most {}, got {}", std::numeric_limits<int>::max(), worker_count
            ));
        if (batch_size < 1)
            throw ConfigurationError(fmt::format("Batch size must be at least 1, got {}", batch_size));

        const Index n_sample = X.rows();
        if (n_sample < 2)
            throw PreconditionError(fmt::format(
                    "Finding a farthest pair requires at least 2 samples, got {}", n_sample
            ));

        // Squared norms are shared read-only by every worker
        const Eigen::VectorXd norms = X.rowwise().squaredNorm();

        // Split the samples into contiguous batches
        std::vector<BatchRange> batches;
        for (Index start = 0; start < n_sample; start += batch_size)
            batches.push_back({start, std::min(batch_size, n_sample - start)});

        // Every unordered pair of batches, each batch also paired with itself
        std::vector<std::array<std::size_t, 2>> batch_pairs;
        for (std::size_t a = 0; a < batches.size(); ++a)
            for (std::size_t b = a; b < batches.size(); ++b)
                batch_pairs.push_back({a, b});
        logProgress("Searching {} batch pairs of size {} with {} workers", batch_pairs.size(), batch_size, worker_count);

        // Each task owns one result slot, so workers share no mutable state
        std::vector<FarthestPair> local_pairs(batch_pairs.size(), noPair());
        std::vector<std::exception_ptr> failures(batch_pairs.size());

        #pragma omp parallel for schedule(dynamic) num_threads(static_cast<int>(worker_count))
        for (Index task = 0; task < Index(batch_pairs.size()); ++task) {
            const auto [a, b] = batch_pairs[task];
            try {
                local_pairs[task] = search(X, norms, batches[a], batches[b]);
            } catch (...) {
                failures[task] = std::current_exception();
            }
        }

        for (const auto &failure: failures)
            if (failure) std::rethrow_exception(failure);

        // Reduce with a max over the per-task results, earlier tasks winning ties
        auto best = noPair();
        for (const auto &candidate: local_pairs)
            if (candidate.distance > best.distance) best = candidate;

        logProgress("Found farthest pair ({}, {}) at distance {}", best.indices[0], best.indices[1], best.distance);
        return best;
    }

}

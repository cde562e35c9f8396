#include "kssampling/performance.h"
#include "kssampling/distance.h"

#include <algorithm>
#include <array>
#include <limits>

namespace KSSampling::performance {

    namespace {

        // Below this many remaining samples the update loop stays on the calling thread
        constexpr std::ptrdiff_t PARALLEL_THRESHOLD = 2048;

        struct MatrixDistance {
            const double* dist;
            std::size_t n_sample;

            double operator()(std::size_t a, std::size_t b) const {
                return dist[a * n_sample + b];
            }
        };

        struct FeatureDistance {
            const double* X;
            std::size_t n_feature;

            double operator()(std::size_t a, std::size_t b) const {
                return sampleDistance(X + a * n_feature, X + b * n_feature, Index(n_feature));
            }
        };

        void checkBuffers(
                const void* input, const std::size_t* seed,
                const std::size_t* result_out, const double* vdist_out,
                std::size_t n_sample, std::size_t n_seed, std::size_t n_result
        ) {
            if (n_sample > 0 && input == nullptr)
                throw PreconditionError("Input buffer is null");
            if (n_seed > 0 && seed == nullptr)
                throw PreconditionError("Seed buffer is null");
            if (n_result > 0 && (result_out == nullptr || vdist_out == nullptr))
                throw PreconditionError("Output buffers are null");
        }

        void checkSeed(const std::size_t* seed, std::size_t n_sample, std::size_t n_seed, std::size_t n_result) {
            if (n_result > n_sample)
                throw PreconditionError(fmt::format(
                        "Cannot select {} results from {} samples", n_result, n_sample
                ));
            if (n_seed > n_result)
                throw PreconditionError(fmt::format(
                        "Seed of {} indices does not fit in {} results", n_seed, n_result
                ));

            std::vector<bool> seen(n_sample);
            for (std::size_t s = 0; s < n_seed; ++s) {
                if (seed[s] >= n_sample)
                    throw PreconditionError(fmt::format(
                            "Seed index {} is outside of [0, {})", seed[s], n_sample
                    ));
                if (seen[seed[s]])
                    throw PreconditionError(fmt::format("Seed index {} appears more than once", seed[s]));
                seen[seed[s]] = true;
            }
        }

        // Farthest pair i < j of a row-major distance buffer; ties resolve to the first in row-major order
        std::array<std::size_t, 2> matrixFarthestPair(const double* dist, std::size_t n_sample) {
            std::vector<std::size_t> row_best(n_sample, 0);
            std::vector<double> row_max(n_sample, -std::numeric_limits<double>::infinity());

            #pragma omp parallel for schedule(dynamic, 16)
            for (std::ptrdiff_t i = 0; i < std::ptrdiff_t(n_sample); ++i) {
                const double* row = dist + std::size_t(i) * n_sample;
                for (std::size_t j = std::size_t(i) + 1; j < n_sample; ++j) {
                    if (row[j] > row_max[i]) {
                        row_max[i] = row[j];
                        row_best[i] = j;
                    }
                }
            }

            // Reducing rows in order keeps the first row-major maximum
            std::size_t best_row = 0;
            for (std::size_t i = 1; i + 1 < n_sample; ++i)
                if (row_max[i] > row_max[best_row]) best_row = i;

            return {best_row, row_best[best_row]};
        }

        template<typename Distance>
        void selectGreedy(
                const Distance &distance, const std::size_t* seed,
                std::size_t* result_out, double* vdist_out,
                std::size_t n_sample, std::size_t n_seed, std::size_t n_result
        ) {
            std::fill(vdist_out, vdist_out + n_result, 0.0);
            std::copy(seed, seed + n_seed, result_out);
            if (n_seed == 2) vdist_out[0] = distance(seed[0], seed[1]);

            // Compact arrays of the unselected samples and their distance to the nearest selected one
            std::vector<bool> is_seed(n_sample);
            for (std::size_t s = 0; s < n_seed; ++s) is_seed[seed[s]] = true;
            std::vector<std::size_t> remains;
            remains.reserve(n_sample - n_seed);
            for (std::size_t i = 0; i < n_sample; ++i)
                if (!is_seed[i]) remains.push_back(i);
            std::vector<double> min_vals(remains.size());
            auto live = std::ptrdiff_t(remains.size());

            #pragma omp parallel for schedule(static) if(live > PARALLEL_THRESHOLD)
            for (std::ptrdiff_t k = 0; k < live; ++k) {
                double nearest = std::numeric_limits<double>::infinity();
                for (std::size_t s = 0; s < n_seed; ++s)
                    nearest = std::min(nearest, distance(seed[s], remains[k]));
                min_vals[k] = nearest;
            }

            for (std::size_t n = n_seed; n < n_result; ++n) {

                // Swap-removal scrambles positions, so ties go to the smallest sample index
                std::ptrdiff_t best = 0;
                for (std::ptrdiff_t k = 1; k < live; ++k) {
                    if (min_vals[k] > min_vals[best] || (min_vals[k] == min_vals[best] && remains[k] < remains[best]))
                        best = k;
                }

                const std::size_t sup = remains[best];
                result_out[n] = sup;
                vdist_out[n - 1] = min_vals[best];

                --live;
                remains[best] = remains[live];
                min_vals[best] = min_vals[live];

                #pragma omp parallel for schedule(static) if(live > PARALLEL_THRESHOLD)
                for (std::ptrdiff_t k = 0; k < live; ++k)
                    min_vals[k] = std::min(min_vals[k], distance(sup, remains[k]));
            }
        }

    }

    void kennardStone(
            const double* dist, const std::size_t* seed,
            std::size_t* result_out, double* vdist_out,
            std::size_t n_sample, std::size_t n_seed, std::size_t n_result
    ) {
        checkBuffers(dist, seed, result_out, vdist_out, n_sample, n_seed, n_result);

        std::array<std::size_t, 2> found_seed{};
        if (n_seed == 0) {
            checkSeed(seed, n_sample, n_seed, n_result);
            if (n_sample < 2 || n_result < 2)
                throw PreconditionError(fmt::format(
                        "Finding a seed requires at least 2 samples and 2 results, got {} and {}",
                        n_sample, n_result
                ));
            found_seed = matrixFarthestPair(dist, n_sample);
            logProgress("Found farthest pair ({}, {}) at distance {}",
                        found_seed[0], found_seed[1], dist[found_seed[0] * n_sample + found_seed[1]]);
            seed = found_seed.data();
            n_seed = found_seed.size();
        }
        checkSeed(seed, n_sample, n_seed, n_result);

        selectGreedy(MatrixDistance{dist, n_sample}, seed, result_out, vdist_out, n_sample, n_seed, n_result);
        logProgress("Selected {} of {} samples", n_result, n_sample);
    }

    void kennardStoneBounded(
            const double* X, const std::size_t* seed,
            std::size_t* result_out, double* vdist_out,
            std::size_t n_sample, std::size_t n_feature, std::size_t n_seed, std::size_t n_result
    ) {
        checkBuffers(X, seed, result_out, vdist_out, n_sample, n_seed, n_result);
        if (n_seed == 0)
            throw PreconditionError("Bounded selection requires an explicit seed; find one with farthestPairBatched()");
        checkSeed(seed, n_sample, n_seed, n_result);

        selectGreedy(FeatureDistance{X, n_feature}, seed, result_out, vdist_out, n_sample, n_seed, n_result);
        logProgress("Selected {} of {} samples", n_result, n_sample);
    }

}

#ifndef KSSAMPLING_UTILITY_H
#define KSSAMPLING_UTILITY_H

#include <cstdio>
#include <functional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include <Eigen/Eigen>

#include <fmt/core.h>

namespace KSSampling {

    using Eigen::Index;
    using FeatureMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    using DistanceMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    using Selection = std::vector<Index>;
    using SamplingResult = std::pair<Selection, Eigen::VectorXd>;
    using DistanceFunction = std::function<DistanceMatrix(const FeatureMatrix&)>;

    // Raised when the inputs of a sampling call cannot produce a valid selection
    class PreconditionError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // Raised for unknown backends and unusable worker pool settings
    class ConfigurationError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    enum class Backend {
        REFERENCE = 0,
        PERFORMANCE = 1
    };

    Backend parseBackend(std::string_view name);

    std::string_view backendName(Backend backend);

    /**
     * Checks that a seed and a result count describe a valid selection over n_sample points.
     *
     * Seed entries must lie in [0, n_sample) and be distinct,
     * and the seed must fit inside the result (n_seed <= n_result <= n_sample).
     */
    void validateSelection(Index n_sample, const Selection& seed, Index n_result);

    void setVerbose(bool verbose);

    bool verbose();

    template<typename... Args>
    void logProgress(fmt::format_string<Args...> format, Args&& ... args) {
        if (!verbose()) return;
        fmt::print(stderr, "[kssampling] {}\n", fmt::format(format, std::forward<Args>(args)...));
    }

}

#endif // !KSSAMPLING_UTILITY_H

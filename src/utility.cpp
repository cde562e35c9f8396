#include "kssampling/utility.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <string>

namespace KSSampling {

    namespace {
        std::atomic<bool> verbose_logging{false};
    }

    Backend parseBackend(std::string_view name) {
        std::string lowered{name};
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });

        if (lowered == "reference") return Backend::REFERENCE;
        if (lowered == "performance") return Backend::PERFORMANCE;
        throw ConfigurationError(fmt::format(
                "Unrecognized backend \"{}\" (expected \"reference\" or \"performance\")", name
        ));
    }

    std::string_view backendName(Backend backend) {
        switch (backend) {
            case Backend::REFERENCE:
                return "reference";
            case Backend::PERFORMANCE:
                return "performance";
        }
        throw ConfigurationError(fmt::format("Unrecognized backend value {}", static_cast<int>(backend)));
    }

    void validateSelection(Index n_sample, const Selection &seed, Index n_result) {
        const auto n_seed = Index(seed.size());

        if (n_result < 0)
            throw PreconditionError(fmt::format("Result count must not be negative, got {}", n_result));
        if (n_result > n_sample)
            throw PreconditionError(fmt::format(
                    "Cannot select {} results from {} samples", n_result, n_sample
            ));
        if (n_seed > n_result)
            throw PreconditionError(fmt::format(
                    "Seed of {} indices does not fit in {} results", n_seed, n_result
            ));

        // Every seed index must be in range, and none may appear twice
        std::vector<bool> seen(n_sample);
        for (const auto index: seed) {
            if (index < 0 || index >= n_sample)
                throw PreconditionError(fmt::format(
                        "Seed index {} is outside of [0, {})", index, n_sample
                ));
            if (seen[index])
                throw PreconditionError(fmt::format("Seed index {} appears more than once", index));
            seen[index] = true;
        }
    }

    void setVerbose(bool verbose) {
        verbose_logging.store(verbose, std::memory_order_relaxed);
    }

    bool verbose() {
        return verbose_logging.load(std::memory_order_relaxed);
    }

}

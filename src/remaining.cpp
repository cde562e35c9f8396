#include "kssampling/remaining.h"

#include <limits>

namespace KSSampling {

    RemainingSet::RemainingSet(Index n_sample, const Selection &excluded) {
        std::vector<bool> skip(n_sample);
        for (const auto index: excluded) skip[index] = true;

        arena.reserve(n_sample);
        for (Index i = 0; i < n_sample; ++i)
            if (!skip[i]) arena.push_back(i);

        live = Index(arena.size());
        min_vals.setConstant(live, std::numeric_limits<double>::infinity());
    }

    void RemainingSet::fold(const Eigen::VectorXd &distances) {
        if (distances.size() != live)
            throw PreconditionError(fmt::format(
                    "Expected {} distances to fold into the remaining set, got {}", live, distances.size()
            ));
        min_vals.head(live) = min_vals.head(live).cwiseMin(distances);
    }

    Index RemainingSet::argmax() const {
        if (empty())
            throw PreconditionError("Cannot select from an empty remaining set");

        Index best = 0;
        for (Index position = 1; position < live; ++position) {
            const double candidate = min_vals[position];
            if (candidate > min_vals[best] || (candidate == min_vals[best] && arena[position] < arena[best]))
                best = position;
        }
        return best;
    }

    Index RemainingSet::remove(Index position) {
        const Index removed = arena[position];

        // Swap with the last live entry, leaving the removed index just past the live range
        --live;
        std::swap(arena[position], arena[live]);
        std::swap(min_vals[position], min_vals[live]);

        return removed;
    }

}

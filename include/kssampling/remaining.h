#ifndef KSSAMPLING_REMAINING_H
#define KSSAMPLING_REMAINING_H

#include <span>

#include "utility.h"

namespace KSSampling {

    /**
     * Unselected sample indices, each paired with its distance to the nearest selected sample.
     *
     * The indices live in a fixed arena; the first size() entries are still unselected.
     * Removing an entry swaps it with the last live entry, so positions are not stable
     * across removals but indices() and values() always stay aligned.
     */
    class RemainingSet {
    public:

        // All of [0, n_sample) except the excluded indices, with no distance folded in yet
        RemainingSet(Index n_sample, const Selection& excluded);

        [[nodiscard]] Index size() const { return live; }

        [[nodiscard]] bool empty() const { return live == 0; }

        [[nodiscard]] std::span<const Index> indices() const {
            return {arena.data(), static_cast<std::size_t>(live)};
        }

        [[nodiscard]] auto values() const { return min_vals.head(live); }

        [[nodiscard]] Index index(Index position) const { return arena[position]; }

        [[nodiscard]] double value(Index position) const { return min_vals[position]; }

        // Element-wise minimum with distances aligned to indices()
        void fold(const Eigen::VectorXd& distances);

        // Position of the largest value; equal values resolve to the smallest sample index
        [[nodiscard]] Index argmax() const;

        // Removes the entry at position and returns its sample index
        Index remove(Index position);

    private:
        std::vector<Index> arena;
        Eigen::VectorXd min_vals;
        Index live;
    };

}

#endif //KSSAMPLING_REMAINING_H

#pragma once

#include "Types.hpp"

#include <utility>

namespace caro::core {

struct RatingConfig {
    int initialRating{1200};
    int kFactor{32};
};

struct RatingChange {
    int oldRating{};
    int newRating{};
    int delta{};
};

// Elo update with the logistic expected-score model.
class RatingCalculator {
public:
    explicit RatingCalculator(int kFactor = RatingConfig{}.kFactor);

    int kFactor() const noexcept { return kFactor_; }

    /// 1 / (1 + 10^((opponent - self) / 400))
    static double expectedScore(int selfRating, int opponentRating);

    /// delta = K * (actual - expected), truncated toward zero.
    RatingChange update(int selfRating, int opponentRating, Outcome outcome) const;

    /// Both sides from the same pre-match snapshot. `outcomeA` is A's view.
    std::pair<RatingChange, RatingChange>
    updateBoth(int ratingA, int ratingB, Outcome outcomeA) const;

private:
    int kFactor_;
};

} // namespace caro::core

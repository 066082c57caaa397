#include "core/RatingCalculator.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace caro::core {

namespace {
    double actualScore(Outcome outcome) {
        switch (outcome) {
        case Outcome::Win:  return 1.0;
        case Outcome::Loss: return 0.0;
        case Outcome::Draw: return 0.5;
        }
        return 0.5;
    }

    Outcome mirrored(Outcome outcome) {
        switch (outcome) {
        case Outcome::Win:  return Outcome::Loss;
        case Outcome::Loss: return Outcome::Win;
        case Outcome::Draw: return Outcome::Draw;
        }
        return Outcome::Draw;
    }
}

RatingCalculator::RatingCalculator(int kFactor)
    : kFactor_{kFactor}
{
    if (kFactor <= 0) {
        throw std::invalid_argument("K factor must be positive");
    }
}

double RatingCalculator::expectedScore(int selfRating, int opponentRating) {
    const double exponent = static_cast<double>(opponentRating - selfRating) / 400.0;
    return 1.0 / (1.0 + std::pow(10.0, exponent));
}

RatingChange RatingCalculator::update(int selfRating, int opponentRating, Outcome outcome) const {
    const double expected = expectedScore(selfRating, opponentRating);
    const double raw = kFactor_ * (actualScore(outcome) - expected);
    const int delta = static_cast<int>(std::trunc(raw));
    return RatingChange{selfRating, selfRating + delta, delta};
}

std::pair<RatingChange, RatingChange>
RatingCalculator::updateBoth(int ratingA, int ratingB, Outcome outcomeA) const {
    return {update(ratingA, ratingB, outcomeA),
            update(ratingB, ratingA, mirrored(outcomeA))};
}

} // namespace caro::core

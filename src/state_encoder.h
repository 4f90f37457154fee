#ifndef MIRAGE_STATE_ENCODER_H
#define MIRAGE_STATE_ENCODER_H

#include "character.h"

#include <Eigen/Dense>

namespace Mirage {

// Feature layout (all entries in [0,1]):
//   0-6   condition     health, energy, wealth, reputation, happiness, stress, trust
//   7-11  personality   openness, conscientiousness, extraversion, agreeableness, neuroticism
//   12-15 emotions      joy, anger, sadness, fear (current episodic values)
//   16-19 pressures     threat, opportunity, social, time
// Health and the pressures drive success odds and termination, so the policy sees them directly.
class StateEncoder {
public:
    static constexpr int kDimension = 20;

    int dimension() const { return kDimension; }
    Eigen::VectorXf encode(const CharacterProfile& profile, const EpisodicState& state) const;
};

} // namespace Mirage

#endif

#include "state_encoder.h"

namespace Mirage {

Eigen::VectorXf StateEncoder::encode(const CharacterProfile& profile, const EpisodicState& state) const {
    Eigen::VectorXf v(kDimension);
    const Personality& p = profile.personality;
    const EnvironmentPressures& env = state.pressures;
    v << state.health, state.energy, state.wealth, state.reputation, state.happiness, state.stress, state.trust,
         p.openness, p.conscientiousness, p.extraversion, p.agreeableness, p.neuroticism,
         state.emotions.joy, state.emotions.anger, state.emotions.sadness, state.emotions.fear,
         env.threat, env.opportunity, env.social_pressure, env.time_pressure;
    return v;
}

} // namespace Mirage

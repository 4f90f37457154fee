#include "character.h"

#include <cmath>

namespace Mirage {

namespace {

float sanitized(float v, float neutral) {
    if (!std::isfinite(v)) return neutral;
    return clamp_unit(v);
}

} // namespace

CharacterProfile sanitize_profile(const CharacterProfile& profile) {
    CharacterProfile p = profile;
    Personality& t = p.personality;
    t.openness = sanitized(t.openness, kNeutralPersonality);
    t.conscientiousness = sanitized(t.conscientiousness, kNeutralPersonality);
    t.extraversion = sanitized(t.extraversion, kNeutralPersonality);
    t.agreeableness = sanitized(t.agreeableness, kNeutralPersonality);
    t.neuroticism = sanitized(t.neuroticism, kNeutralPersonality);

    ElementalAffinity& e = p.elements;
    e.metal = sanitized(e.metal, kNeutralElement);
    e.wood = sanitized(e.wood, kNeutralElement);
    e.water = sanitized(e.water, kNeutralElement);
    e.fire = sanitized(e.fire, kNeutralElement);
    e.earth = sanitized(e.earth, kNeutralElement);

    Emotions& m = p.emotion_baseline;
    m.joy = sanitized(m.joy, kNeutralEmotion);
    m.anger = sanitized(m.anger, kNeutralEmotion);
    m.sadness = sanitized(m.sadness, kNeutralEmotion);
    m.fear = sanitized(m.fear, kNeutralEmotion);

    SocialStanding& s = p.social;
    s.reputation = sanitized(s.reputation, kNeutralSocial);
    s.trust = sanitized(s.trust, kNeutralSocial);
    s.wealth = sanitized(s.wealth, kNeutralSocial);
    s.status = sanitized(s.status, kNeutralSocial);
    return p;
}

EpisodicState initial_episodic_state(const CharacterProfile& profile) {
    EpisodicState state;
    state.wealth = profile.social.wealth;
    state.reputation = profile.social.reputation;
    state.trust = profile.social.trust;
    state.emotions = profile.emotion_baseline;
    state.happiness = clamp_unit(0.5f + 0.5f * (profile.emotion_baseline.joy - profile.emotion_baseline.sadness));
    state.stress = clamp_unit(0.5f * profile.personality.neuroticism + 0.5f * profile.emotion_baseline.fear);
    return state;
}

void apply_delta(EpisodicState& state, const StateDelta& delta, float scale) {
    state.health = clamp_unit(state.health + scale * delta.health);
    state.energy = clamp_unit(state.energy + scale * delta.energy);
    state.wealth = clamp_unit(state.wealth + scale * delta.wealth);
    state.reputation = clamp_unit(state.reputation + scale * delta.reputation);
    state.happiness = clamp_unit(state.happiness + scale * delta.happiness);
    state.stress = clamp_unit(state.stress + scale * delta.stress);
    state.trust = clamp_unit(state.trust + scale * delta.trust);
    state.emotions.joy = clamp_unit(state.emotions.joy + scale * delta.joy);
    state.emotions.anger = clamp_unit(state.emotions.anger + scale * delta.anger);
    state.emotions.sadness = clamp_unit(state.emotions.sadness + scale * delta.sadness);
    state.emotions.fear = clamp_unit(state.emotions.fear + scale * delta.fear);
}

} // namespace Mirage

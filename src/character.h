#ifndef MIRAGE_CHARACTER_H
#define MIRAGE_CHARACTER_H

#include <string>
#include <vector>

namespace Mirage {

// Neutral values used for any profile field the character store leaves unset.
constexpr float kNeutralPersonality = 0.5f;
constexpr float kNeutralElement = 0.2f;
constexpr float kNeutralEmotion = 0.25f;
constexpr float kNeutralSocial = 0.5f;

struct Personality {
    float openness = kNeutralPersonality;
    float conscientiousness = kNeutralPersonality;
    float extraversion = kNeutralPersonality;
    float agreeableness = kNeutralPersonality;
    float neuroticism = kNeutralPersonality;
};

struct ElementalAffinity {
    float metal = kNeutralElement;
    float wood = kNeutralElement;
    float water = kNeutralElement;
    float fire = kNeutralElement;
    float earth = kNeutralElement;
};

struct Emotions {
    float joy = kNeutralEmotion;
    float anger = kNeutralEmotion;
    float sadness = kNeutralEmotion;
    float fear = kNeutralEmotion;
};

struct SocialStanding {
    float reputation = kNeutralSocial;
    float trust = kNeutralSocial;
    float wealth = kNeutralSocial;
    float status = kNeutralSocial;
};

// Read-only input for an episode. Owned by the external character store.
struct CharacterProfile {
    std::string identity_key;
    Personality personality;
    ElementalAffinity elements;
    Emotions emotion_baseline;
    SocialStanding social;
};

// Clamps every scalar into [0,1]; non-finite values become the neutral default.
// Call once where a profile enters the engine.
CharacterProfile sanitize_profile(const CharacterProfile& profile);

struct EnvironmentPressures {
    float threat = 0.3f;
    float opportunity = 0.5f;
    float social_pressure = 0.3f;
    float time_pressure = 0.1f;
};

struct ActionRecord {
    int step = 0;
    int action = 0;
    std::string action_label;
    std::string outcome_label;
    float reward = 0.0f;
    bool success = false;
};

struct EpisodicState {
    float health = 1.0f;
    float energy = 1.0f;
    float wealth = kNeutralSocial;
    float reputation = kNeutralSocial;
    float happiness = 0.5f;
    float stress = 0.3f;
    float trust = kNeutralSocial;
    Emotions emotions;
    EnvironmentPressures pressures;
    int step = 0;
    std::vector<ActionRecord> history;
};

// Fresh episodic state derived from the profile's baselines.
EpisodicState initial_episodic_state(const CharacterProfile& profile);

// Additive change to the episodic scalars of one participant.
struct StateDelta {
    float health = 0.0f;
    float energy = 0.0f;
    float wealth = 0.0f;
    float reputation = 0.0f;
    float happiness = 0.0f;
    float stress = 0.0f;
    float trust = 0.0f;
    float joy = 0.0f;
    float anger = 0.0f;
    float sadness = 0.0f;
    float fear = 0.0f;
};

// Applies the delta and clamps every touched scalar into [0,1].
void apply_delta(EpisodicState& state, const StateDelta& delta, float scale = 1.0f);

inline float clamp_unit(float v) { return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v); }

} // namespace Mirage

#endif

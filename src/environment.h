#ifndef MIRAGE_ENVIRONMENT_H
#define MIRAGE_ENVIRONMENT_H

#include "character.h"
#include "scenario.h"
#include "state_encoder.h"

#include <Eigen/Dense>

#include <array>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace Mirage {

// Semantics of one discrete action. Success probability is
//   0.5 + sum(trait_weights[i] * (trait_i - 0.5)) + sum(pressure_weights[j] * (pressure_j - 0.5))
// clamped to [0.1, 0.9]. Trait order: O, C, E, A, N. Pressure order: threat, opportunity,
// social pressure, time pressure.
struct ActionSpec {
    std::string label;
    std::string success_outcome;
    std::string failure_outcome;
    std::array<float, 5> trait_weights{};
    std::array<float, 4> pressure_weights{};
    float reward_success = 0.0f;
    float reward_failure = 0.0f;
    StateDelta on_success;
    StateDelta on_failure;
    // Applied to the other participant in pairwise variants; ignored by the solo environment.
    StateDelta partner_on_success;
    StateDelta partner_on_failure;
    // Reward scaled by the partner's agreeableness in the interaction variant.
    bool prosocial = false;
};

std::vector<ActionSpec> solo_action_set();
std::vector<ActionSpec> interaction_action_set();
std::vector<ActionSpec> duel_action_set();

constexpr float kMinSuccessProbability = 0.1f;
constexpr float kMaxSuccessProbability = 0.9f;

float success_probability(const ActionSpec& spec, const Personality& personality, const EnvironmentPressures& pressures);

struct EnvironmentConfig {
    int horizon = 100;
    unsigned int seed = std::random_device{}();
    Scenario scenario;
};

struct StepInfo {
    int actor = 0;
    std::string action_label;
    std::string outcome_label;
    bool success = false;
    float success_probability = 0.0f;
};

struct StepResult {
    Eigen::VectorXf state;
    float reward = 0.0f;
    bool done = false;
    StepInfo info;
};

class Environment {
public:
    enum class Phase { FRESH, ACTIVE, TERMINATED };

    virtual ~Environment() = default;

    // FRESH/TERMINATED/ACTIVE -> ACTIVE. Returns the first observation.
    virtual Eigen::VectorXf reset() = 0;
    // Valid only while ACTIVE. Throws InvalidStateError / OutOfRangeActionError; on throw the
    // environment is unchanged.
    virtual StepResult step(int action) = 0;
    // Observation for the participant that acts next.
    virtual Eigen::VectorXf observe() const = 0;

    int state_dim() const { return encoder_.dimension(); }
    int action_dim() const { return static_cast<int>(actions_.size()); }
    const std::vector<ActionSpec>& actions() const { return actions_; }
    const std::string& action_label(int action) const;
    Phase phase() const { return phase_; }
    int horizon() const { return config_.horizon; }

protected:
    Environment(std::vector<ActionSpec> actions, const EnvironmentConfig& config);

    void check_steppable(int action) const;
    bool draw_success(float probability);
    void drift_pressures(EnvironmentPressures& pressures);
    // Generic outcome effects shared by every action plus the action's own delta.
    void apply_outcome(const ActionSpec& spec, bool success, EpisodicState& actor) const;
    EpisodicState fresh_state(const CharacterProfile& profile) const;

    std::vector<ActionSpec> actions_;
    EnvironmentConfig config_;
    StateEncoder encoder_;
    std::mt19937 gen_;
    Phase phase_ = Phase::FRESH;
};

// Single character acting against its situation.
class CharacterEnvironment : public Environment {
public:
    CharacterEnvironment(const CharacterProfile& profile, const EnvironmentConfig& config);

    Eigen::VectorXf reset() override;
    StepResult step(int action) override;
    Eigen::VectorXf observe() const override;

    const CharacterProfile& profile() const { return profile_; }
    const EpisodicState& state() const { return state_; }

private:
    CharacterProfile profile_;
    EpisodicState state_;
};

enum class PairwiseVariant { INTERACTION, DUEL };

// Two characters taking alternating turns; participant 0 acts first after reset. Each step's
// observation is that of the participant acting next. One action affects the other participant
// only through couple().
//   INTERACTION: 12 social actions; prosocial actions (cooperate, share, help) earn x1.2 reward
//                against a partner with agreeableness > 0.6 and x0.8 below 0.3.
//   DUEL:        5 confrontational actions, no reward scaling.
// The step counter counts turns of both participants. The episode ends at the horizon or when
// either participant's health reaches zero.
class PairwiseEnvironment : public Environment {
public:
    PairwiseEnvironment(const CharacterProfile& first, const CharacterProfile& second, PairwiseVariant variant,
                        const EnvironmentConfig& config);

    Eigen::VectorXf reset() override;
    StepResult step(int action) override;
    Eigen::VectorXf observe() const override;

    // Outcome of one action for both participants: the actor receives the action's own effects,
    // the partner receives the action's partner delta. Inputs are left untouched.
    std::pair<EpisodicState, EpisodicState> couple(const ActionSpec& spec, bool success, const EpisodicState& actor,
                                                   const EpisodicState& partner) const;

    PairwiseVariant variant() const { return variant_; }
    int active() const { return active_; }
    int step_count() const { return steps_; }
    const CharacterProfile& profile(int participant) const { return profiles_[participant]; }
    const EpisodicState& state(int participant) const { return states_[participant]; }

private:
    PairwiseVariant variant_;
    std::array<CharacterProfile, 2> profiles_;
    std::array<EpisodicState, 2> states_;
    int active_ = 0;
    int steps_ = 0;
};

} // namespace Mirage

#endif

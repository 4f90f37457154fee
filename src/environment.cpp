#include "environment.h"

#include "errors.h"

#include <algorithm>

namespace Mirage {

namespace {

// Chainable StateDelta for the action tables below.
struct Delta {
    StateDelta d;
    Delta& health(float v) { d.health = v; return *this; }
    Delta& energy(float v) { d.energy = v; return *this; }
    Delta& wealth(float v) { d.wealth = v; return *this; }
    Delta& reputation(float v) { d.reputation = v; return *this; }
    Delta& happiness(float v) { d.happiness = v; return *this; }
    Delta& stress(float v) { d.stress = v; return *this; }
    Delta& trust(float v) { d.trust = v; return *this; }
    Delta& joy(float v) { d.joy = v; return *this; }
    Delta& anger(float v) { d.anger = v; return *this; }
    Delta& sadness(float v) { d.sadness = v; return *this; }
    Delta& fear(float v) { d.fear = v; return *this; }
    operator StateDelta() const { return d; }
};

ActionSpec action(const char* label, const char* success_outcome, const char* failure_outcome,
                  std::array<float, 5> traits, std::array<float, 4> pressures, float reward_success, float reward_failure) {
    ActionSpec spec;
    spec.label = label;
    spec.success_outcome = success_outcome;
    spec.failure_outcome = failure_outcome;
    spec.trait_weights = traits;
    spec.pressure_weights = pressures;
    spec.reward_success = reward_success;
    spec.reward_failure = reward_failure;
    return spec;
}

constexpr float kStepEnergyDrain = 0.02f;
constexpr float kExhaustionHealthLoss = 0.05f;
constexpr float kPressureStep = 0.05f;
constexpr float kTimePressureStep = 0.02f;
constexpr float kWarmPartnerAgreeableness = 0.6f;
constexpr float kColdPartnerAgreeableness = 0.3f;

} // namespace

// --- Action tables ---
//                                                   O      C      E      A      N        threat opport social time
std::vector<ActionSpec> solo_action_set() {
    std::vector<ActionSpec> a;
    a.push_back(action("cooperate", "alliance formed", "rebuffed", {0.0f, 0.0f, 0.2f, 0.4f, 0.0f}, {-0.2f, 0.0f, 0.1f, 0.0f}, 1.0f, -0.5f));
    a.back().on_success = Delta().trust(0.08f);
    a.back().on_failure = Delta().trust(-0.04f);
    a.push_back(action("deceive", "deception worked", "exposed", {0.3f, -0.3f, 0.0f, -0.2f, 0.0f}, {0.0f, 0.0f, -0.2f, 0.0f}, 1.5f, -1.5f));
    a.back().on_success = Delta().wealth(0.1f).trust(-0.1f);
    a.back().on_failure = Delta().reputation(-0.15f).trust(-0.15f).anger(0.05f);
    a.push_back(action("demand", "demand granted", "demand refused", {0.0f, 0.0f, 0.3f, -0.2f, 0.0f}, {0.0f, 0.3f, 0.0f, 0.0f}, 1.2f, -0.8f));
    a.back().on_success = Delta().wealth(0.12f);
    a.back().on_failure = Delta().reputation(-0.05f).anger(0.1f);
    a.push_back(action("withdraw", "recovered in quiet", "isolated", {0.0f, 0.1f, 0.0f, 0.0f, 0.3f}, {0.2f, 0.0f, 0.0f, -0.2f}, 0.2f, -0.3f));
    a.back().on_success = Delta().energy(0.15f).stress(-0.1f);
    a.back().on_failure = Delta().energy(0.05f).sadness(0.05f);
    a.push_back(action("resist", "stood firm", "overpowered", {0.0f, 0.2f, 0.2f, 0.0f, -0.2f}, {-0.3f, 0.0f, 0.0f, 0.0f}, 1.3f, -1.0f));
    a.back().on_success = Delta().reputation(0.05f).anger(-0.05f).fear(-0.05f);
    a.back().on_failure = Delta().health(-0.1f).fear(0.1f);
    a.push_back(action("sacrifice", "sacrifice honoured", "sacrifice wasted", {0.0f, 0.2f, 0.0f, 0.4f, 0.0f}, {0.0f, 0.0f, 0.0f, -0.2f}, 0.8f, -0.6f));
    a.back().on_success = Delta().trust(0.1f).reputation(0.1f).wealth(-0.05f);
    a.back().on_failure = Delta().wealth(-0.1f).sadness(0.1f);
    return a;
}

std::vector<ActionSpec> interaction_action_set() {
    std::vector<ActionSpec> a;
    a.push_back(action("cooperate", "joint success", "cooperation stalled", {0.0f, 0.0f, 0.1f, 0.4f, 0.0f}, {-0.1f, 0.0f, 0.0f, 0.0f}, 1.0f, -0.4f));
    a.back().on_success = Delta().trust(0.06f);
    a.back().partner_on_success = Delta().trust(0.05f).joy(0.05f);
    a.back().prosocial = true;
    a.push_back(action("compete", "came out ahead", "fell behind", {0.0f, 0.2f, 0.3f, -0.2f, 0.0f}, {0.0f, 0.2f, 0.0f, 0.0f}, 1.2f, -0.8f));
    a.back().on_success = Delta().wealth(0.08f);
    a.back().partner_on_success = Delta().stress(0.05f).wealth(-0.05f);
    a.back().partner_on_failure = Delta().joy(0.03f);
    a.push_back(action("compromise", "middle ground found", "talks collapsed", {0.2f, 0.0f, 0.0f, 0.3f, 0.0f}, {0.0f, 0.0f, 0.1f, 0.0f}, 0.6f, -0.2f));
    a.back().on_success = Delta().stress(-0.05f);
    a.back().partner_on_success = Delta().trust(0.03f).stress(-0.05f);
    a.push_back(action("avoid", "slipped away", "cornered", {0.0f, 0.0f, 0.0f, 0.0f, 0.3f}, {0.2f, 0.0f, 0.0f, 0.0f}, 0.2f, -0.3f));
    a.back().on_success = Delta().stress(-0.08f);
    a.back().partner_on_failure = Delta().trust(-0.03f);
    a.push_back(action("share", "generosity welcomed", "gift refused", {0.1f, 0.0f, 0.0f, 0.3f, 0.0f}, {0.0f, 0.1f, 0.0f, 0.0f}, 0.9f, -0.3f));
    a.back().on_success = Delta().wealth(-0.05f).trust(0.05f);
    a.back().partner_on_success = Delta().wealth(0.05f).trust(0.05f).joy(0.05f);
    a.back().prosocial = true;
    a.push_back(action("withhold", "kept the advantage", "seen as petty", {0.0f, 0.2f, 0.0f, -0.2f, 0.0f}, {0.0f, 0.0f, 0.0f, 0.0f}, 0.5f, -0.4f));
    a.back().on_success = Delta().wealth(0.05f);
    a.back().partner_on_success = Delta().trust(-0.05f);
    a.push_back(action("attack", "opponent hurt", "attack repelled", {0.0f, 0.0f, 0.2f, -0.4f, 0.0f}, {-0.1f, 0.0f, 0.0f, 0.0f}, 1.4f, -1.2f));
    a.back().on_success = Delta().reputation(-0.05f);
    a.back().on_failure = Delta().health(-0.1f).fear(0.1f);
    a.back().partner_on_success = Delta().health(-0.1f).anger(0.05f).fear(0.05f).trust(-0.1f);
    a.back().partner_on_failure = Delta().anger(0.05f);
    a.push_back(action("defend", "held ground", "defence broken", {0.0f, 0.3f, 0.0f, 0.0f, 0.1f}, {0.2f, 0.0f, 0.0f, 0.0f}, 0.7f, -0.5f));
    a.back().on_success = Delta().fear(-0.05f);
    a.back().on_failure = Delta().health(-0.05f);
    a.push_back(action("persuade", "won them over", "unconvinced", {0.2f, 0.0f, 0.4f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.2f, 0.0f}, 1.1f, -0.6f));
    a.back().on_success = Delta().reputation(0.05f);
    a.back().partner_on_success = Delta().trust(0.03f);
    a.push_back(action("refuse", "refusal accepted", "refusal resented", {0.0f, 0.2f, 0.0f, -0.3f, 0.0f}, {0.0f, 0.0f, 0.0f, 0.0f}, 0.4f, -0.4f));
    a.back().partner_on_success = Delta().trust(-0.05f).anger(0.03f);
    a.push_back(action("help", "help made a difference", "help came too late", {0.0f, 0.2f, 0.0f, 0.4f, 0.0f}, {0.0f, 0.0f, 0.0f, -0.2f}, 1.0f, -0.3f));
    a.back().on_success = Delta().energy(-0.05f).trust(0.05f);
    a.back().partner_on_success = Delta().health(0.05f).happiness(0.08f).trust(0.06f);
    a.back().prosocial = true;
    a.push_back(action("ignore", "went unnoticed", "slight noticed", {0.0f, 0.0f, 0.0f, -0.2f, 0.1f}, {0.0f, 0.0f, 0.0f, 0.0f}, 0.1f, -0.2f));
    a.back().partner_on_success = Delta().trust(-0.03f).sadness(0.03f);
    return a;
}

std::vector<ActionSpec> duel_action_set() {
    std::vector<ActionSpec> a;
    a.push_back(action("compromise", "truce accepted", "truce ignored", {0.0f, 0.0f, 0.0f, 0.4f, 0.0f}, {-0.1f, 0.0f, 0.0f, 0.0f}, 0.8f, -0.3f));
    a.back().on_success = Delta().joy(0.05f).stress(-0.05f);
    a.back().on_failure = Delta().joy(0.05f);
    a.back().partner_on_success = Delta().trust(0.03f);
    a.back().partner_on_failure = Delta().trust(0.03f);
    a.push_back(action("conflict", "struck a blow", "backfired", {0.0f, 0.0f, 0.3f, -0.3f, 0.0f}, {-0.2f, 0.0f, 0.0f, 0.0f}, 1.4f, -1.0f));
    a.back().on_success = Delta().anger(0.1f);
    a.back().on_failure = Delta().anger(0.1f);
    a.back().partner_on_success = Delta().anger(0.05f).health(-0.05f);
    a.back().partner_on_failure = Delta().anger(0.05f);
    a.push_back(action("cold_shoulder", "composure kept", "seen as weakness", {0.0f, 0.3f, 0.0f, 0.0f, -0.2f}, {0.0f, 0.0f, 0.0f, 0.0f}, 0.5f, -0.4f));
    a.back().on_success = Delta().stress(-0.05f);
    a.back().partner_on_success = Delta().sadness(0.05f);
    a.push_back(action("threaten", "opponent intimidated", "threat called out", {0.0f, 0.0f, 0.2f, -0.2f, -0.3f}, {0.2f, 0.0f, 0.0f, 0.0f}, 1.0f, -0.8f));
    a.back().on_failure = Delta().reputation(-0.05f);
    a.back().partner_on_success = Delta().fear(0.1f);
    a.push_back(action("plead", "sympathy earned", "plea dismissed", {0.0f, 0.0f, 0.0f, 0.2f, 0.2f}, {0.0f, 0.0f, 0.2f, 0.0f}, 0.7f, -0.5f));
    a.back().on_failure = Delta().sadness(0.05f);
    a.back().partner_on_success = Delta().trust(0.05f);
    return a;
}

float success_probability(const ActionSpec& spec, const Personality& personality, const EnvironmentPressures& pressures) {
    const float traits[5] = {personality.openness, personality.conscientiousness, personality.extraversion,
                             personality.agreeableness, personality.neuroticism};
    const float situation[4] = {pressures.threat, pressures.opportunity, pressures.social_pressure, pressures.time_pressure};
    float p = 0.5f;
    for (int i = 0; i < 5; ++i) p += spec.trait_weights[i] * (traits[i] - 0.5f);
    for (int j = 0; j < 4; ++j) p += spec.pressure_weights[j] * (situation[j] - 0.5f);
    return std::clamp(p, kMinSuccessProbability, kMaxSuccessProbability);
}

// --- Environment ---

Environment::Environment(std::vector<ActionSpec> actions, const EnvironmentConfig& config)
    : actions_(std::move(actions)), config_(config), gen_(config.seed) {
    if (config_.horizon <= 0) {
        throw ConfigurationError("environment horizon must be positive, got " + std::to_string(config_.horizon));
    }
}

const std::string& Environment::action_label(int action) const {
    if (action < 0 || action >= action_dim()) throw OutOfRangeActionError(action, action_dim());
    return actions_[action].label;
}

void Environment::check_steppable(int action) const {
    if (phase_ != Phase::ACTIVE) {
        throw InvalidStateError(phase_ == Phase::FRESH ? "step() before reset()" : "step() after episode termination; call reset() first");
    }
    if (action < 0 || action >= action_dim()) throw OutOfRangeActionError(action, action_dim());
}

bool Environment::draw_success(float probability) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    return unit(gen_) < probability;
}

void Environment::drift_pressures(EnvironmentPressures& pressures) {
    std::uniform_real_distribution<float> walk(-kPressureStep, kPressureStep);
    std::uniform_real_distribution<float> rise(0.0f, kTimePressureStep);
    pressures.threat = clamp_unit(pressures.threat + walk(gen_));
    pressures.opportunity = clamp_unit(pressures.opportunity + walk(gen_));
    pressures.social_pressure = clamp_unit(pressures.social_pressure + walk(gen_));
    pressures.time_pressure = clamp_unit(pressures.time_pressure + rise(gen_));
}

void Environment::apply_outcome(const ActionSpec& spec, bool success, EpisodicState& actor) const {
    if (success) {
        StateDelta d;
        d.happiness = 0.1f;
        d.reputation = 0.05f;
        d.stress = -0.05f;
        d.joy = 0.05f;
        apply_delta(actor, d);
        apply_delta(actor, spec.on_success);
    } else {
        StateDelta d;
        d.energy = -0.05f;
        d.happiness = -0.1f;
        d.stress = 0.1f;
        d.sadness = 0.05f;
        d.fear = 0.05f * actor.pressures.threat;
        d.health = -(0.02f + 0.03f * actor.pressures.threat);
        apply_delta(actor, d);
        apply_delta(actor, spec.on_failure);
    }
    actor.energy = clamp_unit(actor.energy - kStepEnergyDrain);
    if (actor.energy <= 0.0f) actor.health = clamp_unit(actor.health - kExhaustionHealthLoss);
}

EpisodicState Environment::fresh_state(const CharacterProfile& profile) const {
    EpisodicState state = initial_episodic_state(profile);
    config_.scenario.apply(state);
    return state;
}

// --- CharacterEnvironment ---

CharacterEnvironment::CharacterEnvironment(const CharacterProfile& profile, const EnvironmentConfig& config)
    : Environment(solo_action_set(), config), profile_(sanitize_profile(profile)) {
    state_ = fresh_state(profile_);
}

Eigen::VectorXf CharacterEnvironment::reset() {
    state_ = fresh_state(profile_);
    phase_ = Phase::ACTIVE;
    return observe();
}

Eigen::VectorXf CharacterEnvironment::observe() const {
    return encoder_.encode(profile_, state_);
}

StepResult CharacterEnvironment::step(int action) {
    check_steppable(action);
    const ActionSpec& spec = actions_[action];

    StepResult result;
    result.info.actor = 0;
    result.info.action_label = spec.label;
    result.info.success_probability = success_probability(spec, profile_.personality, state_.pressures);
    result.info.success = draw_success(result.info.success_probability);
    result.info.outcome_label = result.info.success ? spec.success_outcome : spec.failure_outcome;
    result.reward = result.info.success ? spec.reward_success : spec.reward_failure;

    apply_outcome(spec, result.info.success, state_);
    drift_pressures(state_.pressures);

    ActionRecord record;
    record.step = state_.step;
    record.action = action;
    record.action_label = spec.label;
    record.outcome_label = result.info.outcome_label;
    record.reward = result.reward;
    record.success = result.info.success;
    state_.history.push_back(std::move(record));
    state_.step++;

    result.done = state_.step >= config_.horizon || state_.health <= 0.0f;
    if (result.done) phase_ = Phase::TERMINATED;
    result.state = observe();
    return result;
}

// --- PairwiseEnvironment ---

PairwiseEnvironment::PairwiseEnvironment(const CharacterProfile& first, const CharacterProfile& second,
                                         PairwiseVariant variant, const EnvironmentConfig& config)
    : Environment(variant == PairwiseVariant::DUEL ? duel_action_set() : interaction_action_set(), config),
      variant_(variant), profiles_{sanitize_profile(first), sanitize_profile(second)} {
    states_[0] = fresh_state(profiles_[0]);
    states_[1] = fresh_state(profiles_[1]);
}

Eigen::VectorXf PairwiseEnvironment::reset() {
    states_[0] = fresh_state(profiles_[0]);
    states_[1] = fresh_state(profiles_[1]);
    states_[1].pressures = states_[0].pressures;
    active_ = 0;
    steps_ = 0;
    phase_ = Phase::ACTIVE;
    return observe();
}

Eigen::VectorXf PairwiseEnvironment::observe() const {
    return encoder_.encode(profiles_[active_], states_[active_]);
}

std::pair<EpisodicState, EpisodicState> PairwiseEnvironment::couple(const ActionSpec& spec, bool success,
                                                                    const EpisodicState& actor,
                                                                    const EpisodicState& partner) const {
    EpisodicState next_actor = actor;
    EpisodicState next_partner = partner;
    apply_outcome(spec, success, next_actor);
    apply_delta(next_partner, success ? spec.partner_on_success : spec.partner_on_failure);
    return {std::move(next_actor), std::move(next_partner)};
}

StepResult PairwiseEnvironment::step(int action) {
    check_steppable(action);
    const ActionSpec& spec = actions_[action];
    const int actor = active_;
    const int partner = 1 - active_;

    StepResult result;
    result.info.actor = actor;
    result.info.action_label = spec.label;
    result.info.success_probability = success_probability(spec, profiles_[actor].personality, states_[actor].pressures);
    result.info.success = draw_success(result.info.success_probability);
    result.info.outcome_label = result.info.success ? spec.success_outcome : spec.failure_outcome;
    result.reward = result.info.success ? spec.reward_success : spec.reward_failure;

    if (variant_ == PairwiseVariant::INTERACTION && spec.prosocial) {
        const float partner_agreeableness = profiles_[partner].personality.agreeableness;
        if (partner_agreeableness > kWarmPartnerAgreeableness) {
            result.reward *= 1.2f;
            result.info.outcome_label += ", partner responds warmly";
        } else if (partner_agreeableness < kColdPartnerAgreeableness) {
            result.reward *= 0.8f;
            result.info.outcome_label += ", partner responds coldly";
        }
    }

    auto coupled = couple(spec, result.info.success, states_[actor], states_[partner]);
    states_[actor] = std::move(coupled.first);
    states_[partner] = std::move(coupled.second);
    drift_pressures(states_[actor].pressures);
    states_[partner].pressures = states_[actor].pressures;

    ActionRecord record;
    record.step = steps_;
    record.action = action;
    record.action_label = spec.label;
    record.outcome_label = result.info.outcome_label;
    record.reward = result.reward;
    record.success = result.info.success;
    states_[actor].history.push_back(std::move(record));
    states_[actor].step++;
    steps_++;

    result.done = steps_ >= config_.horizon || states_[0].health <= 0.0f || states_[1].health <= 0.0f;
    if (result.done) phase_ = Phase::TERMINATED;
    active_ = partner;
    result.state = observe();
    return result;
}

} // namespace Mirage

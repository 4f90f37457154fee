#include "character_brain.h"

#include "character_engine.h"
#include "environment.h"
#include "errors.h"
#include "godot_agent_store.h"
#include "logging.h"
#include "state_encoder.h"

#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/variant/utility_functions.hpp>

#include <string>
#include <vector>

namespace {

std::string to_std(const godot::String& s) {
    return std::string(s.utf8().get_data());
}

float unit(const godot::Dictionary& d, const char* key, const char* alias, float fallback) {
    if (d.has(key)) return static_cast<float>(static_cast<double>(d[key]));
    if (alias && d.has(alias)) return static_cast<float>(static_cast<double>(d[alias]));
    return fallback;
}

} // namespace

Eigen::VectorXf CharacterBrain::packed_array_to_eigen(const godot::PackedFloat32Array& p_array) {
    Eigen::VectorXf vec(p_array.size());
    for (int i = 0; i < p_array.size(); ++i) vec[i] = p_array[i];
    return vec;
}

Mirage::CharacterProfile CharacterBrain::profile_from_dictionary(const godot::Dictionary& d) {
    Mirage::CharacterProfile p;
    p.identity_key = to_std(godot::String(d.get("identity_key", "")));
    godot::Dictionary traits = d.get("personality", godot::Dictionary());
    p.personality.openness = unit(traits, "openness", "O", Mirage::kNeutralPersonality);
    p.personality.conscientiousness = unit(traits, "conscientiousness", "C", Mirage::kNeutralPersonality);
    p.personality.extraversion = unit(traits, "extraversion", "E", Mirage::kNeutralPersonality);
    p.personality.agreeableness = unit(traits, "agreeableness", "A", Mirage::kNeutralPersonality);
    p.personality.neuroticism = unit(traits, "neuroticism", "N", Mirage::kNeutralPersonality);
    godot::Dictionary elements = d.get("elements", godot::Dictionary());
    p.elements.metal = unit(elements, "metal", nullptr, Mirage::kNeutralElement);
    p.elements.wood = unit(elements, "wood", nullptr, Mirage::kNeutralElement);
    p.elements.water = unit(elements, "water", nullptr, Mirage::kNeutralElement);
    p.elements.fire = unit(elements, "fire", nullptr, Mirage::kNeutralElement);
    p.elements.earth = unit(elements, "earth", nullptr, Mirage::kNeutralElement);
    godot::Dictionary emotions = d.get("emotions", godot::Dictionary());
    p.emotion_baseline.joy = unit(emotions, "joy", nullptr, Mirage::kNeutralEmotion);
    p.emotion_baseline.anger = unit(emotions, "anger", nullptr, Mirage::kNeutralEmotion);
    p.emotion_baseline.sadness = unit(emotions, "sadness", nullptr, Mirage::kNeutralEmotion);
    p.emotion_baseline.fear = unit(emotions, "fear", nullptr, Mirage::kNeutralEmotion);
    godot::Dictionary social = d.get("social", godot::Dictionary());
    p.social.reputation = unit(social, "reputation", nullptr, Mirage::kNeutralSocial);
    p.social.trust = unit(social, "trust", nullptr, Mirage::kNeutralSocial);
    p.social.wealth = unit(social, "wealth", nullptr, Mirage::kNeutralSocial);
    p.social.status = unit(social, "status", nullptr, Mirage::kNeutralSocial);
    return Mirage::sanitize_profile(p);
}

godot::Dictionary CharacterBrain::episodic_state_to_dictionary(const Mirage::EpisodicState& state) {
    godot::Dictionary d;
    d["health"] = state.health;
    d["energy"] = state.energy;
    d["wealth"] = state.wealth;
    d["reputation"] = state.reputation;
    d["happiness"] = state.happiness;
    d["stress"] = state.stress;
    d["trust"] = state.trust;
    godot::Dictionary emotions;
    emotions["joy"] = state.emotions.joy;
    emotions["anger"] = state.emotions.anger;
    emotions["sadness"] = state.emotions.sadness;
    emotions["fear"] = state.emotions.fear;
    d["emotions"] = emotions;
    godot::Dictionary pressures;
    pressures["threat"] = state.pressures.threat;
    pressures["opportunity"] = state.pressures.opportunity;
    pressures["social_pressure"] = state.pressures.social_pressure;
    pressures["time_pressure"] = state.pressures.time_pressure;
    d["environment"] = pressures;
    d["step"] = state.step;
    return d;
}

CharacterBrain::CharacterBrain() : gen_(std::random_device{}()) {}
CharacterBrain::~CharacterBrain() {}

void CharacterBrain::_bind_methods() {
    godot::ClassDB::bind_method(godot::D_METHOD("initialize", "config"), &CharacterBrain::initialize);
    godot::ClassDB::bind_method(godot::D_METHOD("train", "profile", "episodes", "steps_per_episode"), &CharacterBrain::train, DEFVAL(5), DEFVAL(100));
    godot::ClassDB::bind_method(godot::D_METHOD("simulate", "profile", "steps", "deterministic", "scenario"), &CharacterBrain::simulate, DEFVAL(10), DEFVAL(false), DEFVAL(godot::String()));
    godot::ClassDB::bind_method(godot::D_METHOD("get_action", "identity_key", "observation", "deterministic"), &CharacterBrain::get_action, DEFVAL(false));
    godot::ClassDB::bind_method(godot::D_METHOD("save_agent", "identity_key", "confirm_after_instability"), &CharacterBrain::save_agent, DEFVAL(false));
}

bool CharacterBrain::initialize(const godot::Dictionary& config) {
    Mirage::EngineConfig engine_config;
    godot::Array hidden_gd = config.get("hidden_dims", godot::Array());
    if (!hidden_gd.is_empty()) {
        engine_config.agent.model.hidden_dims.clear();
        for (int i = 0; i < hidden_gd.size(); ++i) engine_config.agent.model.hidden_dims.push_back(static_cast<int>(hidden_gd[i]));
    }
    engine_config.agent.learning_rate = config.get("learning_rate", 2.5e-4f);
    engine_config.ppo.gamma = config.get("gamma", 0.99f);
    engine_config.ppo.lambda = config.get("lambda", 0.95f);
    engine_config.ppo.clip_ratio = config.get("clip_ratio", 0.2f);
    engine_config.ppo.epochs = config.get("epochs", 10);
    engine_config.ppo.value_coef = config.get("value_coef", 0.5f);
    engine_config.ppo.entropy_coef = config.get("entropy_coef", 0.01f);
    engine_config.ppo.max_grad_norm = config.get("max_grad_norm", 0.5f);
    engine_config.ppo.minibatch_size = config.get("minibatch_size", 0);
    engine_config.ppo.normalize_advantages = config.get("normalize_advantages", false);
    int64_t seed = config.get("seed", static_cast<int64_t>(std::random_device{}()));
    engine_config.agent.model.seed = static_cast<unsigned int>(seed);
    engine_config.ppo.seed = static_cast<unsigned int>(seed + 1);
    engine_config.environment.seed = static_cast<unsigned int>(seed + 2);
    engine_config.log_level = to_std(godot::String(config.get("log_level", "info")));
    godot::String storage = config.get("storage_dir", "user://agents");
    engine_config.storage_dir = to_std(storage);

    try {
        Mirage::set_log_level(engine_config.log_level);
        auto registry = std::make_shared<Mirage::AgentRegistry>(engine_config.agent, std::make_shared<Mirage::GodotAgentStore>(storage));
        engine_ = std::make_unique<Mirage::CharacterEngine>(engine_config, registry);
    } catch (const Mirage::MirageError& e) {
        godot::UtilityFunctions::print("CharacterBrain initialization failed: ", e.what());
        initialized_ = false;
        return false;
    }
    gen_.seed(static_cast<unsigned int>(seed + 3));
    initialized_ = true;
    return true;
}

godot::Dictionary CharacterBrain::train(const godot::Dictionary& profile, int episodes, int steps_per_episode) {
    godot::Dictionary out;
    if (!initialized_) return out;
    Mirage::CharacterProfile p = profile_from_dictionary(profile);
    Mirage::TrainingRequest request;
    request.identity_key = p.identity_key;
    request.episodes = episodes;
    request.steps_per_episode = steps_per_episode;
    try {
        Mirage::TrainingResult r = engine_->train(p, request);
        godot::PackedFloat32Array rewards;
        for (float v : r.reward_history) rewards.push_back(v);
        out["reward_history"] = rewards;
        out["avg_episode_length"] = r.avg_episode_length;
        out["final_policy_loss"] = r.final_policy_loss;
        out["final_value_loss"] = r.final_value_loss;
        out["final_entropy"] = r.final_entropy;
        out["final_clip_fraction"] = r.final_clip_fraction;
        out["episodes_completed"] = r.episodes_completed;
        out["skipped_updates"] = r.skipped_updates;
        out["saved"] = r.saved;
    } catch (const Mirage::MirageError& e) {
        godot::UtilityFunctions::print("CharacterBrain.train failed: ", e.what());
        out["error"] = godot::String(e.what());
    }
    return out;
}

godot::Dictionary CharacterBrain::simulate(const godot::Dictionary& profile, int steps, bool deterministic, const godot::String& scenario) {
    godot::Dictionary out;
    if (!initialized_) return out;
    Mirage::CharacterProfile p = profile_from_dictionary(profile);
    Mirage::InferenceRequest request;
    request.identity_key = p.identity_key;
    request.steps = steps;
    request.deterministic = deterministic;
    try {
        Mirage::SimulationResult r = engine_->simulate(p, request, Mirage::Scenario::from_description(to_std(scenario)));
        godot::Array history;
        for (const Mirage::ActionRecord& rec : r.action_history) {
            godot::Dictionary entry;
            entry["step"] = rec.step;
            entry["action"] = godot::String(rec.action_label.c_str());
            entry["outcome"] = godot::String(rec.outcome_label.c_str());
            entry["reward"] = rec.reward;
            history.push_back(entry);
        }
        out["action_history"] = history;
        out["total_reward"] = r.total_reward;
        out["final_state"] = episodic_state_to_dictionary(r.final_state);
    } catch (const Mirage::MirageError& e) {
        godot::UtilityFunctions::print("CharacterBrain.simulate failed: ", e.what());
        out["error"] = godot::String(e.what());
    }
    return out;
}

int CharacterBrain::get_action(const godot::String& identity_key, const godot::PackedFloat32Array& observation, bool deterministic) {
    if (!initialized_) return -1;
    if (observation.size() != Mirage::StateEncoder::kDimension) return -1;
    try {
        // Reaches agents persisted by an earlier session, not only the ones cached in this one.
        std::shared_ptr<Mirage::Agent> agent = engine_->registry().get_or_create(
            to_std(identity_key), Mirage::StateEncoder::kDimension, static_cast<int>(Mirage::solo_action_set().size()));
        return agent->act(packed_array_to_eigen(observation), deterministic, gen_).action;
    } catch (const Mirage::MirageError& e) {
        godot::UtilityFunctions::print("CharacterBrain.get_action failed: ", e.what());
        return -1;
    }
}

bool CharacterBrain::save_agent(const godot::String& identity_key, bool confirm_after_instability) {
    if (!initialized_) return false;
    return engine_->registry().save(to_std(identity_key), confirm_after_instability);
}

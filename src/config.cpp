#include "config.h"

#include "errors.h"
#include "logging.h"

namespace Mirage {

namespace {

template <typename T>
void read_key(const YAML::Node& section, const char* key, T& target) {
    if (!section) return;
    const YAML::Node value = section[key];
    if (value) target = value.as<T>();
}

void read_unit(const YAML::Node& section, const char* key, const char* alias, float& target) {
    if (!section) return;
    if (section[key]) {
        target = section[key].as<float>();
    } else if (alias && section[alias]) {
        target = section[alias].as<float>();
    }
}

} // namespace

void validate_engine_config(const EngineConfig& config) {
    ModelConfig widest = config.agent.model;
    // Dimensions come from the environment at agent creation; only the trunk and floor matter here.
    widest.state_dim = StateEncoder::kDimension;
    widest.action_dim = 12;
    validate_model_config(widest);
    if (!(config.agent.learning_rate > 0.0f)) throw ConfigurationError("learning_rate must be positive");
    if (!(config.agent.adam_beta1 >= 0.0f && config.agent.adam_beta1 < 1.0f)) throw ConfigurationError("beta1 must lie in [0, 1)");
    if (!(config.agent.adam_beta2 >= 0.0f && config.agent.adam_beta2 < 1.0f)) throw ConfigurationError("beta2 must lie in [0, 1)");
    if (!(config.agent.adam_epsilon > 0.0f)) throw ConfigurationError("epsilon must be positive");
    validate_ppo_config(config.ppo);
    if (config.environment.horizon <= 0) throw ConfigurationError("environment horizon must be positive");
    if (config.storage_dir.empty()) throw ConfigurationError("storage directory must not be empty");
}

EngineConfig engine_config_from_yaml(const YAML::Node& root) {
    EngineConfig config;
    try {
        const YAML::Node model = root["model"];
        read_key(model, "hidden_dims", config.agent.model.hidden_dims);
        read_key(model, "probability_floor", config.agent.model.probability_floor);
        read_key(model, "seed", config.agent.model.seed);

        const YAML::Node optimizer = root["optimizer"];
        read_key(optimizer, "learning_rate", config.agent.learning_rate);
        read_key(optimizer, "beta1", config.agent.adam_beta1);
        read_key(optimizer, "beta2", config.agent.adam_beta2);
        read_key(optimizer, "epsilon", config.agent.adam_epsilon);

        const YAML::Node ppo = root["ppo"];
        read_key(ppo, "gamma", config.ppo.gamma);
        read_key(ppo, "lambda", config.ppo.lambda);
        read_key(ppo, "clip_ratio", config.ppo.clip_ratio);
        read_key(ppo, "epochs", config.ppo.epochs);
        read_key(ppo, "value_coef", config.ppo.value_coef);
        read_key(ppo, "entropy_coef", config.ppo.entropy_coef);
        read_key(ppo, "max_grad_norm", config.ppo.max_grad_norm);
        read_key(ppo, "minibatch_size", config.ppo.minibatch_size);
        read_key(ppo, "normalize_advantages", config.ppo.normalize_advantages);
        read_key(ppo, "seed", config.ppo.seed);

        const YAML::Node environment = root["environment"];
        read_key(environment, "horizon", config.environment.horizon);
        read_key(environment, "seed", config.environment.seed);
        if (environment && environment["scenario"]) {
            config.environment.scenario = Scenario::from_description(environment["scenario"].as<std::string>());
        }

        read_key(root["storage"], "directory", config.storage_dir);
        read_key(root["logging"], "level", config.log_level);
    } catch (const YAML::Exception& e) {
        logger()->error("invalid engine configuration: {}", e.what());
        throw ConfigurationError(std::string("invalid engine configuration: ") + e.what());
    }
    try {
        validate_engine_config(config);
    } catch (const ConfigurationError& e) {
        logger()->error("invalid engine configuration: {}", e.what());
        throw;
    }
    return config;
}

EngineConfig load_engine_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        logger()->error("cannot read engine configuration {}: {}", path, e.what());
        throw ConfigurationError("cannot read engine configuration " + path + ": " + e.what());
    }
    return engine_config_from_yaml(root);
}

CharacterProfile profile_from_yaml(const YAML::Node& root) {
    CharacterProfile profile;
    try {
        read_key(root, "identity_key", profile.identity_key);

        const YAML::Node p = root["personality"];
        read_unit(p, "openness", "O", profile.personality.openness);
        read_unit(p, "conscientiousness", "C", profile.personality.conscientiousness);
        read_unit(p, "extraversion", "E", profile.personality.extraversion);
        read_unit(p, "agreeableness", "A", profile.personality.agreeableness);
        read_unit(p, "neuroticism", "N", profile.personality.neuroticism);

        const YAML::Node e = root["elements"];
        read_unit(e, "metal", nullptr, profile.elements.metal);
        read_unit(e, "wood", nullptr, profile.elements.wood);
        read_unit(e, "water", nullptr, profile.elements.water);
        read_unit(e, "fire", nullptr, profile.elements.fire);
        read_unit(e, "earth", nullptr, profile.elements.earth);

        const YAML::Node m = root["emotions"];
        read_unit(m, "joy", nullptr, profile.emotion_baseline.joy);
        read_unit(m, "anger", nullptr, profile.emotion_baseline.anger);
        read_unit(m, "sadness", nullptr, profile.emotion_baseline.sadness);
        read_unit(m, "fear", nullptr, profile.emotion_baseline.fear);

        const YAML::Node s = root["social"];
        read_unit(s, "reputation", nullptr, profile.social.reputation);
        read_unit(s, "trust", nullptr, profile.social.trust);
        read_unit(s, "wealth", nullptr, profile.social.wealth);
        read_unit(s, "status", nullptr, profile.social.status);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("invalid character profile: ") + e.what());
    }
    return sanitize_profile(profile);
}

CharacterProfile load_profile(const std::string& path) {
    try {
        return profile_from_yaml(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("cannot read character profile " + path + ": " + e.what());
    }
}

} // namespace Mirage

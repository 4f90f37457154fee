#ifndef MIRAGE_CONFIG_H
#define MIRAGE_CONFIG_H

#include "agent.h"
#include "character.h"
#include "environment.h"
#include "ppo_optimizer.h"

#include <yaml-cpp/yaml.h>

#include <string>

namespace Mirage {

struct EngineConfig {
    AgentConfig agent;
    PPOConfig ppo;
    EnvironmentConfig environment;
    std::string storage_dir = "agents";
    std::string log_level = "info";
};

// Throws ConfigurationError on the first invalid value.
void validate_engine_config(const EngineConfig& config);

// Sections: model, optimizer, ppo, environment, storage, logging. Missing keys keep defaults.
// Throws ConfigurationError for unreadable files, malformed YAML, wrongly typed or invalid values.
EngineConfig engine_config_from_yaml(const YAML::Node& root);
EngineConfig load_engine_config(const std::string& path);

// Sections: identity_key, personality (also O/C/E/A/N), elements, emotions, social. Missing
// fields take neutral defaults; the result is sanitized.
CharacterProfile profile_from_yaml(const YAML::Node& root);
CharacterProfile load_profile(const std::string& path);

} // namespace Mirage

#endif

#ifndef MIRAGE_CHARACTER_ENGINE_H
#define MIRAGE_CHARACTER_ENGINE_H

#include "agent_registry.h"
#include "character.h"
#include "config.h"
#include "environment.h"
#include "scenario.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Mirage {

struct TrainingRequest {
    std::string identity_key;
    int episodes = 5;
    int steps_per_episode = 100;
};

struct InferenceRequest {
    std::string identity_key;
    int steps = 10;
    bool deterministic = false;
};

struct SimulationResult {
    std::vector<ActionRecord> action_history;
    float total_reward = 0.0f;
    EpisodicState final_state;
};

struct TrainingResult {
    std::vector<float> reward_history;
    float avg_episode_length = 0.0f;
    float final_policy_loss = 0.0f;
    float final_value_loss = 0.0f;
    float final_entropy = 0.0f;
    float final_clip_fraction = 0.0f;
    int episodes_completed = 0;
    int skipped_updates = 0;
    bool cancelled = false;
    bool saved = false;
};

enum class InteractionOutcome { FIRST_DOMINATES, SECOND_DOMINATES, MUTUAL_BENEFIT, MUTUAL_LOSS, UNDETERMINED };
enum class RelationshipChange { STRONGLY_IMPROVED, SLIGHTLY_IMPROVED, UNCHANGED, SLIGHTLY_WORSENED, STRONGLY_WORSENED };

const char* to_string(InteractionOutcome outcome);
const char* to_string(RelationshipChange change);

InteractionOutcome classify_interaction(float first_total, float second_total);
RelationshipChange classify_relationship(float first_total, float second_total);

struct InteractionResult {
    std::vector<ActionRecord> first_actions;
    std::vector<ActionRecord> second_actions;
    float first_total = 0.0f;
    float second_total = 0.0f;
    InteractionOutcome outcome = InteractionOutcome::UNDETERMINED;
    RelationshipChange relationship = RelationshipChange::UNCHANGED;
};

struct DuelTurn {
    int round = 0;
    std::string actor_key;
    std::string action_label;
    std::string outcome_label;
    float reward = 0.0f;
};

struct DuelResult {
    std::vector<DuelTurn> flow;
    float first_total = 0.0f;
    float second_total = 0.0f;
};

class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Entry point for the excluded outer layers: trains and runs per-character agents held in an
// AgentRegistry. Safe to call concurrently for different characters; calls for the same
// character serialize on that agent's lock.
class CharacterEngine {
public:
    CharacterEngine(const EngineConfig& config, std::shared_ptr<AgentRegistry> registry);
    // Registry over a FileAgentStore at config.storage_dir.
    explicit CharacterEngine(const EngineConfig& config);

    // Collect -> GAE -> clipped update, once per episode. Cancellation and the timeout are checked
    // before each episode. The agent is saved afterwards when at least one episode ran, unless an
    // unstable update step flagged it.
    TrainingResult train(const CharacterProfile& profile, const TrainingRequest& request,
                         const CancellationToken* cancel = nullptr,
                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    SimulationResult simulate(const CharacterProfile& profile, const InferenceRequest& request,
                              const Scenario& scenario = Scenario());

    // Alternating turns, first character first, for at most `rounds` rounds.
    InteractionResult interact(const CharacterProfile& first, const CharacterProfile& second, int rounds,
                               const Scenario& scenario = Scenario());
    DuelResult duel(const CharacterProfile& first, const CharacterProfile& second, int rounds);

    AgentRegistry& registry() { return *registry_; }
    const EngineConfig& config() const { return config_; }

    static std::string interaction_key(const std::string& identity_key) { return identity_key + "@interaction"; }
    static std::string duel_key(const std::string& identity_key) { return identity_key + "@duel"; }

private:
    unsigned int next_seed(unsigned int base);
    EnvironmentConfig environment_config(int horizon, const Scenario& scenario);

    EngineConfig config_;
    std::shared_ptr<AgentRegistry> registry_;
    std::atomic<unsigned int> calls_{0};
};

} // namespace Mirage

#endif

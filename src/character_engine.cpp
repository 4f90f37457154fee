#include "character_engine.h"

#include "errors.h"
#include "logging.h"
#include "ppo_optimizer.h"
#include "rollout.h"

#include <random>

namespace Mirage {

const char* to_string(InteractionOutcome outcome) {
    switch (outcome) {
        case InteractionOutcome::FIRST_DOMINATES: return "first character dominates";
        case InteractionOutcome::SECOND_DOMINATES: return "second character dominates";
        case InteractionOutcome::MUTUAL_BENEFIT: return "mutual benefit";
        case InteractionOutcome::MUTUAL_LOSS: return "mutual loss";
        case InteractionOutcome::UNDETERMINED: return "undetermined";
    }
    return "undetermined";
}

const char* to_string(RelationshipChange change) {
    switch (change) {
        case RelationshipChange::STRONGLY_IMPROVED: return "strongly improved";
        case RelationshipChange::SLIGHTLY_IMPROVED: return "slightly improved";
        case RelationshipChange::UNCHANGED: return "unchanged";
        case RelationshipChange::SLIGHTLY_WORSENED: return "slightly worsened";
        case RelationshipChange::STRONGLY_WORSENED: return "strongly worsened";
    }
    return "unchanged";
}

InteractionOutcome classify_interaction(float first_total, float second_total) {
    // Dominance needs a positive total; two losses are never a win for the smaller one.
    if (first_total > 0.0f && first_total > second_total * 1.5f) return InteractionOutcome::FIRST_DOMINATES;
    if (second_total > 0.0f && second_total > first_total * 1.5f) return InteractionOutcome::SECOND_DOMINATES;
    if (first_total > 0.0f && second_total > 0.0f) return InteractionOutcome::MUTUAL_BENEFIT;
    if (first_total < 0.0f && second_total < 0.0f) return InteractionOutcome::MUTUAL_LOSS;
    return InteractionOutcome::UNDETERMINED;
}

RelationshipChange classify_relationship(float first_total, float second_total) {
    const float score = (first_total + second_total) / 2.0f;
    if (score > 5.0f) return RelationshipChange::STRONGLY_IMPROVED;
    if (score > 2.0f) return RelationshipChange::SLIGHTLY_IMPROVED;
    if (score < -5.0f) return RelationshipChange::STRONGLY_WORSENED;
    if (score < -2.0f) return RelationshipChange::SLIGHTLY_WORSENED;
    return RelationshipChange::UNCHANGED;
}

namespace {

const std::string& key_of(const CharacterProfile& profile, const std::string& requested) {
    return requested.empty() ? profile.identity_key : requested;
}

ActionRecord record_of(int step, int action, const StepResult& result) {
    ActionRecord record;
    record.step = step;
    record.action = action;
    record.action_label = result.info.action_label;
    record.outcome_label = result.info.outcome_label;
    record.reward = result.reward;
    record.success = result.info.success;
    return record;
}

} // namespace

CharacterEngine::CharacterEngine(const EngineConfig& config, std::shared_ptr<AgentRegistry> registry)
    : config_(config), registry_(std::move(registry)) {
    validate_engine_config(config_);
    if (!registry_) throw ConfigurationError("CharacterEngine needs an agent registry");
}

CharacterEngine::CharacterEngine(const EngineConfig& config)
    : CharacterEngine(config, std::make_shared<AgentRegistry>(config.agent, std::make_shared<FileAgentStore>(config.storage_dir))) {}

unsigned int CharacterEngine::next_seed(unsigned int base) {
    return base + 0x9E3779B9u * (calls_.fetch_add(1) + 1);
}

EnvironmentConfig CharacterEngine::environment_config(int horizon, const Scenario& scenario) {
    EnvironmentConfig env = config_.environment;
    env.horizon = horizon;
    env.seed = next_seed(config_.environment.seed);
    if (!scenario.empty()) env.scenario = scenario;
    return env;
}

TrainingResult CharacterEngine::train(const CharacterProfile& profile, const TrainingRequest& request,
                                      const CancellationToken* cancel, std::optional<std::chrono::milliseconds> timeout) {
    if (request.episodes <= 0 || request.steps_per_episode <= 0) {
        throw ConfigurationError("training request needs positive episodes and steps_per_episode");
    }
    const std::string key = key_of(profile, request.identity_key);
    CharacterEnvironment env(profile, environment_config(request.steps_per_episode, Scenario()));
    std::shared_ptr<Agent> agent = registry_->get_or_create(key, env.state_dim(), env.action_dim());

    PPOConfig ppo = config_.ppo;
    ppo.seed = next_seed(config_.ppo.seed);
    PolicyOptimizer optimizer(ppo);
    RolloutCollector collector(next_seed(config_.ppo.seed));

    const auto deadline = timeout ? std::optional<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now() + *timeout)
                                  : std::nullopt;
    TrainingResult result;
    long total_steps = 0;
    for (int ep = 0; ep < request.episodes; ++ep) {
        if (cancel && cancel->cancelled()) {
            logger()->info("training '{}' cancelled after {} episodes", key, ep);
            result.cancelled = true;
            break;
        }
        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            logger()->info("training '{}' timed out after {} episodes", key, ep);
            result.cancelled = true;
            break;
        }

        Trajectory trajectory = collector.collect(*agent, env, request.steps_per_episode, false);
        UpdateStats stats = optimizer.train_on(*agent, trajectory);

        result.reward_history.push_back(trajectory.total_reward());
        total_steps += static_cast<long>(trajectory.size());
        result.skipped_updates += stats.skipped_steps;
        if (stats.gradient_steps > 0) {
            result.final_policy_loss = stats.policy_loss;
            result.final_value_loss = stats.value_loss;
            result.final_entropy = stats.entropy;
            result.final_clip_fraction = stats.clip_fraction;
        }
        result.episodes_completed++;
        logger()->debug("'{}' episode {}: reward {:.3f}, length {}, policy {:.4f}, value {:.4f}, entropy {:.4f}, clipped {:.2f}",
                        key, ep, trajectory.total_reward(), trajectory.size(), stats.policy_loss, stats.value_loss,
                        stats.entropy, stats.clip_fraction);
    }

    if (result.episodes_completed > 0) {
        result.avg_episode_length = static_cast<float>(total_steps) / static_cast<float>(result.episodes_completed);
        result.saved = registry_->save(key);
    }
    return result;
}

SimulationResult CharacterEngine::simulate(const CharacterProfile& profile, const InferenceRequest& request,
                                           const Scenario& scenario) {
    if (request.steps <= 0) throw ConfigurationError("inference request needs a positive step count");
    const std::string key = key_of(profile, request.identity_key);
    CharacterEnvironment env(profile, environment_config(request.steps, scenario));
    std::shared_ptr<Agent> agent = registry_->get_or_create(key, env.state_dim(), env.action_dim());

    RolloutCollector collector(next_seed(config_.ppo.seed));
    Trajectory trajectory = collector.collect(*agent, env, request.steps, request.deterministic);

    SimulationResult result;
    result.final_state = env.state();
    result.action_history = result.final_state.history;
    result.total_reward = trajectory.total_reward();
    return result;
}

InteractionResult CharacterEngine::interact(const CharacterProfile& first, const CharacterProfile& second, int rounds,
                                            const Scenario& scenario) {
    if (rounds <= 0) throw ConfigurationError("interaction needs a positive round count");
    PairwiseEnvironment env(first, second, PairwiseVariant::INTERACTION, environment_config(2 * rounds, scenario));
    std::shared_ptr<Agent> agents[2] = {
        registry_->get_or_create(interaction_key(first.identity_key), env.state_dim(), env.action_dim()),
        registry_->get_or_create(interaction_key(second.identity_key), env.state_dim(), env.action_dim())};
    std::mt19937 gen(next_seed(config_.ppo.seed));

    InteractionResult result;
    std::vector<ActionRecord>* records[2] = {&result.first_actions, &result.second_actions};
    float* totals[2] = {&result.first_total, &result.second_total};

    Eigen::VectorXf state = env.reset();
    bool done = false;
    for (int round = 1; round <= rounds && !done; ++round) {
        for (int who = 0; who < 2 && !done; ++who) {
            ActionSample sample = agents[who]->act(state, false, gen);
            StepResult step = env.step(sample.action);
            records[who]->push_back(record_of(round, sample.action, step));
            *totals[who] += step.reward;
            state = step.state;
            done = step.done;
        }
    }
    result.outcome = classify_interaction(result.first_total, result.second_total);
    result.relationship = classify_relationship(result.first_total, result.second_total);
    return result;
}

DuelResult CharacterEngine::duel(const CharacterProfile& first, const CharacterProfile& second, int rounds) {
    if (rounds <= 0) throw ConfigurationError("duel needs a positive round count");
    PairwiseEnvironment env(first, second, PairwiseVariant::DUEL, environment_config(2 * rounds, Scenario()));
    const std::string keys[2] = {first.identity_key, second.identity_key};
    std::shared_ptr<Agent> agents[2] = {
        registry_->get_or_create(duel_key(keys[0]), env.state_dim(), env.action_dim()),
        registry_->get_or_create(duel_key(keys[1]), env.state_dim(), env.action_dim())};
    std::mt19937 gen(next_seed(config_.ppo.seed));

    DuelResult result;
    Eigen::VectorXf state = env.reset();
    bool done = false;
    for (int round = 1; round <= rounds && !done; ++round) {
        for (int who = 0; who < 2 && !done; ++who) {
            ActionSample sample = agents[who]->act(state, false, gen);
            StepResult step = env.step(sample.action);
            DuelTurn turn;
            turn.round = round;
            turn.actor_key = keys[who];
            turn.action_label = step.info.action_label;
            turn.outcome_label = step.info.outcome_label;
            turn.reward = step.reward;
            result.flow.push_back(std::move(turn));
            (who == 0 ? result.first_total : result.second_total) += step.reward;
            state = step.state;
            done = step.done;
        }
    }
    return result;
}

} // namespace Mirage

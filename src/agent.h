#ifndef MIRAGE_AGENT_H
#define MIRAGE_AGENT_H

#include "neural_network.h"
#include "policy_value_model.h"

#include <atomic>
#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <random>
#include <shared_mutex>

namespace Mirage {

struct AgentConfig {
    ModelConfig model;
    float learning_rate = 2.5e-4f;
    float adam_beta1 = 0.9f;
    float adam_beta2 = 0.999f;
    float adam_epsilon = 1e-8f;
};

// One character's policy/value model plus its Adam state.
//
// Locking: readers (rollout collection, inference, save) hold mutex() shared; anything that
// changes parameters (optimizer updates, in-place loads) holds it exclusively. Member functions
// other than act() do not lock on their own.
class Agent {
public:
    static constexpr uint32_t kFormatVersion = 1;
    static constexpr char kMagic[9] = "MIRAGEAG";

    explicit Agent(const AgentConfig& config);

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    PolicyValueModel model_;
    AdamOptimizer trunk_optimizer_;
    AdamOptimizer policy_optimizer_;
    AdamOptimizer value_optimizer_;

    int state_dim() const { return model_.state_dim(); }
    int action_dim() const { return model_.action_dim(); }
    const AgentConfig& config() const { return config_; }
    std::shared_mutex& mutex() const { return mutex_; }

    // Shared-locked inference for one-off callers.
    ActionSample act(const Eigen::VectorXf& state, bool deterministic, std::mt19937& gen) const;

    // One Adam step on trunk and both heads.
    void apply_gradients(const ModelGradients& grads);

    // Set when an update had to skip a numerically unstable gradient step.
    bool instability_flagged() const { return instability_flagged_.load(); }
    void flag_instability() { instability_flagged_.store(true); }
    void clear_instability_flag() { instability_flagged_.store(false); }

    // Copies parameters, Adam state and config from other and clears the instability flag.
    // Caller holds mutex() exclusively.
    void restore_from(const Agent& other);

    // Header (magic, version, dims, hidden sizes, floor), parameters, Adam state.
    bool save(std::ostream& out) const;
    // Rebuilds an agent from a blob written by save(); learning-rate settings come from defaults.
    // Returns nullptr on malformed or newer-format data.
    static std::unique_ptr<Agent> load(std::istream& in, const AgentConfig& defaults);

private:
    AgentConfig config_;
    mutable std::shared_mutex mutex_;
    std::atomic<bool> instability_flagged_{false};
};

} // namespace Mirage

#endif

#ifndef MIRAGE_PPO_OPTIMIZER_H
#define MIRAGE_PPO_OPTIMIZER_H

#include "agent.h"
#include "rollout.h"

#include <random>
#include <vector>

namespace Mirage {

struct PPOConfig {
    float gamma = 0.99f;
    float lambda = 0.95f;
    float clip_ratio = 0.2f;
    int epochs = 10;
    float value_coef = 0.5f;
    float entropy_coef = 0.01f;
    float max_grad_norm = 0.5f;
    // 0 = whole batch, one gradient step per epoch.
    int minibatch_size = 0;
    // Advantages are used as estimated unless this is set, in which case each batch is
    // standardized to zero mean and unit variance before the epochs start.
    bool normalize_advantages = false;
    unsigned int seed = std::random_device{}();
};

// Throws ConfigurationError for out-of-range values.
void validate_ppo_config(const PPOConfig& config);

// One step of the clipped surrogate min(r * A, clip(r, 1 - eps, 1 + eps) * A).
// `clipped` is set when the clipped branch is the one in effect: A > 0 with r >= 1 + eps, or
// A < 0 with r <= 1 - eps. Its derivative with respect to r is then 0, otherwise A.
struct SurrogateTerm {
    float value = 0.0f;
    bool clipped = false;
    float ratio_gradient = 0.0f;
};

SurrogateTerm clipped_surrogate(float ratio, float advantage, float clip_ratio);

// Averages over the gradient steps that were applied.
struct UpdateStats {
    float policy_loss = 0.0f;
    float value_loss = 0.0f;
    float entropy = 0.0f;
    float clip_fraction = 0.0f;
    float approx_kl = 0.0f;
    int epochs = 0;
    int gradient_steps = 0;
    int skipped_steps = 0;
};

class PolicyOptimizer {
public:
    explicit PolicyOptimizer(const PPOConfig& config);

    const PPOConfig& config() const { return config_; }

    // `epochs` passes over the same batch; each pass re-evaluates the model and takes one gradient
    // step per minibatch against policy_loss + value_coef * value_loss - entropy_coef * entropy,
    // with the gradient norm clipped to max_grad_norm. A step whose loss or gradient is not finite
    // is skipped, logged and flags the agent. Holds the agent's mutex exclusively throughout.
    UpdateStats update(Agent& agent, const Trajectory& batch, const std::vector<float>& advantages,
                       const std::vector<float>& returns, int epochs, float clip_ratio);

    // GAE with the configured gamma/lambda followed by update() with the configured epochs and
    // clip ratio.
    UpdateStats train_on(Agent& agent, const Trajectory& batch);

private:
    PPOConfig config_;
    std::mt19937 gen_;
};

} // namespace Mirage

#endif

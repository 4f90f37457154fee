#include "ppo_optimizer.h"

#include "advantage.h"
#include "errors.h"
#include "logging.h"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <numeric>
#include <shared_mutex>
#include <stdexcept>
#include <string>

namespace Mirage {

void validate_ppo_config(const PPOConfig& config) {
    if (!(config.gamma >= 0.0f && config.gamma <= 1.0f)) throw ConfigurationError("gamma must lie in [0, 1]");
    if (!(config.lambda >= 0.0f && config.lambda <= 1.0f)) throw ConfigurationError("lambda must lie in [0, 1]");
    if (!(config.clip_ratio > 0.0f && config.clip_ratio < 1.0f)) throw ConfigurationError("clip_ratio must lie in (0, 1)");
    if (config.epochs <= 0) throw ConfigurationError("epochs must be positive, got " + std::to_string(config.epochs));
    if (!(config.value_coef >= 0.0f)) throw ConfigurationError("value_coef must be non-negative");
    if (!(config.entropy_coef >= 0.0f)) throw ConfigurationError("entropy_coef must be non-negative");
    if (!(config.max_grad_norm > 0.0f)) throw ConfigurationError("max_grad_norm must be positive");
    if (config.minibatch_size < 0) throw ConfigurationError("minibatch_size must be non-negative");
}

SurrogateTerm clipped_surrogate(float ratio, float advantage, float clip_ratio) {
    const float clipped_ratio = std::clamp(ratio, 1.0f - clip_ratio, 1.0f + clip_ratio);
    SurrogateTerm term;
    term.value = std::min(ratio * advantage, clipped_ratio * advantage);
    term.clipped = (advantage > 0.0f && ratio >= 1.0f + clip_ratio) || (advantage < 0.0f && ratio <= 1.0f - clip_ratio);
    term.ratio_gradient = term.clipped ? 0.0f : advantage;
    return term;
}

PolicyOptimizer::PolicyOptimizer(const PPOConfig& config) : config_(config), gen_(config.seed) {
    validate_ppo_config(config_);
}

UpdateStats PolicyOptimizer::train_on(Agent& agent, const Trajectory& batch) {
    AdvantageResult gae = compute_gae(batch.rewards(), batch.values(), batch.bootstrap_value, batch.dones(),
                                      config_.gamma, config_.lambda);
    return update(agent, batch, gae.advantages, gae.returns, config_.epochs, config_.clip_ratio);
}

UpdateStats PolicyOptimizer::update(Agent& agent, const Trajectory& batch, const std::vector<float>& advantages,
                                    const std::vector<float>& returns, int epochs, float clip_ratio) {
    const size_t n = batch.size();
    if (advantages.size() != n || returns.size() != n) {
        throw std::invalid_argument("PolicyOptimizer::update: advantages/returns must match the batch length");
    }
    UpdateStats stats;
    if (n == 0 || epochs <= 0) return stats;

    std::vector<float> adv = config_.normalize_advantages ? standardize(advantages) : advantages;
    const size_t minibatch = config_.minibatch_size > 0 ? std::min<size_t>(config_.minibatch_size, n) : n;
    std::vector<size_t> idx(n);
    std::iota(idx.begin(), idx.end(), 0);

    std::unique_lock<std::shared_mutex> lock(agent.mutex());
    const PolicyValueModel& model = agent.model_;
    const int action_dim = model.action_dim();

    ModelGradients grads;
    ModelTrace trace;
    for (int ep = 0; ep < epochs; ++ep) {
        if (minibatch < n) std::shuffle(idx.begin(), idx.end(), gen_);
        for (size_t i = 0; i < n; i += minibatch) {
            const size_t b_end = std::min(i + minibatch, n);
            const float inv_m = 1.0f / static_cast<float>(b_end - i);
            grads.set_zero_like(model);

            float policy_sum = 0.0f, value_sum = 0.0f, entropy_sum = 0.0f, kl_sum = 0.0f;
            int clipped = 0;
            for (size_t ji = i; ji < b_end; ++ji) {
                const size_t k = idx[ji];
                const TrajectoryStep& tr = batch.steps[k];
                PolicyOutput out = model.forward(tr.state, &trace);

                const float new_lp = std::log(out.probabilities[tr.action]);
                const float ratio = std::exp(new_lp - tr.log_prob);
                SurrogateTerm term = clipped_surrogate(ratio, adv[k], clip_ratio);
                const float h = PolicyValueModel::entropy(out.probabilities);
                const float v_err = out.value - returns[k];

                policy_sum += -term.value;
                value_sum += v_err * v_err;
                entropy_sum += h;
                kl_sum += tr.log_prob - new_lp;
                if (term.clipped) clipped++;

                Eigen::VectorXf logits_grad = Eigen::VectorXf::Zero(action_dim);
                if (term.ratio_gradient != 0.0f) {
                    logits_grad -= (term.ratio_gradient * ratio * inv_m) * model.log_prob_gradient(trace, out.probabilities, tr.action);
                }
                logits_grad -= (config_.entropy_coef * inv_m) * model.entropy_gradient(trace, out.probabilities);
                const float value_grad = config_.value_coef * 2.0f * v_err * inv_m;
                model.backward(trace, logits_grad, value_grad, grads);
            }

            const float policy_loss = policy_sum * inv_m;
            const float value_loss = value_sum * inv_m;
            const float entropy = entropy_sum * inv_m;
            const float total = policy_loss + config_.value_coef * value_loss - config_.entropy_coef * entropy;
            if (!std::isfinite(total) || !grads.all_finite()) {
                stats.skipped_steps++;
                agent.flag_instability();
                logger()->warn("skipping unstable update step (epoch {}, loss {}); parameters left unchanged", ep, total);
                continue;
            }

            const float grad_norm = std::sqrt(grads.squared_norm());
            if (grad_norm > config_.max_grad_norm) grads.scale(config_.max_grad_norm / grad_norm);
            agent.apply_gradients(grads);

            stats.policy_loss += policy_loss;
            stats.value_loss += value_loss;
            stats.entropy += entropy;
            stats.clip_fraction += static_cast<float>(clipped) * inv_m;
            stats.approx_kl += kl_sum * inv_m;
            stats.gradient_steps++;
        }
        stats.epochs++;
    }

    if (stats.gradient_steps > 0) {
        const float inv = 1.0f / static_cast<float>(stats.gradient_steps);
        stats.policy_loss *= inv;
        stats.value_loss *= inv;
        stats.entropy *= inv;
        stats.clip_fraction *= inv;
        stats.approx_kl *= inv;
    }
    return stats;
}

} // namespace Mirage

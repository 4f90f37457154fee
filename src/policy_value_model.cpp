#include "policy_value_model.h"

#include "errors.h"

#include <cmath>
#include <string>

namespace Mirage {

void validate_model_config(const ModelConfig& config) {
    if (config.state_dim <= 0) throw ConfigurationError("state_dim must be positive, got " + std::to_string(config.state_dim));
    if (config.action_dim < 2) throw ConfigurationError("action_dim must be at least 2, got " + std::to_string(config.action_dim));
    if (config.hidden_dims.empty()) throw ConfigurationError("policy/value trunk needs at least one hidden layer");
    for (int h : config.hidden_dims) {
        if (h <= 0) throw ConfigurationError("hidden layer sizes must be positive, got " + std::to_string(h));
    }
    if (!(config.probability_floor > 0.0f) || config.probability_floor * config.action_dim >= 1.0f) {
        throw ConfigurationError("probability_floor must lie in (0, 1/action_dim)");
    }
}

// --- Gradients ---

void ModelGradients::set_zero_like(const PolicyValueModel& model) {
    trunk.set_zero_like(model.trunk_);
    policy.set_zero_like(model.policy_head_);
    value.set_zero_like(model.value_head_);
}

void ModelGradients::scale(float factor) {
    trunk.scale(factor);
    policy.scale(factor);
    value.scale(factor);
}

float ModelGradients::squared_norm() const {
    return trunk.squared_norm() + policy.squared_norm() + value.squared_norm();
}

bool ModelGradients::all_finite() const {
    return trunk.all_finite() && policy.all_finite() && value.all_finite();
}

// --- PolicyValueModel ---

namespace {

NeuralNetwork build_trunk(const ModelConfig& config, std::mt19937& gen) {
    std::vector<int> inner(config.hidden_dims.begin(), config.hidden_dims.end() - 1);
    return NeuralNetwork(config.state_dim, inner, config.hidden_dims.back(), ActivationType::RELU, ActivationType::RELU, gen);
}

} // namespace

PolicyValueModel::PolicyValueModel(const ModelConfig& config) : config_(config) {
    validate_model_config(config_);
    std::mt19937 gen(config_.seed);
    trunk_ = build_trunk(config_, gen);
    const int features = config_.hidden_dims.back();
    policy_head_ = NeuralNetwork(features, {}, config_.action_dim, ActivationType::LINEAR, ActivationType::LINEAR, gen);
    value_head_ = NeuralNetwork(features, {}, 1, ActivationType::LINEAR, ActivationType::LINEAR, gen);
}

PolicyOutput PolicyValueModel::forward(const Eigen::VectorXf& state, ModelTrace* trace) const {
    ForwardTrace* trunk_trace = trace ? &trace->trunk : nullptr;
    Eigen::VectorXf features = trunk_.forward(state, trunk_trace);
    Eigen::VectorXf logits = policy_head_.forward(features, trace ? &trace->policy : nullptr);
    Eigen::VectorXf value = value_head_.forward(features, trace ? &trace->value : nullptr);

    Eigen::VectorXf probs = softmax(logits);
    if (trace) trace->softmax = probs;

    PolicyOutput out;
    out.probabilities = (softmax_scale() * probs.array() + config_.probability_floor).matrix();
    out.value = value[0];
    return out;
}

ActionSample PolicyValueModel::select_action(const Eigen::VectorXf& state, bool deterministic, std::mt19937& gen) const {
    PolicyOutput out = forward(state);
    ActionSample sample;
    if (deterministic) {
        Eigen::Index best = 0;
        out.probabilities.maxCoeff(&best);
        sample.action = static_cast<int>(best);
    } else {
        std::discrete_distribution<int> dist(out.probabilities.data(), out.probabilities.data() + out.probabilities.size());
        sample.action = dist(gen);
    }
    sample.log_prob = std::log(out.probabilities[sample.action]);
    sample.value = out.value;
    sample.probabilities = std::move(out.probabilities);
    return sample;
}

Eigen::VectorXf PolicyValueModel::log_prob_gradient(const ModelTrace& trace, const Eigen::VectorXf& probabilities,
                                                    int action) const {
    // d p_a / d z_k = c * s_a * (delta_ak - s_k), divided by p_a for the log.
    const Eigen::VectorXf& s = trace.softmax;
    Eigen::VectorXf grad = -s * s[action];
    grad[action] += s[action];
    return grad * (softmax_scale() / probabilities[action]);
}

Eigen::VectorXf PolicyValueModel::entropy_gradient(const ModelTrace& trace, const Eigen::VectorXf& probabilities) const {
    // dH/dz_k = c * s_k * (g_k - sum_j s_j g_j) with g_j = -(log p_j + 1)
    const Eigen::VectorXf& s = trace.softmax;
    Eigen::VectorXf g = -(probabilities.array().log() + 1.0f).matrix();
    const float mean_g = s.dot(g);
    return (softmax_scale() * s.array() * (g.array() - mean_g)).matrix();
}

void PolicyValueModel::backward(const ModelTrace& trace, const Eigen::VectorXf& logits_grad, float value_grad,
                                ModelGradients& grads) const {
    Eigen::VectorXf d_features = policy_head_.backward(trace.policy, logits_grad, grads.policy);
    d_features += value_head_.backward(trace.value, Eigen::VectorXf::Constant(1, value_grad), grads.value);
    trunk_.backward(trace.trunk, d_features, grads.trunk);
}

float PolicyValueModel::entropy(const Eigen::VectorXf& probabilities) {
    return -(probabilities.array() * probabilities.array().log()).sum();
}

bool PolicyValueModel::save_parameters(std::ostream& out) const {
    return trunk_.save_parameters(out) && policy_head_.save_parameters(out) && value_head_.save_parameters(out);
}

bool PolicyValueModel::load_parameters(std::istream& in) {
    PolicyValueModel staged = *this;
    if (!staged.trunk_.load_parameters(in)) return false;
    if (!staged.policy_head_.load_parameters(in)) return false;
    if (!staged.value_head_.load_parameters(in)) return false;
    *this = std::move(staged);
    return true;
}

} // namespace Mirage

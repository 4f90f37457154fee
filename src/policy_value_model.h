#ifndef MIRAGE_POLICY_VALUE_MODEL_H
#define MIRAGE_POLICY_VALUE_MODEL_H

#include "neural_network.h"
#include "state_encoder.h"

#include <Eigen/Dense>

#include <istream>
#include <ostream>
#include <random>
#include <vector>

namespace Mirage {

struct ModelConfig {
    int state_dim = StateEncoder::kDimension;
    int action_dim = 6;
    std::vector<int> hidden_dims{128, 128};
    // Mixed into the softmax so that every action keeps probability >= floor.
    float probability_floor = 1e-6f;
    unsigned int seed = std::random_device{}();
};

// Throws ConfigurationError for non-positive dims, fewer than two actions, an empty trunk, or a
// floor that leaves no mass for the softmax.
void validate_model_config(const ModelConfig& config);

struct PolicyOutput {
    Eigen::VectorXf probabilities;
    float value = 0.0f;
};

struct ActionSample {
    int action = 0;
    float log_prob = 0.0f;
    Eigen::VectorXf probabilities;
    float value = 0.0f;
};

// Everything backward() needs from one forward pass.
struct ModelTrace {
    ForwardTrace trunk;
    ForwardTrace policy;
    ForwardTrace value;
    Eigen::VectorXf softmax;
};

class PolicyValueModel;

struct ModelGradients {
    NetworkGradients trunk;
    NetworkGradients policy;
    NetworkGradients value;

    void set_zero_like(const PolicyValueModel& model);
    void scale(float factor);
    float squared_norm() const;
    bool all_finite() const;
};

// Shared ReLU trunk feeding a categorical policy head and a scalar value head.
class PolicyValueModel {
public:
    NeuralNetwork trunk_;
    NeuralNetwork policy_head_;
    NeuralNetwork value_head_;

    explicit PolicyValueModel(const ModelConfig& config);

    const ModelConfig& config() const { return config_; }
    int state_dim() const { return config_.state_dim; }
    int action_dim() const { return config_.action_dim; }

    // Probabilities are c * softmax(logits) + floor with c = 1 - action_dim * floor.
    PolicyOutput forward(const Eigen::VectorXf& state, ModelTrace* trace = nullptr) const;
    ActionSample select_action(const Eigen::VectorXf& state, bool deterministic, std::mt19937& gen) const;

    // Derivative of log p[action] with respect to the policy logits.
    Eigen::VectorXf log_prob_gradient(const ModelTrace& trace, const Eigen::VectorXf& probabilities, int action) const;
    // Derivative of the distribution entropy with respect to the policy logits.
    Eigen::VectorXf entropy_gradient(const ModelTrace& trace, const Eigen::VectorXf& probabilities) const;
    // Accumulates parameter gradients of a loss with the given logit and value derivatives.
    void backward(const ModelTrace& trace, const Eigen::VectorXf& logits_grad, float value_grad, ModelGradients& grads) const;

    bool save_parameters(std::ostream& out) const;
    bool load_parameters(std::istream& in);

    static float entropy(const Eigen::VectorXf& probabilities);

private:
    float softmax_scale() const { return 1.0f - static_cast<float>(config_.action_dim) * config_.probability_floor; }

    ModelConfig config_;
};

} // namespace Mirage

#endif

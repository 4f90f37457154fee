#ifndef MIRAGE_NEURAL_NETWORK_H
#define MIRAGE_NEURAL_NETWORK_H

#include <Eigen/Dense>

#include <istream>
#include <ostream>
#include <random>
#include <vector>

namespace Mirage {

enum class ActivationType { RELU, TANH, LINEAR };

Eigen::VectorXf apply_activation(const Eigen::VectorXf& x, ActivationType type);
// Elementwise derivative, expressed through the activated output.
Eigen::VectorXf activation_derivative(const Eigen::VectorXf& activated_output, ActivationType type);
// Max-shifted normalized exponentials.
Eigen::VectorXf softmax(const Eigen::VectorXf& logits);

class NeuralNetwork;

struct NetworkGradients {
    std::vector<Eigen::MatrixXf> weights;
    std::vector<Eigen::VectorXf> biases;

    void set_zero_like(const NeuralNetwork& net);
    void scale(float factor);
    float squared_norm() const;
    bool all_finite() const;
};

// Per-layer activated outputs of one forward pass; activated[0] is the input.
struct ForwardTrace {
    std::vector<Eigen::VectorXf> activated;
};

// Fully connected feed-forward network with Xavier-uniform initialisation.
class NeuralNetwork {
public:
    std::vector<Eigen::MatrixXf> weights_;
    std::vector<Eigen::VectorXf> biases_;
    std::vector<ActivationType> layer_activations_;

    NeuralNetwork() = default;
    NeuralNetwork(int i_dim, const std::vector<int>& h_dims, int o_dim, ActivationType h_act, ActivationType o_act,
                  std::mt19937& gen);

    void add_layer(int i_dim, int o_dim, ActivationType act, std::mt19937& gen);
    int input_dim() const { return weights_.empty() ? 0 : static_cast<int>(weights_.front().cols()); }
    int output_dim() const { return weights_.empty() ? 0 : static_cast<int>(weights_.back().rows()); }

    Eigen::VectorXf forward(const Eigen::VectorXf& in, ForwardTrace* trace = nullptr) const;
    // Adds dL/dparams for one sample into grads (which must be shaped like this network) and
    // returns dL/d(input).
    Eigen::VectorXf backward(const ForwardTrace& trace, const Eigen::VectorXf& loss_grad, NetworkGradients& grads) const;

    bool save_parameters(std::ostream& out) const;
    // Fails (and leaves the network unchanged) if the stored layer shapes differ from this network's.
    bool load_parameters(std::istream& in);
};

class AdamOptimizer {
public:
    float lr_;
    float beta1_, beta2_, epsilon_;
    int t_;
    std::vector<Eigen::MatrixXf> m_weights_, v_weights_;
    std::vector<Eigen::VectorXf> m_biases_, v_biases_;

    explicit AdamOptimizer(float lr = 2.5e-4f, float b1 = 0.9f, float b2 = 0.999f, float eps = 1e-8f);

    void initialize(const NeuralNetwork& net);
    void update(NeuralNetwork& net, const NetworkGradients& grads);

    bool save_state(std::ostream& out) const;
    // Fails (and keeps the current moments) unless every stored moment matches net's layer shapes.
    bool load_state(std::istream& in, const NeuralNetwork& net);
};

} // namespace Mirage

#endif

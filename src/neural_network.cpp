#include "neural_network.h"

#include "serialization.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace Mirage {

// --- Activation Functions ---

Eigen::VectorXf apply_activation(const Eigen::VectorXf& x, ActivationType type) {
    switch (type) {
        case ActivationType::RELU: return x.unaryExpr([](float v) { return std::max(0.0f, v); });
        case ActivationType::TANH: return x.unaryExpr([](float v) { return std::tanh(v); });
        case ActivationType::LINEAR: return x;
    }
    return x;
}

Eigen::VectorXf activation_derivative(const Eigen::VectorXf& activated_output, ActivationType type) {
    switch (type) {
        case ActivationType::RELU: return activated_output.unaryExpr([](float v) { return v > 0.0f ? 1.0f : 0.0f; });
        case ActivationType::TANH: return activated_output.unaryExpr([](float v) { return 1.0f - v * v; });
        case ActivationType::LINEAR: return Eigen::VectorXf::Ones(activated_output.size());
    }
    return Eigen::VectorXf::Ones(activated_output.size());
}

Eigen::VectorXf softmax(const Eigen::VectorXf& logits) {
    if (logits.size() == 0) return logits;
    Eigen::VectorXf exp_x = (logits.array() - logits.maxCoeff()).exp();
    float sum_exp = exp_x.sum();
    if (!(sum_exp > 1e-8f) || !std::isfinite(sum_exp)) {
        return Eigen::VectorXf::Constant(logits.size(), 1.0f / static_cast<float>(logits.size()));
    }
    return exp_x / sum_exp;
}

// --- Gradients ---

void NetworkGradients::set_zero_like(const NeuralNetwork& net) {
    weights.resize(net.weights_.size());
    biases.resize(net.biases_.size());
    for (size_t k = 0; k < net.weights_.size(); ++k) {
        weights[k].setZero(net.weights_[k].rows(), net.weights_[k].cols());
        biases[k].setZero(net.biases_[k].size());
    }
}

void NetworkGradients::scale(float factor) {
    for (auto& w : weights) w *= factor;
    for (auto& b : biases) b *= factor;
}

float NetworkGradients::squared_norm() const {
    float sum = 0.0f;
    for (const auto& w : weights) sum += w.squaredNorm();
    for (const auto& b : biases) sum += b.squaredNorm();
    return sum;
}

bool NetworkGradients::all_finite() const {
    for (const auto& w : weights) if (!w.allFinite()) return false;
    for (const auto& b : biases) if (!b.allFinite()) return false;
    return true;
}

// --- Neural Network ---

NeuralNetwork::NeuralNetwork(int i_dim, const std::vector<int>& h_dims, int o_dim, ActivationType h_act,
                             ActivationType o_act, std::mt19937& gen) {
    int c_dim = i_dim;
    for (size_t i = 0; i < h_dims.size(); ++i) {
        add_layer(c_dim, h_dims[i], h_act, gen);
        c_dim = h_dims[i];
    }
    add_layer(c_dim, o_dim, o_act, gen);
}

void NeuralNetwork::add_layer(int i_dim, int o_dim, ActivationType act, std::mt19937& gen) {
    float limit = std::sqrt(6.0f / static_cast<float>(i_dim + o_dim));
    std::uniform_real_distribution<float> dist(-limit, limit);
    Eigen::MatrixXf W(o_dim, i_dim);
    for (int r = 0; r < W.rows(); ++r)
        for (int c = 0; c < W.cols(); ++c) W(r, c) = dist(gen);
    weights_.push_back(W);
    biases_.push_back(Eigen::VectorXf::Zero(o_dim));
    layer_activations_.push_back(act);
}

Eigen::VectorXf NeuralNetwork::forward(const Eigen::VectorXf& in, ForwardTrace* trace) const {
    Eigen::VectorXf c_o = in;
    if (trace) {
        trace->activated.clear();
        trace->activated.push_back(c_o);
    }
    for (size_t i = 0; i < weights_.size(); ++i) {
        Eigen::VectorXf pre_a = weights_[i] * c_o + biases_[i];
        c_o = apply_activation(pre_a, layer_activations_[i]);
        if (trace) trace->activated.push_back(c_o);
    }
    return c_o;
}

Eigen::VectorXf NeuralNetwork::backward(const ForwardTrace& trace, const Eigen::VectorXf& loss_grad,
                                        NetworkGradients& grads) const {
    Eigen::VectorXf c_d = loss_grad;
    for (int i = static_cast<int>(weights_.size()) - 1; i >= 0; --i) {
        Eigen::VectorXf d_pre_a = activation_derivative(trace.activated[i + 1], layer_activations_[i]).cwiseProduct(c_d);
        grads.weights[i] += d_pre_a * trace.activated[i].transpose();
        grads.biases[i] += d_pre_a;
        c_d = weights_[i].transpose() * d_pre_a;
    }
    return c_d;
}

bool NeuralNetwork::save_parameters(std::ostream& out) const {
    if (!write_u32(out, static_cast<uint32_t>(weights_.size()))) return false;
    for (const auto& W : weights_)
        if (!write_eigen_matrix(out, W)) return false;
    if (!write_u32(out, static_cast<uint32_t>(biases_.size()))) return false;
    for (const auto& b : biases_)
        if (!write_eigen_vector(out, b)) return false;
    return static_cast<bool>(out);
}

bool NeuralNetwork::load_parameters(std::istream& in) {
    uint32_t num_w_l = 0;
    if (!read_u32(in, num_w_l) || num_w_l != weights_.size()) return false;
    std::vector<Eigen::MatrixXf> loaded_w(num_w_l);
    for (size_t i = 0; i < num_w_l; ++i) {
        if (!read_eigen_matrix(in, loaded_w[i])) return false;
        if (loaded_w[i].rows() != weights_[i].rows() || loaded_w[i].cols() != weights_[i].cols()) return false;
    }
    uint32_t num_b_l = 0;
    if (!read_u32(in, num_b_l) || num_b_l != biases_.size()) return false;
    std::vector<Eigen::VectorXf> loaded_b(num_b_l);
    for (size_t i = 0; i < num_b_l; ++i) {
        if (!read_eigen_vector(in, loaded_b[i])) return false;
        if (loaded_b[i].size() != biases_[i].size()) return false;
    }
    weights_ = std::move(loaded_w);
    biases_ = std::move(loaded_b);
    return true;
}

// --- Adam Optimizer ---

AdamOptimizer::AdamOptimizer(float lr, float b1, float b2, float eps)
    : lr_(lr), beta1_(b1), beta2_(b2), epsilon_(eps), t_(0) {}

void AdamOptimizer::initialize(const NeuralNetwork& net) {
    m_weights_.clear();
    v_weights_.clear();
    m_biases_.clear();
    v_biases_.clear();
    for (const auto& W : net.weights_) {
        m_weights_.push_back(Eigen::MatrixXf::Zero(W.rows(), W.cols()));
        v_weights_.push_back(Eigen::MatrixXf::Zero(W.rows(), W.cols()));
    }
    for (const auto& b : net.biases_) {
        m_biases_.push_back(Eigen::VectorXf::Zero(b.size()));
        v_biases_.push_back(Eigen::VectorXf::Zero(b.size()));
    }
    t_ = 0;
}

void AdamOptimizer::update(NeuralNetwork& net, const NetworkGradients& grads) {
    t_++;
    const float bias_c1 = 1.0f - std::pow(beta1_, static_cast<float>(t_));
    const float bias_c2 = 1.0f - std::pow(beta2_, static_cast<float>(t_));
    for (size_t i = 0; i < net.weights_.size(); ++i) {
        m_weights_[i] = beta1_ * m_weights_[i] + (1 - beta1_) * grads.weights[i];
        v_weights_[i] = beta2_ * v_weights_[i] + (1 - beta2_) * grads.weights[i].array().square().matrix();
        Eigen::MatrixXf mhw = m_weights_[i] / bias_c1;
        Eigen::MatrixXf vhw = v_weights_[i] / bias_c2;
        net.weights_[i] -= (lr_ * mhw.array() / (vhw.array().sqrt() + epsilon_)).matrix();

        m_biases_[i] = beta1_ * m_biases_[i] + (1 - beta1_) * grads.biases[i];
        v_biases_[i] = beta2_ * v_biases_[i] + (1 - beta2_) * grads.biases[i].array().square().matrix();
        Eigen::VectorXf mhb = m_biases_[i] / bias_c1;
        Eigen::VectorXf vhb = v_biases_[i] / bias_c2;
        net.biases_[i] -= (lr_ * mhb.array() / (vhb.array().sqrt() + epsilon_)).matrix();
    }
}

bool AdamOptimizer::save_state(std::ostream& out) const {
    if (!write_u32(out, static_cast<uint32_t>(t_))) return false;
    for (const auto& mW : m_weights_) if (!write_eigen_matrix(out, mW)) return false;
    for (const auto& vW : v_weights_) if (!write_eigen_matrix(out, vW)) return false;
    for (const auto& mb : m_biases_) if (!write_eigen_vector(out, mb)) return false;
    for (const auto& vb : v_biases_) if (!write_eigen_vector(out, vb)) return false;
    return static_cast<bool>(out);
}

bool AdamOptimizer::load_state(std::istream& in, const NeuralNetwork& net) {
    uint32_t t = 0;
    if (!read_u32(in, t)) return false;
    const size_t layers = net.weights_.size();
    std::vector<Eigen::MatrixXf> m_w(layers), v_w(layers);
    std::vector<Eigen::VectorXf> m_b(layers), v_b(layers);
    for (std::vector<Eigen::MatrixXf>* moments : {&m_w, &v_w}) {
        for (size_t i = 0; i < layers; ++i) {
            Eigen::MatrixXf& M = (*moments)[i];
            if (!read_eigen_matrix(in, M)) return false;
            if (M.rows() != net.weights_[i].rows() || M.cols() != net.weights_[i].cols()) return false;
        }
    }
    for (std::vector<Eigen::VectorXf>* moments : {&m_b, &v_b}) {
        for (size_t i = 0; i < layers; ++i) {
            if (!read_eigen_vector(in, (*moments)[i])) return false;
            if ((*moments)[i].size() != net.biases_[i].size()) return false;
        }
    }
    m_weights_ = std::move(m_w);
    v_weights_ = std::move(v_w);
    m_biases_ = std::move(m_b);
    v_biases_ = std::move(v_b);
    t_ = static_cast<int>(t);
    return true;
}

} // namespace Mirage

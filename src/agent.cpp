#include "agent.h"

#include "errors.h"
#include "logging.h"
#include "serialization.h"

#include <cstring>

namespace Mirage {

namespace {

// Largest network a blob may describe; anything bigger is treated as corrupt, not allocated.
constexpr uint64_t kMaxStoredParameters = 1u << 22;

uint64_t parameter_count(const ModelConfig& config) {
    uint64_t total = 0;
    uint64_t inputs = static_cast<uint64_t>(config.state_dim);
    for (int h : config.hidden_dims) {
        total += (inputs + 1) * static_cast<uint64_t>(h);
        inputs = static_cast<uint64_t>(h);
    }
    return total + (inputs + 1) * static_cast<uint64_t>(config.action_dim + 1);
}

} // namespace

Agent::Agent(const AgentConfig& config)
    : model_(config.model),
      trunk_optimizer_(config.learning_rate, config.adam_beta1, config.adam_beta2, config.adam_epsilon),
      policy_optimizer_(config.learning_rate, config.adam_beta1, config.adam_beta2, config.adam_epsilon),
      value_optimizer_(config.learning_rate, config.adam_beta1, config.adam_beta2, config.adam_epsilon),
      config_(config) {
    trunk_optimizer_.initialize(model_.trunk_);
    policy_optimizer_.initialize(model_.policy_head_);
    value_optimizer_.initialize(model_.value_head_);
}

ActionSample Agent::act(const Eigen::VectorXf& state, bool deterministic, std::mt19937& gen) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return model_.select_action(state, deterministic, gen);
}

void Agent::apply_gradients(const ModelGradients& grads) {
    trunk_optimizer_.update(model_.trunk_, grads.trunk);
    policy_optimizer_.update(model_.policy_head_, grads.policy);
    value_optimizer_.update(model_.value_head_, grads.value);
}

void Agent::restore_from(const Agent& other) {
    model_ = other.model_;
    trunk_optimizer_ = other.trunk_optimizer_;
    policy_optimizer_ = other.policy_optimizer_;
    value_optimizer_ = other.value_optimizer_;
    config_ = other.config_;
    clear_instability_flag();
}

bool Agent::save(std::ostream& out) const {
    const ModelConfig& mc = model_.config();
    out.write(kMagic, 8);
    if (!write_u32(out, kFormatVersion)) return false;
    if (!write_u32(out, static_cast<uint32_t>(mc.state_dim))) return false;
    if (!write_u32(out, static_cast<uint32_t>(mc.action_dim))) return false;
    if (!write_u32(out, static_cast<uint32_t>(mc.hidden_dims.size()))) return false;
    for (int h : mc.hidden_dims) {
        if (!write_u32(out, static_cast<uint32_t>(h))) return false;
    }
    out.write(reinterpret_cast<const char*>(&mc.probability_floor), sizeof(float));
    if (!model_.save_parameters(out)) return false;
    if (!trunk_optimizer_.save_state(out)) return false;
    if (!policy_optimizer_.save_state(out)) return false;
    if (!value_optimizer_.save_state(out)) return false;
    return static_cast<bool>(out);
}

std::unique_ptr<Agent> Agent::load(std::istream& in, const AgentConfig& defaults) {
    char magic_buf[8] = {0};
    in.read(magic_buf, 8);
    if (!in || std::memcmp(magic_buf, kMagic, 8) != 0) {
        logger()->warn("agent blob has no {} header", kMagic);
        return nullptr;
    }
    uint32_t version = 0;
    if (!read_u32(in, version)) return nullptr;
    if (version > kFormatVersion) {
        logger()->warn("agent blob format {} is newer than supported {}", version, kFormatVersion);
        return nullptr;
    }

    AgentConfig config = defaults;
    uint32_t state_dim = 0, action_dim = 0, hidden_count = 0;
    if (!read_u32(in, state_dim) || !read_u32(in, action_dim) || !read_u32(in, hidden_count)) return nullptr;
    if (hidden_count == 0 || hidden_count > 64) return nullptr;
    if (state_dim > kMaxStoredParameters || action_dim > kMaxStoredParameters) return nullptr;
    config.model.state_dim = static_cast<int>(state_dim);
    config.model.action_dim = static_cast<int>(action_dim);
    config.model.hidden_dims.assign(hidden_count, 0);
    for (uint32_t i = 0; i < hidden_count; ++i) {
        uint32_t h = 0;
        if (!read_u32(in, h) || h > kMaxStoredParameters) return nullptr;
        config.model.hidden_dims[i] = static_cast<int>(h);
    }
    in.read(reinterpret_cast<char*>(&config.model.probability_floor), sizeof(float));
    if (!in) return nullptr;
    if (parameter_count(config.model) > kMaxStoredParameters) {
        logger()->warn("agent blob describes a network larger than {} parameters", kMaxStoredParameters);
        return nullptr;
    }

    std::unique_ptr<Agent> agent;
    try {
        agent = std::make_unique<Agent>(config);
    } catch (const MirageError& e) {
        logger()->warn("agent blob describes an invalid model: {}", e.what());
        return nullptr;
    }
    if (!agent->model_.load_parameters(in)) return nullptr;
    if (!agent->trunk_optimizer_.load_state(in, agent->model_.trunk_)) return nullptr;
    if (!agent->policy_optimizer_.load_state(in, agent->model_.policy_head_)) return nullptr;
    if (!agent->value_optimizer_.load_state(in, agent->model_.value_head_)) return nullptr;
    return agent;
}

} // namespace Mirage

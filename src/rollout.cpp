#include "rollout.h"

#include "errors.h"

#include <shared_mutex>

namespace Mirage {

float Trajectory::total_reward() const {
    float total = 0.0f;
    for (const auto& s : steps) total += s.reward;
    return total;
}

std::vector<float> Trajectory::rewards() const {
    std::vector<float> out;
    out.reserve(steps.size());
    for (const auto& s : steps) out.push_back(s.reward);
    return out;
}

std::vector<float> Trajectory::values() const {
    std::vector<float> out;
    out.reserve(steps.size());
    for (const auto& s : steps) out.push_back(s.value);
    return out;
}

std::vector<bool> Trajectory::dones() const {
    std::vector<bool> out;
    out.reserve(steps.size());
    for (const auto& s : steps) out.push_back(s.done);
    return out;
}

Trajectory RolloutCollector::collect(const Agent& agent, Environment& environment, int horizon, bool deterministic) {
    if (agent.state_dim() != environment.state_dim() || agent.action_dim() != environment.action_dim()) {
        throw ConfigurationError("agent dims (" + std::to_string(agent.state_dim()) + ", " + std::to_string(agent.action_dim()) +
                                 ") do not match environment (" + std::to_string(environment.state_dim()) + ", " +
                                 std::to_string(environment.action_dim()) + ")");
    }
    std::shared_lock<std::shared_mutex> lock(agent.mutex());

    Trajectory trajectory;
    trajectory.steps.reserve(horizon > 0 ? horizon : 0);
    Eigen::VectorXf state = environment.reset();
    bool done = false;
    for (int t = 0; t < horizon && !done; ++t) {
        ActionSample sample = agent.model_.select_action(state, deterministic, gen_);
        StepResult result = environment.step(sample.action);

        TrajectoryStep step;
        step.state = std::move(state);
        step.action = sample.action;
        step.log_prob = sample.log_prob;
        step.value = sample.value;
        step.reward = result.reward;
        step.done = result.done;
        step.info = std::move(result.info);
        trajectory.steps.push_back(std::move(step));

        state = std::move(result.state);
        done = result.done;
    }
    trajectory.bootstrap_value = done ? 0.0f : agent.model_.forward(state).value;
    return trajectory;
}

} // namespace Mirage

#ifndef MIRAGE_ROLLOUT_H
#define MIRAGE_ROLLOUT_H

#include "agent.h"
#include "environment.h"

#include <Eigen/Dense>

#include <random>
#include <string>
#include <vector>

namespace Mirage {

struct TrajectoryStep {
    Eigen::VectorXf state;
    int action = 0;
    float log_prob = 0.0f;
    float value = 0.0f;
    float reward = 0.0f;
    bool done = false;
    StepInfo info;
};

struct Trajectory {
    std::vector<TrajectoryStep> steps;
    // V(s_T) of the state after the last step; 0 when the episode terminated.
    float bootstrap_value = 0.0f;

    size_t size() const { return steps.size(); }
    bool empty() const { return steps.empty(); }
    float total_reward() const;
    std::vector<float> rewards() const;
    std::vector<float> values() const;
    std::vector<bool> dones() const;
};

// Runs one episode from reset(), stopping at done or after horizon steps. The agent is only
// read; its mutex is held shared for the whole episode.
class RolloutCollector {
public:
    explicit RolloutCollector(unsigned int seed = std::random_device{}()) : gen_(seed) {}

    Trajectory collect(const Agent& agent, Environment& environment, int horizon, bool deterministic);

private:
    std::mt19937 gen_;
};

} // namespace Mirage

#endif

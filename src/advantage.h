#ifndef MIRAGE_ADVANTAGE_H
#define MIRAGE_ADVANTAGE_H

#include <vector>

namespace Mirage {

struct AdvantageResult {
    std::vector<float> returns;
    std::vector<float> advantages;
};

// Generalized advantage estimation, computed backward from the last step:
//   delta_t = r_t + gamma * V(t+1) * (1 - done_t) - V(t)
//   A_t     = delta_t + gamma * lambda * (1 - done_t) * A_{t+1}
//   R_t     = A_t + V(t)
// V(t+1) is bootstrap_value for the last step and values[t+1] otherwise.
// Throws std::invalid_argument if values/dones differ in length from rewards.
AdvantageResult compute_gae(const std::vector<float>& rewards, const std::vector<float>& values, float bootstrap_value,
                            const std::vector<bool>& dones, float gamma, float lambda);

// Zero mean, unit (sample) standard deviation; std floored at 1e-8. Sequences shorter than two
// are only centred.
std::vector<float> standardize(const std::vector<float>& values);

} // namespace Mirage

#endif

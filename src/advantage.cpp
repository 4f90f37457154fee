#include "advantage.h"

#include <cmath>
#include <stdexcept>

namespace Mirage {

AdvantageResult compute_gae(const std::vector<float>& rewards, const std::vector<float>& values, float bootstrap_value,
                            const std::vector<bool>& dones, float gamma, float lambda) {
    if (values.size() != rewards.size() || dones.size() != rewards.size()) {
        throw std::invalid_argument("compute_gae: rewards, values and dones must have equal length");
    }
    const int n = static_cast<int>(rewards.size());
    AdvantageResult result;
    result.returns.resize(n);
    result.advantages.resize(n);

    float gae = 0.0f;
    for (int t = n - 1; t >= 0; --t) {
        const float next_value = (t == n - 1) ? bootstrap_value : values[t + 1];
        const float next_nonterminal = dones[t] ? 0.0f : 1.0f;
        const float delta = rewards[t] + gamma * next_value * next_nonterminal - values[t];
        gae = delta + gamma * lambda * next_nonterminal * gae;
        result.advantages[t] = gae;
        result.returns[t] = gae + values[t];
    }
    return result;
}

std::vector<float> standardize(const std::vector<float>& values) {
    std::vector<float> out(values);
    if (out.empty()) return out;
    float mean = 0.0f;
    for (float v : out) mean += v;
    mean /= static_cast<float>(out.size());
    float sq = 0.0f;
    for (float& v : out) {
        v -= mean;
        sq += v * v;
    }
    if (out.size() < 2) return out;
    float std_dev = std::sqrt(sq / static_cast<float>(out.size() - 1));
    if (std_dev < 1e-8f) std_dev = 1e-8f;
    for (float& v : out) v /= std_dev;
    return out;
}

} // namespace Mirage

#define BOOST_TEST_MODULE PPOOptimizerTests
#include <boost/test/unit_test.hpp>

#include "agent.h"
#include "environment.h"
#include "errors.h"
#include "ppo_optimizer.h"
#include "rollout.h"

#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

using namespace Mirage;

constexpr float EPSILON = 1e-6f;

namespace {

AgentConfig small_agent(unsigned int seed) {
    AgentConfig config;
    config.model.state_dim = 20;
    config.model.action_dim = 6;
    config.model.hidden_dims = {32, 32};
    config.model.seed = seed;
    config.learning_rate = 1e-3f;
    return config;
}

PPOConfig fixed_ppo(unsigned int seed) {
    PPOConfig config;
    config.seed = seed;
    return config;
}

// One repeated state and action with a fixed advantage and return.
Trajectory single_state_batch(const Agent& agent, int action, int length, Eigen::VectorXf& state) {
    state = Eigen::VectorXf::Constant(20, 0.5f);
    PolicyOutput out = agent.model_.forward(state);
    Trajectory batch;
    for (int i = 0; i < length; ++i) {
        TrajectoryStep step;
        step.state = state;
        step.action = action;
        step.log_prob = std::log(out.probabilities[action]);
        step.value = out.value;
        step.reward = 1.0f;
        batch.steps.push_back(step);
    }
    return batch;
}

} // namespace

// ============================================================================
// CLIPPED SURROGATE
// ============================================================================

BOOST_AUTO_TEST_SUITE(SurrogateTests)

BOOST_AUTO_TEST_CASE(TestUpperBoundaryWithPositiveAdvantage) {
    const float eps = 0.2f;
    SurrogateTerm t = clipped_surrogate(1.0f + eps, 2.0f, eps);
    BOOST_CHECK(t.clipped);
    BOOST_CHECK_EQUAL(t.ratio_gradient, 0.0f);
    BOOST_CHECK_SMALL(t.value - (1.0f + eps) * 2.0f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestUpperBoundaryWithNegativeAdvantage) {
    const float eps = 0.2f;
    SurrogateTerm t = clipped_surrogate(1.0f + eps, -2.0f, eps);
    BOOST_CHECK(!t.clipped);
    BOOST_CHECK_EQUAL(t.ratio_gradient, -2.0f);
    BOOST_CHECK_SMALL(t.value - (1.0f + eps) * -2.0f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestLowerBoundary) {
    const float eps = 0.2f;
    SurrogateTerm neg = clipped_surrogate(1.0f - eps, -1.0f, eps);
    BOOST_CHECK(neg.clipped);
    BOOST_CHECK_EQUAL(neg.ratio_gradient, 0.0f);
    SurrogateTerm pos = clipped_surrogate(1.0f - eps, 1.0f, eps);
    BOOST_CHECK(!pos.clipped);
    BOOST_CHECK_EQUAL(pos.ratio_gradient, 1.0f);
}

BOOST_AUTO_TEST_CASE(TestInsideTrustRegion) {
    SurrogateTerm t = clipped_surrogate(1.05f, 3.0f, 0.2f);
    BOOST_CHECK(!t.clipped);
    BOOST_CHECK_SMALL(t.value - 3.15f, 1e-5f);
    BOOST_CHECK_EQUAL(t.ratio_gradient, 3.0f);
}

BOOST_AUTO_TEST_CASE(TestFarOutsideIsPessimistic) {
    // Large ratio with positive advantage is capped; with negative advantage the unclipped
    // (more negative) term wins.
    BOOST_CHECK_SMALL(clipped_surrogate(3.0f, 1.0f, 0.2f).value - 1.2f, 1e-5f);
    BOOST_CHECK_SMALL(clipped_surrogate(3.0f, -1.0f, 0.2f).value + 3.0f, 1e-5f);
    BOOST_CHECK_SMALL(clipped_surrogate(0.1f, -1.0f, 0.2f).value + 0.8f, 1e-5f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// CONFIGURATION
// ============================================================================

BOOST_AUTO_TEST_SUITE(ConfigTests)

BOOST_AUTO_TEST_CASE(TestDefaults) {
    PPOConfig c;
    BOOST_CHECK_SMALL(c.gamma - 0.99f, EPSILON);
    BOOST_CHECK_SMALL(c.lambda - 0.95f, EPSILON);
    BOOST_CHECK_SMALL(c.clip_ratio - 0.2f, EPSILON);
    BOOST_CHECK_EQUAL(c.epochs, 10);
    BOOST_CHECK(!c.normalize_advantages);
    BOOST_CHECK_NO_THROW(validate_ppo_config(c));
}

BOOST_AUTO_TEST_CASE(TestInvalidValuesRejected) {
    PPOConfig c;
    c.clip_ratio = 0.0f;
    BOOST_CHECK_THROW(validate_ppo_config(c), ConfigurationError);
    c = PPOConfig();
    c.epochs = 0;
    BOOST_CHECK_THROW(PolicyOptimizer{c}, ConfigurationError);
    c = PPOConfig();
    c.gamma = 1.5f;
    BOOST_CHECK_THROW(validate_ppo_config(c), ConfigurationError);
    c = PPOConfig();
    c.max_grad_norm = 0.0f;
    BOOST_CHECK_THROW(validate_ppo_config(c), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// UPDATES
// ============================================================================

BOOST_AUTO_TEST_SUITE(UpdateTests)

BOOST_AUTO_TEST_CASE(TestPositiveAdvantageRaisesActionProbability) {
    Agent agent(small_agent(1));
    Eigen::VectorXf state;
    Trajectory batch = single_state_batch(agent, 3, 8, state);
    const float before = agent.model_.forward(state).probabilities[3];

    PolicyOptimizer optimizer(fixed_ppo(2));
    UpdateStats stats = optimizer.update(agent, batch, std::vector<float>(8, 1.0f), std::vector<float>(8, 1.0f), 5, 0.2f);
    BOOST_CHECK_EQUAL(stats.epochs, 5);
    BOOST_CHECK_EQUAL(stats.gradient_steps, 5);
    BOOST_CHECK_EQUAL(stats.skipped_steps, 0);
    BOOST_CHECK_GT(agent.model_.forward(state).probabilities[3], before);
    BOOST_CHECK(!agent.instability_flagged());
}

BOOST_AUTO_TEST_CASE(TestNegativeAdvantageLowersActionProbability) {
    Agent agent(small_agent(3));
    Eigen::VectorXf state;
    Trajectory batch = single_state_batch(agent, 1, 8, state);
    const float before = agent.model_.forward(state).probabilities[1];

    PolicyOptimizer optimizer(fixed_ppo(4));
    optimizer.update(agent, batch, std::vector<float>(8, -1.0f), std::vector<float>(8, 0.0f), 5, 0.2f);
    BOOST_CHECK_LT(agent.model_.forward(state).probabilities[1], before);
}

BOOST_AUTO_TEST_CASE(TestValueMovesTowardReturns) {
    Agent agent(small_agent(5));
    Eigen::VectorXf state;
    Trajectory batch = single_state_batch(agent, 0, 8, state);
    const float target = agent.model_.forward(state).value + 2.0f;
    const float before = std::abs(agent.model_.forward(state).value - target);

    PolicyOptimizer optimizer(fixed_ppo(6));
    optimizer.update(agent, batch, std::vector<float>(8, 0.0f), std::vector<float>(8, target), 10, 0.2f);
    BOOST_CHECK_LT(std::abs(agent.model_.forward(state).value - target), before);
}

BOOST_AUTO_TEST_CASE(TestNonFiniteStepSkippedAndFlagged) {
    Agent agent(small_agent(7));
    Eigen::VectorXf state;
    Trajectory batch = single_state_batch(agent, 0, 4, state);
    const Eigen::MatrixXf weights_before = agent.model_.trunk_.weights_[0];

    std::vector<float> advantages(4, 1.0f);
    advantages[2] = std::numeric_limits<float>::quiet_NaN();
    PolicyOptimizer optimizer(fixed_ppo(8));
    UpdateStats stats = optimizer.update(agent, batch, advantages, std::vector<float>(4, 1.0f), 3, 0.2f);

    BOOST_CHECK_EQUAL(stats.gradient_steps, 0);
    BOOST_CHECK_EQUAL(stats.skipped_steps, 3);
    BOOST_CHECK(agent.instability_flagged());
    BOOST_CHECK((agent.model_.trunk_.weights_[0].array() == weights_before.array()).all());
}

BOOST_AUTO_TEST_CASE(TestLengthMismatchThrows) {
    Agent agent(small_agent(9));
    Eigen::VectorXf state;
    Trajectory batch = single_state_batch(agent, 0, 4, state);
    PolicyOptimizer optimizer(fixed_ppo(10));
    BOOST_CHECK_THROW(optimizer.update(agent, batch, std::vector<float>(3, 1.0f), std::vector<float>(4, 1.0f), 1, 0.2f),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestEmptyBatchIsNoOp) {
    Agent agent(small_agent(11));
    PolicyOptimizer optimizer(fixed_ppo(12));
    UpdateStats stats = optimizer.update(agent, Trajectory(), {}, {}, 4, 0.2f);
    BOOST_CHECK_EQUAL(stats.gradient_steps, 0);
    BOOST_CHECK_EQUAL(stats.epochs, 0);
}

BOOST_AUTO_TEST_CASE(TestNormalizationSwitchChangesUpdate) {
    // Policy term only, so any movement comes from the advantages.
    PPOConfig ppo = fixed_ppo(22);
    ppo.entropy_coef = 0.0f;
    ppo.value_coef = 0.0f;
    const std::vector<float> constant(8, 1.0f);

    Agent raw_agent(small_agent(23));
    Eigen::VectorXf state;
    Trajectory batch = single_state_batch(raw_agent, 2, 8, state);
    const float before = raw_agent.model_.forward(state).probabilities[2];
    PolicyOptimizer raw(ppo);
    raw.update(raw_agent, batch, constant, constant, 3, 0.2f);
    BOOST_CHECK_GT(raw_agent.model_.forward(state).probabilities[2], before);

    // A constant batch standardizes to all-zero advantages, leaving nothing to follow.
    Agent normalized_agent(small_agent(23));
    ppo.normalize_advantages = true;
    PolicyOptimizer normalized(ppo);
    UpdateStats stats = normalized.update(normalized_agent, batch, constant, constant, 3, 0.2f);
    BOOST_CHECK_EQUAL(stats.gradient_steps, 3);
    BOOST_CHECK_EQUAL(normalized_agent.model_.forward(state).probabilities[2], before);
}

BOOST_AUTO_TEST_CASE(TestMinibatchesPerEpoch) {
    Agent agent(small_agent(13));
    CharacterProfile profile;
    EnvironmentConfig env_config;
    env_config.seed = 14;
    env_config.horizon = 20;
    CharacterEnvironment env(profile, env_config);

    RolloutCollector collector(15);
    Trajectory trajectory = collector.collect(agent, env, 20, false);
    BOOST_REQUIRE_EQUAL(trajectory.size(), 20u);
    BOOST_CHECK(trajectory.steps.back().done);
    BOOST_CHECK_EQUAL(trajectory.bootstrap_value, 0.0f);

    PPOConfig ppo = fixed_ppo(16);
    ppo.minibatch_size = 8;
    ppo.epochs = 2;
    ppo.normalize_advantages = true;
    PolicyOptimizer optimizer(ppo);
    UpdateStats stats = optimizer.train_on(agent, trajectory);
    BOOST_CHECK_EQUAL(stats.epochs, 2);
    BOOST_CHECK_EQUAL(stats.gradient_steps, 6);
    BOOST_CHECK(std::isfinite(stats.policy_loss));
    BOOST_CHECK(std::isfinite(stats.value_loss));
    BOOST_CHECK_GT(stats.entropy, 0.0f);
    BOOST_CHECK_GE(stats.clip_fraction, 0.0f);
    BOOST_CHECK_LE(stats.clip_fraction, 1.0f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ROLLOUT COLLECTION
// ============================================================================

BOOST_AUTO_TEST_SUITE(RolloutTests)

BOOST_AUTO_TEST_CASE(TestTruncatedEpisodeBootstraps) {
    Agent agent(small_agent(17));
    EnvironmentConfig env_config;
    env_config.seed = 18;
    env_config.horizon = 100;
    CharacterEnvironment env(CharacterProfile(), env_config);

    RolloutCollector collector(19);
    Trajectory trajectory = collector.collect(agent, env, 10, false);
    BOOST_REQUIRE_EQUAL(trajectory.size(), 10u);
    BOOST_CHECK(!trajectory.steps.back().done);
    BOOST_CHECK_SMALL(trajectory.bootstrap_value - agent.model_.forward(env.observe()).value, 1e-6f);
    for (const TrajectoryStep& step : trajectory.steps) {
        BOOST_CHECK_LE(step.log_prob, 0.0f);
        BOOST_CHECK_GE(step.action, 0);
        BOOST_CHECK_LT(step.action, 6);
    }
}

BOOST_AUTO_TEST_CASE(TestDimensionMismatchThrows) {
    AgentConfig config = small_agent(20);
    config.model.action_dim = 12;
    Agent agent(config);
    CharacterEnvironment env{CharacterProfile(), EnvironmentConfig()};
    RolloutCollector collector(21);
    BOOST_CHECK_THROW(collector.collect(agent, env, 5, false), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

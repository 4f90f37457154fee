#define BOOST_TEST_MODULE PolicyValueModelTests
#include <boost/test/unit_test.hpp>

#include "agent.h"
#include "errors.h"
#include "policy_value_model.h"

#include <cmath>
#include <cstdint>
#include <random>
#include <sstream>

using namespace Mirage;

constexpr float EPSILON = 1e-5f;

namespace {

ModelConfig small_config(unsigned int seed, int action_dim = 6) {
    ModelConfig config;
    config.state_dim = 20;
    config.action_dim = action_dim;
    config.hidden_dims = {16, 16};
    config.seed = seed;
    return config;
}

Eigen::VectorXf random_state(std::mt19937& gen, float scale = 1.0f) {
    std::uniform_real_distribution<float> dist(-scale, scale);
    Eigen::VectorXf s(20);
    for (int i = 0; i < s.size(); ++i) s[i] = dist(gen);
    return s;
}

float log_prob_of(const PolicyValueModel& model, const Eigen::VectorXf& state, int action) {
    return std::log(model.forward(state).probabilities[action]);
}

} // namespace

// ============================================================================
// FORWARD PASS
// ============================================================================

BOOST_AUTO_TEST_SUITE(ForwardTests)

BOOST_AUTO_TEST_CASE(TestProbabilitiesFormDistribution) {
    PolicyValueModel model(small_config(7));
    std::mt19937 gen(11);
    for (int trial = 0; trial < 50; ++trial) {
        PolicyOutput out = model.forward(random_state(gen));
        BOOST_REQUIRE_EQUAL(out.probabilities.size(), 6);
        BOOST_CHECK_SMALL(out.probabilities.sum() - 1.0f, EPSILON);
        BOOST_CHECK_GT(out.probabilities.minCoeff(), 0.0f);
        BOOST_CHECK(std::isfinite(out.value));
    }
}

BOOST_AUTO_TEST_CASE(TestFloorHoldsForExtremeInputs) {
    PolicyValueModel model(small_config(3));
    std::mt19937 gen(5);
    for (int trial = 0; trial < 10; ++trial) {
        PolicyOutput out = model.forward(random_state(gen, 1e4f));
        BOOST_CHECK_SMALL(out.probabilities.sum() - 1.0f, EPSILON);
        BOOST_CHECK_GE(out.probabilities.minCoeff(), model.config().probability_floor * 0.999f);
        BOOST_CHECK(out.probabilities.allFinite());
    }
}

BOOST_AUTO_TEST_CASE(TestSameSeedSameModel) {
    PolicyValueModel a(small_config(42));
    PolicyValueModel b(small_config(42));
    std::mt19937 gen(1);
    Eigen::VectorXf s = random_state(gen);
    BOOST_CHECK_SMALL((a.forward(s).probabilities - b.forward(s).probabilities).cwiseAbs().maxCoeff(), 1e-7f);
}

BOOST_AUTO_TEST_CASE(TestDeterministicSelectionIsArgmax) {
    PolicyValueModel model(small_config(9));
    std::mt19937 gen(2);
    for (int trial = 0; trial < 20; ++trial) {
        Eigen::VectorXf s = random_state(gen);
        ActionSample sample = model.select_action(s, true, gen);
        Eigen::Index best = 0;
        model.forward(s).probabilities.maxCoeff(&best);
        BOOST_CHECK_EQUAL(sample.action, static_cast<int>(best));
        BOOST_CHECK_SMALL(sample.log_prob - std::log(sample.probabilities[sample.action]), EPSILON);
    }
}

BOOST_AUTO_TEST_CASE(TestSampledActionsInRange) {
    PolicyValueModel model(small_config(10, 12));
    std::mt19937 gen(3);
    Eigen::VectorXf s = random_state(gen);
    for (int trial = 0; trial < 200; ++trial) {
        int a = model.select_action(s, false, gen).action;
        BOOST_CHECK_GE(a, 0);
        BOOST_CHECK_LT(a, 12);
    }
}

BOOST_AUTO_TEST_CASE(TestInvalidConfigRejected) {
    ModelConfig bad = small_config(1);
    bad.action_dim = 1;
    BOOST_CHECK_THROW(PolicyValueModel{bad}, ConfigurationError);
    bad = small_config(1);
    bad.hidden_dims.clear();
    BOOST_CHECK_THROW(PolicyValueModel{bad}, ConfigurationError);
    bad = small_config(1);
    bad.probability_floor = 0.5f;
    BOOST_CHECK_THROW(PolicyValueModel{bad}, ConfigurationError);
    // A zero floor would let a saturated softmax produce log(0).
    bad = small_config(1);
    bad.probability_floor = 0.0f;
    BOOST_CHECK_THROW(PolicyValueModel{bad}, ConfigurationError);
    bad.probability_floor = -1e-6f;
    BOOST_CHECK_THROW(validate_model_config(bad), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// GRADIENTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(GradientTests)

// The policy head's output bias adds straight onto the logits, so its finite difference is the
// logit derivative.
BOOST_AUTO_TEST_CASE(TestLogProbGradientMatchesFiniteDifference) {
    PolicyValueModel model(small_config(21));
    std::mt19937 gen(4);
    Eigen::VectorXf s = random_state(gen);
    const int action = 2;

    ModelTrace trace;
    PolicyOutput out = model.forward(s, &trace);
    Eigen::VectorXf analytic = model.log_prob_gradient(trace, out.probabilities, action);

    const float h = 1e-2f;
    for (int k = 0; k < model.action_dim(); ++k) {
        PolicyValueModel plus = model;
        PolicyValueModel minus = model;
        plus.policy_head_.biases_.back()[k] += h;
        minus.policy_head_.biases_.back()[k] -= h;
        const float numeric = (log_prob_of(plus, s, action) - log_prob_of(minus, s, action)) / (2.0f * h);
        BOOST_CHECK_SMALL(analytic[k] - numeric, 2e-3f);
    }
}

BOOST_AUTO_TEST_CASE(TestEntropyGradientMatchesFiniteDifference) {
    PolicyValueModel model(small_config(22));
    std::mt19937 gen(6);
    Eigen::VectorXf s = random_state(gen);

    ModelTrace trace;
    PolicyOutput out = model.forward(s, &trace);
    Eigen::VectorXf analytic = model.entropy_gradient(trace, out.probabilities);

    const float h = 1e-2f;
    for (int k = 0; k < model.action_dim(); ++k) {
        PolicyValueModel plus = model;
        PolicyValueModel minus = model;
        plus.policy_head_.biases_.back()[k] += h;
        minus.policy_head_.biases_.back()[k] -= h;
        const float numeric = (PolicyValueModel::entropy(plus.forward(s).probabilities) -
                               PolicyValueModel::entropy(minus.forward(s).probabilities)) / (2.0f * h);
        BOOST_CHECK_SMALL(analytic[k] - numeric, 2e-3f);
    }
}

BOOST_AUTO_TEST_CASE(TestBackwardShapesAndFiniteness) {
    PolicyValueModel model(small_config(23));
    std::mt19937 gen(8);
    ModelTrace trace;
    PolicyOutput out = model.forward(random_state(gen), &trace);

    ModelGradients grads;
    grads.set_zero_like(model);
    model.backward(trace, model.log_prob_gradient(trace, out.probabilities, 0), 0.5f, grads);
    BOOST_CHECK(grads.all_finite());
    BOOST_CHECK_GT(grads.squared_norm(), 0.0f);
    BOOST_REQUIRE_EQUAL(grads.trunk.weights.size(), model.trunk_.weights_.size());
    for (size_t i = 0; i < grads.trunk.weights.size(); ++i) {
        BOOST_CHECK_EQUAL(grads.trunk.weights[i].rows(), model.trunk_.weights_[i].rows());
        BOOST_CHECK_EQUAL(grads.trunk.weights[i].cols(), model.trunk_.weights_[i].cols());
    }
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// PERSISTENCE
// ============================================================================

BOOST_AUTO_TEST_SUITE(PersistenceTests)

BOOST_AUTO_TEST_CASE(TestAgentRoundTripGivesIdenticalDistributions) {
    AgentConfig config;
    config.model = small_config(31);
    Agent original(config);

    std::stringstream blob(std::ios::in | std::ios::out | std::ios::binary);
    BOOST_REQUIRE(original.save(blob));
    std::unique_ptr<Agent> restored = Agent::load(blob, AgentConfig());
    BOOST_REQUIRE(restored);
    BOOST_CHECK_EQUAL(restored->state_dim(), 20);
    BOOST_CHECK_EQUAL(restored->action_dim(), 6);
    BOOST_CHECK(restored->model_.config().hidden_dims == config.model.hidden_dims);

    std::mt19937 gen(12);
    for (int trial = 0; trial < 10; ++trial) {
        Eigen::VectorXf s = random_state(gen);
        PolicyOutput a = original.model_.forward(s);
        PolicyOutput b = restored->model_.forward(s);
        BOOST_CHECK_EQUAL((a.probabilities - b.probabilities).cwiseAbs().maxCoeff(), 0.0f);
        BOOST_CHECK_EQUAL(a.value, b.value);
    }
}

BOOST_AUTO_TEST_CASE(TestCorruptBlobRejected) {
    std::stringstream bad(std::string("NOTANAGENTBLOB"), std::ios::in | std::ios::binary);
    BOOST_CHECK(!Agent::load(bad, AgentConfig()));

    AgentConfig config;
    config.model = small_config(32);
    Agent original(config);
    std::stringstream blob(std::ios::in | std::ios::out | std::ios::binary);
    BOOST_REQUIRE(original.save(blob));
    std::string truncated = blob.str().substr(0, blob.str().size() / 2);
    std::stringstream half(truncated, std::ios::in | std::ios::binary);
    BOOST_CHECK(!Agent::load(half, AgentConfig()));
}

BOOST_AUTO_TEST_CASE(TestOptimizerStateMustMatchModel) {
    AgentConfig wide;
    wide.model = small_config(42);
    Agent agent(wide);
    AgentConfig narrow;
    narrow.model = small_config(43);
    narrow.model.state_dim = 10;
    Agent other(narrow);

    // Header and parameters of the 20-input agent followed by the 10-input agent's trunk moments.
    std::stringstream params(std::ios::in | std::ios::out | std::ios::binary);
    BOOST_REQUIRE(agent.model_.save_parameters(params));
    std::stringstream full(std::ios::in | std::ios::out | std::ios::binary);
    BOOST_REQUIRE(agent.save(full));
    const size_t header = 8 + 4 * sizeof(uint32_t) + wide.model.hidden_dims.size() * sizeof(uint32_t) + sizeof(float);
    std::stringstream spliced(std::ios::in | std::ios::out | std::ios::binary);
    spliced << full.str().substr(0, header + params.str().size());
    BOOST_REQUIRE(other.trunk_optimizer_.save_state(spliced));
    BOOST_REQUIRE(agent.policy_optimizer_.save_state(spliced));
    BOOST_REQUIRE(agent.value_optimizer_.save_state(spliced));
    BOOST_CHECK(!Agent::load(spliced, AgentConfig()));

    AdamOptimizer adam;
    adam.initialize(agent.model_.trunk_);
    std::stringstream moments(std::ios::in | std::ios::out | std::ios::binary);
    BOOST_REQUIRE(other.trunk_optimizer_.save_state(moments));
    BOOST_CHECK(!adam.load_state(moments, agent.model_.trunk_));
    BOOST_CHECK_EQUAL(adam.m_weights_[0].cols(), 20);
    BOOST_CHECK_EQUAL(adam.t_, 0);
}

BOOST_AUTO_TEST_CASE(TestLoadParametersRejectsShapeMismatch) {
    PolicyValueModel a(small_config(40));
    ModelConfig other = small_config(41);
    other.hidden_dims = {8, 8};
    PolicyValueModel b(other);

    std::stringstream blob(std::ios::in | std::ios::out | std::ios::binary);
    BOOST_REQUIRE(b.save_parameters(blob));
    std::mt19937 gen(13);
    Eigen::VectorXf s = random_state(gen);
    const Eigen::VectorXf before = a.forward(s).probabilities;
    BOOST_CHECK(!a.load_parameters(blob));
    BOOST_CHECK_EQUAL((a.forward(s).probabilities - before).cwiseAbs().maxCoeff(), 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()

#define BOOST_TEST_MODULE CharacterEngineTests
#include <boost/test/unit_test.hpp>

#include "character_engine.h"
#include "errors.h"

#include <chrono>
#include <filesystem>
#include <random>
#include <set>
#include <thread>

using namespace Mirage;

// ============================================================================
// Test Fixture
// ============================================================================

class EngineFixture {
public:
    EngineFixture() {
        std::random_device rd;
        dir = std::filesystem::temp_directory_path() / ("mirage_engine_" + std::to_string(rd()));
        config.agent.model.hidden_dims = {16, 16};
        config.agent.model.seed = 100;
        config.ppo.epochs = 2;
        config.ppo.seed = 200;
        config.environment.seed = 300;
        config.storage_dir = dir.string();
    }

    ~EngineFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

protected:
    std::filesystem::path dir;
    EngineConfig config;

    static CharacterProfile character(const std::string& key, float agreeableness = 0.5f) {
        CharacterProfile p;
        p.identity_key = key;
        p.personality.agreeableness = agreeableness;
        return p;
    }

    static TrainingRequest training(const std::string& key, int episodes, int steps) {
        TrainingRequest r;
        r.identity_key = key;
        r.episodes = episodes;
        r.steps_per_episode = steps;
        return r;
    }
};

// ============================================================================
// TRAINING
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TrainingTests, EngineFixture)

BOOST_AUTO_TEST_CASE(TestTrainRunsEveryEpisodeAndSaves) {
    CharacterEngine engine(config);
    TrainingResult r = engine.train(character("iris"), training("iris", 3, 15));
    BOOST_CHECK_EQUAL(r.episodes_completed, 3);
    BOOST_CHECK_EQUAL(r.reward_history.size(), 3u);
    BOOST_CHECK_CLOSE(r.avg_episode_length, 15.0f, 1e-4f);
    BOOST_CHECK(!r.cancelled);
    BOOST_CHECK(r.saved);
    BOOST_CHECK_EQUAL(r.skipped_updates, 0);
    BOOST_CHECK_GT(r.final_entropy, 0.0f);
    BOOST_CHECK(std::filesystem::exists(dir / "agent_iris.bin"));
}

BOOST_AUTO_TEST_CASE(TestEmptyRequestKeyUsesProfileKey) {
    CharacterEngine engine(config);
    engine.train(character("jade"), training("", 1, 5));
    BOOST_CHECK(engine.registry().find("jade"));
}

BOOST_AUTO_TEST_CASE(TestTrainedAgentSurvivesRestart) {
    Eigen::VectorXf fixed_state = Eigen::VectorXf::Constant(20, 0.3f);
    Eigen::VectorXf expected;
    {
        CharacterEngine engine(config);
        engine.train(character("kate"), training("kate", 2, 10));
        expected = engine.registry().find("kate")->model_.forward(fixed_state).probabilities;
    }
    CharacterEngine restarted(config);
    std::shared_ptr<Agent> agent = restarted.registry().get_or_create("kate", 20, 6);
    BOOST_CHECK_EQUAL((agent->model_.forward(fixed_state).probabilities - expected).cwiseAbs().maxCoeff(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestCancelledBeforeStart) {
    CharacterEngine engine(config);
    CancellationToken token;
    token.cancel();
    TrainingResult r = engine.train(character("liam"), training("liam", 5, 10), &token);
    BOOST_CHECK(r.cancelled);
    BOOST_CHECK_EQUAL(r.episodes_completed, 0);
    BOOST_CHECK(r.reward_history.empty());
    BOOST_CHECK(!r.saved);
    BOOST_CHECK(!std::filesystem::exists(dir / "agent_liam.bin"));
}

BOOST_AUTO_TEST_CASE(TestExpiredTimeoutStopsTraining) {
    CharacterEngine engine(config);
    TrainingResult r = engine.train(character("mona"), training("mona", 5, 10), nullptr, std::chrono::milliseconds(0));
    BOOST_CHECK(r.cancelled);
    BOOST_CHECK_EQUAL(r.episodes_completed, 0);
}

BOOST_AUTO_TEST_CASE(TestInvalidRequestRejected) {
    CharacterEngine engine(config);
    BOOST_CHECK_THROW(engine.train(character("ned"), training("ned", 0, 10)), ConfigurationError);
    BOOST_CHECK_THROW(engine.train(character("ned"), training("ned", 2, 0)), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(TestInvalidEngineConfigRejected) {
    EngineConfig bad = config;
    bad.ppo.clip_ratio = 2.0f;
    BOOST_CHECK_THROW(CharacterEngine{bad}, ConfigurationError);
}

BOOST_AUTO_TEST_CASE(TestConcurrentTrainingOfDifferentCharacters) {
    CharacterEngine engine(config);
    const std::vector<std::string> keys{"olga", "pete", "quin", "rosa"};
    std::vector<TrainingResult> results(keys.size());
    std::vector<std::thread> threads;
    for (size_t i = 0; i < keys.size(); ++i) {
        threads.emplace_back([&, i] { results[i] = engine.train(character(keys[i]), training(keys[i], 2, 8)); });
    }
    for (auto& t : threads) t.join();
    for (size_t i = 0; i < keys.size(); ++i) {
        BOOST_CHECK_EQUAL(results[i].episodes_completed, 2);
        BOOST_CHECK(results[i].saved);
    }
    BOOST_CHECK_EQUAL(engine.registry().size(), keys.size());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// INFERENCE
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SimulationTests, EngineFixture)

BOOST_AUTO_TEST_CASE(TestSimulationHistory) {
    CharacterEngine engine(config);
    InferenceRequest request;
    request.identity_key = "sara";
    request.steps = 10;
    SimulationResult r = engine.simulate(character("sara"), request);
    BOOST_REQUIRE_EQUAL(r.action_history.size(), 10u);
    float total = 0.0f;
    std::set<std::string> labels;
    for (const ActionSpec& spec : solo_action_set()) labels.insert(spec.label);
    for (size_t i = 0; i < r.action_history.size(); ++i) {
        BOOST_CHECK_EQUAL(r.action_history[i].step, static_cast<int>(i));
        BOOST_CHECK(labels.count(r.action_history[i].action_label) == 1);
        total += r.action_history[i].reward;
    }
    BOOST_CHECK_CLOSE(r.total_reward, total, 1e-3f);
    BOOST_CHECK_EQUAL(r.final_state.step, 10);
}

BOOST_AUTO_TEST_CASE(TestSimulationDoesNotPersist) {
    CharacterEngine engine(config);
    InferenceRequest request;
    request.identity_key = "tara";
    request.steps = 3;
    engine.simulate(character("tara"), request);
    BOOST_CHECK(!std::filesystem::exists(dir / "agent_tara.bin"));
}

BOOST_AUTO_TEST_CASE(TestScenarioShapesSituation) {
    CharacterEngine engine(config);
    InferenceRequest request;
    request.identity_key = "uma";
    request.steps = 1;
    SimulationResult r = engine.simulate(character("uma"), request, Scenario::from_description("sudden danger"));
    // One drift step of at most 0.05 away from the preset.
    BOOST_CHECK_GE(r.final_state.pressures.threat, 0.75f - 1e-4f);
    BOOST_CHECK_LE(r.final_state.pressures.threat, 0.85f + 1e-4f);
}

BOOST_AUTO_TEST_CASE(TestInvalidStepCountRejected) {
    CharacterEngine engine(config);
    InferenceRequest request;
    request.steps = 0;
    BOOST_CHECK_THROW(engine.simulate(character("vic"), request), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// PAIRWISE ENCOUNTERS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(EncounterTests, EngineFixture)

BOOST_AUTO_TEST_CASE(TestInteractionRecordsBothSides) {
    CharacterEngine engine(config);
    InteractionResult r = engine.interact(character("wes", 0.8f), character("xia", 0.2f), 3);
    BOOST_CHECK_EQUAL(r.first_actions.size(), 3u);
    BOOST_CHECK_EQUAL(r.second_actions.size(), 3u);
    BOOST_CHECK(r.outcome == classify_interaction(r.first_total, r.second_total));
    BOOST_CHECK(r.relationship == classify_relationship(r.first_total, r.second_total));
    BOOST_CHECK(engine.registry().find(CharacterEngine::interaction_key("wes")));
    BOOST_CHECK(engine.registry().find(CharacterEngine::interaction_key("xia")));
    // Pairwise agents never collide with the solo agent of the same character.
    BOOST_CHECK(!engine.registry().find("wes"));
}

BOOST_AUTO_TEST_CASE(TestDuelFlowAlternates) {
    CharacterEngine engine(config);
    DuelResult r = engine.duel(character("yara"), character("zane"), 4);
    BOOST_REQUIRE_EQUAL(r.flow.size(), 8u);
    float first = 0.0f, second = 0.0f;
    for (size_t i = 0; i < r.flow.size(); ++i) {
        BOOST_CHECK_EQUAL(r.flow[i].actor_key, i % 2 == 0 ? "yara" : "zane");
        BOOST_CHECK_EQUAL(r.flow[i].round, static_cast<int>(i / 2) + 1);
        (i % 2 == 0 ? first : second) += r.flow[i].reward;
    }
    BOOST_CHECK_CLOSE(r.first_total, first, 1e-3f);
    BOOST_CHECK_CLOSE(r.second_total, second, 1e-3f);
    BOOST_CHECK(engine.registry().find(CharacterEngine::duel_key("yara")));
}

BOOST_AUTO_TEST_CASE(TestInvalidRoundCountRejected) {
    CharacterEngine engine(config);
    BOOST_CHECK_THROW(engine.interact(character("a"), character("b"), 0), ConfigurationError);
    BOOST_CHECK_THROW(engine.duel(character("a"), character("b"), -1), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// CLASSIFICATION
// ============================================================================

BOOST_AUTO_TEST_SUITE(ClassificationTests)

BOOST_AUTO_TEST_CASE(TestInteractionOutcome) {
    BOOST_CHECK(classify_interaction(6.0f, 2.0f) == InteractionOutcome::FIRST_DOMINATES);
    BOOST_CHECK(classify_interaction(2.0f, 6.0f) == InteractionOutcome::SECOND_DOMINATES);
    BOOST_CHECK(classify_interaction(3.0f, 2.5f) == InteractionOutcome::MUTUAL_BENEFIT);
    BOOST_CHECK(classify_interaction(-2.0f, -2.5f) == InteractionOutcome::MUTUAL_LOSS);
    BOOST_CHECK(classify_interaction(-1.0f, -6.0f) == InteractionOutcome::MUTUAL_LOSS);
    BOOST_CHECK(classify_interaction(2.0f, -1.0f) == InteractionOutcome::FIRST_DOMINATES);
    BOOST_CHECK(classify_interaction(0.0f, 0.0f) == InteractionOutcome::UNDETERMINED);
    BOOST_CHECK_EQUAL(std::string(to_string(InteractionOutcome::MUTUAL_BENEFIT)), "mutual benefit");
}

BOOST_AUTO_TEST_CASE(TestRelationshipChange) {
    BOOST_CHECK(classify_relationship(6.0f, 6.0f) == RelationshipChange::STRONGLY_IMPROVED);
    BOOST_CHECK(classify_relationship(3.0f, 2.0f) == RelationshipChange::SLIGHTLY_IMPROVED);
    BOOST_CHECK(classify_relationship(1.0f, -1.0f) == RelationshipChange::UNCHANGED);
    BOOST_CHECK(classify_relationship(-3.0f, -2.0f) == RelationshipChange::SLIGHTLY_WORSENED);
    BOOST_CHECK(classify_relationship(-6.0f, -6.0f) == RelationshipChange::STRONGLY_WORSENED);
    BOOST_CHECK_EQUAL(std::string(to_string(RelationshipChange::UNCHANGED)), "unchanged");
}

BOOST_AUTO_TEST_SUITE_END()

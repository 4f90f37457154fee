#include "character_engine.h"
#include "config.h"
#include "errors.h"
#include "logging.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

void usage(const char* argv0) {
    std::fprintf(stderr, "usage: %s <engine.yaml> <profile.yaml> [episodes] [steps_per_episode]\n", argv0);
}

bool parse_positive(const char* text, int& out) {
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || v <= 0 || v > 1000000) return false;
    out = static_cast<int>(v);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3 || argc > 5) {
        usage(argv[0]);
        return 2;
    }

    Mirage::TrainingRequest request;
    if (argc > 3 && !parse_positive(argv[3], request.episodes)) {
        usage(argv[0]);
        return 2;
    }
    if (argc > 4 && !parse_positive(argv[4], request.steps_per_episode)) {
        usage(argv[0]);
        return 2;
    }

    try {
        Mirage::EngineConfig config = Mirage::load_engine_config(argv[1]);
        if (!Mirage::set_log_level(config.log_level)) {
            Mirage::logger()->warn("unknown log level '{}', keeping 'info'", config.log_level);
        }
        Mirage::CharacterProfile profile = Mirage::load_profile(argv[2]);
        if (profile.identity_key.empty()) {
            std::fprintf(stderr, "profile %s has no identity_key\n", argv[2]);
            return 2;
        }
        request.identity_key = profile.identity_key;

        Mirage::CharacterEngine engine(config);
        Mirage::TrainingResult result = engine.train(profile, request);

        std::cout << "character: " << profile.identity_key << "\n";
        std::cout << "episodes:  " << result.episodes_completed << " (avg length " << result.avg_episode_length << ")\n";
        for (size_t i = 0; i < result.reward_history.size(); ++i) {
            std::cout << "  episode " << i << ": reward " << result.reward_history[i] << "\n";
        }
        std::cout << "policy loss " << result.final_policy_loss << ", value loss " << result.final_value_loss
                  << ", entropy " << result.final_entropy << ", clip fraction " << result.final_clip_fraction << "\n";
        if (result.skipped_updates > 0) std::cout << "skipped unstable updates: " << result.skipped_updates << "\n";
        std::cout << (result.saved ? "agent saved to " + config.storage_dir : std::string("agent NOT saved")) << "\n";

        Mirage::InferenceRequest inference;
        inference.identity_key = profile.identity_key;
        inference.steps = 10;
        inference.deterministic = true;
        Mirage::SimulationResult sim = engine.simulate(profile, inference);
        std::cout << "greedy rollout (" << sim.action_history.size() << " steps, reward " << sim.total_reward << "):\n";
        for (const Mirage::ActionRecord& rec : sim.action_history) {
            std::cout << "  " << rec.step << " " << rec.action_label << " -> " << rec.outcome_label << " (" << rec.reward << ")\n";
        }
        std::cout << "final: health " << sim.final_state.health << ", happiness " << sim.final_state.happiness
                  << ", stress " << sim.final_state.stress << ", trust " << sim.final_state.trust << "\n";
    } catch (const Mirage::MirageError& e) {
        Mirage::logger()->error("{}", e.what());
        return 1;
    }
    return 0;
}

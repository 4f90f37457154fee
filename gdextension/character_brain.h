#ifndef MIRAGE_CHARACTER_BRAIN_H
#define MIRAGE_CHARACTER_BRAIN_H

#include <godot_cpp/classes/ref_counted.hpp>
#include <godot_cpp/core/binder_common.hpp>
#include <godot_cpp/variant/array.hpp>
#include <godot_cpp/variant/dictionary.hpp>
#include <godot_cpp/variant/packed_float32_array.hpp>
#include <godot_cpp/variant/string.hpp>

#include <Eigen/Dense>

#include <memory>
#include <random>

namespace Mirage {
class CharacterEngine;
struct CharacterProfile;
struct EpisodicState;
} // namespace Mirage

// Scripting surface of the engine: per-character training, simulation and inference.
class CharacterBrain : public godot::RefCounted {
    GDCLASS(CharacterBrain, godot::RefCounted);

private:
    std::unique_ptr<Mirage::CharacterEngine> engine_;
    std::mt19937 gen_;
    bool initialized_ = false;

protected:
    static void _bind_methods();

public:
    CharacterBrain();
    ~CharacterBrain();

    bool initialize(const godot::Dictionary& config);
    godot::Dictionary train(const godot::Dictionary& profile, int episodes, int steps_per_episode);
    godot::Dictionary simulate(const godot::Dictionary& profile, int steps, bool deterministic, const godot::String& scenario);
    // Cached, stored, or fresh agent for the key; -1 for a wrong-sized observation or an error.
    int get_action(const godot::String& identity_key, const godot::PackedFloat32Array& observation, bool deterministic);
    bool save_agent(const godot::String& identity_key, bool confirm_after_instability);

    static Mirage::CharacterProfile profile_from_dictionary(const godot::Dictionary& profile);
    static godot::Dictionary episodic_state_to_dictionary(const Mirage::EpisodicState& state);
    static Eigen::VectorXf packed_array_to_eigen(const godot::PackedFloat32Array& p_array);
};

#endif

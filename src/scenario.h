#ifndef MIRAGE_SCENARIO_H
#define MIRAGE_SCENARIO_H

#include "character.h"

#include <optional>
#include <string>

namespace Mirage {

// Situation preset applied on top of the baseline episodic state at every reset.
struct Scenario {
    std::optional<float> threat;
    std::optional<float> opportunity;
    std::optional<float> time_pressure;
    std::optional<float> social_pressure;
    std::optional<float> joy;
    std::optional<float> anger;
    std::optional<float> sadness;
    std::optional<float> fear;

    // Keyword match over a free-form description (case-insensitive).
    static Scenario from_description(const std::string& description);

    bool empty() const;
    void apply(EpisodicState& state) const;
};

} // namespace Mirage

#endif

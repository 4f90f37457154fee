#include "scenario.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace Mirage {

namespace {

bool mentions_any(const std::string& text, std::initializer_list<const char*> words) {
    for (const char* w : words) {
        if (text.find(w) != std::string::npos) return true;
    }
    return false;
}

} // namespace

Scenario Scenario::from_description(const std::string& description) {
    std::string text = description;
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    Scenario s;
    if (mentions_any(text, {"danger", "threat", "battle", "combat"})) {
        s.threat = 0.8f;
        s.fear = 0.6f;
    }
    if (mentions_any(text, {"opportunit", "luck", "discover"})) {
        s.opportunity = 0.8f;
        s.joy = 0.6f;
    }
    if (mentions_any(text, {"urgent", "deadline", "time limit"})) {
        s.time_pressure = 0.8f;
    }
    if (mentions_any(text, {"social", "crowd", "public"})) {
        s.social_pressure = 0.7f;
    }
    if (mentions_any(text, {"anger", "angry", "betray"})) {
        s.anger = 0.7f;
    }
    if (mentions_any(text, {"sad", "loss", "grief"})) {
        s.sadness = 0.7f;
    }
    return s;
}

bool Scenario::empty() const {
    return !threat && !opportunity && !time_pressure && !social_pressure && !joy && !anger && !sadness && !fear;
}

void Scenario::apply(EpisodicState& state) const {
    if (threat) state.pressures.threat = *threat;
    if (opportunity) state.pressures.opportunity = *opportunity;
    if (time_pressure) state.pressures.time_pressure = *time_pressure;
    if (social_pressure) state.pressures.social_pressure = *social_pressure;
    if (joy) state.emotions.joy = *joy;
    if (anger) state.emotions.anger = *anger;
    if (sadness) state.emotions.sadness = *sadness;
    if (fear) state.emotions.fear = *fear;
}

} // namespace Mirage

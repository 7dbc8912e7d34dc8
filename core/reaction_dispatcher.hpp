#pragma once

#include <random>
#include <string>

#include "detection/detection_state_machine.hpp"
#include "sound_catalog.hpp"
#include "status_codes.hpp"

namespace peckwatch {

struct PlayInstruction {
    std::string category;
    std::string asset;
    std::string url;
};

// Maps triggered detections to reaction sounds. Holds no state of its own;
// the caller supplies the session's mode and random source.
class ReactionDispatcher {
public:
    explicit ReactionDispatcher(const SoundCatalog& catalog) : catalog_(catalog) {}

    // Ok with `out` filled when a sound should play. NoReaction when the
    // event did not trigger or the mode is SILENT, EmptyCategory when the
    // mode has no playable category left.
    Status dispatch(const dsp::DetectionEvent& event, ReactionMode mode, std::mt19937& rng,
                    PlayInstruction& out) const;

    // Manual test sound. Ignores detection state and SILENT; falls back to
    // any non-empty category when the mode group has none.
    Status test_sound(ReactionMode mode, std::mt19937& rng, PlayInstruction& out) const;

private:
    const SoundCatalog& catalog_;

    Status play_from(const std::string& category, std::mt19937& rng, PlayInstruction& out) const;
};

} // namespace peckwatch

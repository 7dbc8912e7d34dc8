#include "reaction_dispatcher.hpp"

namespace peckwatch {

Status ReactionDispatcher::play_from(const std::string& category, std::mt19937& rng, PlayInstruction& out) const {
    std::string asset;
    Status s = catalog_.pick(category, rng, asset);
    if (!ok(s)) return s;
    out.category = category;
    out.asset = asset;
    out.url = catalog_.asset_url(category, asset);
    return Status::Ok;
}

Status ReactionDispatcher::dispatch(const dsp::DetectionEvent& event, ReactionMode mode, std::mt19937& rng,
                                    PlayInstruction& out) const {
    if (!event.triggered || mode == ReactionMode::Silent) return Status::NoReaction;
    std::string category;
    if (!catalog_.resolve(mode, rng, category)) return Status::EmptyCategory;
    return play_from(category, rng, out);
}

Status ReactionDispatcher::test_sound(ReactionMode mode, std::mt19937& rng, PlayInstruction& out) const {
    std::string category;
    if (mode == ReactionMode::Silent || !catalog_.resolve(mode, rng, category)) {
        if (!catalog_.resolve(ReactionMode::Mixed, rng, category)) return Status::EmptyCategory;
    }
    return play_from(category, rng, out);
}

} // namespace peckwatch

#include "OverlapResolver.hpp"

#include <algorithm>

namespace {

bool largerFirst(const DetectedObject& a, const DetectedObject& b) {
    if (a.diameterPx != b.diameterPx) {
        return a.diameterPx > b.diameterPx;
    }
    return a.id < b.id;
}

} // namespace

OverlapResolver::OverlapResolver(const Config& config)
    : config_(config) {}

bool OverlapResolver::overlaps(const DetectedObject& kept, const DetectedObject& candidate) const {
    return centerDistance(kept, candidate) < config_.tolerance * kept.diameterPx;
}

std::vector<DetectedObject> OverlapResolver::resolve(std::vector<DetectedObject> candidates) const {
    std::sort(candidates.begin(), candidates.end(), largerFirst);

    std::vector<DetectedObject> kept;
    kept.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        const bool duplicate = std::any_of(kept.begin(), kept.end(),
                                           [&](const DetectedObject& existing) {
                                               return overlaps(existing, candidate);
                                           });
        if (!duplicate) {
            kept.push_back(candidate);
        }
    }

    return kept;
}

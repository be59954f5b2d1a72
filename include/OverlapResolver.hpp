#pragma once

#include "DetectedObject.hpp"

#include <vector>

// Collapses candidates that describe the same physical object onto the
// largest member of their cluster.
class OverlapResolver {
public:
    struct Config {
        double tolerance;   // Fraction of the kept circle's diameter

        Config()
            : tolerance(0.3) {}
    };

    explicit OverlapResolver(const Config& config = Config());

    // Candidates are visited by diameter descending, id ascending. A candidate is
    // dropped when its center lies strictly closer than tolerance * diameterPx of
    // an already kept object. Kept objects retain their original ids.
    std::vector<DetectedObject> resolve(std::vector<DetectedObject> candidates) const;

    bool overlaps(const DetectedObject& kept, const DetectedObject& candidate) const;

private:
    Config config_;
};

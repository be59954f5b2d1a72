#include "OverlapResolver.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

namespace {

DetectedObject makeObject(int id, float x, float y, double diameter) {
    DetectedObject object;
    object.id = id;
    object.center = cv::Point2f(x, y);
    object.diameterPx = diameter;
    return object;
}

std::vector<int> idsOf(const std::vector<DetectedObject>& objects) {
    std::vector<int> ids;
    for (const auto& object : objects) {
        ids.push_back(object.id);
    }
    return ids;
}

std::vector<DetectedObject> noisyCandidates() {
    return {
        makeObject(1, 100.0F, 100.0F, 80.0),
        makeObject(2, 104.0F, 98.0F, 60.0),
        makeObject(3, 300.0F, 120.0F, 50.0),
        makeObject(4, 310.0F, 125.0F, 52.0),
        makeObject(5, 500.0F, 400.0F, 30.0),
        makeObject(6, 180.0F, 100.0F, 40.0),
        makeObject(7, 505.0F, 402.0F, 30.0),
    };
}

} // namespace

TEST(OverlapResolverTest, NearlyConcentricSmallerCircleIsDiscarded) {
    const OverlapResolver resolver;
    const auto result = resolver.resolve({makeObject(1, 10.0F, 10.0F, 40.0),
                                          makeObject(2, 12.0F, 11.0F, 38.0)});

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result.front().id, 1);
    EXPECT_DOUBLE_EQ(result.front().diameterPx, 40.0);
}

TEST(OverlapResolverTest, DistantEqualCirclesAreBothKept) {
    const OverlapResolver resolver;
    const auto result = resolver.resolve({makeObject(1, 0.0F, 0.0F, 20.0),
                                          makeObject(2, 100.0F, 100.0F, 20.0)});

    EXPECT_EQ(idsOf(result), (std::vector<int>{1, 2}));
}

TEST(OverlapResolverTest, SingleCandidateIsReturnedUnchanged) {
    for (double tolerance : {0.0, 0.3, 5.0}) {
        OverlapResolver::Config config;
        config.tolerance = tolerance;
        const OverlapResolver resolver(config);

        DetectedObject object = makeObject(7, 12.5F, 8.25F, 33.3);
        object.diameterPhysical = 3.33;
        const auto result = resolver.resolve({object});

        ASSERT_EQ(result.size(), 1u);
        EXPECT_EQ(result.front().id, 7);
        EXPECT_FLOAT_EQ(result.front().center.x, 12.5F);
        EXPECT_FLOAT_EQ(result.front().center.y, 8.25F);
        EXPECT_DOUBLE_EQ(result.front().diameterPx, 33.3);
        ASSERT_TRUE(result.front().diameterPhysical.has_value());
        EXPECT_DOUBLE_EQ(*result.front().diameterPhysical, 3.33);
    }
}

TEST(OverlapResolverTest, EmptyInputYieldsEmptyResult) {
    const OverlapResolver resolver;
    EXPECT_TRUE(resolver.resolve({}).empty());
}

TEST(OverlapResolverTest, ChainWithinReachOfLargestCollapsesOntoIt) {
    const OverlapResolver resolver;
    const auto result = resolver.resolve({makeObject(3, 10.0F, 0.0F, 20.0),
                                          makeObject(1, 0.0F, 0.0F, 40.0),
                                          makeObject(2, 5.0F, 0.0F, 30.0)});

    EXPECT_EQ(idsOf(result), (std::vector<int>{1}));
}

TEST(OverlapResolverTest, ChainMemberOutOfReachOfLargestSurvives) {
    // 2 is absorbed by 1 (10 < 12); 3 is only close to the discarded 2.
    const OverlapResolver resolver;
    const auto result = resolver.resolve({makeObject(1, 0.0F, 0.0F, 40.0),
                                          makeObject(2, 10.0F, 0.0F, 30.0),
                                          makeObject(3, 20.0F, 0.0F, 20.0)});

    EXPECT_EQ(idsOf(result), (std::vector<int>{1, 3}));
}

TEST(OverlapResolverTest, IdenticalCirclesKeepLowerId) {
    const OverlapResolver resolver;
    const auto result = resolver.resolve({makeObject(2, 50.0F, 50.0F, 25.0),
                                          makeObject(1, 50.0F, 50.0F, 25.0)});

    EXPECT_EQ(idsOf(result), (std::vector<int>{1}));
}

TEST(OverlapResolverTest, DistanceEqualToThresholdIsNotAMerge) {
    OverlapResolver::Config config;
    config.tolerance = 0.5;
    const OverlapResolver resolver(config);

    const auto result = resolver.resolve({makeObject(1, 0.0F, 0.0F, 10.0),
                                          makeObject(2, 3.0F, 4.0F, 6.0)});

    EXPECT_EQ(idsOf(result), (std::vector<int>{1, 2}));
}

TEST(OverlapResolverTest, ThresholdUsesKeptDiameterNotCandidateDiameter) {
    // 8 < 0.3 * 30 but 8 >= 0.3 * 20: the larger, kept circle decides.
    const OverlapResolver resolver;
    const auto result = resolver.resolve({makeObject(1, 0.0F, 0.0F, 20.0),
                                          makeObject(2, 8.0F, 0.0F, 30.0)});

    EXPECT_EQ(idsOf(result), (std::vector<int>{2}));
}

TEST(OverlapResolverTest, KeepsOriginalIdsWithGaps) {
    const OverlapResolver resolver;
    const auto result = resolver.resolve(noisyCandidates());

    EXPECT_EQ(idsOf(result), (std::vector<int>{1, 4, 6, 5}));
}

TEST(OverlapResolverTest, ResolvingTwiceChangesNothing) {
    const OverlapResolver resolver;
    const auto once = resolver.resolve(noisyCandidates());
    const auto twice = resolver.resolve(once);

    EXPECT_EQ(idsOf(once), idsOf(twice));
}

TEST(OverlapResolverTest, NeverGrowsAndKeepsLargestOfEachOverlappingPair) {
    const OverlapResolver resolver;
    const auto candidates = noisyCandidates();
    const auto result = resolver.resolve(candidates);

    EXPECT_LE(result.size(), candidates.size());

    for (size_t i = 0; i < result.size(); ++i) {
        for (size_t j = 0; j < result.size(); ++j) {
            if (i != j && result[i].diameterPx >= result[j].diameterPx) {
                EXPECT_FALSE(resolver.overlaps(result[i], result[j]))
                    << "objects " << result[i].id << " and " << result[j].id;
            }
        }
    }

    for (const auto& a : candidates) {
        for (const auto& b : candidates) {
            const bool aFirst = a.diameterPx > b.diameterPx ||
                                (a.diameterPx == b.diameterPx && a.id < b.id);
            if (!aFirst || !resolver.overlaps(a, b)) {
                continue;
            }
            const bool bSurvived = std::any_of(result.begin(), result.end(),
                                               [&](const DetectedObject& o) { return o.id == b.id; });
            const bool aSurvived = std::any_of(result.begin(), result.end(),
                                               [&](const DetectedObject& o) { return o.id == a.id; });
            if (aSurvived) {
                EXPECT_FALSE(bSurvived) << "object " << b.id << " should be absorbed by " << a.id;
            }
        }
    }
}

TEST(OverlapResolverTest, DecisionIsScaleInvariant) {
    const OverlapResolver resolver;
    const auto candidates = noisyCandidates();

    const double factor = 3.5;
    std::vector<DetectedObject> scaled = candidates;
    for (auto& object : scaled) {
        object.center *= static_cast<float>(factor);
        object.diameterPx *= factor;
    }

    const auto original = resolver.resolve(candidates);
    const auto enlarged = resolver.resolve(scaled);

    ASSERT_EQ(idsOf(original), idsOf(enlarged));
    for (size_t i = 0; i < original.size(); ++i) {
        EXPECT_NEAR(enlarged[i].diameterPx, original[i].diameterPx * factor, 1e-9);
    }
}

TEST(OverlapResolverTest, InputOrderDoesNotChangeResult) {
    const OverlapResolver resolver;
    std::vector<DetectedObject> candidates = {
        makeObject(1, 0.0F, 0.0F, 30.0),
        makeObject(2, 2.0F, 1.0F, 30.0),
        makeObject(3, 8.0F, 0.0F, 25.0),
        makeObject(4, 60.0F, 0.0F, 30.0),
    };
    const auto expected = idsOf(resolver.resolve(candidates));
    EXPECT_EQ(expected, (std::vector<int>{1, 4}));

    auto byId = [](const DetectedObject& a, const DetectedObject& b) { return a.id < b.id; };
    std::sort(candidates.begin(), candidates.end(), byId);
    do {
        EXPECT_EQ(idsOf(resolver.resolve(candidates)), expected);
    } while (std::next_permutation(candidates.begin(), candidates.end(), byId));
}

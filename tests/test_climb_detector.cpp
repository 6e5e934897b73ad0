#include <cstddef>
#include <vector>

#include <gtest/gtest.h>

#include "ProfileBuilder.hpp"
#include "core/ClimbDetector.hpp"
#include "core/Errors.hpp"

namespace {

// 0-2000 m at +6 %, 2000-4000 m at -6 %, 4000-9000 m at +8 %, 50 m spacing.
ElevationProfile up_down_up() {
  return ProfileBuilder(50.0).grade(2000, 6).grade(2000, -6).grade(5000, 8)
      .build();
}

void expect_same(const Climb &a, const Climb &b) {
  EXPECT_EQ(a.start_idx, b.start_idx);
  EXPECT_EQ(a.end_idx, b.end_idx);
  EXPECT_EQ(a.start_distance_m, b.start_distance_m);
  EXPECT_EQ(a.end_distance_m, b.end_distance_m);
  EXPECT_EQ(a.elevation_gain_m, b.elevation_gain_m);
  EXPECT_EQ(a.avg_gradient_pct, b.avg_gradient_pct);
  EXPECT_EQ(a.max_gradient_pct, b.max_gradient_pct);
  EXPECT_EQ(a.difficulty_score, b.difficulty_score);
  EXPECT_EQ(a.category, b.category);
}

} // namespace

TEST(ClimbDetectorTest, FlatRouteHasNoClimbs) {
  // Constant elevation never enters the CLIMBING state.
  const auto p = ProfileBuilder(100.0, 250.0).flat(10000).build();
  EXPECT_TRUE(ClimbDetector().detect(p).empty());
}

TEST(ClimbDetectorTest, SingleSteadyClimbIsHC) {
  // 1000 m over 10 km at a steady 10 %.
  const auto p = ProfileBuilder(100.0).grade(10000, 10).build();
  const auto climbs = ClimbDetector().detect(p);
  ASSERT_EQ(climbs.size(), 1u);
  const auto &c = climbs[0];
  EXPECT_EQ(c.start_idx, 0u);
  EXPECT_EQ(c.end_idx, p.size() - 1);
  EXPECT_NEAR(c.elevation_gain_m, 1000.0, 1e-6);
  EXPECT_NEAR(c.length_m, 10000.0, 1e-6);
  EXPECT_NEAR(c.avg_gradient_pct, 10.0, 1e-6);
  EXPECT_NEAR(c.max_gradient_pct, 10.0, 1e-6);
  EXPECT_NEAR(c.difficulty_score, 10000.0, 1e-3);
  EXPECT_EQ(c.category, ClimbCategory::HC);
}

TEST(ClimbDetectorTest, SingleSampleDipStaysOneClimb) {
  // 25 m over 500 m at 5 % with a 1 m dip halfway.
  auto p = ProfileBuilder(10.0).grade(500, 5).build();
  p.points[25].elevation_m -= 1.0;

  for (int window : {5, 1}) {
    DetectionParams params;
    params.smoothing_window = window;
    const auto climbs = ClimbDetector(params).detect(p);
    ASSERT_EQ(climbs.size(), 1u) << "window " << window;
    EXPECT_EQ(climbs[0].start_idx, 0u);
    EXPECT_EQ(climbs[0].end_idx, 50u);
    EXPECT_NEAR(climbs[0].elevation_gain_m, 25.0, 1e-9);
    EXPECT_NEAR(climbs[0].avg_gradient_pct, 5.0, 1e-9);
    EXPECT_EQ(climbs[0].category, ClimbCategory::Cat4);
  }
}

TEST(ClimbDetectorTest, ShortRiseIsFilteredOut) {
  // 10 m over 100 m is steep but below the 20 m gain minimum.
  const auto p =
      ProfileBuilder(10.0).flat(1000).grade(100, 10).flat(1000).build();
  EXPECT_TRUE(ClimbDetector().detect(p).empty());
}

TEST(ClimbDetectorTest, DescentSeparatesClimbs) {
  // Two climbs split by a long descent, ordered and categorised separately.
  const auto p = up_down_up();
  const auto climbs = ClimbDetector().detect(p);
  ASSERT_EQ(climbs.size(), 2u);

  // Smoothing rounds the summit and the valley floor.
  EXPECT_EQ(climbs[0].start_idx, 0u);
  EXPECT_EQ(climbs[0].end_idx, 40u);
  EXPECT_NEAR(climbs[0].elevation_gain_m, 116.4, 1e-6);
  EXPECT_EQ(climbs[0].category, ClimbCategory::Cat4);

  EXPECT_EQ(climbs[1].start_idx, 81u);
  EXPECT_EQ(climbs[1].end_idx, p.size() - 1);
  EXPECT_NEAR(climbs[1].elevation_gain_m, 394.6, 1e-6);
  EXPECT_NEAR(climbs[1].length_m, 4950.0, 1e-6);
  EXPECT_EQ(climbs[1].category, ClimbCategory::Cat2); // score > 3000
}

TEST(ClimbDetectorTest, ShortDipMergesWithinGap) {
  // A 50 m descent between two ramps merges unless the gap limit is smaller.
  const auto p =
      ProfileBuilder(50.0).grade(1000, 5).grade(50, -4).grade(1000, 5).build();

  DetectionParams params;
  params.smoothing_window = 1;
  const auto merged = ClimbDetector(params).detect(p);
  ASSERT_EQ(merged.size(), 1u);
  EXPECT_NEAR(merged[0].elevation_gain_m, 98.0, 1e-9);
  EXPECT_NEAR(merged[0].length_m, 2050.0, 1e-9);

  params.merge_gap_m = 49.0;
  const auto split = ClimbDetector(params).detect(p);
  ASSERT_EQ(split.size(), 2u);
  EXPECT_NEAR(split[0].elevation_gain_m, 50.0, 1e-9);
  EXPECT_NEAR(split[1].elevation_gain_m, 50.0, 1e-9);
}

TEST(ClimbDetectorTest, DeterministicOutput) {
  // Identical inputs produce bit-identical climbs.
  const auto p = up_down_up();
  ClimbDetector detector;
  const auto a = detector.detect(p);
  const auto b = detector.detect(p);
  ASSERT_EQ(a.size(), b.size());
  for (std::size_t i = 0; i < a.size(); ++i)
    expect_same(a[i], b[i]);
}

TEST(ClimbDetectorTest, ResultsRespectAdmissionAndOrdering) {
  // Every climb passes the gate; climbs are sorted and disjoint.
  auto p = ProfileBuilder(25.0)
               .grade(600, 4)
               .grade(300, -3)
               .grade(1200, 7)
               .flat(500)
               .grade(400, -8)
               .grade(800, 3.5)
               .grade(200, -2)
               .grade(2500, 9)
               .build();
  DetectionParams params;
  params.min_gradient_pct = 3.5;
  params.min_elevation_gain_m = 15;
  const auto climbs = ClimbDetector(params).detect(p);
  ASSERT_FALSE(climbs.empty());
  for (std::size_t i = 0; i < climbs.size(); ++i) {
    const auto &c = climbs[i];
    EXPECT_GE(c.elevation_gain_m, params.min_elevation_gain_m);
    EXPECT_GE(c.avg_gradient_pct, params.min_gradient_pct);
    EXPECT_GT(c.length_m, 0.0);
    EXPECT_GT(c.end_distance_m, c.start_distance_m);
    if (i + 1 < climbs.size()) {
      EXPECT_LE(c.end_distance_m, climbs[i + 1].start_distance_m);
      EXPECT_LT(c.start_distance_m, climbs[i + 1].start_distance_m);
    }
  }
}

TEST(ClimbDetectorTest, DuplicatePointsAreTolerated) {
  // Repeated points neither fail nor split the climb.
  auto p = ProfileBuilder(100.0).grade(3000, 6).build();
  p.points.insert(p.points.begin() + 10, p.points[10]);
  p.points.insert(p.points.begin() + 20, p.points[20]);
  const auto climbs = ClimbDetector().detect(p);
  ASSERT_EQ(climbs.size(), 1u);
  EXPECT_NEAR(climbs[0].elevation_gain_m, 180.0, 1e-6);
  EXPECT_NEAR(climbs[0].length_m, 3000.0, 1e-6);
}

TEST(ClimbDetectorTest, InvalidProfilesFailFast) {
  // Malformed input raises instead of returning a partial result.
  ClimbDetector detector;
  EXPECT_THROW(detector.detect(make_profile({0}, {100})), InvalidInputError);
  EXPECT_THROW(detector.detect(make_profile({0, 100, 50}, {0, 10, 20})),
               InvalidInputError);
  EXPECT_THROW(detector.detect(make_profile({-5, 100}, {0, 10})),
               InvalidInputError);
}

TEST(ClimbDetectorTest, AnalyzeReturnsSmoothedSeriesAndSummary) {
  // The renderer gets one smoothed value per point plus raw route stats.
  const auto p = up_down_up();
  const auto a = ClimbDetector().analyze(p);
  ASSERT_EQ(a.smoothed_elevation_m.size(), p.size());
  EXPECT_DOUBLE_EQ(a.smoothed_elevation_m.front(), p.points.front().elevation_m);
  EXPECT_NEAR(a.smoothed_elevation_m[40], 116.4, 1e-9);
  EXPECT_EQ(a.summary.point_count, p.size());
  EXPECT_NEAR(a.summary.total_distance_m, 9000.0, 1e-9);
  EXPECT_NEAR(a.summary.total_ascent_m, 520.0, 1e-6);
  EXPECT_NEAR(a.summary.total_descent_m, 120.0, 1e-6);
  EXPECT_EQ(a.climbs.size(), 2u);
}

TEST(ClimbDetectorTest, FreeFunctionMatchesDetector) {
  // detect_climbs() is the one-shot form of ClimbDetector::detect().
  const auto p = up_down_up();
  const auto a = detect_climbs(p, DetectionParams{});
  const auto b = ClimbDetector().detect(p);
  ASSERT_EQ(a.size(), b.size());
  for (std::size_t i = 0; i < a.size(); ++i)
    expect_same(a[i], b[i]);
}

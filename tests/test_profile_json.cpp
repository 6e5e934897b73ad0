#include <gtest/gtest.h>

#include "core/Errors.hpp"
#include "models/Climb.hpp"
#include "models/ProfileJson.hpp"

TEST(ProfileJsonTest, DecodesPointObjects) {
  // {"points": [...]} maps each object to a TrackPoint.
  const auto j = Json::parse(R"({"points": [
      {"distance_m": 0, "elevation_m": 100.5},
      {"distance_m": 12.5, "elevation_m": 101}]})");
  const auto p = j.get<ElevationProfile>();
  ASSERT_EQ(p.size(), 2u);
  EXPECT_DOUBLE_EQ(p.points[1].distance_m, 12.5);
  EXPECT_DOUBLE_EQ(p.points[0].elevation_m, 100.5);
}

TEST(ProfileJsonTest, DecodesParallelArrays) {
  // Parallel arrays in metres.
  const auto j = Json::parse(
      R"({"distance_m": [0, 10, 20], "elevation_m": [5, 6, 7]})");
  const auto p = j.get<ElevationProfile>();
  ASSERT_EQ(p.size(), 3u);
  EXPECT_DOUBLE_EQ(p.points[2].distance_m, 20);
  EXPECT_DOUBLE_EQ(p.points[2].elevation_m, 7);
}

TEST(ProfileJsonTest, ConvertsKilometres) {
  // distance_km is scaled to metres.
  const auto j =
      Json::parse(R"({"distance_km": [0, 0.5, 1.25], "elevation_m": [1, 2, 3]})");
  const auto p = j.get<ElevationProfile>();
  ASSERT_EQ(p.size(), 3u);
  EXPECT_DOUBLE_EQ(p.points[1].distance_m, 500);
  EXPECT_DOUBLE_EQ(p.points[2].distance_m, 1250);
}

TEST(ProfileJsonTest, RejectsMalformedShapes) {
  // Shape problems are reported as InvalidInputError.
  EXPECT_THROW(Json::parse(R"({"distance_m": [0, 1], "elevation_m": [1]})")
                   .get<ElevationProfile>(),
               InvalidInputError);
  EXPECT_THROW(Json::parse(R"({"points": [{"distance_m": 0}]})")
                   .get<ElevationProfile>(),
               InvalidInputError);
  EXPECT_THROW(Json::parse(R"({"points": [{"distance_m": "0",
                                           "elevation_m": 1}]})")
                   .get<ElevationProfile>(),
               InvalidInputError);
  EXPECT_THROW(Json::parse(R"({"elevation_m": [1, 2]})").get<ElevationProfile>(),
               InvalidInputError);
  EXPECT_THROW(Json::parse(R"([1, 2])").get<ElevationProfile>(),
               InvalidInputError);
}

TEST(ProfileJsonTest, ClimbSerialisesCategoryString) {
  // Climbs carry their category as "HC" / "1".."4".
  Climb c;
  c.category = ClimbCategory::HC;
  c.elevation_gain_m = 1000;
  const Json j = c;
  EXPECT_EQ(j.at("category").get<std::string>(), "HC");
  EXPECT_DOUBLE_EQ(j.at("elevation_gain_m").get<double>(), 1000);
  EXPECT_EQ(ClimbCategoryFromString("Cat3"), ClimbCategory::Cat3);
  EXPECT_FALSE(ClimbCategoryFromString("5").has_value());
}

#include "models/params.hpp"
#include "core/Errors.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace {

double number_at(const Json &j, const char *key) {
  const auto &v = j.at(key);
  if (!v.is_number())
    throw InvalidConfigError(std::string("'") + key + "' must be a number");
  return v.get<double>();
}

CategoryThreshold threshold_from_json(const Json &j) {
  if (!j.is_object())
    throw InvalidConfigError("category entries must be objects");
  if (!j.contains("category") || !j["category"].is_string())
    throw InvalidConfigError("category entry needs a string 'category'");

  const auto name = j["category"].get<std::string>();
  auto cat = ClimbCategoryFromString(name);
  if (!cat)
    throw InvalidConfigError("unknown climb category: " + name);

  CategoryThreshold t;
  t.category = *cat;
  t.min_gain_m = j.contains("min_gain_m") ? number_at(j, "min_gain_m") : 0.0;
  t.min_score = j.contains("min_score") ? number_at(j, "min_score") : 0.0;
  return t;
}

bool non_negative(double v) { return std::isfinite(v) && v >= 0.0; }

} // namespace

DetectionParams DetectionParams::from_json(const Json &j,
                                           const DetectionParams &base) {
  if (!j.is_object())
    throw InvalidConfigError("detection params must be a JSON object");

  DetectionParams p = base;
  if (j.contains("min_gradient_pct"))
    p.min_gradient_pct = number_at(j, "min_gradient_pct");
  if (j.contains("min_elevation_gain_m"))
    p.min_elevation_gain_m = number_at(j, "min_elevation_gain_m");
  if (j.contains("break_gradient_pct"))
    p.break_gradient_pct = number_at(j, "break_gradient_pct");
  if (j.contains("merge_gap_m"))
    p.merge_gap_m = number_at(j, "merge_gap_m");
  if (j.contains("min_length_m"))
    p.min_length_m = number_at(j, "min_length_m");
  if (j.contains("smoothing_window")) {
    const auto &w = j["smoothing_window"];
    if (!w.is_number_integer())
      throw InvalidConfigError("'smoothing_window' must be an integer");
    const bool fits =
        w.is_number_unsigned()
            ? w.get<std::uint64_t>() <=
                  static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : w.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                  w.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!fits)
      throw InvalidConfigError("'smoothing_window' out of range: " + w.dump());
    p.smoothing_window = static_cast<int>(w.get<std::int64_t>());
  }
  if (j.contains("categories")) {
    const auto &arr = j["categories"];
    if (!arr.is_array())
      throw InvalidConfigError("'categories' must be an array");
    p.categories.clear();
    for (const auto &row : arr)
      p.categories.push_back(threshold_from_json(row));
  }
  return p;
}

void DetectionParams::validate() const {
  if (!non_negative(min_gradient_pct))
    throw InvalidConfigError("min_gradient_pct must be >= 0");
  if (!non_negative(min_elevation_gain_m))
    throw InvalidConfigError("min_elevation_gain_m must be >= 0");
  if (!non_negative(break_gradient_pct))
    throw InvalidConfigError("break_gradient_pct must be >= 0");
  if (!non_negative(merge_gap_m))
    throw InvalidConfigError("merge_gap_m must be >= 0");
  if (!non_negative(min_length_m))
    throw InvalidConfigError("min_length_m must be >= 0");
  if (smoothing_window < 1 || smoothing_window % 2 == 0)
    throw InvalidConfigError("smoothing_window must be a positive odd integer, "
                             "got " +
                             std::to_string(smoothing_window));
  // entry must be reachable from FLAT
  if (break_gradient_pct >= min_gradient_pct)
    throw InvalidConfigError(
        "break_gradient_pct must be lower than min_gradient_pct");

  // rows hardest first, each tier at most once; Cat4 is implicit
  int prev = -1;
  for (const auto &t : categories) {
    const int rank = static_cast<int>(t.category);
    if (t.category == ClimbCategory::Cat4)
      throw InvalidConfigError("category 4 is the default tier and cannot "
                               "have thresholds");
    if (rank <= prev)
      throw InvalidConfigError("category table must list HC..3 hardest first "
                               "without repeats");
    if (!non_negative(t.min_gain_m) || !non_negative(t.min_score))
      throw InvalidConfigError(std::string("thresholds for category ") +
                               ClimbCategoryToString(t.category) +
                               " must be >= 0");
    prev = rank;
  }
}

void to_json(Json &j, const DetectionParams &p) {
  j = Json{{"min_gradient_pct", p.min_gradient_pct},
           {"min_elevation_gain_m", p.min_elevation_gain_m},
           {"break_gradient_pct", p.break_gradient_pct},
           {"smoothing_window", p.smoothing_window},
           {"merge_gap_m", p.merge_gap_m},
           {"min_length_m", p.min_length_m},
           {"categories", p.categories}};
}

#pragma once
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#include "models/Climb.hpp"    // Climb, ClimbAnalysis
#include "models/CoreTypes.hpp" // ElevationProfile, RouteSummary

// ------- Small helpers -------

inline void print_route_summary(std::ostream &os, const RouteSummary &s) {
  os << "  route: points=" << s.point_count << "  length="
     << (s.total_distance_m / 1000.0) << " km"
     << "  ascent=" << s.total_ascent_m << " m"
     << "  descent=" << s.total_descent_m << " m\n"
     << "         elevation{min=" << s.min_elevation_m
     << ", max=" << s.max_elevation_m << "}\n";
}

inline void print_climb_table(std::ostream &os,
                              const std::vector<Climb> &climbs) {
  if (climbs.empty()) {
    os << "  no climbs detected\n";
    return;
  }
  os << "  #   cat  start_km   end_km  length_m   gain_m  avg_%  max_%"
        "    score\n";
  std::size_t n = 0;
  for (const auto &c : climbs) {
    os << "  " << std::setw(2) << ++n << "  " << std::setw(3)
       << ClimbCategoryToString(c.category) << "  " << std::setw(8)
       << std::setprecision(2) << (c.start_distance_m / 1000.0) << " "
       << std::setw(8) << (c.end_distance_m / 1000.0) << "  " << std::setw(8)
       << std::setprecision(0) << c.length_m << "  " << std::setw(7)
       << std::setprecision(1) << c.elevation_gain_m << "  " << std::setw(5)
       << c.avg_gradient_pct << "  " << std::setw(5) << c.max_gradient_pct
       << "  " << std::setw(7) << std::setprecision(0) << c.difficulty_score
       << "\n";
  }
}

// One row per climb, header first.
inline void write_climbs_csv(std::ostream &out,
                             const std::vector<Climb> &climbs) {
  out << "start_idx,end_idx,start_distance_m,end_distance_m,"
         "start_elevation_m,end_elevation_m,length_m,elevation_gain_m,"
         "avg_gradient_pct,max_gradient_pct,difficulty_score,category\n";
  for (const auto &c : climbs) {
    out << c.start_idx << "," << c.end_idx << "," << c.start_distance_m << ","
        << c.end_distance_m << "," << c.start_elevation_m << ","
        << c.end_elevation_m << "," << c.length_m << "," << c.elevation_gain_m
        << "," << c.avg_gradient_pct << "," << c.max_gradient_pct << ","
        << c.difficulty_score << "," << ClimbCategoryToString(c.category)
        << "\n";
  }
}

// distance, raw elevation and smoothed elevation per point.
inline void write_profile_csv(std::ostream &out,
                              const ElevationProfile &profile,
                              const std::vector<double> &smoothed) {
  out << "s_km,elev_m,elev_smoothed_m\n";
  for (std::size_t k = 0; k < profile.size(); ++k) {
    out << (profile.points[k].distance_m / 1000.0) << ","
        << profile.points[k].elevation_m << ","
        << (k < smoothed.size() ? smoothed[k] : profile.points[k].elevation_m)
        << "\n";
  }
}

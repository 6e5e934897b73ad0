#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "core/ClimbDetector.hpp"
#include "core/Errors.hpp"
#include "debug/ClimbLab.hpp"
#include "models/ProfileJson.hpp"
#include "models/params.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// ultra-light arg parser
struct Options {
  std::string input;  // --input uploads/route.json
  std::string params; // --params params.json (DetectionParams keys)
  bool dump_csv = false; // --csv climbs.csv
  std::string csv_path;
  bool dump_profile = false; // --smoothed-csv profile.csv
  std::string profile_path;
  bool verbose = false; // --verbose
  bool bad = false;
};

static Options parse(int argc, char **argv) {
  Options o;
  for (int i = 1; i < argc; i++) {
    std::string a(argv[i]);
    auto nexts = [&](std::string &tgt) {
      if (i + 1 < argc) {
        tgt = argv[++i];
      } else {
        std::cerr << "missing value after " << a << "\n";
        o.bad = true;
      }
    };
    if (a == "--input")
      nexts(o.input);
    else if (a == "--params")
      nexts(o.params);
    else if (a == "--csv") {
      o.dump_csv = true;
      nexts(o.csv_path);
    } else if (a == "--smoothed-csv") {
      o.dump_profile = true;
      nexts(o.profile_path);
    } else if (a == "--verbose")
      o.verbose = true;
    else {
      std::cerr << "Unknown arg: " << a << "\n";
      o.bad = true;
    }
  }
  return o;
}

static bool read_json(const std::string &path, json &out) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "Cannot open: " << path << "\n";
    return false;
  }
  try {
    in >> out;
  } catch (const json::parse_error &e) {
    std::cerr << "JSON read/parse error in " << path << ": " << e.what()
              << "\n";
    return false;
  }
  return true;
}

template <typename Writer>
static bool write_file(const std::string &path, const char *tag, Writer w) {
  std::ofstream out(path);
  if (!out) {
    std::cerr << "[" << tag << "] cannot write " << path << "\n";
    return false;
  }
  w(out);
  std::cerr << "[" << tag << "] wrote " << path << "\n";
  return true;
}

int main(int argc, char **argv) {
  Options opt = parse(argc, argv);
  if (opt.bad || opt.input.empty()) {
    std::cerr << "Usage: climb_lab --input <profile.json> [--params "
                 "<params.json>] [--csv climbs.csv] [--smoothed-csv "
                 "profile.csv] [--verbose]\n";
    return 2;
  }

  // 1) Load profile
  json j;
  if (!read_json(opt.input, j))
    return 2;
  ElevationProfile profile;
  try {
    profile = j.get<ElevationProfile>();
  } catch (const InvalidInputError &e) {
    std::cerr << "Profile decode error: " << e.what() << "\n";
    return 3;
  }

  // 2) Params (defaults unless a file is given)
  DetectionParams params;
  if (!opt.params.empty()) {
    json pj;
    if (!read_json(opt.params, pj))
      return 2;
    try {
      params = DetectionParams::from_json(pj);
    } catch (const InvalidConfigError &e) {
      std::cerr << "Params error: " << e.what() << "\n";
      return 4;
    }
  }
  if (opt.verbose)
    std::cerr << "[params] " << json(params).dump() << "\n";

  // 3) Detect
  ClimbAnalysis analysis;
  try {
    analysis = ClimbDetector(params).analyze(profile);
  } catch (const InvalidConfigError &e) {
    std::cerr << "Params error: " << e.what() << "\n";
    return 4;
  } catch (const InvalidInputError &e) {
    std::cerr << "Invalid profile: " << e.what() << "\n";
    return 3;
  }
  std::cerr << "[route] points=" << profile.size()
            << " total=" << analysis.summary.total_distance_m << " m\n";

  // 4) Report
  std::cout << std::fixed << std::setprecision(1);
  print_route_summary(std::cout, analysis.summary);
  print_climb_table(std::cout, analysis.climbs);

  // 5) Optional CSV
  if (opt.dump_csv &&
      !write_file(opt.csv_path, "csv", [&](std::ostream &out) {
        write_climbs_csv(out, analysis.climbs);
      }))
    return 2;
  if (opt.dump_profile &&
      !write_file(opt.profile_path, "csv", [&](std::ostream &out) {
        write_profile_csv(out, profile, analysis.smoothed_elevation_m);
      }))
    return 2;

  return 0;
}

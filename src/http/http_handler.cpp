#include "http_handler.hpp"
#include "core/Errors.hpp"
#include "core/ProfileUtils.hpp"
#include "debug/json_debug.hpp"
#include "models/ProfileJson.hpp"

#include <iostream>
#include <utility>

using json = nlohmann::json;

namespace {

void send_json(httplib::Response &res, int status, const json &body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

void send_error(httplib::Response &res, int status, const char *kind,
                const std::string &what) {
  send_json(res, status, {{"ok", false}, {"kind", kind}, {"what", what}});
}

// The profile is either under "profile" or the body itself.
const json &profile_node(const json &body) {
  if (body.contains("profile"))
    return body["profile"];
  return body;
}

size_t point_count(const json &p) {
  if (!p.is_object())
    return 0;
  if (p.contains("points") && p["points"].is_array())
    return p["points"].size();
  for (const char *key : {"distance_m", "distance_km"}) {
    if (p.contains(key) && p[key].is_array())
      return p[key].size();
  }
  return 0;
}

} // namespace

HttpHandler::HttpHandler(ServerSettings settings)
    : settings_(std::move(settings)), default_detector_(settings_.detection) {}

// ===== routes =====

void HttpHandler::callPostHandler(std::string action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (action == "climbs") {
    handleClimbs(req, res);
  } else if (action == "sample") {
    handleSample(req, res);
  } else if (action == "debug") {
    handleDebug(req, res);
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

void HttpHandler::callGetHandler(std::string action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "params") {
    handleParams(req, res);
  } else if (action == "categories") {
    handleCategories(req, res);
  } else if (action == "health") {
    handleHealth(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

// ===== helpers =====

bool HttpHandler::parseBody(const httplib::Request &req,
                            httplib::Response &res, json &out) const {
  try {
    out = json::parse(req.body);
  } catch (const json::parse_error &e) {
    send_json(res, 400, parse_error_json(req.body, e));
    return false;
  }
  if (!out.is_object()) {
    send_error(res, 400, "invalid_input", "request body must be an object");
    return false;
  }
  return true;
}

ElevationProfile HttpHandler::profileFrom(const json &body,
                                          bool &too_large) const {
  const json &node = profile_node(body);
  too_large = point_count(node) > settings_.max_points;
  if (too_large)
    return {};
  return node.get<ElevationProfile>();
}

// ===== POST: /climbs =====

void HttpHandler::handleClimbs(const httplib::Request &req,
                               httplib::Response &res) {
  json body;
  if (!parseBody(req, res, body))
    return;

  try {
    bool too_large = false;
    const ElevationProfile profile = profileFrom(body, too_large);
    if (too_large) {
      send_error(res, 413, "too_large",
                 "profile exceeds " + std::to_string(settings_.max_points) +
                     " points");
      return;
    }

    // per-request overrides on top of the configured defaults
    ClimbAnalysis analysis;
    DetectionParams used = settings_.detection;
    if (body.contains("params")) {
      used = DetectionParams::from_json(body["params"], settings_.detection);
      analysis = ClimbDetector(used).analyze(profile);
    } else {
      analysis = default_detector_.analyze(profile);
    }

    json out = {{"ok", true},
                {"summary", analysis.summary},
                {"climbs", analysis.climbs},
                {"params", used}};
    if (body.value("include_smoothed", false))
      out["smoothed_elevation_m"] = analysis.smoothed_elevation_m;

    std::cerr << "[climbs] points=" << profile.size()
              << " climbs=" << analysis.climbs.size() << "\n";
    send_json(res, 200, out);
  } catch (const InvalidConfigError &e) {
    send_error(res, 400, "invalid_config", e.what());
  } catch (const InvalidInputError &e) {
    send_error(res, 400, "invalid_input", e.what());
  } catch (const json::exception &e) {
    send_error(res, 400, "invalid_input", e.what());
  }
}

// ===== POST: /sample =====

void HttpHandler::handleSample(const httplib::Request &req,
                               httplib::Response &res) {
  json body;
  if (!parseBody(req, res, body))
    return;

  try {
    bool too_large = false;
    const ElevationProfile profile = profileFrom(body, too_large);
    if (too_large) {
      send_error(res, 413, "too_large",
                 "profile exceeds " + std::to_string(settings_.max_points) +
                     " points");
      return;
    }
    ProfileUtils::validate(profile);

    const double interval_m = body.value("interval_m", 500.0);
    const auto idx =
        ProfileUtils::sample_indices_along_distance(profile, interval_m);

    json out;
    out["ok"] = true;
    out["interval_m"] = interval_m;
    out["indices"] = idx;
    out["points"] = json::array();
    for (size_t i : idx)
      out["points"].push_back(json(profile.points[i]));
    send_json(res, 200, out);
  } catch (const InvalidConfigError &e) {
    send_error(res, 400, "invalid_config", e.what());
  } catch (const InvalidInputError &e) {
    send_error(res, 400, "invalid_input", e.what());
  } catch (const json::exception &e) {
    send_error(res, 400, "invalid_input", e.what());
  }
}

// ===== POST: /debug =====

void HttpHandler::handleDebug(const httplib::Request &req,
                              httplib::Response &res) {
  const bool validate =
      req.has_param("validate") && (req.get_param_value("validate") == "true");
  if (!validate) {
    res.set_content(R"({"ok":true,"message":"debug alive"})",
                    "application/json");
    return;
  }

  try {
    auto parsed = json::parse(req.body);
    json ok = {{"ok", true},
               {"message", "JSON parsed successfully"},
               {"profile_points", point_count(profile_node(parsed))}};
    send_json(res, 200, ok);
  } catch (const json::parse_error &e) {
    send_json(res, 400, parse_error_json(req.body, e));
  }
}

// ===== GET =====

void HttpHandler::handleParams(const httplib::Request &,
                               httplib::Response &res) {
  send_json(res, 200, json(default_detector_.params()));
}

void HttpHandler::handleCategories(const httplib::Request &,
                                   httplib::Response &res) {
  send_json(res, 200,
            {{"categories", default_detector_.params().categories},
             {"default", ClimbCategoryToString(ClimbCategory::Cat4)}});
}

void HttpHandler::handleHealth(const httplib::Request &,
                               httplib::Response &res) {
  res.set_content(R"({"ok":true})", "application/json");
}

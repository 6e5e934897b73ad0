#pragma once

#include "core/ClimbDetector.hpp"
#include "http/ServerSettings.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>

// Thin wrapper around httplib callbacks. The main server forwards requests to
// these member functions based on the action string parsed from the URL.
class HttpHandler {
public:
  explicit HttpHandler(ServerSettings settings);

  void callPostHandler(std::string action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(std::string action, const httplib::Request &req,
                      httplib::Response &res);

private:
  ServerSettings settings_;
  ClimbDetector default_detector_;

  // Individual request handlers
  void handleClimbs(const httplib::Request &req, httplib::Response &res);
  void handleSample(const httplib::Request &req, httplib::Response &res);
  void handleDebug(const httplib::Request &req, httplib::Response &res);
  void handleParams(const httplib::Request &req, httplib::Response &res);
  void handleCategories(const httplib::Request &req, httplib::Response &res);
  void handleHealth(const httplib::Request &req, httplib::Response &res);

  // Parses the body into `out`; on failure writes a 400 and returns false.
  bool parseBody(const httplib::Request &req, httplib::Response &res,
                 nlohmann::json &out) const;
  // Decodes and bounds-checks the request's profile; throws
  // InvalidInputError. Sets `too_large` instead of decoding when over
  // max_points.
  ElevationProfile profileFrom(const nlohmann::json &body,
                               bool &too_large) const;
};

#pragma once

#include "httplib.h"
#include "models/params.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Thin wrapper around httplib callbacks.  The main server forwards requests to
// these member functions based on the action string parsed from the URL.
class HttpHandler {
public:
  explicit HttpHandler(Settings settings) : settings_(std::move(settings)) {}

  void callPostHandler(const std::string &action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(const std::string &action, const httplib::Request &req,
                      httplib::Response &res);

private:
  Settings settings_;

  // Individual request handlers
  void handleMatchCrashes(const httplib::Request &req, httplib::Response &res);
  void handleDedup(const httplib::Request &req, httplib::Response &res);
  void handleRates(const httplib::Request &req, httplib::Response &res);
  void handlePing(const httplib::Request &req, httplib::Response &res);
  void handleConfig(const httplib::Request &req, httplib::Response &res);
};

#include "http_handler.hpp"
#include "http/payloads.hpp"
#include "io/GeoJsonIO.hpp"

#include <functional>
#include <iostream>

using json = nlohmann::json;

// Parses the body, runs `fn` and writes its JSON result. Parse errors come
// back as 400 with line/column; bad payloads as 400; anything else as 500.
static void run_json(const httplib::Request &req, httplib::Response &res,
                     const std::function<json(const json &)> &fn) {
  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::parse_error &e) {
    auto [line, col] = calc_line_col(req.body, e.byte);
    json err = {{"ok", false},   {"kind", "parse_error"},
                {"what", e.what()}, {"byte", e.byte},
                {"line", line},  {"column", col}};
    res.status = 400;
    res.set_content(err.dump(), "application/json");
    return;
  }

  try {
    json out = fn(body);
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_content(out.dump(), "application/json");
  } catch (const json::exception &e) {
    res.status = 400;
    res.set_content(json{{"error", e.what()}}.dump(), "application/json");
  } catch (const std::runtime_error &e) {
    res.status = 400;
    res.set_content(json{{"error", e.what()}}.dump(), "application/json");
  } catch (const std::exception &e) {
    std::cerr << "[" << req.path << "] EXCEPTION: " << e.what() << "\n";
    res.status = 500;
    res.set_content(json{{"error", e.what()}}.dump(), "application/json");
  }
}

// ===== routes =====

void HttpHandler::callPostHandler(const std::string &action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (action == "crashes/match") {
    handleMatchCrashes(req, res);
  } else if (action == "lines/dedup") {
    handleDedup(req, res);
  } else if (action == "lines/rates") {
    handleRates(req, res);
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

void HttpHandler::callGetHandler(const std::string &action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "ping") {
    handlePing(req, res);
  } else if (action == "config") {
    handleConfig(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

// ===== matching =====

void HttpHandler::handleMatchCrashes(const httplib::Request &req,
                                     httplib::Response &res) {
  run_json(req, res, [](const json &body) { return match_crashes_payload(body); });
}

void HttpHandler::handleDedup(const httplib::Request &req,
                              httplib::Response &res) {
  const MatchingParams defaults = settings_.matching;
  run_json(req, res, [&defaults](const json &body) {
    return dedup_payload(body, defaults);
  });
}

void HttpHandler::handleRates(const httplib::Request &req,
                              httplib::Response &res) {
  run_json(req, res, [](const json &body) { return rates_payload(body); });
}

// ===== misc =====

void HttpHandler::handlePing(const httplib::Request &, httplib::Response &res) {
  res.set_content(R"({"ok":true})", "application/json");
}

void HttpHandler::handleConfig(const httplib::Request &,
                               httplib::Response &res) {
  const MatchingParams &m = settings_.matching;
  json out = {{"matching",
               {{"sample_count", m.sample_count},
                {"bin_size_deg", m.bin_size_deg},
                {"max_distance_m", m.max_distance_m},
                {"max_bearing_diff_deg", m.max_bearing_diff_deg},
                {"match_fraction", m.match_fraction}}},
              {"rates",
               {{"years", settings_.rates.years},
                {"days_per_year", settings_.rates.days_per_year},
                {"min_aadt", settings_.rates.min_aadt}}},
              {"route_groups", settings_.route_groups}};
  res.set_content(out.dump(), "application/json");
}

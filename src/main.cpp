// Entry point for the roadrisk HTTP service.  It wires up the httplib server,
// loads configuration and exposes the REST endpoints handled by `HttpHandler`.

#include "http/http_handler.hpp"
#include "models/params.hpp"

#include <cstdio>
#include <execinfo.h>
#include <iostream>
#include <signal.h>
#include <unistd.h>

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

static std::string action_of(const std::string &path) {
  return (!path.empty() && path[0] == '/') ? path.substr(1) : path;
}

int main(int argc, char **argv) {
  install_bt_handlers();

  // ---------------------- Load configuration ------------------------------
  const std::string cfg_path = (argc > 1) ? argv[1] : "config/settings.json";
  Settings settings;
  try {
    settings = Settings::load(cfg_path);
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 1;
  }
  const int port = settings.server.port;
  std::cout << "[DEBUG] Starting server on port " << port << std::endl;

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(settings.server.payload_max_mb * 1024ull *
                                1024ull);
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);

  HttpHandler handler(settings);

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &path : settings.server.post_endpoints) {
    const std::string action = action_of(path);
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callPostHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[POST " << action << "] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
  }

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &path : settings.server.get_endpoints) {
    const std::string action = action_of(path);
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      handler.callGetHandler(action, req, res);
    });
  }

  // ---------------------- Start server ------------------------------------
  if (!server.listen("0.0.0.0", port)) {
    std::cerr << "[ERROR] cannot listen on port " << port << "\n";
    return 1;
  }
  return 0;
}

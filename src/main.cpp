// Entry point for the climb detection HTTP server. It wires up the httplib
// server, loads configuration and exposes the REST endpoints handled by
// `HttpHandler`.

#include "core/Errors.hpp"
#include "http/ServerSettings.hpp"
#include "http/http_handler.hpp"
#include <nlohmann/json.hpp>

#include <execinfo.h>
#include <iostream>
#include <signal.h>
#include <string>
#include <unistd.h>
#include <utility>

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

int main(int argc, char **argv) {
  install_bt_handlers();

  // ---------------------- Load configuration ------------------------------
  const std::string cfg_path = argc > 1 ? argv[1] : "config/settings.json";
  ServerSettings settings;
  try {
    settings = ServerSettings::fromFile(cfg_path);
  } catch (const InvalidConfigError &e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 1;
  }
  std::cout << "[DEBUG] Starting server on " << settings.host << ":"
            << settings.port << " (max_points=" << settings.max_points << ")"
            << std::endl;

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(1024ull * 1024ull * 64ull); // 64MB
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);

  const std::string host = settings.host;
  const int port = settings.port;
  const auto post_endpoints = settings.post_endpoints;
  const auto get_endpoints = settings.get_endpoints;
  HttpHandler handler(std::move(settings));

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &path : post_endpoints) {
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
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
  for (const auto &path : get_endpoints) {
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callGetHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[GET " << action << "] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
  }

  // ---------------------- Start server ------------------------------------
  if (!server.listen(host, port)) {
    std::cerr << "[main] cannot listen on " << host << ":" << port << "\n";
    return 1;
  }
  return 0;
}

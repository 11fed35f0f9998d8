#include "clipboard_backend.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "sync_engine.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <thread>

using namespace clipmesh;

static void usage() {
  std::cerr
      << "usage: clipmesh [--config FILE] [--listen-port N] [--listen-host H]\n"
         "                [--key HEX64] [--peer HOST:PORT]... [--max-file-size N]\n"
         "                [--poll-ms N] [--download-dir DIR] [--threads N]\n"
         "                [--log-level trace|debug|info|warn|error]\n";
}

int main(int argc, char **argv) {
  std::string config_path;
  std::string log_level;
  std::vector<std::pair<std::string, std::string>> overrides;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--config")
      config_path = next(i);
    else if (a == "--listen-port")
      overrides.emplace_back("listen_port", next(i));
    else if (a == "--listen-host")
      overrides.emplace_back("listen_host", next(i));
    else if (a == "--key")
      overrides.emplace_back("secret_key", next(i));
    else if (a == "--peer")
      overrides.emplace_back("peer", next(i));
    else if (a == "--max-file-size")
      overrides.emplace_back("max_file_size", next(i));
    else if (a == "--poll-ms")
      overrides.emplace_back("poll_interval_ms", next(i));
    else if (a == "--download-dir")
      overrides.emplace_back("download_dir", next(i));
    else if (a == "--threads")
      overrides.emplace_back("threads", next(i));
    else if (a == "--log-level")
      log_level = next(i);
    else if (a == "-h" || a == "--help") {
      usage();
      return 0;
    } else {
      std::cerr << "unknown option " << a << "\n";
      usage();
      return 1;
    }
  }

  EngineConfig cfg;
  std::string err;
  std::string file_log_level;
  bool explicit_config = !config_path.empty();
  if (!explicit_config)
    config_path = default_config_path();
  std::error_code fs_ec;
  if (explicit_config || std::filesystem::exists(config_path, fs_ec)) {
    if (!load_config_file(config_path, cfg, file_log_level, err)) {
      std::cerr << "config: " << err << std::endl;
      return 1;
    }
  }
  for (const auto &kv : overrides) {
    if (!apply_config_value(cfg, kv.first, kv.second, err)) {
      std::cerr << "config: " << err << std::endl;
      return 1;
    }
  }

  if (log_level.empty())
    log_level = file_log_level;
  if (log_level.empty()) {
    const char *env = std::getenv("CLIPMESH_LOG");
    if (env)
      log_level = env;
  }
  if (!log_level.empty()) {
    LogLevel lvl;
    if (!parse_log_level(log_level, lvl)) {
      std::cerr << "bad log level '" << log_level << "'" << std::endl;
      return 1;
    }
    Logger::instance().set_level(lvl);
  }

  if (!validate_config(cfg, err)) {
    std::cerr << "config: " << err << std::endl;
    return 1;
  }
  if (!crypto_init()) {
    std::cerr << "libsodium initialization failed" << std::endl;
    return 1;
  }
#if !defined(_WIN32)
  std::signal(SIGPIPE, SIG_IGN);
#endif

  auto clipboard = make_system_clipboard();
  if (!clipboard)
    return 1;

  asio::io_context io;
  SyncEngine engine(io, cfg, *clipboard);
  try {
    engine.start();
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "cannot listen on %s:%u: %s",
                           cfg.listen_host.c_str(), (unsigned)cfg.listen_port,
                           e.what());
    return 1;
  }

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code ec, int sig) {
    if (ec)
      return;
    Logger::instance().log(LogLevel::INFO, "signal %d, shutting down", sig);
    engine.stop();
  });

  std::vector<std::thread> th;
  th.reserve(cfg.threads);
  for (int i = 0; i < cfg.threads; i++)
    th.emplace_back([&]() { io.run(); });
  for (auto &t : th)
    t.join();
  return 0;
}

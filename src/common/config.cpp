#include "config.hpp"
#include "util.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace clipmesh {

bool validate_config(const EngineConfig &cfg, std::string &err) {
  if (cfg.listen_port == 0) {
    err = "listen_port must be > 0";
    return false;
  }
  if (cfg.secret_key.size() != kKeyBytes) {
    err = "secret_key must be exactly 32 bytes (64 hex chars)";
    return false;
  }
  for (const auto &p : cfg.peers) {
    if (p.host.empty() || p.port == 0) {
      err = "invalid peer address '" + p.endpoint() + "'";
      return false;
    }
  }
  if (cfg.poll_interval.count() <= 0) {
    err = "poll_interval_ms must be > 0";
    return false;
  }
  if (cfg.threads < 1) {
    err = "threads must be >= 1";
    return false;
  }
  if (cfg.reconnect_initial.count() <= 0 ||
      cfg.reconnect_max < cfg.reconnect_initial) {
    err = "invalid reconnect backoff bounds";
    return false;
  }
  return true;
}

static bool parse_u64(const std::string &s, uint64_t &out) {
  if (s.empty())
    return false;
  uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9')
      return false;
    uint64_t next = v * 10 + (uint64_t)(c - '0');
    if (next / 10 != v)
      return false;
    v = next;
  }
  out = v;
  return true;
}

bool apply_config_value(EngineConfig &cfg, const std::string &key,
                        const std::string &value, std::string &err) {
  uint64_t n = 0;
  if (key == "listen_port") {
    if (!parse_u64(value, n) || n == 0 || n > 65535) {
      err = "bad listen_port '" + value + "'";
      return false;
    }
    cfg.listen_port = (uint16_t)n;
  } else if (key == "listen_host") {
    cfg.listen_host = value;
  } else if (key == "secret_key") {
    cfg.secret_key = hex_to_bytes(value);
    if (cfg.secret_key.size() != kKeyBytes) {
      err = "secret_key must be 64 hex chars";
      return false;
    }
  } else if (key == "max_file_size") {
    if (!parse_u64(value, n)) {
      err = "bad max_file_size '" + value + "'";
      return false;
    }
    cfg.max_file_size = n;
  } else if (key == "peer") {
    PeerConfig p;
    if (!parse_host_port(value, p.host, p.port)) {
      err = "unparseable peer address '" + value + "'";
      return false;
    }
    cfg.peers.push_back(p);
  } else if (key == "poll_interval_ms") {
    if (!parse_u64(value, n) || n == 0 || n > 60000) {
      err = "bad poll_interval_ms '" + value + "'";
      return false;
    }
    cfg.poll_interval = std::chrono::milliseconds(n);
  } else if (key == "download_dir") {
    cfg.download_dir = value;
  } else if (key == "origin_id") {
    auto bytes = hex_to_bytes(value);
    if (bytes.size() != kOriginIdBytes) {
      err = "origin_id must be 32 hex chars";
      return false;
    }
    OriginId id;
    std::copy(bytes.begin(), bytes.end(), id.begin());
    cfg.origin_id = id;
  } else if (key == "threads") {
    if (!parse_u64(value, n) || n == 0 || n > 64) {
      err = "bad threads '" + value + "'";
      return false;
    }
    cfg.threads = (int)n;
  } else {
    err = "unknown key '" + key + "'";
    return false;
  }
  return true;
}

bool load_config_file(const std::string &path, EngineConfig &cfg,
                      std::string &log_level, std::string &err) {
  std::ifstream in(path);
  if (!in) {
    err = "cannot open " + path;
    return false;
  }
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    lineno++;
    auto hash = line.find('#');
    if (hash != std::string::npos)
      line.erase(hash);
    line = trim(line);
    if (line.empty())
      continue;
    auto eq = line.find('=');
    if (eq == std::string::npos) {
      err = path + ":" + std::to_string(lineno) + ": expected key = value";
      return false;
    }
    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
      value = value.substr(1, value.size() - 2);
    if (key == "log_level") {
      log_level = value;
      continue;
    }
    std::string e;
    if (!apply_config_value(cfg, key, value, e)) {
      err = path + ":" + std::to_string(lineno) + ": " + e;
      return false;
    }
  }
  return true;
}

static std::string env_or_empty(const char *name) {
  const char *v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

std::string default_config_path() {
  const fs::path rel = fs::path("lan-clipboard-sync") / "config.conf";
#if defined(_WIN32)
  std::string appdata = env_or_empty("APPDATA");
  if (!appdata.empty())
    return (fs::path(appdata) / rel).string();
#else
  std::string xdg = env_or_empty("XDG_CONFIG_HOME");
  if (!xdg.empty())
    return (fs::path(xdg) / rel).string();
  std::string home = env_or_empty("HOME");
  if (!home.empty())
    return (fs::path(home) / ".config" / rel).string();
#endif
  return "lan-clipboard-sync.conf";
}

std::string default_download_root() {
#if defined(_WIN32)
  std::string home = env_or_empty("USERPROFILE");
  if (!home.empty())
    return (fs::path(home) / "Downloads" / "lan-clipboard").string();
#else
  std::string xdg = env_or_empty("XDG_DOWNLOAD_DIR");
  if (!xdg.empty())
    return (fs::path(xdg) / "lan-clipboard").string();
  std::string home = env_or_empty("HOME");
  if (!home.empty())
    return (fs::path(home) / "Downloads" / "lan-clipboard").string();
#endif
  return "lan-clipboard-downloads";
}

} // namespace clipmesh

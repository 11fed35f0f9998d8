#include "file_receiver.hpp"
#include "logging.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace clipmesh {

std::string
FileReceiver::timestamp_dir_name(std::chrono::system_clock::time_point t) {
  auto tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm_buf{};
#if defined(_WIN32)
  localtime_s(&tm_buf, &tt);
#else
  localtime_r(&tt, &tm_buf);
#endif
  char name[32];
  std::strftime(name, sizeof(name), "%Y%m%d-%H%M%S", &tm_buf);
  return name;
}

// Relative, no "..", no root or drive.
static bool safe_relative(const fs::path &p) {
  if (p.empty() || p.is_absolute() || p.has_root_name() || p.has_root_directory())
    return false;
  for (const auto &part : p)
    if (part == ".." || part == ".")
      return false;
  return true;
}

std::vector<std::string>
FileReceiver::receive(const FileList &files,
                      std::chrono::system_clock::time_point now) {
  std::vector<std::string> written;
  std::error_code ec;
  fs::path base = fs::path(root_) / timestamp_dir_name(now);
  fs::create_directories(root_, ec);
  // two payloads within the same second get a numeric suffix
  fs::path dest = base;
  for (int i = 1; !fs::create_directory(dest, ec); i++) {
    if (ec || i > 1000) {
      Logger::instance().log(LogLevel::ERROR, "cannot create %s: %s",
                             dest.string().c_str(),
                             ec ? ec.message().c_str() : "exists");
      return written;
    }
    dest = base.string() + "-" + std::to_string(i);
  }
  fs::path abs_dest = fs::absolute(dest, ec);
  if (ec)
    abs_dest = dest;

  for (const auto &f : files) {
    fs::path rel = fs::path(f.path).lexically_normal();
    if (!safe_relative(fs::path(f.path)) || !safe_relative(rel)) {
      Logger::instance().log(LogLevel::WARN, "rejecting unsafe path '%s'",
                             f.path.c_str());
      continue;
    }
    fs::path target = dest / rel;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      Logger::instance().log(LogLevel::WARN, "cannot create %s: %s",
                             target.parent_path().string().c_str(),
                             ec.message().c_str());
      continue;
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (out)
      out.write(reinterpret_cast<const char *>(f.data.data()),
                (std::streamsize)f.data.size());
    if (!out) {
      Logger::instance().log(LogLevel::WARN, "write failed: %s",
                             target.string().c_str());
      continue;
    }
    std::string top = (abs_dest / *rel.begin()).string();
    if (std::find(written.begin(), written.end(), top) == written.end())
      written.push_back(top);
  }
  Logger::instance().log(LogLevel::INFO, "received %zu file(s) into %s",
                         files.size(), dest.string().c_str());
  return written;
}

} // namespace clipmesh

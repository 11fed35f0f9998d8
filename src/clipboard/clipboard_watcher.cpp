#include "clipboard_watcher.hpp"
#include "logging.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace clipmesh {

ClipboardWatcher::ClipboardWatcher(Strand strand, ClipboardBackend &clipboard,
                                   std::chrono::milliseconds interval,
                                   uint64_t file_load_limit,
                                   ChangeHandler on_change)
    : strand_(std::move(strand)), timer_(strand_), clipboard_(clipboard),
      interval_(interval), file_load_limit_(file_load_limit),
      on_change_(std::move(on_change)) {}

void ClipboardWatcher::start() {
  poll_once();
  Logger::instance().log(LogLevel::INFO,
                         "clipboard watcher started (%s, every %lld ms)",
                         clipboard_.name(), (long long)interval_.count());
  auto self = shared_from_this();
  asio::dispatch(strand_, [this, self]() { schedule(); });
}

void ClipboardWatcher::stop() {
  auto self = shared_from_this();
  asio::dispatch(strand_, [this, self]() {
    stopped_ = true;
    timer_.cancel();
  });
}

void ClipboardWatcher::schedule() {
  if (stopped_)
    return;
  timer_.expires_after(interval_);
  auto self = shared_from_this();
  timer_.async_wait([this, self](std::error_code ec) {
    if (ec || stopped_)
      return;
    poll_once();
    schedule();
  });
}

// size and mtime of each listed item; equal probes mean an unchanged file list
static std::string probe_files(const std::vector<std::string> &paths) {
  std::string probe;
  for (const auto &p : paths) {
    std::error_code ec;
    auto mtime = fs::last_write_time(p, ec).time_since_epoch().count();
    uint64_t size = fs::is_regular_file(p, ec) ? fs::file_size(p, ec) : 0;
    probe += p + '\0' + std::to_string(size) + '\0' + std::to_string(mtime) +
             '\n';
  }
  return probe;
}

ClipboardWatcher::Read ClipboardWatcher::read_current(ClipboardContent &out) {
  std::vector<std::string> paths;
  if (!clipboard_.read_files(paths))
    return Read::Failed;
  if (!paths.empty()) {
    std::string probe = probe_files(paths);
    if (primed_ && probe == files_probe_)
      return Read::Unchanged;
    FileList files;
    if (collect_files(paths, file_load_limit_, files) != Status::Ok)
      return Read::Failed;
    files_probe_ = std::move(probe);
    out = ClipboardContent::from_files(std::move(files));
    return Read::Present;
  }
  files_probe_.clear();

  ImageData img;
  if (!clipboard_.read_image(img))
    return Read::Failed;
  if (!img.bytes.empty()) {
    out = ClipboardContent::from_image(std::move(img.encoding),
                                       std::move(img.bytes));
    return Read::Present;
  }

  std::string text;
  if (!clipboard_.read_text(text))
    return Read::Failed;
  if (!text.empty()) {
    out = ClipboardContent::from_text(std::move(text));
    return Read::Present;
  }
  return Read::Absent;
}

bool ClipboardWatcher::poll_once() {
  ClipboardContent current;
  Read r = read_current(current);
  if (r == Read::Failed) {
    Logger::instance().log(LogLevel::DEBUG,
                           "clipboard read failed, retrying next tick");
    return false;
  }
  bool first = !primed_;
  primed_ = true;
  if (r != Read::Present)
    return false;

  Fingerprint fp = fingerprint(current);
  if (last_seen_ && *last_seen_ == fp)
    return false;
  last_seen_ = fp;
  if (first)
    return false;
  Logger::instance().log(LogLevel::DEBUG, "local clipboard changed: %s",
                         current.describe().c_str());
  on_change_(std::move(current));
  return true;
}

} // namespace clipmesh

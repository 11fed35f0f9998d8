#include "sync_engine.hpp"
#include "logging.hpp"
#include <future>
#include <stdexcept>

namespace clipmesh {

static std::string resolve_download_root(const EngineConfig &cfg) {
  return cfg.download_dir.empty() ? default_download_root() : cfg.download_dir;
}

SyncEngine::SyncEngine(asio::io_context &io, EngineConfig cfg,
                       ClipboardBackend &clipboard, SyncEvents events)
    : io_(io), strand_(asio::make_strand(io)),
      files_strand_(asio::make_strand(io)), cfg_(std::move(cfg)),
      clipboard_(clipboard), events_(std::move(events)),
      receiver_(resolve_download_root(cfg_)) {
  std::string err;
  if (!validate_config(cfg_, err))
    throw std::invalid_argument(err);
  if (!crypto_.set_key(cfg_.secret_key))
    throw std::invalid_argument("secret_key rejected");
  origin_ = cfg_.origin_id ? *cfg_.origin_id : random_origin_id();
}

SyncEngine::~SyncEngine() = default;

void SyncEngine::start(bool watch_clipboard) {
  if (started_)
    return;
  started_ = true;
  if (watch_clipboard) {
    watcher_ = std::make_shared<ClipboardWatcher>(
        strand_, clipboard_, cfg_.poll_interval, cfg_.max_file_size,
        [this](ClipboardContent c) { handle_local_change(std::move(c)); });
    watcher_->start();
  }

  listener_.reset(new Listener(
      io_, crypto_, [this](Payload &&p, const std::string &remote) {
        Logger::instance().log(LogLevel::DEBUG, "payload from %s: %s",
                               remote.c_str(), p.content.describe().c_str());
        on_inbound(std::move(p));
      }));
  listener_->start(cfg_.listen_host, cfg_.listen_port);

  LinkOptions opts;
  opts.initial_backoff = cfg_.reconnect_initial;
  opts.max_backoff = cfg_.reconnect_max;
  for (const auto &peer : cfg_.peers) {
    auto link = std::make_shared<PeerLink>(io_, peer, opts, events_.peer_state,
                                           events_.peer_error);
    links_.push_back(link);
    link->start();
  }

  Logger::instance().log(LogLevel::INFO,
                         "sync engine started: origin=%s peers=%zu max_file_size=%llu",
                         origin_str(origin_).c_str(), links_.size(),
                         (unsigned long long)cfg_.max_file_size);
}

void SyncEngine::stop() {
  if (!started_ || stopped_)
    return;
  stopped_ = true;
  if (watcher_)
    watcher_->stop();
  if (listener_)
    listener_->stop();
  for (auto &link : links_)
    link->stop();
  Logger::instance().log(LogLevel::INFO, "sync engine stopping");
}

void SyncEngine::on_local_change(ClipboardContent content) {
  asio::post(strand_, [this, c = std::move(content)]() mutable {
    handle_local_change(std::move(c));
  });
}

void SyncEngine::on_inbound(Payload payload) {
  asio::post(strand_, [this, p = std::move(payload)]() mutable {
    handle_inbound(std::move(p));
  });
}

uint16_t SyncEngine::listen_port() const {
  return listener_ ? listener_->port() : cfg_.listen_port;
}

std::vector<PeerStatus> SyncEngine::peer_status() const {
  std::vector<PeerStatus> out;
  for (const auto &link : links_)
    out.push_back(PeerStatus{link->peer(), link->state(), link->last_error()});
  return out;
}

std::optional<Fingerprint> SyncEngine::query_last_applied() {
  std::promise<std::optional<Fingerprint>> done;
  auto result = done.get_future();
  asio::post(strand_, [this, &done]() { done.set_value(last_applied_); });
  return result.get();
}

void SyncEngine::handle_local_change(ClipboardContent content) {
  Fingerprint fp = fingerprint(content);
  if (last_applied_ && *last_applied_ == fp) {
    Logger::instance().log(LogLevel::DEBUG,
                           "local change matches applied remote content, "
                           "not rebroadcasting");
    return;
  }
  // The clipboard moved past the applied content; it may be originated again.
  last_applied_.reset();

  if (content.kind() == ContentKind::Files &&
      content.byte_size() > cfg_.max_file_size) {
    Logger::instance().log(
        LogLevel::INFO, "file list of %llu bytes exceeds max_file_size %llu, kept local",
        (unsigned long long)content.byte_size(),
        (unsigned long long)cfg_.max_file_size);
    return;
  }

  Payload payload{origin_, std::move(content)};
  std::vector<uint8_t> wire;
  Status st = encode_to_wire(crypto_, payload, wire);
  if (st != Status::Ok) {
    Logger::instance().log(LogLevel::WARN, "not sending %s: %s",
                           payload.content.describe().c_str(), status_str(st));
    return;
  }

  auto frame = std::make_shared<const std::vector<uint8_t>>(std::move(wire));
  for (auto &link : links_)
    link->send(frame);
  Logger::instance().log(LogLevel::INFO, "broadcast %s to %zu peer(s)",
                         payload.content.describe().c_str(), links_.size());
  if (events_.content_sent)
    events_.content_sent(payload.content, links_.size());
}

void SyncEngine::handle_inbound(Payload payload) {
  if (payload.origin_id == origin_) {
    Logger::instance().log(LogLevel::DEBUG, "ignoring payload with own origin");
    return;
  }
  const ClipboardContent &content = payload.content;
  if (content.kind() == ContentKind::Files &&
      content.byte_size() > cfg_.max_file_size) {
    Logger::instance().log(
        LogLevel::WARN,
        "rejecting file list of %llu bytes from %s: exceeds max_file_size %llu",
        (unsigned long long)content.byte_size(),
        origin_str(payload.origin_id).c_str(),
        (unsigned long long)cfg_.max_file_size);
    return;
  }

  // Recorded before the clipboard write so the watcher's next poll is an echo.
  last_applied_ = fingerprint(content);
  Logger::instance().log(LogLevel::INFO, "applying remote %s from %s",
                         content.describe().c_str(),
                         origin_str(payload.origin_id).c_str());

  bool ok = true;
  if (auto text = content.text()) {
    ok = clipboard_.write_text(*text);
  } else if (auto img = content.image()) {
    ok = clipboard_.write_image(*img);
  } else {
    apply_files(std::make_shared<const ClipboardContent>(std::move(payload.content)));
    return;
  }
  if (!ok) {
    Logger::instance().log(LogLevel::WARN, "clipboard write failed (%s)",
                           clipboard_.name());
    return;
  }
  if (events_.content_applied)
    events_.content_applied(content);
}

// Files are written off the engine strand; the clipboard update comes back to
// it and is skipped when newer remote content was applied in the meantime.
// Entries the receiver skipped are not on disk, so the fingerprint recorded
// for echo suppression is taken from what the watcher will read back.
void SyncEngine::apply_files(std::shared_ptr<const ClipboardContent> content) {
  Fingerprint fp = *last_applied_;
  asio::post(files_strand_, [this, content, fp]() {
    auto written =
        receiver_.receive(*content->files(), std::chrono::system_clock::now());
    if (written.empty())
      return;
    FileList on_disk;
    if (collect_files(written, cfg_.max_file_size, on_disk) != Status::Ok) {
      Logger::instance().log(
          LogLevel::WARN, "received files not readable back, clipboard unchanged");
      return;
    }
    Fingerprint observed =
        fingerprint(ClipboardContent::from_files(std::move(on_disk)));
    asio::post(strand_, [this, content, fp, observed, written]() {
      if (!last_applied_ || *last_applied_ != fp) {
        Logger::instance().log(LogLevel::DEBUG,
                               "received files superseded, clipboard unchanged");
        return;
      }
      if (observed != fp)
        Logger::instance().log(LogLevel::INFO,
                               "only part of the received file list was written");
      last_applied_ = observed;
      if (!clipboard_.write_files(written)) {
        Logger::instance().log(LogLevel::WARN,
                               "clipboard write failed for %zu file(s) (%s)",
                               written.size(), clipboard_.name());
        return;
      }
      if (events_.content_applied)
        events_.content_applied(*content);
    });
  });
}

} // namespace clipmesh

#include "peer_link.hpp"
#include "logging.hpp"
#include <algorithm>

namespace clipmesh {

const char *link_state_str(LinkState s) {
  switch (s) {
  case LinkState::Disconnected:
    return "disconnected";
  case LinkState::Connecting:
    return "connecting";
  case LinkState::Connected:
    return "connected";
  }
  return "unknown";
}

PeerLink::PeerLink(asio::io_context &io, PeerConfig peer, LinkOptions opts,
                   StateHandler on_state, ErrorHandler on_error)
    : strand_(asio::make_strand(io)), peer_(std::move(peer)), opts_(opts),
      on_state_(std::move(on_state)), on_error_(std::move(on_error)),
      resolver_(strand_), sock_(strand_), retry_timer_(strand_),
      probe_buf_(512), backoff_(opts.initial_backoff) {}

void PeerLink::start() {
  auto self = shared_from_this();
  asio::dispatch(strand_, [this, self]() {
    if (!stopped_)
      connect();
  });
}

void PeerLink::stop() {
  auto self = shared_from_this();
  asio::dispatch(strand_, [this, self]() {
    if (stopped_)
      return;
    stopped_ = true;
    epoch_++;
    retry_timer_.cancel();
    resolver_.cancel();
    std::error_code ec;
    sock_.close(ec);
    write_q_.clear();
    set_state(Disconnected{std::chrono::steady_clock::time_point::max()});
  });
}

std::string PeerLink::last_error() const {
  std::lock_guard<std::mutex> lk(err_mtx_);
  return last_error_;
}

void PeerLink::set_state(State s) {
  state_ = std::move(s);
  LinkState ls = static_cast<LinkState>(state_.index());
  if (public_state_.exchange(ls) == ls)
    return;
  Logger::instance().log(LogLevel::INFO, "peer %s %s",
                         peer_.endpoint().c_str(), link_state_str(ls));
  if (on_state_)
    on_state_(peer_, ls);
}

void PeerLink::connect() {
  set_state(Connecting{});
  uint64_t epoch = ++epoch_;
  auto self = shared_from_this();
  resolver_.async_resolve(
      peer_.host, std::to_string(peer_.port),
      [this, self, epoch](std::error_code ec,
                          tcp::resolver::results_type results) {
        if (epoch != epoch_ || stopped_)
          return;
        if (ec) {
          fail("resolve", ec);
          return;
        }
        asio::async_connect(
            sock_, results,
            [this, self, epoch](std::error_code ec, const tcp::endpoint &) {
              if (epoch != epoch_ || stopped_)
                return;
              if (ec) {
                fail("connect", ec);
                return;
              }
              on_connected();
            });
      });
}

void PeerLink::on_connected() {
  std::error_code ec;
  sock_.set_option(tcp::no_delay(true), ec);
  backoff_ = opts_.initial_backoff;
  set_state(Connected{});
  watch_remote_close();
}

// Peers never write on this connection; any completion means it is gone.
void PeerLink::watch_remote_close() {
  uint64_t epoch = epoch_;
  auto self = shared_from_this();
  sock_.async_read_some(
      asio::buffer(probe_buf_),
      [this, self, epoch](std::error_code ec, std::size_t) {
        if (epoch != epoch_ || stopped_)
          return;
        if (!ec)
          ec = std::make_error_code(std::errc::protocol_error);
        fail("read", ec);
      });
}

void PeerLink::send(WireFrame frame) {
  auto self = shared_from_this();
  asio::post(strand_, [this, self, frame]() {
    if (stopped_)
      return;
    if (!std::holds_alternative<Connected>(state_)) {
      Logger::instance().log(LogLevel::DEBUG,
                             "peer %s not connected, update dropped",
                             peer_.endpoint().c_str());
      return;
    }
    if (write_q_.size() >= opts_.max_queued_frames) {
      Logger::instance().log(LogLevel::WARN,
                             "peer %s send queue full, update dropped",
                             peer_.endpoint().c_str());
      return;
    }
    write_q_.push_back(frame);
    if (write_q_.size() == 1)
      do_write();
  });
}

void PeerLink::do_write() {
  if (write_q_.empty())
    return;
  uint64_t epoch = epoch_;
  auto self = shared_from_this();
  auto front = write_q_.front();
  asio::async_write(sock_, asio::buffer(*front),
                    [this, self, epoch, front](std::error_code ec,
                                               std::size_t) {
                      if (epoch != epoch_ || stopped_)
                        return;
                      if (ec) {
                        fail("write", ec);
                        return;
                      }
                      frames_sent_++;
                      write_q_.pop_front();
                      if (!write_q_.empty())
                        do_write();
                    });
}

void PeerLink::fail(const std::string &what, const std::error_code &ec) {
  bool was_connected = std::holds_alternative<Connected>(state_);
  std::string msg = what + ": " + ec.message();
  {
    std::lock_guard<std::mutex> lk(err_mtx_);
    last_error_ = msg;
  }
  Logger::instance().log(was_connected ? LogLevel::WARN : LogLevel::DEBUG,
                         "peer %s %s", peer_.endpoint().c_str(), msg.c_str());
  if (on_error_)
    on_error_(peer_, msg);

  epoch_++;
  std::error_code ignored;
  sock_.close(ignored);
  write_q_.clear();
  if (stopped_)
    return;

  auto retry_at = std::chrono::steady_clock::now() + backoff_;
  set_state(Disconnected{retry_at});
  backoff_ = std::min(backoff_ * 2, opts_.max_backoff);
  retry_timer_.expires_at(retry_at);
  uint64_t epoch = epoch_;
  auto self = shared_from_this();
  retry_timer_.async_wait([this, self, epoch](std::error_code ec) {
    if (ec || stopped_ || epoch != epoch_)
      return;
    connect();
  });
}

} // namespace clipmesh

#include "listener.hpp"
#include "logging.hpp"

namespace clipmesh {

Listener::Listener(asio::io_context &io, const CryptoProvider &crypto,
                   PayloadHandler on_payload)
    : io_(io), strand_(asio::make_strand(io)), acceptor_(strand_),
      crypto_(crypto), on_payload_(std::move(on_payload)) {}

Listener::~Listener() {
  std::error_code ec;
  acceptor_.close(ec);
}

void Listener::start(const std::string &host, uint16_t port) {
  tcp::endpoint ep(asio::ip::make_address(host), port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen();
  port_ = acceptor_.local_endpoint().port();
  Logger::instance().log(LogLevel::INFO, "listening on %s:%u", host.c_str(),
                         (unsigned)port_);
  asio::dispatch(strand_, [this]() { do_accept(); });
}

void Listener::stop() {
  asio::dispatch(strand_, [this]() {
    if (stopping_)
      return;
    stopping_ = true;
    std::error_code ec;
    acceptor_.close(ec);
    for (auto &c : conns_) {
      asio::dispatch(c->sock.get_executor(), [c]() {
        c->draining = true;
        if (!c->reader.mid_frame()) {
          std::error_code ec2;
          c->sock.close(ec2);
        }
      });
    }
  });
}

void Listener::do_accept() {
  if (stopping_)
    return;
  acceptor_.async_accept(
      asio::make_strand(io_), [this](std::error_code ec, tcp::socket sock) {
        if (stopping_)
          return;
        if (ec) {
          Logger::instance().log(LogLevel::ERROR, "accept failed: %s",
                                 ec.message().c_str());
        } else {
          auto c = std::make_shared<Conn>(std::move(sock));
          std::error_code ep_ec;
          auto ep = c->sock.remote_endpoint(ep_ec);
          c->remote = ep_ec ? std::string("?")
                            : ep.address().to_string() + ":" +
                                  std::to_string(ep.port());
          Logger::instance().log(LogLevel::INFO, "accepted %s",
                                 c->remote.c_str());
          conns_.insert(c);
          asio::dispatch(c->sock.get_executor(), [this, c]() { do_read(c); });
        }
        do_accept();
      });
}

void Listener::close_conn(std::shared_ptr<Conn> c) {
  std::error_code ec;
  c->sock.close(ec);
  asio::post(strand_, [this, c]() { conns_.erase(c); });
}

void Listener::do_read(std::shared_ptr<Conn> c) {
  c->sock.async_read_some(
      asio::buffer(c->read_buf), [this, c](std::error_code ec, std::size_t n) {
        if (ec) {
          if (ec != asio::error::eof && ec != asio::error::operation_aborted)
            Logger::instance().log(LogLevel::DEBUG, "%s read error: %s",
                                   c->remote.c_str(), ec.message().c_str());
          close_conn(c);
          return;
        }
        if (!parse_and_handle(c, c->read_buf.data(), n)) {
          close_conn(c);
          return;
        }
        if (c->draining && !c->reader.mid_frame()) {
          close_conn(c);
          return;
        }
        do_read(c);
      });
}

bool Listener::parse_and_handle(std::shared_ptr<Conn> c, const uint8_t *data,
                                size_t n) {
  c->reader.feed(data, n);
  std::vector<uint8_t> wire;
  while (true) {
    bool ready = false;
    Status st = c->reader.next(wire, ready);
    if (st != Status::Ok) {
      Logger::instance().log(LogLevel::WARN,
                             "%s sent an invalid frame length, dropping",
                             c->remote.c_str());
      return false;
    }
    if (!ready)
      return true;
    Payload payload;
    st = decode_from_wire(crypto_, wire.data(), wire.size(), payload);
    if (st == Status::CryptoError) {
      Logger::instance().log(
          LogLevel::WARN,
          "decryption failed from %s (wrong key or tampered frame), dropping",
          c->remote.c_str());
      return false;
    }
    if (st != Status::Ok) {
      Logger::instance().log(LogLevel::WARN,
                             "malformed payload from %s (%s), dropping",
                             c->remote.c_str(), status_str(st));
      return false;
    }
    on_payload_(std::move(payload), c->remote);
  }
}

} // namespace clipmesh

#pragma once
#include <asio.hpp>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "crypto.hpp"
#include "protocol.hpp"

namespace clipmesh {

// Accepts peer connections. Each connection decodes frames independently; a
// frame that fails authentication or parsing closes only that connection.
class Listener {
public:
    using tcp = asio::ip::tcp;
    using PayloadHandler = std::function<void(Payload&&, const std::string& remote)>;

    Listener(asio::io_context& io, const CryptoProvider& crypto, PayloadHandler on_payload);
    ~Listener();

    // Throws std::system_error when the address cannot be bound.
    void start(const std::string& host, uint16_t port);
    // Stops accepting; open connections close once their current frame is done.
    void stop();
    uint16_t port() const { return port_; }

    struct Conn : public std::enable_shared_from_this<Conn> {
        tcp::socket sock;
        std::vector<uint8_t> read_buf;
        FrameReader reader;
        std::string remote;
        bool draining{false};
        Conn(tcp::socket s) : sock(std::move(s)), read_buf(64*1024) {}
    };

private:
    void do_accept();
    void do_read(std::shared_ptr<Conn> c);
    bool parse_and_handle(std::shared_ptr<Conn> c, const uint8_t* data, size_t n);
    void close_conn(std::shared_ptr<Conn> c);

    asio::io_context& io_;
    asio::strand<asio::io_context::executor_type> strand_;
    tcp::acceptor acceptor_;
    const CryptoProvider& crypto_;
    PayloadHandler on_payload_;
    uint16_t port_{0};
    bool stopping_{false};
    std::set<std::shared_ptr<Conn>> conns_;
};

} // namespace clipmesh

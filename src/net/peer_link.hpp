#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>
#include "config.hpp"

namespace clipmesh {

enum class LinkState { Disconnected, Connecting, Connected };
const char* link_state_str(LinkState s);

struct LinkOptions {
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{30000};
    size_t max_queued_frames{8};
};

using WireFrame = std::shared_ptr<const std::vector<uint8_t>>;

// Persistent outbound connection to one peer.
//   Disconnected{retry_at} -> Connecting -> Connected -> Disconnected ...
// Frames offered while not connected are dropped, never queued for later.
class PeerLink : public std::enable_shared_from_this<PeerLink> {
public:
    using tcp = asio::ip::tcp;
    using StateHandler = std::function<void(const PeerConfig&, LinkState)>;
    using ErrorHandler = std::function<void(const PeerConfig&, const std::string&)>;

    PeerLink(asio::io_context& io, PeerConfig peer, LinkOptions opts,
             StateHandler on_state = {}, ErrorHandler on_error = {});

    void start();
    void stop();
    // Fire-and-forget; never blocks and never reports failure to the caller.
    void send(WireFrame frame);

    LinkState state() const { return public_state_.load(); }
    std::string last_error() const;
    const PeerConfig& peer() const { return peer_; }
    uint64_t frames_sent() const { return frames_sent_.load(); }

private:
    struct Disconnected { std::chrono::steady_clock::time_point retry_at; };
    struct Connecting {};
    struct Connected {};
    using State = std::variant<Disconnected, Connecting, Connected>;

    void connect();
    void on_connected();
    void watch_remote_close();
    void do_write();
    void fail(const std::string& what, const std::error_code& ec);
    void set_state(State s);

    asio::strand<asio::io_context::executor_type> strand_;
    PeerConfig peer_;
    LinkOptions opts_;
    StateHandler on_state_;
    ErrorHandler on_error_;

    tcp::resolver resolver_;
    tcp::socket sock_;
    asio::steady_timer retry_timer_;
    std::deque<WireFrame> write_q_;
    std::vector<uint8_t> probe_buf_;

    State state_{Disconnected{}};
    std::chrono::milliseconds backoff_;
    uint64_t epoch_{0};
    bool stopped_{false};

    std::atomic<LinkState> public_state_{LinkState::Disconnected};
    std::atomic<uint64_t> frames_sent_{0};
    mutable std::mutex err_mtx_;
    std::string last_error_;
};

} // namespace clipmesh

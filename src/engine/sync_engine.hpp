#pragma once
#include <asio.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "clipboard_backend.hpp"
#include "clipboard_watcher.hpp"
#include "config.hpp"
#include "content.hpp"
#include "crypto.hpp"
#include "file_receiver.hpp"
#include "listener.hpp"
#include "peer_link.hpp"
#include "protocol.hpp"

namespace clipmesh {

// Observational hooks for a UI or tray; invoked from io threads.
struct SyncEvents {
    std::function<void(const PeerConfig&, LinkState)> peer_state;
    std::function<void(const PeerConfig&, const std::string&)> peer_error;
    std::function<void(const ClipboardContent&)> content_applied;
    std::function<void(const ClipboardContent&, size_t links)> content_sent;
};

struct PeerStatus {
    PeerConfig peer;
    LinkState state;
    std::string last_error;
};

// Orchestrates local changes and inbound payloads. Clipboard polling, inbound
// application and the last applied fingerprint all live on one strand, so a
// poll can never observe an applied update that the engine has not recorded.
class SyncEngine {
public:
    // Throws std::invalid_argument for an invalid configuration.
    SyncEngine(asio::io_context& io, EngineConfig cfg, ClipboardBackend& clipboard,
               SyncEvents events = {});
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    // Binds the listener (throws std::system_error on failure), then starts
    // peer links and, when `watch_clipboard` is set, the clipboard watcher.
    void start(bool watch_clipboard = true);
    void stop();

    void on_local_change(ClipboardContent content);
    void on_inbound(Payload payload);

    uint16_t listen_port() const;
    const OriginId& origin_id() const { return origin_; }
    std::vector<PeerStatus> peer_status() const;
    // Round-trips through the engine strand; must not be called from it.
    std::optional<Fingerprint> query_last_applied();

private:
    void handle_local_change(ClipboardContent content);
    void handle_inbound(Payload payload);
    void apply_files(std::shared_ptr<const ClipboardContent> content);

    asio::io_context& io_;
    asio::strand<asio::io_context::executor_type> strand_;
    asio::strand<asio::io_context::executor_type> files_strand_;
    EngineConfig cfg_;
    ClipboardBackend& clipboard_;
    SyncEvents events_;
    OriginId origin_;
    SodiumAead crypto_;
    FileReceiver receiver_;

    std::optional<Fingerprint> last_applied_;

    std::unique_ptr<Listener> listener_;
    std::vector<std::shared_ptr<PeerLink>> links_;
    std::shared_ptr<ClipboardWatcher> watcher_;
    bool started_{false};
    bool stopped_{false};
};

} // namespace clipmesh

#pragma once
#include <asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "clipboard_backend.hpp"
#include "content.hpp"

namespace clipmesh {

// Polls the clipboard and reports content whose fingerprint differs from the
// previous observation. Read failures are skipped until the next tick.
// Ticks and the change handler run on the strand given at construction.
class ClipboardWatcher : public std::enable_shared_from_this<ClipboardWatcher> {
public:
    using Strand = asio::strand<asio::io_context::executor_type>;
    using ChangeHandler = std::function<void(ClipboardContent)>;

    ClipboardWatcher(Strand strand, ClipboardBackend& clipboard,
                     std::chrono::milliseconds interval, uint64_t file_load_limit,
                     ChangeHandler on_change);

    // Reads the current clipboard as baseline (not reported) on the calling
    // thread, then polls on the strand. Call before anything else uses it.
    void start();
    void stop();
    // Single tick; true when a change was reported.
    bool poll_once();

private:
    enum class Read { Present, Absent, Unchanged, Failed };

    Read read_current(ClipboardContent& out);
    void schedule();

    Strand strand_;
    asio::steady_timer timer_;
    ClipboardBackend& clipboard_;
    std::chrono::milliseconds interval_;
    uint64_t file_load_limit_;
    ChangeHandler on_change_;

    bool stopped_{false};
    bool primed_{false};
    std::optional<Fingerprint> last_seen_;
    std::string files_probe_;
};

} // namespace clipmesh

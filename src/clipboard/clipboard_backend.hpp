#pragma once
#include <memory>
#include <string>
#include <vector>
#include "content.hpp"

namespace clipmesh {

// Host clipboard access. Reads return false when the clipboard could not be
// queried and true with empty output when that kind of content is absent.
// Implementations must tolerate calls from different threads.
class ClipboardBackend {
public:
    virtual ~ClipboardBackend() = default;
    virtual const char* name() const = 0;

    virtual bool read_text(std::string& out) = 0;
    virtual bool write_text(const std::string& text) = 0;
    virtual bool read_image(ImageData& out) = 0;
    virtual bool write_image(const ImageData& img) = 0;
    // Absolute local paths.
    virtual bool read_files(std::vector<std::string>& paths) = 0;
    virtual bool write_files(const std::vector<std::string>& paths) = 0;
};

// Probes the environment once: Win32, then Wayland, then X11.
// Returns nullptr when no clipboard is reachable.
std::unique_ptr<ClipboardBackend> make_system_clipboard();

} // namespace clipmesh

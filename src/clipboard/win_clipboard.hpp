#pragma once
#include <mutex>
#include "clipboard_backend.hpp"

namespace clipmesh {

// Win32 clipboard: CF_UNICODETEXT, the registered "PNG" format or CF_DIB,
// and CF_HDROP for file lists.
class WinClipboard : public ClipboardBackend {
public:
    WinClipboard();
    const char* name() const override { return "windows"; }

    bool read_text(std::string& out) override;
    bool write_text(const std::string& text) override;
    bool read_image(ImageData& out) override;
    bool write_image(const ImageData& img) override;
    bool read_files(std::vector<std::string>& paths) override;
    bool write_files(const std::vector<std::string>& paths) override;

private:
    std::mutex mtx_;
    unsigned int png_format_{0};
};

} // namespace clipmesh

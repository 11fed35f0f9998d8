#include "clipboard_backend.hpp"
#include "logging.hpp"
#include <cstdlib>

#if defined(_WIN32)
#include "win_clipboard.hpp"
#else
#include "command_clipboard.hpp"
#endif

namespace clipmesh {

std::unique_ptr<ClipboardBackend> make_system_clipboard() {
#if defined(_WIN32)
  return std::unique_ptr<ClipboardBackend>(new WinClipboard());
#else
  const char *wayland = std::getenv("WAYLAND_DISPLAY");
  if (wayland && *wayland)
    return std::unique_ptr<ClipboardBackend>(new WaylandClipboard());
  const char *display = std::getenv("DISPLAY");
  if (display && *display)
    return std::unique_ptr<ClipboardBackend>(new X11Clipboard());
  Logger::instance().log(LogLevel::ERROR,
                         "no clipboard: neither WAYLAND_DISPLAY nor DISPLAY set");
  return nullptr;
#endif
}

} // namespace clipmesh

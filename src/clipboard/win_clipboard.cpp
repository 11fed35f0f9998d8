#include "win_clipboard.hpp"
#include "logging.hpp"
#include "util.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>
#include <chrono>
#include <cstring>
#include <thread>

namespace clipmesh {

namespace {

// OpenClipboard fails while another process holds it; retry briefly.
class ClipboardLock {
public:
  ClipboardLock() {
    for (int i = 0; i < 10 && !open_; i++) {
      open_ = OpenClipboard(nullptr) != 0;
      if (!open_)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  ~ClipboardLock() {
    if (open_)
      CloseClipboard();
  }
  bool ok() const { return open_; }

private:
  bool open_{false};
};

std::wstring utf8_to_wide(const std::string &s) {
  if (s.empty())
    return std::wstring();
  int n = MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), nullptr, 0);
  std::wstring out(n, L'\0');
  MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), &out[0], n);
  return out;
}

std::string wide_to_utf8(const wchar_t *w, size_t len) {
  if (len == 0)
    return std::string();
  int n = WideCharToMultiByte(CP_UTF8, 0, w, (int)len, nullptr, 0, nullptr,
                              nullptr);
  std::string out(n, '\0');
  WideCharToMultiByte(CP_UTF8, 0, w, (int)len, &out[0], n, nullptr, nullptr);
  return out;
}

bool set_global(UINT format, const void *data, size_t len) {
  HGLOBAL mem = GlobalAlloc(GMEM_MOVEABLE, len);
  if (!mem)
    return false;
  void *dst = GlobalLock(mem);
  if (!dst) {
    GlobalFree(mem);
    return false;
  }
  std::memcpy(dst, data, len);
  GlobalUnlock(mem);
  if (!SetClipboardData(format, mem)) {
    GlobalFree(mem);
    return false;
  }
  return true;
}

bool get_global(UINT format, std::vector<uint8_t> &out) {
  HANDLE h = GetClipboardData(format);
  if (!h)
    return false;
  const void *src = GlobalLock(h);
  if (!src)
    return false;
  size_t len = GlobalSize(h);
  const uint8_t *p = static_cast<const uint8_t *>(src);
  out.assign(p, p + len);
  GlobalUnlock(h);
  return true;
}

} // namespace

WinClipboard::WinClipboard() { png_format_ = RegisterClipboardFormatW(L"PNG"); }

bool WinClipboard::read_text(std::string &out) {
  std::lock_guard<std::mutex> lk(mtx_);
  out.clear();
  ClipboardLock lock;
  if (!lock.ok())
    return false;
  if (!IsClipboardFormatAvailable(CF_UNICODETEXT))
    return true;
  HANDLE h = GetClipboardData(CF_UNICODETEXT);
  if (!h)
    return false;
  const wchar_t *w = static_cast<const wchar_t *>(GlobalLock(h));
  if (!w)
    return false;
  out = wide_to_utf8(w, wcslen(w));
  GlobalUnlock(h);
  return true;
}

bool WinClipboard::write_text(const std::string &text) {
  std::lock_guard<std::mutex> lk(mtx_);
  std::wstring w = utf8_to_wide(text);
  ClipboardLock lock;
  if (!lock.ok() || !EmptyClipboard())
    return false;
  return set_global(CF_UNICODETEXT, w.c_str(), (w.size() + 1) * sizeof(wchar_t));
}

bool WinClipboard::read_image(ImageData &out) {
  std::lock_guard<std::mutex> lk(mtx_);
  out = ImageData{};
  ClipboardLock lock;
  if (!lock.ok())
    return false;
  if (png_format_ && IsClipboardFormatAvailable(png_format_)) {
    if (!get_global(png_format_, out.bytes))
      return false;
    // GlobalSize may round up past the bytes that were written
    out.bytes.resize(png_length(out.bytes.data(), out.bytes.size()));
    out.encoding = "image/png";
    return true;
  }
  if (!IsClipboardFormatAvailable(CF_DIB))
    return true;
  std::vector<uint8_t> dib;
  if (!get_global(CF_DIB, dib) || dib.size() < sizeof(BITMAPINFOHEADER))
    return false;
  // Prefix a BITMAPFILEHEADER so the bytes form a standalone .bmp.
  const auto *bih = reinterpret_cast<const BITMAPINFOHEADER *>(dib.data());
  DWORD palette = bih->biClrUsed ? bih->biClrUsed
                  : (bih->biBitCount <= 8 ? (1u << bih->biBitCount) : 0);
  DWORD masks = (bih->biCompression == BI_BITFIELDS &&
                 bih->biSize == sizeof(BITMAPINFOHEADER))
                    ? 12
                    : 0;
  uint64_t image = bih->biSizeImage;
  if (image == 0 &&
      (bih->biCompression == BI_RGB || bih->biCompression == BI_BITFIELDS)) {
    uint64_t stride = (((uint64_t)bih->biWidth * bih->biBitCount + 31) / 32) * 4;
    image = stride * (uint64_t)(bih->biHeight < 0 ? -(int64_t)bih->biHeight
                                                   : bih->biHeight);
  }
  uint64_t exact = bih->biSize + masks + palette * sizeof(RGBQUAD) + image;
  if (image != 0 && exact < dib.size()) {
    dib.resize((size_t)exact);
    bih = reinterpret_cast<const BITMAPINFOHEADER *>(dib.data());
  }
  BITMAPFILEHEADER bfh{};
  bfh.bfType = 0x4D42;
  bfh.bfSize = (DWORD)(sizeof(bfh) + dib.size());
  bfh.bfOffBits = (DWORD)(sizeof(bfh) + bih->biSize + masks +
                          palette * sizeof(RGBQUAD));
  out.bytes.resize(sizeof(bfh) + dib.size());
  std::memcpy(out.bytes.data(), &bfh, sizeof(bfh));
  std::memcpy(out.bytes.data() + sizeof(bfh), dib.data(), dib.size());
  out.encoding = "image/bmp";
  return true;
}

bool WinClipboard::write_image(const ImageData &img) {
  std::lock_guard<std::mutex> lk(mtx_);
  ClipboardLock lock;
  if (!lock.ok() || !EmptyClipboard())
    return false;
  if (img.encoding == "image/png" && png_format_)
    return set_global(png_format_, img.bytes.data(), img.bytes.size());
  if (img.encoding == "image/bmp" &&
      img.bytes.size() > sizeof(BITMAPFILEHEADER)) {
    return set_global(CF_DIB, img.bytes.data() + sizeof(BITMAPFILEHEADER),
                      img.bytes.size() - sizeof(BITMAPFILEHEADER));
  }
  Logger::instance().log(LogLevel::WARN, "windows: unsupported image type %s",
                         img.encoding.c_str());
  return false;
}

bool WinClipboard::read_files(std::vector<std::string> &paths) {
  std::lock_guard<std::mutex> lk(mtx_);
  paths.clear();
  ClipboardLock lock;
  if (!lock.ok())
    return false;
  if (!IsClipboardFormatAvailable(CF_HDROP))
    return true;
  HDROP drop = static_cast<HDROP>(GetClipboardData(CF_HDROP));
  if (!drop)
    return false;
  UINT count = DragQueryFileW(drop, 0xFFFFFFFF, nullptr, 0);
  for (UINT i = 0; i < count; i++) {
    UINT len = DragQueryFileW(drop, i, nullptr, 0);
    std::wstring w(len + 1, L'\0');
    DragQueryFileW(drop, i, &w[0], len + 1);
    paths.push_back(wide_to_utf8(w.c_str(), len));
  }
  return true;
}

bool WinClipboard::write_files(const std::vector<std::string> &paths) {
  std::lock_guard<std::mutex> lk(mtx_);
  // DROPFILES header followed by a double-NUL terminated wide path list.
  std::wstring list;
  for (const auto &p : paths) {
    list += utf8_to_wide(p);
    list.push_back(L'\0');
  }
  list.push_back(L'\0');
  std::vector<uint8_t> buf(sizeof(DROPFILES) + list.size() * sizeof(wchar_t));
  DROPFILES df{};
  df.pFiles = sizeof(DROPFILES);
  df.fWide = TRUE;
  std::memcpy(buf.data(), &df, sizeof(df));
  std::memcpy(buf.data() + sizeof(df), list.data(),
              list.size() * sizeof(wchar_t));
  ClipboardLock lock;
  if (!lock.ok() || !EmptyClipboard())
    return false;
  return set_global(CF_HDROP, buf.data(), buf.size());
}

} // namespace clipmesh

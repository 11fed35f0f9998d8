#include "content.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sodium.h>

namespace fs = std::filesystem;

namespace clipmesh {

bool operator==(const ImageData &a, const ImageData &b) {
  return a.encoding == b.encoding && a.bytes == b.bytes;
}

bool operator==(const FileEntry &a, const FileEntry &b) {
  return a.path == b.path && a.size == b.size && a.data == b.data;
}

ClipboardContent ClipboardContent::from_text(std::string text) {
  ClipboardContent c;
  c.value_ = std::move(text);
  return c;
}

ClipboardContent ClipboardContent::from_image(std::string encoding,
                                              std::vector<uint8_t> bytes) {
  ClipboardContent c;
  c.value_ = ImageData{std::move(encoding), std::move(bytes)};
  return c;
}

ClipboardContent ClipboardContent::from_files(FileList files) {
  ClipboardContent c;
  c.value_ = std::move(files);
  return c;
}

uint64_t ClipboardContent::byte_size() const {
  if (auto t = text())
    return t->size();
  if (auto img = image())
    return img->bytes.size();
  uint64_t total = 0;
  for (const auto &f : *files())
    total += f.size;
  return total;
}

std::string ClipboardContent::describe() const {
  char buf[96];
  if (auto f = files())
    std::snprintf(buf, sizeof(buf), "files count=%zu bytes=%llu", f->size(),
                  (unsigned long long)byte_size());
  else
    std::snprintf(buf, sizeof(buf), "%s bytes=%llu", kind_str(kind()),
                  (unsigned long long)byte_size());
  return buf;
}

const char *kind_str(ContentKind k) {
  switch (k) {
  case ContentKind::Text:
    return "text";
  case ContentKind::Image:
    return "image";
  case ContentKind::Files:
    return "files";
  }
  return "unknown";
}

namespace {

struct Hasher {
  crypto_generichash_state st;
  Hasher() { crypto_generichash_init(&st, nullptr, 0, kFingerprintBytes); }
  void add(const void *p, size_t n) {
    crypto_generichash_update(&st, static_cast<const unsigned char *>(p), n);
  }
  // Length-prefixed so field boundaries are unambiguous.
  void add_field(const void *p, size_t n) {
    std::vector<uint8_t> len;
    put_be64(len, n);
    add(len.data(), len.size());
    add(p, n);
  }
  void add_u64(uint64_t v) {
    std::vector<uint8_t> b;
    put_be64(b, v);
    add(b.data(), b.size());
  }
};

} // namespace

Fingerprint fingerprint(const ClipboardContent &c) {
  Hasher h;
  uint8_t tag = static_cast<uint8_t>(c.kind());
  h.add(&tag, 1);
  if (auto t = c.text()) {
    h.add_field(t->data(), t->size());
  } else if (auto img = c.image()) {
    h.add_field(img->encoding.data(), img->encoding.size());
    h.add_field(img->bytes.data(), img->bytes.size());
  } else {
    // Order-independent: directory listing order differs between hosts.
    std::vector<const FileEntry *> files;
    for (const auto &f : *c.files())
      files.push_back(&f);
    std::stable_sort(files.begin(), files.end(),
                     [](const FileEntry *a, const FileEntry *b) {
                       return a->path < b->path;
                     });
    h.add_u64(files.size());
    for (const FileEntry *e : files) {
      const FileEntry &f = *e;
      h.add_field(f.path.data(), f.path.size());
      h.add_u64(f.size);
      h.add_field(f.data.data(), f.data.size());
    }
  }
  Fingerprint fp;
  crypto_generichash_final(&h.st, fp.data(), fp.size());
  return fp;
}

std::string fingerprint_hex(const Fingerprint &fp) {
  return bytes_to_hex(fp.data(), fp.size());
}

static bool read_whole_file(const fs::path &p, uint64_t size,
                            std::vector<uint8_t> &out) {
  std::ifstream in(p, std::ios::binary);
  if (!in)
    return false;
  out.resize((size_t)size);
  if (size > 0 && !in.read(reinterpret_cast<char *>(out.data()),
                           (std::streamsize)size))
    return false;
  return true;
}

Status collect_files(const std::vector<std::string> &paths,
                     uint64_t load_limit, FileList &out) {
  struct Pending {
    fs::path source;
    FileEntry entry;
  };
  std::vector<Pending> found;
  uint64_t total = 0;
  std::error_code ec;

  for (const auto &raw : paths) {
    fs::path item(raw);
    fs::file_status st = fs::status(item, ec);
    if (ec) {
      Logger::instance().log(LogLevel::WARN, "skip %s: %s", raw.c_str(),
                             ec.message().c_str());
      continue;
    }
    fs::path base = item.filename();
    if (base.empty())
      base = item.parent_path().filename();

    if (fs::is_regular_file(st)) {
      uint64_t sz = fs::file_size(item, ec);
      if (ec) {
        Logger::instance().log(LogLevel::WARN, "skip %s: %s", raw.c_str(),
                               ec.message().c_str());
        continue;
      }
      found.push_back({item, FileEntry{base.generic_string(), sz, {}}});
      total += sz;
    } else if (fs::is_directory(st)) {
      fs::recursive_directory_iterator it(
          item, fs::directory_options::skip_permission_denied, ec);
      if (ec) {
        Logger::instance().log(LogLevel::WARN, "skip dir %s: %s", raw.c_str(),
                               ec.message().c_str());
        continue;
      }
      for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec)
          break;
        if (!it->is_regular_file(ec))
          continue;
        uint64_t sz = it->file_size(ec);
        if (ec)
          continue;
        fs::path rel = base / fs::relative(it->path(), item, ec);
        if (ec)
          continue;
        found.push_back({it->path(), FileEntry{rel.generic_string(), sz, {}}});
        total += sz;
      }
    }
  }

  std::sort(found.begin(), found.end(), [](const Pending &a, const Pending &b) {
    return a.entry.path < b.entry.path;
  });
  out.clear();
  bool load = total <= load_limit;
  for (auto &p : found) {
    if (load && !read_whole_file(p.source, p.entry.size, p.entry.data)) {
      Logger::instance().log(LogLevel::WARN, "read failed: %s",
                             p.source.string().c_str());
      continue;
    }
    out.push_back(std::move(p.entry));
  }
  if (!paths.empty() && out.empty())
    return Status::IoError;
  return Status::Ok;
}

} // namespace clipmesh

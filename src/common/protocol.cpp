#include "protocol.hpp"
#include "util.hpp"
#include <cstring>

namespace clipmesh {

OriginId random_origin_id() {
  OriginId id;
  random_bytes(id.data(), id.size());
  return id;
}

std::string origin_str(const OriginId &id) {
  return bytes_to_hex(id.data(), id.size());
}

std::vector<uint8_t> serialize_payload(const Payload &p) {
  std::vector<uint8_t> out;
  out.reserve(32 + p.content.byte_size());
  out.push_back(kPayloadFormat);
  out.insert(out.end(), p.origin_id.begin(), p.origin_id.end());
  out.push_back(static_cast<uint8_t>(p.content.kind()));
  if (auto t = p.content.text()) {
    put_be32(out, (uint32_t)t->size());
    out.insert(out.end(), t->begin(), t->end());
  } else if (auto img = p.content.image()) {
    put_be16(out, (uint16_t)img->encoding.size());
    out.insert(out.end(), img->encoding.begin(), img->encoding.end());
    put_be32(out, (uint32_t)img->bytes.size());
    out.insert(out.end(), img->bytes.begin(), img->bytes.end());
  } else {
    const FileList &files = *p.content.files();
    put_be32(out, (uint32_t)files.size());
    for (const auto &f : files) {
      put_be16(out, (uint16_t)f.path.size());
      out.insert(out.end(), f.path.begin(), f.path.end());
      put_be64(out, f.size);
      out.insert(out.end(), f.data.begin(), f.data.end());
    }
  }
  return out;
}

namespace {

struct Cursor {
  const uint8_t *p;
  size_t left;
  bool take(size_t n, const uint8_t *&at) {
    if (left < n)
      return false;
    at = p;
    p += n;
    left -= n;
    return true;
  }
  bool u8(uint8_t &v) {
    const uint8_t *at;
    if (!take(1, at))
      return false;
    v = at[0];
    return true;
  }
  bool u16(uint16_t &v) {
    const uint8_t *at;
    if (!take(2, at))
      return false;
    v = get_be16(at);
    return true;
  }
  bool u32(uint32_t &v) {
    const uint8_t *at;
    if (!take(4, at))
      return false;
    v = get_be32(at);
    return true;
  }
  bool u64(uint64_t &v) {
    const uint8_t *at;
    if (!take(8, at))
      return false;
    v = get_be64(at);
    return true;
  }
};

bool valid_entry_path(const std::string &path) {
  if (path.empty())
    return false;
  return std::memchr(path.data(), '\0', path.size()) == nullptr &&
         is_valid_utf8(path);
}

} // namespace

Status parse_payload(const uint8_t *data, size_t len, Payload &out) {
  Cursor c{data, len};
  uint8_t format = 0, kind = 0;
  const uint8_t *at = nullptr;
  if (!c.u8(format) || format != kPayloadFormat)
    return Status::ProtocolError;
  if (!c.take(kOriginIdBytes, at))
    return Status::ProtocolError;
  std::memcpy(out.origin_id.data(), at, kOriginIdBytes);
  if (!c.u8(kind))
    return Status::ProtocolError;

  switch (static_cast<ContentKind>(kind)) {
  case ContentKind::Text: {
    uint32_t n = 0;
    if (!c.u32(n) || !c.take(n, at))
      return Status::ProtocolError;
    std::string text(reinterpret_cast<const char *>(at), n);
    if (!is_valid_utf8(text))
      return Status::ProtocolError;
    out.content = ClipboardContent::from_text(std::move(text));
    break;
  }
  case ContentKind::Image: {
    uint16_t elen = 0;
    uint32_t n = 0;
    if (!c.u16(elen) || elen == 0 || !c.take(elen, at))
      return Status::ProtocolError;
    std::string encoding(reinterpret_cast<const char *>(at), elen);
    if (!c.u32(n) || !c.take(n, at))
      return Status::ProtocolError;
    out.content = ClipboardContent::from_image(std::move(encoding),
                                               std::vector<uint8_t>(at, at + n));
    break;
  }
  case ContentKind::Files: {
    uint32_t count = 0;
    // an empty list is never originated
    if (!c.u32(count) || count == 0)
      return Status::ProtocolError;
    FileList files;
    // each entry needs at least 2 + 1 + 8 bytes
    if ((uint64_t)count * 11 > c.left)
      return Status::ProtocolError;
    files.reserve(count);
    for (uint32_t i = 0; i < count; i++) {
      uint16_t plen = 0;
      uint64_t size = 0;
      if (!c.u16(plen) || !c.take(plen, at))
        return Status::ProtocolError;
      FileEntry e;
      e.path.assign(reinterpret_cast<const char *>(at), plen);
      if (!valid_entry_path(e.path))
        return Status::ProtocolError;
      if (!c.u64(size) || size > c.left || !c.take((size_t)size, at))
        return Status::ProtocolError;
      e.size = size;
      e.data.assign(at, at + size);
      files.push_back(std::move(e));
    }
    out.content = ClipboardContent::from_files(std::move(files));
    break;
  }
  default:
    return Status::ProtocolError;
  }
  if (c.left != 0)
    return Status::ProtocolError;
  return Status::Ok;
}

std::vector<uint8_t> frame_to_wire(const Frame &f) {
  std::vector<uint8_t> out;
  out.reserve(kLengthBytes + f.length);
  put_be32(out, f.length);
  out.insert(out.end(), f.nonce.begin(), f.nonce.end());
  out.insert(out.end(), f.sealed.begin(), f.sealed.end());
  return out;
}

Status frame_from_wire(const uint8_t *data, size_t len, Frame &out) {
  if (len < kLengthBytes)
    return Status::ProtocolError;
  uint32_t body = get_be32(data);
  if (body > kMaxFrameBody || body < kMinFrameBody)
    return Status::ProtocolError;
  if (len - kLengthBytes != body)
    return Status::ProtocolError;
  out.length = body;
  std::memcpy(out.nonce.data(), data + kLengthBytes, kNonceBytes);
  out.sealed.assign(data + kLengthBytes + kNonceBytes, data + len);
  return Status::Ok;
}

Status encode(const CryptoProvider &crypto, const Payload &p, Frame &out) {
  if (auto files = p.content.files()) {
    if (files->empty())
      return Status::ProtocolError;
    for (const auto &f : *files)
      if (f.data.size() != f.size || !valid_entry_path(f.path))
        return Status::ProtocolError;
  }
  std::vector<uint8_t> body = serialize_payload(p);
  if (body.size() > kMaxFrameBody - kMinFrameBody)
    return Status::SizeLimitExceeded;
  out.nonce = random_nonce();
  if (!crypto.encrypt(out.nonce, body))
    return Status::CryptoError;
  out.sealed = std::move(body);
  out.length = (uint32_t)(kNonceBytes + out.sealed.size());
  return Status::Ok;
}

Status decode(const CryptoProvider &crypto, const Frame &f, Payload &out) {
  if (f.length != kNonceBytes + f.sealed.size())
    return Status::ProtocolError;
  std::vector<uint8_t> body = f.sealed;
  if (!crypto.decrypt(f.nonce, body))
    return Status::CryptoError;
  Payload parsed;
  Status st = parse_payload(body.data(), body.size(), parsed);
  if (st != Status::Ok)
    return st;
  out = std::move(parsed);
  return Status::Ok;
}

Status encode_to_wire(const CryptoProvider &crypto, const Payload &p,
                      std::vector<uint8_t> &wire) {
  Frame f;
  Status st = encode(crypto, p, f);
  if (st != Status::Ok)
    return st;
  wire = frame_to_wire(f);
  return Status::Ok;
}

Status decode_from_wire(const CryptoProvider &crypto, const uint8_t *data,
                        size_t len, Payload &out) {
  Frame f;
  Status st = frame_from_wire(data, len, f);
  if (st != Status::Ok)
    return st;
  return decode(crypto, f, out);
}

void FrameReader::feed(const uint8_t *data, size_t n) {
  if (off_ > 0 && off_ == buf_.size()) {
    buf_.clear();
    off_ = 0;
  }
  buf_.insert(buf_.end(), data, data + n);
}

Status FrameReader::next(std::vector<uint8_t> &wire, bool &ready) {
  ready = false;
  size_t avail = buf_.size() - off_;
  if (avail < kLengthBytes)
    return Status::Ok;
  uint32_t body = get_be32(buf_.data() + off_);
  if (body > kMaxFrameBody || body < kMinFrameBody)
    return Status::ProtocolError;
  size_t need = kLengthBytes + body;
  if (avail < need)
    return Status::Ok;
  wire.assign(buf_.begin() + off_, buf_.begin() + off_ + need);
  off_ += need;
  if (off_ == buf_.size()) {
    buf_.clear();
    off_ = 0;
  } else if (off_ > 1024 * 1024) {
    buf_.erase(buf_.begin(), buf_.begin() + off_);
    off_ = 0;
  }
  ready = true;
  return Status::Ok;
}

} // namespace clipmesh

#include "util.hpp"
#include "status.hpp"
#include <cctype>
#include <cstring>

namespace clipmesh {

const char *status_str(Status s) {
  switch (s) {
  case Status::Ok:
    return "ok";
  case Status::CryptoError:
    return "crypto error";
  case Status::ProtocolError:
    return "protocol error";
  case Status::IoError:
    return "io error";
  case Status::ConfigError:
    return "config error";
  case Status::SizeLimitExceeded:
    return "size limit exceeded";
  }
  return "unknown";
}

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos || pos == 0)
    return false;
  host = s.substr(0, pos);
  if (host.size() > 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  std::string digits = s.substr(pos + 1);
  if (digits.empty() || digits.size() > 5)
    return false;
  int p = 0;
  for (char c : digits) {
    if (!std::isdigit((unsigned char)c))
      return false;
    p = p * 10 + (c - '0');
  }
  if (p <= 0 || p > 65535)
    return false;
  port = (uint16_t)p;
  return true;
}

static int hex_val(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::vector<uint8_t> hex_to_bytes(const std::string &hex) {
  std::vector<uint8_t> out;
  if (hex.empty() || (hex.size() % 2) != 0)
    return out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_val(hex[i]), lo = hex_val(hex[i + 1]);
    if (hi < 0 || lo < 0)
      return {};
    out.push_back((uint8_t)((hi << 4) | lo));
  }
  return out;
}

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; i++) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

void put_be16(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back((uint8_t)(v >> 8));
  out.push_back((uint8_t)(v & 0xFF));
}

void put_be32(std::vector<uint8_t> &out, uint32_t v) {
  for (int s = 24; s >= 0; s -= 8)
    out.push_back((uint8_t)(v >> s));
}

void put_be64(std::vector<uint8_t> &out, uint64_t v) {
  for (int s = 56; s >= 0; s -= 8)
    out.push_back((uint8_t)(v >> s));
}

uint16_t get_be16(const uint8_t *p) { return (uint16_t)((p[0] << 8) | p[1]); }

uint32_t get_be32(const uint8_t *p) {
  return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) |
         ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

uint64_t get_be64(const uint8_t *p) {
  uint64_t v = 0;
  for (int i = 0; i < 8; i++)
    v = (v << 8) | p[i];
  return v;
}

bool is_valid_utf8(const std::string &s) {
  size_t i = 0, n = s.size();
  while (i < n) {
    uint8_t c = (uint8_t)s[i];
    size_t len;
    uint32_t cp;
    if (c < 0x80) {
      i++;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > n)
      return false;
    for (size_t j = 1; j < len; j++) {
      uint8_t cc = (uint8_t)s[i + j];
      if ((cc & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong forms, surrogates, out of range
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
        (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF))
      return false;
    i += len;
  }
  return true;
}

std::string percent_decode(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); i++) {
    if (s[i] == '%' && i + 2 < s.size()) {
      int hi = hex_val(s[i + 1]), lo = hex_val(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back((char)((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(s[i]);
  }
  return out;
}

std::string percent_encode_path(const std::string &path) {
  static const char digits[] = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : path) {
    if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' ||
        c == '~') {
      out.push_back((char)c);
    } else {
      out.push_back('%');
      out.push_back(digits[c >> 4]);
      out.push_back(digits[c & 0x0F]);
    }
  }
  return out;
}

std::string trim(const std::string &s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace((unsigned char)s[b]))
    b++;
  while (e > b && std::isspace((unsigned char)s[e - 1]))
    e--;
  return s.substr(b, e - b);
}

size_t png_length(const uint8_t *data, size_t len) {
  static const uint8_t kSignature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
  if (len < sizeof(kSignature) ||
      std::memcmp(data, kSignature, sizeof(kSignature)) != 0)
    return len;
  size_t off = sizeof(kSignature);
  // chunk: u32 length | 4-byte type | data | u32 crc
  while (len - off >= 12) {
    uint64_t end = (uint64_t)off + 12 + get_be32(data + off);
    if (end > len)
      return len;
    if (std::memcmp(data + off + 4, "IEND", 4) == 0)
      return (size_t)end;
    off = (size_t)end;
  }
  return len;
}

} // namespace clipmesh

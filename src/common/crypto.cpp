#include "crypto.hpp"
#include "logging.hpp"
#include <algorithm>
#include <sodium.h>

namespace clipmesh {

static_assert(crypto_aead_chacha20poly1305_ietf_KEYBYTES == kKeyBytes,
              "key size mismatch");
static_assert(crypto_aead_chacha20poly1305_ietf_NPUBBYTES == kNonceBytes,
              "nonce size mismatch");
static_assert(crypto_aead_chacha20poly1305_ietf_ABYTES == kTagBytes,
              "tag size mismatch");

bool crypto_init() { return sodium_init() >= 0; }

void random_bytes(uint8_t *out, size_t len) { randombytes_buf(out, len); }

Nonce random_nonce() {
  Nonce n;
  randombytes_buf(n.data(), n.size());
  return n;
}

SodiumAead::SodiumAead() {
  if (!crypto_init())
    Logger::instance().log(LogLevel::ERROR, "sodium_init failed");
}

SodiumAead::~SodiumAead() { sodium_memzero(key_.data(), key_.size()); }

bool SodiumAead::set_key(const std::vector<uint8_t> &key) {
  if (key.size() != kKeyBytes)
    return false;
  std::copy(key.begin(), key.end(), key_.begin());
  has_key_ = true;
  return true;
}

bool SodiumAead::encrypt(const Nonce &nonce,
                         std::vector<uint8_t> &inout) const {
  if (!has_key_)
    return false;
  std::vector<uint8_t> out(inout.size() + kTagBytes);
  unsigned long long outlen = 0;
  if (crypto_aead_chacha20poly1305_ietf_encrypt(
          out.data(), &outlen, inout.data(), inout.size(), nullptr, 0, nullptr,
          nonce.data(), key_.data()) != 0)
    return false;
  out.resize((size_t)outlen);
  inout.swap(out);
  return true;
}

bool SodiumAead::decrypt(const Nonce &nonce,
                         std::vector<uint8_t> &inout) const {
  if (!has_key_ || inout.size() < kTagBytes)
    return false;
  std::vector<uint8_t> out(inout.size() - kTagBytes);
  unsigned long long outlen = 0;
  if (crypto_aead_chacha20poly1305_ietf_decrypt(
          out.data(), &outlen, nullptr, inout.data(), inout.size(), nullptr, 0,
          nonce.data(), key_.data()) != 0)
    return false;
  out.resize((size_t)outlen);
  inout.swap(out);
  return true;
}

} // namespace clipmesh

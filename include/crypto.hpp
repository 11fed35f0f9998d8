#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace clipmesh {

constexpr size_t kKeyBytes = 32;
constexpr size_t kNonceBytes = 12;
constexpr size_t kTagBytes = 16;

using Nonce = std::array<uint8_t, kNonceBytes>;

// Initializes libsodium; safe to call repeatedly.
bool crypto_init();
void random_bytes(uint8_t* out, size_t len);
Nonce random_nonce();

class CryptoProvider {
public:
    virtual ~CryptoProvider() = default;
    virtual bool set_key(const std::vector<uint8_t>& key) = 0;
    // In place: plaintext in, ciphertext||tag out.
    virtual bool encrypt(const Nonce& nonce, std::vector<uint8_t>& inout) const = 0;
    // In place: ciphertext||tag in, plaintext out. False on authentication failure.
    virtual bool decrypt(const Nonce& nonce, std::vector<uint8_t>& inout) const = 0;
};

// ChaCha20-Poly1305 (IETF, 96-bit nonce).
class SodiumAead : public CryptoProvider {
public:
    SodiumAead();
    ~SodiumAead() override;
    bool set_key(const std::vector<uint8_t>& key) override;
    bool encrypt(const Nonce& nonce, std::vector<uint8_t>& inout) const override;
    bool decrypt(const Nonce& nonce, std::vector<uint8_t>& inout) const override;
private:
    std::array<uint8_t, kKeyBytes> key_{};
    bool has_key_{false};
};

} // namespace clipmesh

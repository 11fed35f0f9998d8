#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "content.hpp"
#include "crypto.hpp"
#include "status.hpp"

namespace clipmesh {

// Wire frame: [u32 length BE][12-byte nonce][ciphertext || 16-byte tag]
// where length counts everything after itself. No version marker.
constexpr size_t   kLengthBytes = 4;
constexpr uint32_t kMaxFrameBody = 50u * 1024 * 1024;
constexpr uint32_t kMinFrameBody = kNonceBytes + kTagBytes;

// First byte of every decrypted payload.
constexpr uint8_t kPayloadFormat = 1;

constexpr size_t kOriginIdBytes = 16;
using OriginId = std::array<uint8_t, kOriginIdBytes>;

OriginId random_origin_id();
std::string origin_str(const OriginId& id);

struct Payload {
    OriginId origin_id{};
    ClipboardContent content;

    bool operator==(const Payload& o) const {
        return origin_id == o.origin_id && content == o.content;
    }
};

struct Frame {
    uint32_t length{0};
    Nonce nonce{};
    std::vector<uint8_t> sealed;   // ciphertext || tag
};

// Plaintext payload record, shared by both directions:
//   u8 format | 16B origin | u8 kind | kind-specific fields
//   Text : u32 len | utf8 bytes
//   Image: u16 len | encoding | u32 len | bytes
//   Files: u32 count (>= 1) | { u16 len | path | u64 size | bytes[size] }*
std::vector<uint8_t> serialize_payload(const Payload& p);
Status parse_payload(const uint8_t* data, size_t len, Payload& out);

std::vector<uint8_t> frame_to_wire(const Frame& f);
// Expects exactly one complete frame; a length field that disagrees with the
// buffer is rejected before any decryption.
Status frame_from_wire(const uint8_t* data, size_t len, Frame& out);

// A fresh random nonce is drawn for every call.
Status encode(const CryptoProvider& crypto, const Payload& p, Frame& out);
Status decode(const CryptoProvider& crypto, const Frame& f, Payload& out);

Status encode_to_wire(const CryptoProvider& crypto, const Payload& p,
                      std::vector<uint8_t>& wire);
Status decode_from_wire(const CryptoProvider& crypto, const uint8_t* data,
                        size_t len, Payload& out);

// Splits a TCP byte stream into complete wire frames.
class FrameReader {
public:
    void feed(const uint8_t* data, size_t n);
    // Ok with ready=false: need more bytes. ProtocolError: stream is unusable.
    Status next(std::vector<uint8_t>& wire, bool& ready);
    bool mid_frame() const { return buf_.size() > off_; }
private:
    std::vector<uint8_t> buf_;
    size_t off_{0};
};

} // namespace clipmesh

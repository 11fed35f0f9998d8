#pragma once
#include <cstdint>

namespace clipmesh {

enum class Status : uint8_t {
    Ok = 0,
    CryptoError,        // authentication failed: wrong key or tampered frame
    ProtocolError,      // malformed payload, bad length, oversized frame
    IoError,            // clipboard, file or socket failure
    ConfigError,        // invalid key length, bad peer address
    SizeLimitExceeded
};

const char* status_str(Status s);

} // namespace clipmesh

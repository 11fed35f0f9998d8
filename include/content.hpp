#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "status.hpp"

namespace clipmesh {

enum class ContentKind : uint8_t { Text = 1, Image = 2, Files = 3 };

struct ImageData {
    std::string encoding;          // MIME type, e.g. "image/png"
    std::vector<uint8_t> bytes;
};

// One file of a copied file list. `path` is relative, '/'-separated.
struct FileEntry {
    std::string path;
    uint64_t size{0};
    std::vector<uint8_t> data;
};

bool operator==(const ImageData& a, const ImageData& b);
bool operator==(const FileEntry& a, const FileEntry& b);

using FileList = std::vector<FileEntry>;

class ClipboardContent {
public:
    ClipboardContent() = default;
    static ClipboardContent from_text(std::string text);
    static ClipboardContent from_image(std::string encoding, std::vector<uint8_t> bytes);
    static ClipboardContent from_files(FileList files);

    ContentKind kind() const { return static_cast<ContentKind>(value_.index() + 1); }
    const std::string* text() const { return std::get_if<std::string>(&value_); }
    const ImageData* image() const { return std::get_if<ImageData>(&value_); }
    const FileList* files() const { return std::get_if<FileList>(&value_); }

    // Sum of declared entry sizes for Files, payload bytes otherwise.
    uint64_t byte_size() const;
    std::string describe() const;

    bool operator==(const ClipboardContent& o) const { return value_ == o.value_; }
    bool operator!=(const ClipboardContent& o) const { return !(value_ == o.value_); }

private:
    std::variant<std::string, ImageData, FileList> value_;
};

const char* kind_str(ContentKind k);

constexpr size_t kFingerprintBytes = 32;
using Fingerprint = std::array<uint8_t, kFingerprintBytes>;

// BLAKE2b over the kind tag and every field of the active variant. File
// entries are hashed in path order, so listing order does not matter.
Fingerprint fingerprint(const ClipboardContent& c);
std::string fingerprint_hex(const Fingerprint& fp);

// Expands local paths (files or directories, recursively) into entries whose
// relative paths start at each item's file name. When the summed size exceeds
// `load_limit` no file data is read and every entry carries only its size.
// Entries come back sorted by path.
Status collect_files(const std::vector<std::string>& paths, uint64_t load_limit,
                     FileList& out);

} // namespace clipmesh

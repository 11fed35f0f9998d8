#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace clipmesh {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::vector<uint8_t> hex_to_bytes(const std::string& hex);
std::string bytes_to_hex(const uint8_t* data, size_t len);

void put_be16(std::vector<uint8_t>& out, uint16_t v);
void put_be32(std::vector<uint8_t>& out, uint32_t v);
void put_be64(std::vector<uint8_t>& out, uint64_t v);
uint16_t get_be16(const uint8_t* p);
uint32_t get_be32(const uint8_t* p);
uint64_t get_be64(const uint8_t* p);

bool is_valid_utf8(const std::string& s);
// Decodes %XX escapes; malformed escapes are kept literally.
std::string percent_decode(const std::string& s);
std::string percent_encode_path(const std::string& path);
std::string trim(const std::string& s);

// Length of the PNG stream up to and including its IEND chunk, or `len` when
// the data is not a complete PNG. Clipboard buffers may carry trailing slack.
size_t png_length(const uint8_t* data, size_t len);

} // namespace clipmesh

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace wire_codec {

std::string hex_encode(const uint8_t* data, size_t len);
std::string hex_encode(const std::vector<uint8_t>& data);
bool hex_decode(const std::string& hex, std::vector<uint8_t>& out);

// gzip, then lowercase hex. Safe to embed in a single protocol line.
bool compress_to_hex(const std::vector<uint8_t>& in, std::string& out);

// Inverse of compress_to_hex. On any failure returns false, leaves `out`
// empty and, if given, fills `error` with the reason.
bool decompress_hex(const std::string& in, std::vector<uint8_t>& out, std::string* error = nullptr);

}

#include "wire_codec.hpp"

#include <zlib.h>

#include <cstring>

namespace wire_codec {

namespace {
    const char* HEX_DIGITS = "0123456789abcdef";

    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    // 15 window bits + 16 selects the gzip wrapper.
    constexpr int GZIP_WINDOW_BITS = 15 + 16;

    void set_error(std::string* error, const std::string& msg) {
        if (error) *error = msg;
    }
}

std::string hex_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.resize(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out[2*i] = HEX_DIGITS[(data[i] >> 4) & 0xF];
        out[2*i + 1] = HEX_DIGITS[data[i] & 0xF];
    }
    return out;
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    return hex_encode(data.data(), data.size());
}

bool hex_decode(const std::string& hex, std::vector<uint8_t>& out) {
    out.clear();
    if (hex.size() % 2 != 0) {
        return false;
    }
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            out.clear();
            return false;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return true;
}

bool compress_to_hex(const std::vector<uint8_t>& in, std::string& out) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    std::vector<uint8_t> compressed(deflateBound(&zs, static_cast<uLong>(in.size())) + 32);
    zs.next_in = const_cast<Bytef*>(in.data());
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = compressed.data();
    zs.avail_out = static_cast<uInt>(compressed.size());

    int ret = deflate(&zs, Z_FINISH);
    size_t produced = zs.total_out;
    deflateEnd(&zs);
    if (ret != Z_STREAM_END) {
        return false;
    }

    out = hex_encode(compressed.data(), produced);
    return true;
}

bool decompress_hex(const std::string& in, std::vector<uint8_t>& out, std::string* error) {
    out.clear();

    std::vector<uint8_t> compressed;
    if (!hex_decode(in, compressed)) {
        set_error(error, "invalid hex payload");
        return false;
    }
    if (compressed.empty()) {
        set_error(error, "empty payload");
        return false;
    }

    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (inflateInit2(&zs, GZIP_WINDOW_BITS) != Z_OK) {
        set_error(error, "inflateInit2 failed");
        return false;
    }
    zs.next_in = compressed.data();
    zs.avail_in = static_cast<uInt>(compressed.size());

    std::vector<uint8_t> result;
    uint8_t buf[65536];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = buf;
        zs.avail_out = sizeof(buf);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            set_error(error, zs.msg ? std::string("corrupt gzip stream: ") + zs.msg : "corrupt gzip stream");
            inflateEnd(&zs);
            return false;
        }
        result.insert(result.end(), buf, buf + (sizeof(buf) - zs.avail_out));
        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            set_error(error, "truncated gzip stream");
            inflateEnd(&zs);
            return false;
        }
    }
    bool trailing = zs.avail_in != 0;
    inflateEnd(&zs);
    if (trailing) {
        set_error(error, "trailing bytes after gzip stream");
        return false;
    }

    out.swap(result);
    return true;
}

}

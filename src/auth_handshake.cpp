#include "auth_handshake.hpp"
#include "protocol.hpp"
#include "utils.hpp"
#include "wire_codec.hpp"

#include "mbedtls/ctr_drbg.h"
#include "mbedtls/entropy.h"
#include "mbedtls/md.h"

#include <cstring>
#include <vector>

namespace {
    constexpr size_t NONCE_BYTES = 32;

    bool constant_time_equal(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        unsigned char diff = 0;
        for (size_t i = 0; i < a.size(); ++i) {
            diff |= static_cast<unsigned char>(a[i] ^ b[i]);
        }
        return diff == 0;
    }

    void send_rejection(LineChannel& channel, int timeout_ms) {
        IoStatus st = channel.write_line(protocol::CMD_AUTH_FAILED, timeout_ms);
        if (st != IoStatus::OK) {
            LOG_DEBUG("could not deliver %s: %s", protocol::CMD_AUTH_FAILED, io_status_name(st));
        }
    }
}

const char* auth_result_name(AuthResult result) {
    switch (result) {
        case AuthResult::OK: return "ok";
        case AuthResult::FINGERPRINT_MISMATCH: return "certificate fingerprint mismatch";
        case AuthResult::SECRET_REJECTED: return "shared secret rejected";
        case AuthResult::PROTOCOL_ERROR: return "unexpected handshake message";
        case AuthResult::TRANSPORT_ERROR: return "transport error during handshake";
    }
    return "unknown";
}

std::string normalize_fingerprint(const std::string& fingerprint) {
    std::string out;
    out.reserve(fingerprint.size());
    for (char c : trim(fingerprint)) {
        if (c != ':') out.push_back(c);
    }
    return to_lower(out);
}

bool generate_random_hex(size_t bytes, std::string& out) {
    mbedtls_entropy_context entropy;
    mbedtls_ctr_drbg_context ctr_drbg;
    mbedtls_entropy_init(&entropy);
    mbedtls_ctr_drbg_init(&ctr_drbg);

    const char* pers = "relayshell-random";
    std::vector<uint8_t> buf(bytes);
    bool ok = mbedtls_ctr_drbg_seed(&ctr_drbg, mbedtls_entropy_func, &entropy,
                                    (const unsigned char*)pers, std::strlen(pers)) == 0 &&
              mbedtls_ctr_drbg_random(&ctr_drbg, buf.data(), buf.size()) == 0;
    if (ok) {
        out = wire_codec::hex_encode(buf);
    } else {
        LOG_ERROR("random generation failed");
    }

    mbedtls_ctr_drbg_free(&ctr_drbg);
    mbedtls_entropy_free(&entropy);
    return ok;
}

std::string compute_auth_proof(const std::string& shared_secret_hex, const std::string& nonce_hex) {
    std::vector<uint8_t> key;
    std::vector<uint8_t> nonce;
    if (!wire_codec::hex_decode(shared_secret_hex, key) || !wire_codec::hex_decode(nonce_hex, nonce) || nonce.empty()) {
        return std::string();
    }
    const mbedtls_md_info_t* md = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    if (md == nullptr) {
        return std::string();
    }
    unsigned char mac[32] = {0};
    if (mbedtls_md_hmac(md, key.data(), key.size(), nonce.data(), nonce.size(), mac) != 0) {
        return std::string();
    }
    return wire_codec::hex_encode(mac, sizeof(mac));
}

AuthResult authenticate_to_listener(LineChannel& channel,
                                    const std::string& peer_fingerprint,
                                    const AuthContext& auth,
                                    int timeout_ms) {
    if (!auth.expected_fingerprint.empty()) {
        std::string expected = normalize_fingerprint(auth.expected_fingerprint);
        std::string actual = normalize_fingerprint(peer_fingerprint);
        if (actual.empty() || actual != expected) {
            LOG_ERROR("listener certificate fingerprint mismatch (got %s)", actual.empty() ? "<none>" : actual.c_str());
            return AuthResult::FINGERPRINT_MISMATCH;
        }
        LOG_INFO("Listener certificate fingerprint verified");
    }

    if (auth.shared_secret_hex.empty()) {
        return AuthResult::OK;
    }

    std::string line;
    IoStatus st = channel.read_line(line, timeout_ms);
    if (st != IoStatus::OK) {
        LOG_ERROR("waiting for auth challenge: %s", io_status_name(st));
        return AuthResult::TRANSPORT_ERROR;
    }
    line = trim(line);
    std::string prefix = std::string(protocol::CMD_AUTH_CHALLENGE) + " ";
    if (!starts_with(line, prefix)) {
        LOG_ERROR("expected %s from listener", protocol::CMD_AUTH_CHALLENGE);
        return AuthResult::PROTOCOL_ERROR;
    }

    std::string proof = compute_auth_proof(auth.shared_secret_hex, line.substr(prefix.size()));
    if (proof.empty()) {
        LOG_ERROR("malformed auth challenge");
        return AuthResult::PROTOCOL_ERROR;
    }
    st = channel.write_line(std::string(protocol::CMD_AUTH) + " " + proof, timeout_ms);
    if (st != IoStatus::OK) {
        return AuthResult::TRANSPORT_ERROR;
    }

    st = channel.read_line(line, timeout_ms);
    if (st != IoStatus::OK) {
        // Listeners close the connection right after AUTH_FAILED.
        return st == IoStatus::CLOSED ? AuthResult::SECRET_REJECTED : AuthResult::TRANSPORT_ERROR;
    }
    line = trim(line);
    if (line == protocol::CMD_AUTH_OK) {
        return AuthResult::OK;
    }
    if (line == protocol::CMD_AUTH_FAILED) {
        return AuthResult::SECRET_REJECTED;
    }
    return AuthResult::PROTOCOL_ERROR;
}

AuthResult authenticate_agent(LineChannel& channel,
                              const std::string& shared_secret_hex,
                              int timeout_ms) {
    if (shared_secret_hex.empty()) {
        return AuthResult::OK;
    }

    std::string nonce;
    if (!generate_random_hex(NONCE_BYTES, nonce)) {
        return AuthResult::TRANSPORT_ERROR;
    }
    IoStatus st = channel.write_line(std::string(protocol::CMD_AUTH_CHALLENGE) + " " + nonce, timeout_ms);
    if (st != IoStatus::OK) {
        return AuthResult::TRANSPORT_ERROR;
    }

    std::string line;
    st = channel.read_line(line, timeout_ms);
    if (st != IoStatus::OK) {
        return AuthResult::TRANSPORT_ERROR;
    }
    line = trim(line);
    std::string prefix = std::string(protocol::CMD_AUTH) + " ";
    if (!starts_with(line, prefix)) {
        send_rejection(channel, timeout_ms);
        return AuthResult::PROTOCOL_ERROR;
    }

    std::string expected = compute_auth_proof(shared_secret_hex, nonce);
    std::string received = to_lower(line.substr(prefix.size()));
    if (expected.empty() || !constant_time_equal(received, expected)) {
        send_rejection(channel, timeout_ms);
        return AuthResult::SECRET_REJECTED;
    }

    st = channel.write_line(protocol::CMD_AUTH_OK, timeout_ms);
    if (st != IoStatus::OK) {
        return AuthResult::TRANSPORT_ERROR;
    }
    return AuthResult::OK;
}

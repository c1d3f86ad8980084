#pragma once

#include "line_channel.hpp"

#include <string>

// Authentication material for one connection attempt. Both fields optional.
struct AuthContext {
    std::string shared_secret_hex;     // 64 hex chars, validated by the config layer
    std::string expected_fingerprint;  // SHA-256 of the listener certificate
};

enum class AuthResult {
    OK,
    FINGERPRINT_MISMATCH,
    SECRET_REJECTED,
    PROTOCOL_ERROR,
    TRANSPORT_ERROR
};

const char* auth_result_name(AuthResult result);

// Agent side. Runs right after the TLS handshake, before any command traffic.
AuthResult authenticate_to_listener(LineChannel& channel,
                                    const std::string& peer_fingerprint,
                                    const AuthContext& auth,
                                    int timeout_ms);

// Listener side. With an empty secret the agent is admitted immediately.
AuthResult authenticate_agent(LineChannel& channel,
                              const std::string& shared_secret_hex,
                              int timeout_ms);

// Lowercase, colons removed.
std::string normalize_fingerprint(const std::string& fingerprint);

// hex(HMAC-SHA256(key, nonce)); empty on failure.
std::string compute_auth_proof(const std::string& shared_secret_hex, const std::string& nonce_hex);

bool generate_random_hex(size_t bytes, std::string& out);

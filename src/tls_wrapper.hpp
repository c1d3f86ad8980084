#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "connection.hpp"

#include "mbedtls/ctr_drbg.h"
#include "mbedtls/entropy.h"
#include "mbedtls/net_sockets.h"
#include "mbedtls/ssl.h"

class TLSWrapper {
public:
    TLSWrapper();
    ~TLSWrapper();

    TLSWrapper(const TLSWrapper&) = delete;
    TLSWrapper& operator=(const TLSWrapper&) = delete;

    // Server mode requires cert and key; client mode ignores them.
    bool configure_ssl(bool is_server, const std::string& cert, const std::string& key);

    bool attach_socket(intptr_t fd);
    bool perform_handshake(int timeout_ms);

    // Deadline-bound I/O on a non-blocking socket. One internal mutex
    // serializes every call into the mbedtls context.
    IoStatus tls_write_all(const void* buf, size_t len, int timeout_ms);
    IoStatus tls_read_some(void* buf, size_t len, size_t& n, int timeout_ms);

    void close_notify();
    std::string get_peer_fingerprint();
    std::string get_tls_version();
    std::string get_ciphersuite();

    intptr_t socket_fd() const { return socket_fd_; }

    static std::string file_fingerprint(const std::string& cert_file);

private:
    bool initialize_context();
    bool load_certificates();
    bool configure_ssl_internal();

    mbedtls_entropy_context entropy;
    mbedtls_ctr_drbg_context ctr_drbg;
    mbedtls_ssl_context ssl;
    mbedtls_ssl_config conf;
    mbedtls_x509_crt srvcert;
    mbedtls_pk_context pkey;

    std::string cert_file;
    std::string key_file;
    bool is_server_ = false;

    std::mutex io_mutex_;
    intptr_t socket_fd_ = -1;
};

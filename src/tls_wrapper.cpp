#include "tls_wrapper.hpp"
#include "utils.hpp"
#include "wire_codec.hpp"
#include "mbedtls/sha256.h"
#include "psa/crypto.h"

#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <unistd.h>

TLSWrapper::TLSWrapper() {
    mbedtls_ssl_init(&ssl);
    mbedtls_ssl_config_init(&conf);
    mbedtls_x509_crt_init(&srvcert);
    mbedtls_pk_init(&pkey);
    mbedtls_ctr_drbg_init(&ctr_drbg);
    mbedtls_entropy_init(&entropy);
}

TLSWrapper::~TLSWrapper() {
    mbedtls_x509_crt_free(&srvcert);
    mbedtls_pk_free(&pkey);
    mbedtls_ssl_free(&ssl);
    mbedtls_ssl_config_free(&conf);
    mbedtls_ctr_drbg_free(&ctr_drbg);
    mbedtls_entropy_free(&entropy);
}

namespace {
    static int send_cb(void* ctx, const unsigned char* buf, size_t len) {
        TLSWrapper* self = static_cast<TLSWrapper*>(ctx);
        intptr_t fd = self->socket_fd();
        if (fd < 0) return MBEDTLS_ERR_NET_INVALID_CONTEXT;
        ssize_t ret = ::send(static_cast<int>(fd), buf, len, MSG_NOSIGNAL);
        if (ret < 0) {
            if (errno == EWOULDBLOCK || errno == EAGAIN || errno == EINTR) return MBEDTLS_ERR_SSL_WANT_WRITE;
            return MBEDTLS_ERR_NET_SEND_FAILED;
        }
        return static_cast<int>(ret);
    }

    static int recv_cb(void* ctx, unsigned char* buf, size_t len) {
        TLSWrapper* self = static_cast<TLSWrapper*>(ctx);
        intptr_t fd = self->socket_fd();
        if (fd < 0) return MBEDTLS_ERR_NET_INVALID_CONTEXT;
        ssize_t ret = ::recv(static_cast<int>(fd), buf, len, 0);
        if (ret < 0) {
            if (errno == EWOULDBLOCK || errno == EAGAIN || errno == EINTR) return MBEDTLS_ERR_SSL_WANT_READ;
            return MBEDTLS_ERR_NET_RECV_FAILED;
        }
        return static_cast<int>(ret); // 0 = closed
    }

    using Clock = std::chrono::steady_clock;

    int remaining_ms(Clock::time_point deadline) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        return left > 0 ? static_cast<int>(left) : 0;
    }

    // Waits until fd is ready for `events`; short slices keep shutdown() responsive.
    void wait_fd(intptr_t fd, short events, int timeout_ms) {
        pollfd pfd{};
        pfd.fd = static_cast<int>(fd);
        pfd.events = events;
        ::poll(&pfd, 1, std::min(timeout_ms, 200));
    }

    bool is_peer_closed(int ret) {
        return ret == 0 || ret == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY || ret == MBEDTLS_ERR_SSL_CONN_EOF;
    }
}

bool TLSWrapper::attach_socket(intptr_t fd) {
    socket_fd_ = fd;
    int flags = fcntl(static_cast<int>(fd), F_GETFL, 0);
    if (flags < 0 || fcntl(static_cast<int>(fd), F_SETFL, flags | O_NONBLOCK) < 0) {
        LOG_ERROR("fcntl(O_NONBLOCK) failed: %s", error_to_string(errno).c_str());
        return false;
    }
    mbedtls_ssl_set_bio(&ssl, this, send_cb, recv_cb, nullptr);
    return true;
}

bool TLSWrapper::perform_handshake(int timeout_ms) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    int ret;
    while ((ret = mbedtls_ssl_handshake(&ssl)) != 0) {
        if (ret != MBEDTLS_ERR_SSL_WANT_READ && ret != MBEDTLS_ERR_SSL_WANT_WRITE) {
            LOG_ERROR("mbedtls_ssl_handshake returned -0x%x", static_cast<unsigned>(-ret));
            return false;
        }
        int left = remaining_ms(deadline);
        if (left == 0) {
            LOG_ERROR("TLS handshake timed out");
            return false;
        }
        wait_fd(socket_fd_, ret == MBEDTLS_ERR_SSL_WANT_READ ? POLLIN : POLLOUT, left);
    }
    return true;
}

IoStatus TLSWrapper::tls_write_all(const void* buf, size_t len, int timeout_ms) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    const unsigned char* p = static_cast<const unsigned char*>(buf);
    size_t remaining = len;

    std::lock_guard<std::mutex> lock(io_mutex_);
    while (remaining > 0) {
        int ret = mbedtls_ssl_write(&ssl, p, remaining);
        if (ret > 0) {
            p += ret;
            remaining -= static_cast<size_t>(ret);
            continue;
        }
        if (ret == MBEDTLS_ERR_SSL_WANT_WRITE || ret == MBEDTLS_ERR_SSL_WANT_READ) {
            int left = remaining_ms(deadline);
            if (left == 0) {
                return IoStatus::TIMEOUT;
            }
            wait_fd(socket_fd_, ret == MBEDTLS_ERR_SSL_WANT_WRITE ? POLLOUT : POLLIN, left);
            continue;
        }
        if (is_peer_closed(ret)) {
            return IoStatus::CLOSED;
        }
        LOG_ERROR("mbedtls_ssl_write returned -0x%x", static_cast<unsigned>(-ret));
        return IoStatus::ERROR;
    }
    return IoStatus::OK;
}

IoStatus TLSWrapper::tls_read_some(void* buf, size_t len, size_t& n, int timeout_ms) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    n = 0;
    for (;;) {
        int ret;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            ret = mbedtls_ssl_read(&ssl, static_cast<unsigned char*>(buf), len);
        }
        if (ret > 0) {
            n = static_cast<size_t>(ret);
            return IoStatus::OK;
        }
        if (is_peer_closed(ret)) {
            return IoStatus::CLOSED;
        }
        if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE
#ifdef MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET
            || ret == MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET
#endif
            ) {
            int left = remaining_ms(deadline);
            if (left == 0) {
                return IoStatus::TIMEOUT;
            }
            wait_fd(socket_fd_, POLLIN, left);
            continue;
        }
        LOG_ERROR("mbedtls_ssl_read returned -0x%x", static_cast<unsigned>(-ret));
        return IoStatus::ERROR;
    }
}

void TLSWrapper::close_notify() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    mbedtls_ssl_close_notify(&ssl);
}

bool TLSWrapper::initialize_context() {
    if (psa_crypto_init() != PSA_SUCCESS) {
        LOG_ERROR("psa_crypto_init failed");
        return false;
    }

    const char* pers = "relayshell";
    if (mbedtls_ctr_drbg_seed(&ctr_drbg, mbedtls_entropy_func, &entropy, (const unsigned char*)pers, std::strlen(pers)) != 0) {
        LOG_ERROR("mbedtls_ctr_drbg_seed failed");
        return false;
    }

    return load_certificates();
}

bool TLSWrapper::load_certificates() {
    if (!is_server_) {
        return true;
    }
    if (mbedtls_x509_crt_parse_file(&srvcert, cert_file.c_str()) != 0) {
        LOG_ERROR("mbedtls_x509_crt_parse_file (cert) failed for %s", cert_file.c_str());
        return false;
    }
    if (mbedtls_pk_parse_keyfile(&pkey, key_file.c_str(), nullptr, mbedtls_ctr_drbg_random, &ctr_drbg) != 0) {
        LOG_ERROR("mbedtls_pk_parse_keyfile failed for %s", key_file.c_str());
        return false;
    }
    return true;
}

bool TLSWrapper::configure_ssl_internal() {
    if (mbedtls_ssl_config_defaults(&conf,
                                    is_server_ ? MBEDTLS_SSL_IS_SERVER : MBEDTLS_SSL_IS_CLIENT,
                                    MBEDTLS_SSL_TRANSPORT_STREAM,
                                    MBEDTLS_SSL_PRESET_DEFAULT) != 0) {
        LOG_ERROR("mbedtls_ssl_config_defaults failed");
        return false;
    }

    mbedtls_ssl_conf_rng(&conf, mbedtls_ctr_drbg_random, &ctr_drbg);
    mbedtls_ssl_conf_min_tls_version(&conf, MBEDTLS_SSL_VERSION_TLS1_2);

    // The listener certificate is self-signed; agents pin its fingerprint instead.
    mbedtls_ssl_conf_authmode(&conf, MBEDTLS_SSL_VERIFY_NONE);

    if (is_server_) {
        if (mbedtls_ssl_conf_own_cert(&conf, &srvcert, &pkey) != 0) {
            LOG_ERROR("mbedtls_ssl_conf_own_cert failed");
            return false;
        }
    }

    if (mbedtls_ssl_setup(&ssl, &conf) != 0) {
        LOG_ERROR("mbedtls_ssl_setup failed");
        return false;
    }

    return true;
}

bool TLSWrapper::configure_ssl(bool is_server, const std::string& cert, const std::string& key) {
    cert_file = cert;
    key_file = key;
    is_server_ = is_server;

    if (!initialize_context()) {
        return false;
    }
    return configure_ssl_internal();
}

std::string TLSWrapper::get_peer_fingerprint() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    const mbedtls_x509_crt* peer = mbedtls_ssl_get_peer_cert(&ssl);
    if (!peer) return std::string();

    unsigned char hash[32] = {0};
    if (mbedtls_sha256(peer->raw.p, peer->raw.len, hash, 0) != 0) {
        return std::string();
    }
    return wire_codec::hex_encode(hash, sizeof(hash));
}

std::string TLSWrapper::get_tls_version() {
    const char* v = mbedtls_ssl_get_version(&ssl);
    if (!v) return std::string();
    return std::string(v);
}

std::string TLSWrapper::get_ciphersuite() {
    const char* s = mbedtls_ssl_get_ciphersuite(&ssl);
    if (!s) return std::string();
    return std::string(s);
}

std::string TLSWrapper::file_fingerprint(const std::string& cert_file) {
    mbedtls_x509_crt crt;
    mbedtls_x509_crt_init(&crt);
    std::string out;
    if (mbedtls_x509_crt_parse_file(&crt, cert_file.c_str()) == 0) {
        unsigned char hash[32] = {0};
        if (mbedtls_sha256(crt.raw.p, crt.raw.len, hash, 0) == 0) {
            out = wire_codec::hex_encode(hash, sizeof(hash));
        }
    } else {
        LOG_ERROR("cannot parse certificate %s", cert_file.c_str());
    }
    mbedtls_x509_crt_free(&crt);
    return out;
}

#ifndef SRVFRONT_TLS_HPP_
#define SRVFRONT_TLS_HPP_

// ============================================================================
// TLS configuration and mbedTLS wrappers
// ============================================================================
//
// Usage:
//   srvfront::ServerOptions options;
//   options.tls.cert_path = "/path/to/server.crt";
//   options.tls.key_path = "/path/to/server.key";
//
// The context is loaded by the Server constructor, so a bad certificate or
// key fails start-up instead of the first client handshake.

#include <cstdint>
#include <cstring>
#include <string>

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mbedtls/error.h>
#include <mbedtls/pk.h>
#include <mbedtls/ssl.h>
#include <mbedtls/x509_crt.h>
#include <psa/crypto.h>

namespace srvfront {

struct TlsConfig {
  std::string cert_path;          // Server certificate (PEM)
  std::string key_path;           // Server private key (PEM)
  std::string ca_path;            // CA certificate for client auth (optional)
  bool require_client_cert = false;

  bool enabled() const { return !cert_path.empty(); }
};

inline std::string tls_error_string(int code) {
  char buf[128];
  mbedtls_strerror(code, buf, sizeof(buf));
  return std::string(buf) + " (" + std::to_string(code) + ")";
}

// ============================================================================
// TLS Context (one per server, manages certificates and config)
// ============================================================================

class TlsContext {
 public:
  TlsContext() {
    mbedtls_ssl_config_init(&conf_);
    mbedtls_x509_crt_init(&srvcert_);
    mbedtls_x509_crt_init(&cacert_);
    mbedtls_pk_init(&pkey_);
    mbedtls_entropy_init(&entropy_);
    mbedtls_ctr_drbg_init(&ctr_drbg_);
  }

  ~TlsContext() {
    mbedtls_ssl_config_free(&conf_);
    mbedtls_x509_crt_free(&srvcert_);
    mbedtls_x509_crt_free(&cacert_);
    mbedtls_pk_free(&pkey_);
    mbedtls_entropy_free(&entropy_);
    mbedtls_ctr_drbg_free(&ctr_drbg_);
  }

  TlsContext(const TlsContext&) = delete;
  TlsContext& operator=(const TlsContext&) = delete;

  // Returns 0 on success, mbedtls error code on failure
  int init(const TlsConfig& config) {
    const char* pers = "srvfront_tls";

#if defined(MBEDTLS_USE_PSA_CRYPTO) || defined(MBEDTLS_SSL_PROTO_TLS1_3)
    // PSA-backed builds refuse to set up a session without this
    psa_status_t status = psa_crypto_init();
    if (status != PSA_SUCCESS) return MBEDTLS_ERR_SSL_BAD_CONFIG;
#endif

    int ret = mbedtls_ctr_drbg_seed(&ctr_drbg_, mbedtls_entropy_func, &entropy_,
                                    reinterpret_cast<const unsigned char*>(pers), strlen(pers));
    if (ret != 0) return ret;

    ret = mbedtls_x509_crt_parse_file(&srvcert_, config.cert_path.c_str());
    if (ret != 0) return ret;

    if (!config.ca_path.empty()) {
      ret = mbedtls_x509_crt_parse_file(&cacert_, config.ca_path.c_str());
      if (ret != 0) return ret;
    }

    ret = mbedtls_pk_parse_keyfile(&pkey_, config.key_path.c_str(), nullptr,
                                   mbedtls_ctr_drbg_random, &ctr_drbg_);
    if (ret != 0) return ret;

    ret = mbedtls_ssl_config_defaults(&conf_, MBEDTLS_SSL_IS_SERVER, MBEDTLS_SSL_TRANSPORT_STREAM,
                                      MBEDTLS_SSL_PRESET_DEFAULT);
    if (ret != 0) return ret;

    mbedtls_ssl_conf_rng(&conf_, mbedtls_ctr_drbg_random, &ctr_drbg_);
    if (!config.ca_path.empty()) {
      mbedtls_ssl_conf_ca_chain(&conf_, &cacert_, nullptr);
    }
    ret = mbedtls_ssl_conf_own_cert(&conf_, &srvcert_, &pkey_);
    if (ret != 0) return ret;

    mbedtls_ssl_conf_authmode(&conf_, config.require_client_cert ? MBEDTLS_SSL_VERIFY_REQUIRED
                                                                 : MBEDTLS_SSL_VERIFY_NONE);
    mbedtls_ssl_conf_min_tls_version(&conf_, MBEDTLS_SSL_VERSION_TLS1_2);

    return 0;
  }

  const mbedtls_ssl_config* config() const { return &conf_; }

 private:
  mbedtls_ssl_config conf_;
  mbedtls_x509_crt srvcert_;
  mbedtls_x509_crt cacert_;
  mbedtls_pk_context pkey_;
  mbedtls_entropy_context entropy_;
  mbedtls_ctr_drbg_context ctr_drbg_;
};

// ============================================================================
// TLS Session (one per connection, bound to a non-blocking fd)
// ============================================================================

class TlsSession {
 public:
  TlsSession() { mbedtls_ssl_init(&ssl_); }
  ~TlsSession() { mbedtls_ssl_free(&ssl_); }

  TlsSession(const TlsSession&) = delete;
  TlsSession& operator=(const TlsSession&) = delete;

  // The session never owns fd; the transport closes it.
  int setup(const TlsContext& ctx, int fd) {
    int ret = mbedtls_ssl_setup(&ssl_, ctx.config());
    if (ret != 0) return ret;

    fd_ = fd;
    mbedtls_ssl_set_bio(&ssl_, &fd_, &TlsSession::bio_send, &TlsSession::bio_recv, nullptr);
    return 0;
  }

  // 0 when complete, MBEDTLS_ERR_SSL_WANT_READ/WANT_WRITE to retry
  int handshake() { return mbedtls_ssl_handshake(&ssl_); }

  int read(uint8_t* buf, size_t len) { return mbedtls_ssl_read(&ssl_, buf, len); }

  int write(const uint8_t* buf, size_t len) { return mbedtls_ssl_write(&ssl_, buf, len); }

  int close_notify() { return mbedtls_ssl_close_notify(&ssl_); }

  size_t bytes_available() const { return mbedtls_ssl_get_bytes_avail(&ssl_); }

 private:
  static int bio_send(void* ctx, const unsigned char* buf, size_t len);
  static int bio_recv(void* ctx, unsigned char* buf, size_t len);

  mbedtls_ssl_context ssl_;
  int fd_ = -1;
};

}  // namespace srvfront

#endif  // SRVFRONT_TLS_HPP_

#ifndef CM_CLIENT_TESTS_TLS_TEST_PEER_H
#define CM_CLIENT_TESTS_TLS_TEST_PEER_H

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/write.hpp>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include "http2_connection.h"
#include "http2_frame.h"

namespace cm::client::testing {

namespace detail {
constexpr unsigned char kAlpnH2[] = {2, 'h', '2'};
constexpr unsigned char kAlpnHttp11[] = {8, 'h', 't', 't', 'p',
                                         '/', '1', '.', '1'};

inline int SelectAlpn(SSL*, const unsigned char** out, unsigned char* outlen,
                      const unsigned char* in, unsigned int inlen, void* arg) {
  const bool h2 = arg != nullptr;
  const unsigned char* offer = h2 ? kAlpnH2 : kAlpnHttp11;
  const unsigned int offer_len =
      h2 ? sizeof(kAlpnH2) : sizeof(kAlpnHttp11);
  unsigned char* selected = nullptr;
  if (SSL_select_next_proto(&selected, outlen, offer, offer_len, in, inlen) !=
      OPENSSL_NPN_NEGOTIATED) {
    return SSL_TLSEXT_ERR_NOACK;
  }
  *out = selected;
  return SSL_TLSEXT_ERR_OK;
}
}  // namespace detail

// Server context with a throwaway self-signed P-256 certificate for
// "localhost". Selects h2 or http/1.1 from the client's ALPN offer.
inline std::shared_ptr<boost::asio::ssl::context> MakeServerContext(
    bool select_h2) {
  auto ctx = std::make_shared<boost::asio::ssl::context>(
      boost::asio::ssl::context::tls_server);

  EVP_PKEY* key = nullptr;
  EVP_PKEY_CTX* kctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
  if (!kctx || EVP_PKEY_keygen_init(kctx) != 1 ||
      EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx, NID_X9_62_prime256v1) !=
          1 ||
      EVP_PKEY_keygen(kctx, &key) != 1) {
    EVP_PKEY_CTX_free(kctx);
    return nullptr;
  }
  EVP_PKEY_CTX_free(kctx);

  X509* cert = X509_new();
  X509_set_version(cert, 2);
  ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
  X509_gmtime_adj(X509_getm_notBefore(cert), 0);
  X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
  X509_set_pubkey(cert, key);
  X509_NAME* name = X509_get_subject_name(cert);
  X509_NAME_add_entry_by_txt(
      name, "CN", MBSTRING_ASC,
      reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
  X509_set_issuer_name(cert, name);
  const bool ok = X509_sign(cert, key, EVP_sha256()) > 0 &&
                  SSL_CTX_use_certificate(ctx->native_handle(), cert) == 1 &&
                  SSL_CTX_use_PrivateKey(ctx->native_handle(), key) == 1;
  X509_free(cert);
  EVP_PKEY_free(key);
  if (!ok) {
    return nullptr;
  }
  SSL_CTX_set_alpn_select_cb(ctx->native_handle(), &detail::SelectAlpn,
                             select_h2 ? ctx.get() : nullptr);
  return ctx;
}

// Server half of one HTTP/2 connection, driven frame by frame from a
// coroutine.
class H2TestPeer {
 public:
  using TlsStream = http2::TlsStream;

  // Accepts one connection and completes the server TLS handshake.
  bool Accept(boost::asio::ip::tcp::acceptor& acceptor,
              boost::asio::ssl::context& ctx, Yield yield) {
    boost::system::error_code ec;
    boost::asio::ip::tcp::socket socket(acceptor.get_executor());
    acceptor.async_accept(socket, yield[ec]);
    if (ec) {
      return false;
    }
    tls_ = std::make_unique<TlsStream>(std::move(socket), ctx);
    tls_->async_handshake(boost::asio::ssl::stream_base::server, yield[ec]);
    return !ec;
  }

  bool ReadPreface(Yield yield) {
    std::vector<std::uint8_t> preface(http2::kClientPrefaceSize);
    boost::system::error_code ec;
    boost::asio::async_read(*tls_, boost::asio::buffer(preface), yield[ec]);
    return !ec && std::memcmp(preface.data(), http2::kClientPreface,
                              preface.size()) == 0;
  }

  bool ReadFrame(Yield yield, http2::FrameHeader& header,
                 std::vector<std::uint8_t>& payload) {
    std::uint8_t head[http2::kFrameHeaderSize];
    boost::system::error_code ec;
    boost::asio::async_read(*tls_, boost::asio::buffer(head), yield[ec]);
    if (ec) {
      return false;
    }
    header = http2::ParseFrameHeader(head);
    payload.resize(header.length);
    if (header.length > 0) {
      boost::asio::async_read(*tls_, boost::asio::buffer(payload), yield[ec]);
    }
    return !ec;
  }

  // Skips frames until one of `type` on `stream_id` arrives.
  bool ReadUntil(Yield yield, http2::FrameType type, std::uint32_t stream_id,
                 std::vector<std::uint8_t>& payload) {
    http2::FrameHeader header;
    while (ReadFrame(yield, header, payload)) {
      if (header.type == static_cast<std::uint8_t>(type) &&
          header.stream_id == stream_id) {
        last_flags_ = header.flags;
        return true;
      }
    }
    return false;
  }

  // Reads until the client closes the connection.
  void Drain(Yield yield) {
    http2::FrameHeader header;
    std::vector<std::uint8_t> payload;
    while (ReadFrame(yield, header, payload)) {
    }
  }

  bool Write(Yield yield, const std::vector<std::uint8_t>& bytes) {
    boost::system::error_code ec;
    boost::asio::async_write(*tls_, boost::asio::buffer(bytes), yield[ec]);
    return !ec;
  }

  std::uint8_t last_flags() const { return last_flags_; }

 private:
  std::unique_ptr<TlsStream> tls_;
  std::uint8_t last_flags_{0};
};

}  // namespace cm::client::testing

#endif  // CM_CLIENT_TESTS_TLS_TEST_PEER_H

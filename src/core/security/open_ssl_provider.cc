#include <core/security/open_ssl_provider.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace ssl = boost::asio::ssl;

namespace bridgefinder::core {

OpenSSLProvider::~OpenSSLProvider() {
    if (initialized_) {
        EVP_cleanup();
        ERR_free_strings();
        initialized_ = false;
    }
}

OpenSSLProvider& OpenSSLProvider::instance() {
    static OpenSSLProvider instance;
    return instance;
}

void OpenSSLProvider::InitOpenSSL() {
    if (!instance().initialized_) {
        if (OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                             nullptr)
            != 1) {
            spdlog::error("OPENSSL_init_ssl failed");
            return;
        }
        instance().initialized_ = true;
    }
}

ssl::context OpenSSLProvider::BuildClientContext() {
    ssl::context ctx(ssl::context::tls_client);

    ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2
                    | ssl::context::no_sslv3 | ssl::context::no_tlsv1
                    | ssl::context::no_tlsv1_1);

    SSL_CTX_set_session_cache_mode(ctx.native_handle(), SSL_SESS_CACHE_CLIENT);
    SSL_CTX_sess_set_cache_size(ctx.native_handle(), 16);

    // At most SSL_MAX_SID_CTX_LENGTH bytes.
    constexpr std::string_view session_id_context = "bridgefinder";
    SSL_CTX_set_session_id_context(ctx.native_handle(),
                                   reinterpret_cast<const unsigned char*>(
                                       session_id_context.data()),
                                   session_id_context.size());

    boost::system::error_code ec;
    ctx.set_default_verify_paths(ec);
    if (ec) {
        spdlog::warn("Could not load the system trust store: {}", ec.message());
    }
    ctx.set_verify_mode(ssl::verify_peer);

    return ctx;
}

} // namespace bridgefinder::core

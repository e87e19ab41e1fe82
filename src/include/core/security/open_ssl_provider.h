/**
 * @file open_ssl_provider.h
 * @brief OpenSSL library initialization and the TLS client context used for the cloud directory
 */
#pragma once

#include <boost/asio/ssl/context.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <string_view>

namespace bridgefinder::core {

class OpenSSLProvider {
private:
    OpenSSLProvider() = default;
    OpenSSLProvider(const OpenSSLProvider&) = delete;
    OpenSSLProvider& operator=(const OpenSSLProvider&) = delete;
    ~OpenSSLProvider();

    static OpenSSLProvider& instance();

    bool initialized_ = false;

public:
    /**
     * @brief Initialize OpenSSL library
     * 
     * Must be called before any TLS connection is made. Safe to call more than once.
     */
    static void InitOpenSSL();

    /**
     * @brief Build a client SSL context that verifies peers against the system trust store
     * 
     * Host name verification is configured per connection by HttpsClient.
     * 
     * @return boost::asio::ssl::context SSL context configured for client use
     */
    static boost::asio::ssl::context BuildClientContext();
};

} // namespace bridgefinder::core

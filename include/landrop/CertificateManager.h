/**
 * @file CertificateManager.h
 * @brief Self-signed TLS certificate generation and loading
 */

#pragma once

#include "config.h"

#include <string>

// Forward declarations for OpenSSL types
struct ssl_ctx_st;
typedef struct ssl_ctx_st SSL_CTX;

namespace LanDrop {

//=============================================================================
// CertificateManager Class
//=============================================================================

/**
 * @class CertificateManager
 * @brief Manages the server's self-signed certificate
 *
 * Peers never verify each other's certificates; TLS only provides
 * confidentiality and integrity on the wire. The certificate lives in
 * AppPaths::certsDir() and is regenerated when missing or expired.
 *
 * Usage:
 * @code
 * std::string error;
 * if (!CertificateManager::ensureCertificateExists(certDir, name, error)) {
 *     LOG_ERROR("certificate: " << error);
 * }
 * @endcode
 */
class CertificateManager {
public:
    /**
     * @brief Generate a self-signed certificate
     *
     * RSA CERT_KEY_BITS key, X.509 v3, SHA-256 signature, valid for
     * CERT_VALIDITY_DAYS, Subject = Issuer = CN=<commonName>, O=LanDrop.
     * Both files are PEM; the key is unencrypted and chmod 0600.
     */
    static bool generateSelfSignedCert(const std::string& certPath,
                                       const std::string& keyPath,
                                       const std::string& commonName,
                                       std::string& errorMsg);

    /**
     * @brief Load certificate and private key into ctx and check they match
     */
    static bool loadCertificate(SSL_CTX* ctx,
                                const std::string& certPath,
                                const std::string& keyPath,
                                std::string& errorMsg);

    static bool certificateExists(const std::string& certPath);

    /**
     * @brief Generate the certificate in certDir unless a valid one is there
     */
    static bool ensureCertificateExists(const std::string& certDir,
                                        const std::string& commonName,
                                        std::string& errorMsg);

    /**
     * @return true if expired or unreadable
     */
    static bool isCertificateExpired(const std::string& certPath,
                                     std::string& errorMsg);

    static std::string getCertFilePath(const std::string& certDir);
    static std::string getKeyFilePath(const std::string& certDir);

private:
    static bool ensureCertDir(const std::string& certDir, std::string& errorMsg);
};

}  // namespace LanDrop

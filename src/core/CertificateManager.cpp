/**
 * @file CertificateManager.cpp
 * @brief TLS certificate generation and management
 */

#include "landrop/CertificateManager.h"
#include "landrop/ThreadSafeLog.h"

#include <openssl/asn1.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <filesystem>
#include <memory>

namespace LanDrop {

namespace {

struct EvpPkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct EvpPkeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
struct BioDeleter { void operator()(BIO* p) const { BIO_free(p); } };

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

bool addNameEntry(X509_NAME* name, const char* field, const std::string& value) {
    return X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                                      reinterpret_cast<const unsigned char*>(value.c_str()),
                                      static_cast<int>(value.length()), -1, 0) == 1;
}

} // namespace

//=============================================================================
// Path Utilities
//=============================================================================

std::string CertificateManager::getCertFilePath(const std::string& certDir) {
    return (std::filesystem::path(certDir) / CERT_FILE).string();
}

std::string CertificateManager::getKeyFilePath(const std::string& certDir) {
    return (std::filesystem::path(certDir) / KEY_FILE).string();
}

bool CertificateManager::ensureCertDir(const std::string& certDir, std::string& errorMsg) {
    std::error_code ec;
    const std::filesystem::path dir(certDir);

    if (std::filesystem::exists(dir, ec)) {
        if (!std::filesystem::is_directory(dir, ec)) {
            errorMsg = "Certificate path exists but is not a directory: " + certDir;
            return false;
        }
        return true;
    }

    if (!std::filesystem::create_directories(dir, ec)) {
        errorMsg = "Failed to create certificate directory: " + certDir +
                   (ec ? " (" + ec.message() + ")" : std::string());
        return false;
    }
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
    return true;
}

//=============================================================================
// Existence / Expiry
//=============================================================================

bool CertificateManager::certificateExists(const std::string& certPath) {
    std::error_code ec;
    return std::filesystem::is_regular_file(std::filesystem::path(certPath), ec);
}

bool CertificateManager::ensureCertificateExists(const std::string& certDir,
                                                 const std::string& commonName,
                                                 std::string& errorMsg) {
    const std::string certPath = getCertFilePath(certDir);
    const std::string keyPath = getKeyFilePath(certDir);

    if (certificateExists(certPath) && certificateExists(keyPath)) {
        std::string expiryError;
        if (!isCertificateExpired(certPath, expiryError)) {
            return true;
        }
        ThreadSafeLog::log("CERT: regenerating expired or unreadable certificate " + certPath);
    }

    return generateSelfSignedCert(certPath, keyPath, commonName, errorMsg);
}

bool CertificateManager::isCertificateExpired(const std::string& certPath,
                                              std::string& errorMsg) {
    BioPtr bio(BIO_new_file(certPath.c_str(), "r"));
    if (!bio) {
        errorMsg = "Failed to open certificate file";
        return true;
    }

    X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert) {
        errorMsg = "Failed to read certificate";
        return true;
    }

    return X509_cmp_time(X509_get0_notAfter(cert.get()), nullptr) < 0;
}

//=============================================================================
// Generation
//=============================================================================

bool CertificateManager::generateSelfSignedCert(const std::string& certPath,
                                                const std::string& keyPath,
                                                const std::string& commonName,
                                                std::string& errorMsg) {
    const std::string certDir = std::filesystem::path(certPath).parent_path().string();
    if (!certDir.empty() && !ensureCertDir(certDir, errorMsg)) {
        return false;
    }

    EvpPkeyCtxPtr pkeyCtx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!pkeyCtx) {
        errorMsg = "Failed to create key context";
        return false;
    }
    if (EVP_PKEY_keygen_init(pkeyCtx.get()) <= 0) {
        errorMsg = "Failed to initialize keygen";
        return false;
    }
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(pkeyCtx.get(), CERT_KEY_BITS) <= 0) {
        errorMsg = "Failed to set RSA key size";
        return false;
    }

    EVP_PKEY* rawKey = nullptr;
    if (EVP_PKEY_keygen(pkeyCtx.get(), &rawKey) <= 0) {
        errorMsg = "Failed to generate RSA key";
        return false;
    }
    EvpPkeyPtr pkey(rawKey);

    X509Ptr cert(X509_new());
    if (!cert) {
        errorMsg = "Failed to create certificate";
        return false;
    }
    if (X509_set_version(cert.get(), 2) != 1) {
        errorMsg = "Failed to set certificate version";
        return false;
    }

    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()),
                    static_cast<long>(CERT_VALIDITY_DAYS) * 24 * 60 * 60);

    if (X509_set_pubkey(cert.get(), pkey.get()) != 1) {
        errorMsg = "Failed to set public key";
        return false;
    }

    X509_NAME* name = X509_get_subject_name(cert.get());
    const std::string cn = commonName.empty() ? std::string(CERT_ORGANIZATION) : commonName;
    if (!name || !addNameEntry(name, "CN", cn) || !addNameEntry(name, "O", CERT_ORGANIZATION)) {
        errorMsg = "Failed to set subject name";
        return false;
    }
    if (X509_set_issuer_name(cert.get(), name) != 1) {
        errorMsg = "Failed to set issuer name";
        return false;
    }
    if (X509_sign(cert.get(), pkey.get(), EVP_sha256()) <= 0) {
        errorMsg = "Failed to sign certificate";
        return false;
    }

    {
        BioPtr certBio(BIO_new_file(certPath.c_str(), "w"));
        if (!certBio || PEM_write_bio_X509(certBio.get(), cert.get()) != 1) {
            errorMsg = "Failed to write certificate: " + certPath;
            return false;
        }
    }
    {
        BioPtr keyBio(BIO_new_file(keyPath.c_str(), "w"));
        if (!keyBio ||
            PEM_write_bio_PrivateKey(keyBio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
            errorMsg = "Failed to write private key: " + keyPath;
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::permissions(keyPath,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        ThreadSafeLog::log("CERT_WARN: cannot restrict key permissions: " + ec.message());
    }

    ThreadSafeLog::log("CERT: generated self-signed certificate CN=" + cn);
    return true;
}

//=============================================================================
// Loading
//=============================================================================

bool CertificateManager::loadCertificate(SSL_CTX* ctx,
                                         const std::string& certPath,
                                         const std::string& keyPath,
                                         std::string& errorMsg) {
    if (!ctx) {
        errorMsg = "SSL context is null";
        return false;
    }
    if (SSL_CTX_use_certificate_file(ctx, certPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        errorMsg = "Failed to load certificate: " + certPath;
        return false;
    }
    if (SSL_CTX_use_PrivateKey_file(ctx, keyPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        errorMsg = "Failed to load private key: " + keyPath;
        return false;
    }
    if (SSL_CTX_check_private_key(ctx) != 1) {
        errorMsg = "Private key does not match certificate";
        return false;
    }
    return true;
}

}  // namespace LanDrop

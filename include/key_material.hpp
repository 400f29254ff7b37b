#pragma once

#include <string>
#include <vector>
#include <memory>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace strongbox {

// Key types the codecs know how to parse. Keys of any other type can still
// appear inside certificates; they are tagged OTHER.
enum class KeyAlgorithm {
    RSA,
    DSA,
    OTHER
};

std::string algorithm_name(KeyAlgorithm algorithm);

KeyAlgorithm algorithm_of(const EVP_PKEY* pkey);

// Asymmetric public key. Two public keys are equal when their DER
// SubjectPublicKeyInfo encodings are byte-identical.
class PublicKey {
public:
    // Takes ownership of pkey. Throws EncodingError if it cannot be encoded.
    explicit PublicKey(EVP_PKEY* pkey);

    KeyAlgorithm algorithm() const { return algorithm_; }
    const std::vector<unsigned char>& encoded() const { return encoded_; }
    EVP_PKEY* native() const { return pkey_.get(); }

    bool operator==(const PublicKey& other) const { return encoded_ == other.encoded_; }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

private:
    std::shared_ptr<EVP_PKEY> pkey_;
    KeyAlgorithm algorithm_;
    std::vector<unsigned char> encoded_;
};

// Asymmetric private key, encoded as unencrypted PKCS#8 PrivateKeyInfo.
class PrivateKey {
public:
    // Takes ownership of pkey. Throws EncodingError if it cannot be encoded.
    explicit PrivateKey(EVP_PKEY* pkey);

    KeyAlgorithm algorithm() const { return algorithm_; }
    const std::vector<unsigned char>& encoded() const { return encoded_; }
    EVP_PKEY* native() const { return pkey_.get(); }

    // Public half of the key pair.
    PublicKey public_key() const;

    bool operator==(const PrivateKey& other) const { return encoded_ == other.encoded_; }
    bool operator!=(const PrivateKey& other) const { return !(*this == other); }

private:
    std::shared_ptr<EVP_PKEY> pkey_;
    KeyAlgorithm algorithm_;
    std::vector<unsigned char> encoded_;
};

// Parsed X.509 certificate.
class Certificate {
public:
    // Takes ownership of cert. Throws EncodingError if it cannot be encoded.
    explicit Certificate(X509* cert);

    const std::vector<unsigned char>& encoded() const { return encoded_; }
    X509* native() const { return cert_.get(); }

    // Public key embedded in the certificate.
    PublicKey public_key() const;

    // One-line distinguished name, e.g. "/CN=alice".
    std::string subject() const;

    bool operator==(const Certificate& other) const { return encoded_ == other.encoded_; }
    bool operator!=(const Certificate& other) const { return !(*this == other); }

private:
    std::shared_ptr<X509> cert_;
    std::vector<unsigned char> encoded_;
};

}

#include "key_material.hpp"
#include "errors.hpp"
#include "openssl_util.hpp"

namespace strongbox {

namespace {

template <typename T, typename Encoder>
std::vector<unsigned char> encode_der(const T* object, Encoder encoder, const char* what) {
    auto out = to_der(object, encoder);
    if (out.empty()) {
        throw EncodingError(std::string("Failed to DER-encode ") + what + ": " + openssl_error_string());
    }
    return out;
}

std::vector<unsigned char> encode_pkcs8(EVP_PKEY* pkey) {
    openssl_ptr<PKCS8_PRIV_KEY_INFO, PKCS8_PRIV_KEY_INFO_free> p8(EVP_PKEY2PKCS8(pkey));
    if (!p8) {
        throw EncodingError("Failed to convert private key to PKCS#8: " + openssl_error_string());
    }
    return encode_der(p8.get(), i2d_PKCS8_PRIV_KEY_INFO, "PKCS#8 private key");
}

}

std::string algorithm_name(KeyAlgorithm algorithm) {
    switch (algorithm) {
        case KeyAlgorithm::RSA: return "RSA";
        case KeyAlgorithm::DSA: return "DSA";
        case KeyAlgorithm::OTHER: return "OTHER";
        default: return "UNKNOWN";
    }
}

KeyAlgorithm algorithm_of(const EVP_PKEY* pkey) {
    switch (EVP_PKEY_get_base_id(pkey)) {
        case EVP_PKEY_RSA: return KeyAlgorithm::RSA;
        case EVP_PKEY_DSA: return KeyAlgorithm::DSA;
        default: return KeyAlgorithm::OTHER;
    }
}

PublicKey::PublicKey(EVP_PKEY* pkey) : pkey_(pkey, EVP_PKEY_free) {
    if (!pkey) {
        throw EncodingError("Null public key handle");
    }
    algorithm_ = algorithm_of(pkey);
    encoded_ = encode_der(pkey, i2d_PUBKEY, "public key");
}

PrivateKey::PrivateKey(EVP_PKEY* pkey) : pkey_(pkey, EVP_PKEY_free) {
    if (!pkey) {
        throw EncodingError("Null private key handle");
    }
    algorithm_ = algorithm_of(pkey);
    encoded_ = encode_pkcs8(pkey);
}

PublicKey PrivateKey::public_key() const {
    // Re-parse the SubjectPublicKeyInfo so the result shares no state with the private key.
    auto spki = encode_der(pkey_.get(), i2d_PUBKEY, "public key");
    const unsigned char* p = spki.data();
    EVP_PKEY* pub = d2i_PUBKEY(nullptr, &p, static_cast<long>(spki.size()));
    if (!pub) {
        throw EncodingError("Failed to derive public key: " + openssl_error_string());
    }
    return PublicKey(pub);
}

Certificate::Certificate(X509* cert) : cert_(cert, X509_free) {
    if (!cert) {
        throw EncodingError("Null certificate handle");
    }
    encoded_ = encode_der(cert, i2d_X509, "certificate");
}

PublicKey Certificate::public_key() const {
    EVP_PKEY* pkey = X509_get_pubkey(cert_.get());
    if (!pkey) {
        throw EncodingError("Certificate carries no usable public key: " + openssl_error_string());
    }
    return PublicKey(pkey);
}

std::string Certificate::subject() const {
    char* line = X509_NAME_oneline(X509_get_subject_name(cert_.get()), nullptr, 0);
    if (!line) return "";
    std::string out(line);
    OPENSSL_free(line);
    return out;
}

}

#pragma once

#include <gtest/gtest.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/dsa.h>
#include <openssl/rsa.h>
#include <openssl/rand.h>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "key_material.hpp"
#include "audit_logger.hpp"

namespace strongbox::testing {

inline PrivateKey generate_rsa_key(unsigned int bits = 2048) {
    EVP_PKEY* pkey = EVP_RSA_gen(bits);
    if (!pkey) throw std::runtime_error("RSA key generation failed");
    return PrivateKey(pkey);
}

inline PrivateKey generate_dsa_key() {
    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_from_name(nullptr, "DSA", nullptr);
    EVP_PKEY* params = nullptr;
    if (!pctx || EVP_PKEY_paramgen_init(pctx) <= 0
        || EVP_PKEY_CTX_set_dsa_paramgen_bits(pctx, 2048) <= 0
        || EVP_PKEY_paramgen(pctx, &params) <= 0) {
        EVP_PKEY_CTX_free(pctx);
        throw std::runtime_error("DSA parameter generation failed");
    }
    EVP_PKEY_CTX_free(pctx);

    EVP_PKEY_CTX* kctx = EVP_PKEY_CTX_new_from_pkey(nullptr, params, nullptr);
    EVP_PKEY* pkey = nullptr;
    bool ok = kctx && EVP_PKEY_keygen_init(kctx) > 0 && EVP_PKEY_keygen(kctx, &pkey) > 0;
    EVP_PKEY_CTX_free(kctx);
    EVP_PKEY_free(params);
    if (!ok) throw std::runtime_error("DSA key generation failed");
    return PrivateKey(pkey);
}

// Key generation is slow; each suite shares these.
inline const PrivateKey& rsa_key_a() {
    static const PrivateKey key = generate_rsa_key();
    return key;
}

inline const PrivateKey& rsa_key_b() {
    static const PrivateKey key = generate_rsa_key();
    return key;
}

inline const PrivateKey& dsa_key() {
    static const PrivateKey key = generate_dsa_key();
    return key;
}

inline Certificate make_self_signed(const PrivateKey& key, const std::string& common_name, long serial = 1) {
    X509* x = X509_new();
    if (!x) throw std::runtime_error("X509_new failed");

    X509_set_version(x, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(x), serial);
    X509_gmtime_adj(X509_getm_notBefore(x), 0);
    X509_gmtime_adj(X509_getm_notAfter(x), 365L * 24 * 3600);
    X509_set_pubkey(x, key.native());

    X509_NAME* name = X509_get_subject_name(x);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(common_name.c_str()), -1, -1, 0);
    X509_set_issuer_name(x, name);

    if (X509_sign(x, key.native(), EVP_sha256()) <= 0) {
        X509_free(x);
        throw std::runtime_error("Certificate signing failed");
    }
    return Certificate(x);
}

inline std::string random_suffix() {
    unsigned char b[8];
    if (RAND_bytes(b, sizeof(b)) != 1) throw std::runtime_error("RAND_bytes failed");
    std::stringstream ss;
    for (unsigned char c : b) ss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return ss.str();
}

// Redirects a stream into a buffer for the lifetime of the object.
class StreamCapture {
public:
    explicit StreamCapture(std::ostream& stream) : stream_(stream), old_(stream.rdbuf(buffer_.rdbuf())) {}
    ~StreamCapture() { stream_.rdbuf(old_); }
    std::string str() const { return buffer_.str(); }

private:
    std::ostream& stream_;
    std::stringstream buffer_;
    std::streambuf* old_;
};

// Gives each test its own scratch directory.
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / ("strongbox_test_" + random_suffix());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string path_for(const std::string& name) const {
        return (dir_ / name).string();
    }

    std::filesystem::path dir_;
};

}

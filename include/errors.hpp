#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <openssl/err.h>

namespace strongbox {

enum class KeyAlgorithm;

// Drains the calling thread's OpenSSL error queue into a single line.
// Returns an empty string when the queue holds nothing.
inline std::string openssl_error_string() {
    std::string out;
    unsigned long code;
    char buf[256];
    while ((code = ERR_get_error()) != 0) {
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

// Base of every failure surfaced by the key store.
class KeyStoreError : public std::runtime_error {
public:
    explicit KeyStoreError(const std::string& what) : std::runtime_error(what) {}
};

// Bad path, wrong master password, corrupt file or unknown store kind.
class LoadError : public KeyStoreError {
public:
    explicit LoadError(const std::string& what) : KeyStoreError(what) {}
};

// I/O or serialization failure while writing the store back.
class PersistError : public KeyStoreError {
public:
    explicit PersistError(const std::string& what) : KeyStoreError(what) {}
};

// The entry password does not unlock the sealed private key.
class UnrecoverableKeyError : public KeyStoreError {
public:
    explicit UnrecoverableKeyError(const std::string& what) : KeyStoreError(what) {}
};

// The OpenSSL runtime lacks a cipher, PRF or key type needed for an entry.
class AlgorithmUnavailableError : public KeyStoreError {
public:
    explicit AlgorithmUnavailableError(const std::string& what) : KeyStoreError(what) {}
};

// Key or certificate cannot be placed in the backend's representation.
class EncodingError : public KeyStoreError {
public:
    explicit EncodingError(const std::string& what) : KeyStoreError(what) {}
};

// Key text is not valid base64 or carries the wrong wrapper.
class InvalidKeyError : public KeyStoreError {
public:
    explicit InvalidKeyError(const std::string& what) : KeyStoreError(what) {}
};

// Decoded key bytes matched none of the attempted algorithms.
class UnsupportedKeyFormatError : public KeyStoreError {
public:
    UnsupportedKeyFormatError(const std::string& what, std::vector<KeyAlgorithm> attempted)
        : KeyStoreError(what), attempted_(std::move(attempted)) {}

    const std::vector<KeyAlgorithm>& attempted() const { return attempted_; }

private:
    std::vector<KeyAlgorithm> attempted_;
};

class CertificateFormatError : public KeyStoreError {
public:
    explicit CertificateFormatError(const std::string& what) : KeyStoreError(what) {}
};

}

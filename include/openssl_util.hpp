#pragma once

#include <vector>
#include <memory>
#include <openssl/crypto.h>

namespace strongbox {

// Runs an i2d_* encoder into a byte vector. Returns an empty vector on
// failure; no valid DER structure is zero bytes long.
template <typename T, typename Encoder>
std::vector<unsigned char> to_der(const T* object, Encoder encoder) {
    unsigned char* buf = nullptr;
    int len = encoder(object, &buf);
    if (len <= 0 || !buf) {
        return {};
    }
    std::vector<unsigned char> out(buf, buf + len);
    OPENSSL_free(buf);
    return out;
}

// Owning pointer for an OpenSSL object with its matching *_free function.
template <typename T, void (*Free)(T*)>
struct OpenSSLDeleter {
    void operator()(T* p) const { Free(p); }
};

template <typename T, void (*Free)(T*)>
using openssl_ptr = std::unique_ptr<T, OpenSSLDeleter<T, Free>>;

}

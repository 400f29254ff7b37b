#include "key_codec.hpp"
#include "base64_codec.hpp"
#include "errors.hpp"
#include "audit_logger.hpp"
#include "metrics.hpp"
#include "openssl_util.hpp"
#include <openssl/decoder.h>
#include <openssl/err.h>

namespace strongbox {

namespace {

const char* label_for(KeyKind kind) {
    return kind == KeyKind::PRIVATE ? "PRIVATE KEY" : "PUBLIC KEY";
}

// Extracts the base64 payload. Text without a BEGIN line is taken whole.
std::string strip_wrapper(const std::string& text, KeyKind kind) {
    static const std::string begin_marker = "-----BEGIN ";
    static const std::string dashes = "-----";

    size_t begin = text.find(begin_marker);
    if (begin == std::string::npos) {
        return Base64Codec::strip_whitespace(text);
    }

    size_t label_start = begin + begin_marker.size();
    size_t label_end = text.find(dashes, label_start);
    if (label_end == std::string::npos) {
        throw InvalidKeyError("Unterminated BEGIN line in key text");
    }
    std::string label = text.substr(label_start, label_end - label_start);
    if (label != label_for(kind)) {
        throw InvalidKeyError("Expected " + std::string(label_for(kind)) + " block, found " + label);
    }

    std::string end_line = dashes + "END " + label + dashes;
    size_t body_start = label_end + dashes.size();
    size_t body_end = text.find(end_line, body_start);
    if (body_end == std::string::npos) {
        throw InvalidKeyError("Missing END line for " + label + " block");
    }
    return Base64Codec::strip_whitespace(text.substr(body_start, body_end - body_start));
}

std::vector<unsigned char> decode_payload(const std::string& text, KeyKind kind) {
    auto bytes = Base64Codec::decode(strip_wrapper(text, kind));
    if (!bytes) {
        AuditLogger::log(AuditLogger::Level::WARNING, AuditLogger::EventType::DECODE_FAILURE,
                         "", "Key text is not valid base64");
        throw InvalidKeyError("Key text is not valid base64");
    }
    return *bytes;
}

// Parses DER with decoders restricted to a single key type.
// Returns nullptr when that type does not accept the bytes.
EVP_PKEY* parse_as(const std::vector<unsigned char>& der, KeyAlgorithm algorithm, KeyKind kind) {
    if (algorithm == KeyAlgorithm::OTHER) return nullptr;

    const std::string type_name = algorithm_name(algorithm);
    const char* structure = kind == KeyKind::PUBLIC ? "SubjectPublicKeyInfo" : "PrivateKeyInfo";
    int selection = kind == KeyKind::PUBLIC ? EVP_PKEY_PUBLIC_KEY : EVP_PKEY_KEYPAIR;

    EVP_PKEY* pkey = nullptr;
    openssl_ptr<OSSL_DECODER_CTX, OSSL_DECODER_CTX_free> ctx(
        OSSL_DECODER_CTX_new_for_pkey(&pkey, "DER", structure, type_name.c_str(),
                                      selection, nullptr, nullptr));
    if (!ctx) {
        ERR_clear_error();
        return nullptr;
    }

    const unsigned char* data = der.data();
    size_t remaining = der.size();
    if (OSSL_DECODER_from_data(ctx.get(), &data, &remaining) != 1 || remaining != 0
        || !pkey || !EVP_PKEY_is_a(pkey, type_name.c_str())) {
        EVP_PKEY_free(pkey);
        ERR_clear_error();
        return nullptr;
    }
    return pkey;
}

// Walks the algorithm list in order and returns the first successful parse.
EVP_PKEY* parse_with_fallback(const std::vector<unsigned char>& der, KeyKind kind,
                              const AlgorithmList& algorithms) {
    for (size_t i = 0; i < algorithms.size(); ++i) {
        if (EVP_PKEY* pkey = parse_as(der, algorithms[i], kind)) {
            if (i > 0) {
                MetricsRegistry::instance().increment_counter(metric::DECODE_FALLBACKS);
            }
            return pkey;
        }
    }

    std::string tried;
    for (auto algorithm : algorithms) {
        if (!tried.empty()) tried += ", ";
        tried += algorithm_name(algorithm);
    }
    std::string what = std::string(kind == KeyKind::PUBLIC ? "Public" : "Private")
                     + " key matches none of the attempted algorithms [" + tried + "]";
    AuditLogger::log(AuditLogger::Level::WARNING, AuditLogger::EventType::DECODE_FAILURE, "", what);
    throw UnsupportedKeyFormatError(what, algorithms);
}

}

const AlgorithmList& default_algorithms() {
    static const AlgorithmList algorithms = {KeyAlgorithm::RSA, KeyAlgorithm::DSA};
    return algorithms;
}

std::string encode_to_text(const std::vector<unsigned char>& der, KeyKind kind) {
    std::string label = label_for(kind);
    std::string s;
    s += "-----BEGIN " + label + "-----\n";
    s += Base64Codec::encode(der) + '\n';
    s += "-----END " + label + "-----\n";
    return s;
}

std::string encode_to_text(const PublicKey& key) {
    return encode_to_text(key.encoded(), KeyKind::PUBLIC);
}

std::string encode_to_text(const PrivateKey& key) {
    return encode_to_text(key.encoded(), KeyKind::PRIVATE);
}

PublicKey decode_public_key(const std::string& text, const AlgorithmList& algorithms) {
    auto der = decode_payload(text, KeyKind::PUBLIC);
    return PublicKey(parse_with_fallback(der, KeyKind::PUBLIC, algorithms));
}

PrivateKey decode_private_key(const std::string& text, const AlgorithmList& algorithms) {
    auto der = decode_payload(text, KeyKind::PRIVATE);
    return PrivateKey(parse_with_fallback(der, KeyKind::PRIVATE, algorithms));
}

}

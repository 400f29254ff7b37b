#pragma once

#include <string>
#include <vector>
#include "key_material.hpp"

namespace strongbox {

enum class KeyKind {
    PRIVATE,
    PUBLIC
};

using AlgorithmList = std::vector<KeyAlgorithm>;

// Parse order used when the caller does not supply one: RSA first, then DSA.
const AlgorithmList& default_algorithms();

/**
 * Renders DER key bytes as PEM-like text:
 *   -----BEGIN <KIND> KEY-----\n<base64>\n-----END <KIND> KEY-----\n
 * The base64 body is a single line. Existing consumers depend on the
 * missing 64-column folding, so it must stay unwrapped.
 */
std::string encode_to_text(const std::vector<unsigned char>& der, KeyKind kind);
std::string encode_to_text(const PublicKey& key);
std::string encode_to_text(const PrivateKey& key);

/**
 * Decodes a SubjectPublicKeyInfo from PEM-like text or bare base64.
 * Each algorithm in `algorithms` is tried in order and the first parse that
 * succeeds wins.
 * @throws InvalidKeyError on malformed base64 or a PRIVATE wrapper.
 * @throws UnsupportedKeyFormatError when every algorithm rejects the bytes.
 */
PublicKey decode_public_key(const std::string& text,
                            const AlgorithmList& algorithms = default_algorithms());

// Same as decode_public_key for PKCS#8 PrivateKeyInfo.
PrivateKey decode_private_key(const std::string& text,
                              const AlgorithmList& algorithms = default_algorithms());

}

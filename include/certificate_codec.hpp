#pragma once

#include <string>
#include "key_material.hpp"

namespace strongbox {

/**
 * Parses a certificate from raw base64 DER (no PEM header or footer).
 * @throws CertificateFormatError on malformed base64, malformed DER or
 *         trailing bytes after the certificate.
 */
Certificate decode_certificate(const std::string& base64_der);

// Single-line base64 of the certificate's DER encoding.
std::string encode_certificate(const Certificate& certificate);

}

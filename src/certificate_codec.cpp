#include "certificate_codec.hpp"
#include "base64_codec.hpp"
#include "errors.hpp"
#include "audit_logger.hpp"

namespace strongbox {

Certificate decode_certificate(const std::string& base64_der) {
    auto bytes = Base64Codec::decode(base64_der);
    if (!bytes) {
        AuditLogger::log(AuditLogger::Level::WARNING, AuditLogger::EventType::DECODE_FAILURE,
                         "", "Certificate text is not valid base64");
        throw CertificateFormatError("Certificate text is not valid base64");
    }

    const unsigned char* p = bytes->data();
    X509* cert = d2i_X509(nullptr, &p, static_cast<long>(bytes->size()));
    if (!cert) {
        std::string detail = openssl_error_string();
        AuditLogger::log(AuditLogger::Level::WARNING, AuditLogger::EventType::DECODE_FAILURE,
                         "", "Malformed X.509 DER: " + detail);
        throw CertificateFormatError("Malformed X.509 certificate: " + detail);
    }
    if (p != bytes->data() + bytes->size()) {
        X509_free(cert);
        throw CertificateFormatError("Trailing data after X.509 certificate");
    }
    return Certificate(cert);
}

std::string encode_certificate(const Certificate& certificate) {
    return Base64Codec::encode(certificate.encoded());
}

}

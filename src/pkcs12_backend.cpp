#include "pkcs12_backend.hpp"
#include "store_config.hpp"
#include "errors.hpp"
#include "openssl_util.hpp"
#include <openssl/pkcs12.h>
#include <openssl/asn1.h>
#include <openssl/sha.h>
#include <openssl/err.h>
#include <openssl/bio.h>
#include <iomanip>
#include <sstream>

namespace strongbox {

namespace {

struct SafeBagStackFree {
    void operator()(STACK_OF(PKCS12_SAFEBAG)* s) const { sk_PKCS12_SAFEBAG_pop_free(s, PKCS12_SAFEBAG_free); }
};
struct Pkcs7StackFree {
    void operator()(STACK_OF(PKCS7)* s) const { sk_PKCS7_pop_free(s, PKCS7_free); }
};

using SafeBagStack = std::unique_ptr<STACK_OF(PKCS12_SAFEBAG), SafeBagStackFree>;
using Pkcs7Stack = std::unique_ptr<STACK_OF(PKCS7), Pkcs7StackFree>;
using BioPtr = openssl_ptr<BIO, BIO_free_all>;
using Pkcs12Ptr = openssl_ptr<PKCS12, PKCS12_free>;
using SigPtr = openssl_ptr<X509_SIG, X509_SIG_free>;
using P8Ptr = openssl_ptr<PKCS8_PRIV_KEY_INFO, PKCS8_PRIV_KEY_INFO_free>;

// Nested safeContentsBags deeper than this are rejected.
constexpr int MAX_BAG_DEPTH = 8;

struct KeyBag {
    std::string name;
    std::string local_id;
    std::vector<unsigned char> der;
    bool sealed;
};

struct CertBag {
    std::string name;
    std::string local_id;
    Certificate certificate;
    bool used;
};

std::string to_hex(const std::string& bytes) {
    std::stringstream ss;
    for (unsigned char c : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    }
    return ss.str();
}

std::string bag_name(PKCS12_SAFEBAG* bag) {
    char* name = PKCS12_get_friendlyname(bag);
    if (!name) return "";
    std::string out(name);
    OPENSSL_free(name);
    return out;
}

std::string bag_local_id(const PKCS12_SAFEBAG* bag) {
    const ASN1_TYPE* attr = PKCS12_SAFEBAG_get0_attr(bag, NID_localKeyID);
    if (!attr || attr->type != V_ASN1_OCTET_STRING) return "";
    const ASN1_OCTET_STRING* id = attr->value.octet_string;
    return std::string(reinterpret_cast<const char*>(ASN1_STRING_get0_data(id)), ASN1_STRING_length(id));
}

// localKeyId linking the key and certificate bags of one entry.
// Derived from the alias so entries sharing a certificate stay distinct.
std::vector<unsigned char> local_key_id(const std::string& alias) {
    std::vector<unsigned char> id(SHA_DIGEST_LENGTH);
    SHA1(reinterpret_cast<const unsigned char*>(alias.data()), alias.size(), id.data());
    return id;
}

void collect_bags(const STACK_OF(PKCS12_SAFEBAG)* bags, std::vector<KeyBag>& keys,
                  std::vector<CertBag>& certs, int depth) {
    if (depth > MAX_BAG_DEPTH) {
        throw LoadError("Safe contents nested too deeply");
    }

    for (int i = 0; i < sk_PKCS12_SAFEBAG_num(bags); ++i) {
        PKCS12_SAFEBAG* bag = sk_PKCS12_SAFEBAG_value(bags, i);
        switch (PKCS12_SAFEBAG_get_nid(bag)) {
            case NID_pkcs8ShroudedKeyBag: {
                auto der = to_der(PKCS12_SAFEBAG_get0_pkcs8(bag), i2d_X509_SIG);
                if (der.empty()) throw LoadError("Unreadable shrouded key bag: " + openssl_error_string());
                keys.push_back(KeyBag{bag_name(bag), bag_local_id(bag), std::move(der), true});
                break;
            }
            case NID_keyBag: {
                auto der = to_der(PKCS12_SAFEBAG_get0_p8inf(bag), i2d_PKCS8_PRIV_KEY_INFO);
                if (der.empty()) throw LoadError("Unreadable key bag: " + openssl_error_string());
                keys.push_back(KeyBag{bag_name(bag), bag_local_id(bag), std::move(der), false});
                break;
            }
            case NID_certBag: {
                if (PKCS12_SAFEBAG_get_bag_nid(bag) != NID_x509Certificate) break;
                X509* cert = PKCS12_SAFEBAG_get1_cert(bag);
                if (!cert) throw LoadError("Unreadable certificate bag: " + openssl_error_string());
                certs.push_back(CertBag{bag_name(bag), bag_local_id(bag), Certificate(cert), false});
                break;
            }
            case NID_safeContentsBag:
                collect_bags(PKCS12_SAFEBAG_get0_safes(bag), keys, certs, depth + 1);
                break;
            default:
                // CRL and secret bags carry nothing this store models.
                break;
        }
    }
}

CertBag* match_certificate(const KeyBag& key, std::vector<CertBag>& certs) {
    if (!key.local_id.empty()) {
        for (auto& cert : certs) {
            if (!cert.used && cert.local_id == key.local_id) return &cert;
        }
    }
    if (!key.name.empty()) {
        for (auto& cert : certs) {
            if (!cert.used && cert.name == key.name) return &cert;
        }
    }
    return nullptr;
}

bool is_unavailable_algorithm(unsigned long code) {
    int reason = ERR_GET_REASON(code);
    if (reason == ERR_R_UNSUPPORTED || reason == ERR_R_FETCH_FAILED) return true;
    if (ERR_GET_LIB(code) != ERR_LIB_EVP) return false;
    switch (reason) {
        case EVP_R_UNKNOWN_CIPHER:
        case EVP_R_UNKNOWN_PBE_ALGORITHM:
        case EVP_R_UNSUPPORTED_ALGORITHM:
        case EVP_R_UNSUPPORTED_CIPHER:
        case EVP_R_UNSUPPORTED_KEYLENGTH:
        case EVP_R_UNSUPPORTED_KEY_DERIVATION_FUNCTION:
        case EVP_R_UNSUPPORTED_PRF:
        case EVP_R_UNSUPPORTED_PRIVATE_KEY_ALGORITHM:
            return true;
        default:
            return false;
    }
}

// Turns the error queue left by PKCS8_decrypt into the matching exception.
[[noreturn]] void throw_unseal_failure() {
    bool unavailable = false;
    std::string detail;
    unsigned long code;
    char buf[256];
    while ((code = ERR_get_error()) != 0) {
        if (is_unavailable_algorithm(code)) unavailable = true;
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!detail.empty()) detail += "; ";
        detail += buf;
    }
    if (unavailable) {
        throw AlgorithmUnavailableError("Sealing algorithm of the entry is not available: " + detail);
    }
    throw UnrecoverableKeyError("Cannot recover key: wrong password or damaged key");
}

// friendlyName is a BMPString: aliases must be valid UTF-8 inside the Basic
// Multilingual Plane.
bool is_encodable_alias(const std::string& alias) {
    ASN1_STRING* bmp = nullptr;
    int rc = ASN1_mbstring_copy(&bmp, reinterpret_cast<const unsigned char*>(alias.data()),
                                static_cast<int>(alias.size()), MBSTRING_UTF8, B_ASN1_BMPSTRING);
    ASN1_STRING_free(bmp);
    if (rc < 0) {
        ERR_clear_error();
        return false;
    }
    return true;
}

void push_bag(STACK_OF(PKCS12_SAFEBAG)* bags, PKCS12_SAFEBAG* bag, const std::string& alias) {
    if (!bag) {
        throw PersistError("Failed to build safe bag: " + openssl_error_string());
    }
    auto id = local_key_id(alias);
    if (PKCS12_add_friendlyname_utf8(bag, alias.c_str(), static_cast<int>(alias.size())) != 1
        || PKCS12_add_localkeyid(bag, id.data(), static_cast<int>(id.size())) != 1
        || sk_PKCS12_SAFEBAG_push(bags, bag) <= 0) {
        PKCS12_SAFEBAG_free(bag);
        throw PersistError("Failed to label safe bag: " + openssl_error_string());
    }
}

PKCS12_SAFEBAG* make_key_bag(const std::vector<unsigned char>& der, bool sealed) {
    const unsigned char* p = der.data();
    long len = static_cast<long>(der.size());
    if (sealed) {
        X509_SIG* sig = d2i_X509_SIG(nullptr, &p, len);
        if (!sig) return nullptr;
        PKCS12_SAFEBAG* bag = PKCS12_SAFEBAG_create0_pkcs8(sig);
        if (!bag) X509_SIG_free(sig);
        return bag;
    }
    PKCS8_PRIV_KEY_INFO* p8 = d2i_PKCS8_PRIV_KEY_INFO(nullptr, &p, len);
    if (!p8) return nullptr;
    PKCS12_SAFEBAG* bag = PKCS12_SAFEBAG_create0_p8inf(p8);
    if (!bag) PKCS8_PRIV_KEY_INFO_free(p8);
    return bag;
}

}

Pkcs12Backend::Pkcs12Backend(const StoreConfig& config)
    : key_iterations_(config.key_iterations)
    , safe_iterations_(config.safe_iterations)
    , mac_iterations_(config.mac_iterations)
{}

const Pkcs12Backend::Entry* Pkcs12Backend::find(const std::string& alias) const {
    for (const auto& entry : entries_) {
        if (entry.alias == alias) return &entry;
    }
    return nullptr;
}

Pkcs12Backend::Entry* Pkcs12Backend::find(const std::string& alias) {
    for (auto& entry : entries_) {
        if (entry.alias == alias) return &entry;
    }
    return nullptr;
}

// Reads and verifies the whole file, then swaps it in. Key entries come
// first in key-bag order, followed by certificates no key claimed.
void Pkcs12Backend::load(const std::string& path, const std::string& password) {
    BioPtr in(BIO_new_file(path.c_str(), "rb"));
    if (!in) {
        throw LoadError("Cannot open key store " + path + ": " + openssl_error_string());
    }

    Pkcs12Ptr p12(d2i_PKCS12_bio(in.get(), nullptr));
    if (!p12) {
        throw LoadError("Malformed key store " + path + ": " + openssl_error_string());
    }
    if (!PKCS12_mac_present(p12.get())) {
        throw LoadError("Key store " + path + " carries no integrity MAC");
    }
    if (PKCS12_verify_mac(p12.get(), password.c_str(), -1) != 1) {
        ERR_clear_error();
        throw LoadError("Key store " + path + " failed its integrity check: wrong password or corrupt file");
    }

    Pkcs7Stack safes(PKCS12_unpack_authsafes(p12.get()));
    if (!safes) {
        throw LoadError("Cannot unpack key store contents: " + openssl_error_string());
    }

    std::vector<KeyBag> keys;
    std::vector<CertBag> certs;
    for (int i = 0; i < sk_PKCS7_num(safes.get()); ++i) {
        PKCS7* p7 = sk_PKCS7_value(safes.get(), i);
        SafeBagStack bags;
        if (PKCS7_type_is_data(p7)) {
            bags.reset(PKCS12_unpack_p7data(p7));
        } else if (PKCS7_type_is_encrypted(p7)) {
            bags.reset(PKCS12_unpack_p7encdata(p7, password.c_str(), -1));
        } else {
            throw LoadError("Unsupported safe content type in key store " + path);
        }
        if (!bags) {
            throw LoadError("Cannot read safe contents of " + path + ": " + openssl_error_string());
        }
        collect_bags(bags.get(), keys, certs, 0);
    }

    std::vector<Entry> loaded;
    auto add = [&loaded](Entry entry) {
        for (const auto& existing : loaded) {
            if (existing.alias == entry.alias) {
                throw LoadError("Duplicate alias in key store");
            }
        }
        loaded.push_back(std::move(entry));
    };

    for (auto& key : keys) {
        CertBag* cert = match_certificate(key, certs);
        if (!cert) {
            throw LoadError("A private key in the store has no matching certificate");
        }
        cert->used = true;
        std::string alias = !key.name.empty() ? key.name
                          : !cert->name.empty() ? cert->name
                          : to_hex(key.local_id);
        add(Entry{alias, cert->certificate, std::move(key.der), key.sealed});
    }

    for (size_t i = 0; i < certs.size(); ++i) {
        if (certs[i].used) continue;
        std::string alias = !certs[i].name.empty() ? certs[i].name
                          : !certs[i].local_id.empty() ? to_hex(certs[i].local_id)
                          : "cert-" + std::to_string(i);
        add(Entry{alias, certs[i].certificate, {}, false});
    }

    entries_ = std::move(loaded);
}

void Pkcs12Backend::persist(const std::string& path, const std::string& password) const {
    SafeBagStack cert_bags(sk_PKCS12_SAFEBAG_new_null());
    SafeBagStack key_bags(sk_PKCS12_SAFEBAG_new_null());
    Pkcs7Stack safes(sk_PKCS7_new_null());
    if (!cert_bags || !key_bags || !safes) {
        throw PersistError("Out of memory while serializing key store");
    }

    for (const auto& entry : entries_) {
        push_bag(cert_bags.get(), PKCS12_SAFEBAG_create_cert(entry.certificate.native()), entry.alias);
        if (!entry.key_der.empty()) {
            push_bag(key_bags.get(), make_key_bag(entry.key_der, entry.key_sealed), entry.alias);
        }
    }

    // PKCS12_add_safe only allocates when handed a null stack; ours already exists.
    STACK_OF(PKCS7)* raw_safes = safes.get();
    if (sk_PKCS12_SAFEBAG_num(cert_bags.get()) > 0
        && !PKCS12_add_safe(&raw_safes, cert_bags.get(), NID_aes_256_cbc, safe_iterations_, password.c_str())) {
        throw PersistError("Failed to encrypt certificate safe: " + openssl_error_string());
    }
    if (sk_PKCS12_SAFEBAG_num(key_bags.get()) > 0
        && !PKCS12_add_safe(&raw_safes, key_bags.get(), -1, 0, nullptr)) {
        throw PersistError("Failed to pack key safe: " + openssl_error_string());
    }

    Pkcs12Ptr p12(PKCS12_add_safes(safes.get(), 0));
    if (!p12) {
        throw PersistError("Failed to assemble PKCS#12 structure: " + openssl_error_string());
    }
    if (PKCS12_set_mac(p12.get(), password.c_str(), -1, nullptr, 0, mac_iterations_, EVP_sha256()) != 1) {
        throw PersistError("Failed to compute integrity MAC: " + openssl_error_string());
    }

    BioPtr out(BIO_new_file(path.c_str(), "wb"));
    if (!out) {
        throw PersistError("Cannot open " + path + " for writing: " + openssl_error_string());
    }
    if (i2d_PKCS12_bio(out.get(), p12.get()) != 1 || BIO_flush(out.get()) != 1) {
        throw PersistError("Failed to write key store " + path + ": " + openssl_error_string());
    }
}

std::vector<std::string> Pkcs12Backend::aliases() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.alias);
    }
    return out;
}

bool Pkcs12Backend::is_key_entry(const std::string& alias) const {
    const Entry* entry = find(alias);
    return entry && !entry->key_der.empty();
}

std::optional<Certificate> Pkcs12Backend::certificate(const std::string& alias) const {
    const Entry* entry = find(alias);
    if (!entry) return std::nullopt;
    return entry->certificate;
}

std::optional<PrivateKey> Pkcs12Backend::recover_key(const std::string& alias,
                                                     const std::string& password) const {
    const Entry* entry = find(alias);
    if (!entry || entry->key_der.empty()) return std::nullopt;

    const unsigned char* p = entry->key_der.data();
    long len = static_cast<long>(entry->key_der.size());
    P8Ptr p8;
    if (entry->key_sealed) {
        SigPtr sig(d2i_X509_SIG(nullptr, &p, len));
        if (!sig) {
            throw UnrecoverableKeyError("Sealed key is damaged: " + openssl_error_string());
        }
        p8.reset(PKCS8_decrypt(sig.get(), password.c_str(), -1));
        if (!p8) throw_unseal_failure();
    } else {
        p8.reset(d2i_PKCS8_PRIV_KEY_INFO(nullptr, &p, len));
        if (!p8) {
            throw UnrecoverableKeyError("Stored key is damaged: " + openssl_error_string());
        }
    }

    EVP_PKEY* pkey = EVP_PKCS82PKEY(p8.get());
    if (!pkey) {
        throw AlgorithmUnavailableError("No key manager for the stored key type: "
                                        + openssl_error_string());
    }
    return PrivateKey(pkey);
}

void Pkcs12Backend::set_key_entry(const std::string& alias, const PrivateKey& key,
                                  const Certificate& certificate, const std::string& password) {
    if (alias.empty()) {
        throw EncodingError("Alias must not be empty");
    }
    if (!is_encodable_alias(alias)) {
        throw EncodingError("Alias is not representable as a PKCS#12 friendly name");
    }

    const unsigned char* p = key.encoded().data();
    P8Ptr p8(d2i_PKCS8_PRIV_KEY_INFO(nullptr, &p, static_cast<long>(key.encoded().size())));
    if (!p8) {
        throw EncodingError("Private key is not valid PKCS#8: " + openssl_error_string());
    }

    SigPtr sig(PKCS8_encrypt(-1, EVP_aes_256_cbc(), password.c_str(), -1,
                             nullptr, 0, key_iterations_, p8.get()));
    if (!sig) {
        throw EncodingError("Failed to seal private key: " + openssl_error_string());
    }
    auto sealed = to_der(sig.get(), i2d_X509_SIG);
    if (sealed.empty()) {
        throw EncodingError("Failed to encode sealed key: " + openssl_error_string());
    }

    if (Entry* existing = find(alias)) {
        existing->certificate = certificate;
        existing->key_der = std::move(sealed);
        existing->key_sealed = true;
    } else {
        entries_.push_back(Entry{alias, certificate, std::move(sealed), true});
    }
}

bool Pkcs12Backend::delete_entry(const std::string& alias) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->alias == alias) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

}

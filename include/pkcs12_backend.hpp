#pragma once

#include <string>
#include <vector>
#include "keystore_backend.hpp"

namespace strongbox {

struct StoreConfig;

// PKCS#12 (RFC 7292) key store.
//
// File layout written by persist():
//   - an encrypted-data safe (PBES2, AES-256-CBC) holding one certBag per entry
//   - a plain data safe holding one pkcs8ShroudedKeyBag per key entry
//   - an HMAC-SHA256 MAC over the authenticated safe
// Every bag carries friendlyName = alias and a localKeyId shared by the
// key and certificate of one entry.
//
// Private keys stay sealed in memory as DER EncryptedPrivateKeyInfo and are
// only decrypted by recover_key().
class Pkcs12Backend : public KeyStoreBackend {
public:
    static constexpr const char* KIND = "PKCS12";

    explicit Pkcs12Backend(const StoreConfig& config);

    std::string kind() const override { return KIND; }

    void load(const std::string& path, const std::string& password) override;
    void clear() override { entries_.clear(); }
    void persist(const std::string& path, const std::string& password) const override;

    std::vector<std::string> aliases() const override;
    bool contains(const std::string& alias) const override { return find(alias) != nullptr; }
    bool is_key_entry(const std::string& alias) const override;
    std::optional<Certificate> certificate(const std::string& alias) const override;

    std::optional<PrivateKey> recover_key(const std::string& alias,
                                          const std::string& password) const override;
    void set_key_entry(const std::string& alias, const PrivateKey& key,
                       const Certificate& certificate, const std::string& password) override;
    bool delete_entry(const std::string& alias) override;

    size_t size() const override { return entries_.size(); }

private:
    struct Entry {
        std::string alias;
        Certificate certificate;
        std::vector<unsigned char> key_der;  // Empty for certificate-only entries
        bool key_sealed = true;              // false: key_der is a plain PrivateKeyInfo
    };

    const Entry* find(const std::string& alias) const;
    Entry* find(const std::string& alias);

    std::vector<Entry> entries_;
    int key_iterations_;
    int safe_iterations_;
    int mac_iterations_;
};

}

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "key_material.hpp"

namespace strongbox {

struct StoreConfig;

// Abstract password-protected container of (certificate, private key) entries
// addressed by alias. The default implementation is a PKCS#12 file; any
// format offering the same load/enumerate/get/set/delete/persist operations
// can stand in.
class KeyStoreBackend {
public:
    virtual ~KeyStoreBackend() = default;

    // Store kind this backend implements, e.g. "PKCS12".
    virtual std::string kind() const = 0;

    /**
     * Replaces the in-memory contents with the store at `path`.
     * @throws LoadError if the file is unreadable, malformed or the password
     *         fails the integrity check. Contents are unchanged on failure.
     */
    virtual void load(const std::string& path, const std::string& password) = 0;

    // Drops every entry, leaving an empty store.
    virtual void clear() = 0;

    /**
     * Serializes every entry to `path`, truncating whatever is there.
     * @throws PersistError on encoding or I/O failure.
     */
    virtual void persist(const std::string& path, const std::string& password) const = 0;

    // Aliases in enumeration order.
    virtual std::vector<std::string> aliases() const = 0;

    virtual bool contains(const std::string& alias) const = 0;

    // True if the alias holds a private key (as opposed to a bare certificate).
    virtual bool is_key_entry(const std::string& alias) const = 0;

    virtual std::optional<Certificate> certificate(const std::string& alias) const = 0;

    /**
     * Unseals the private key stored under `alias`.
     * @return std::nullopt if the alias is absent or holds no private key.
     * @throws UnrecoverableKeyError if `password` does not unseal the key.
     * @throws AlgorithmUnavailableError if the runtime lacks the sealing
     *         cipher/PRF or the key type.
     */
    virtual std::optional<PrivateKey> recover_key(const std::string& alias,
                                                  const std::string& password) const = 0;

    /**
     * Seals `key` under `password` and stores it with `certificate`,
     * overwriting an existing entry with the same alias in place.
     * @throws EncodingError if the entry cannot be represented.
     */
    virtual void set_key_entry(const std::string& alias, const PrivateKey& key,
                               const Certificate& certificate, const std::string& password) = 0;

    // Removes the alias. Returns false if it was not present.
    virtual bool delete_entry(const std::string& alias) = 0;

    virtual size_t size() const = 0;
};

/**
 * Instantiates the backend named by config.store_kind.
 * @throws LoadError for an unknown store kind.
 */
std::unique_ptr<KeyStoreBackend> make_backend(const StoreConfig& config);

}

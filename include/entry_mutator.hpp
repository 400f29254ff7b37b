#pragma once

#include <string>
#include "key_material.hpp"
#include "keystore_container.hpp"

namespace strongbox {

/**
 * Seals `private_key` under the container's master password, stores it with
 * `certificate` under `alias` (replacing any existing entry) and persists the
 * whole store.
 * @throws EncodingError if the entry cannot be represented (e.g. empty alias).
 * @throws PersistError if writing the store fails. The entry then exists in
 *         memory but not on disk.
 */
void add_entry(KeyStoreContainer& container, const std::string& alias,
               const Certificate& certificate, const PrivateKey& private_key);

/**
 * Removes `alias` if present and persists the store. Removing an absent
 * alias is not an error; the store is still rewritten.
 * @throws PersistError
 */
void delete_entry(KeyStoreContainer& container, const std::string& alias);

}

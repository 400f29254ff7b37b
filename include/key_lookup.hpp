#pragma once

#include <string>
#include <optional>
#include "key_material.hpp"
#include "keystore_container.hpp"

namespace strongbox {

/**
 * Looks for the entry whose certificate embeds `public_key` and unseals its
 * private key with `entry_password`.
 * Aliases are visited in enumeration order and the first match wins;
 * certificate-only entries are skipped.
 * @return std::nullopt if no entry matches.
 * @throws UnrecoverableKeyError if the matched key does not unseal.
 * @throws AlgorithmUnavailableError if the runtime lacks the sealing
 *         algorithm or key type of the matched entry.
 */
std::optional<PrivateKey> find_private_key(const KeyStoreContainer& container,
                                           const PublicKey& public_key,
                                           const std::string& entry_password);

// Lookup by the public key embedded in `certificate`.
std::optional<PrivateKey> find_private_key(const KeyStoreContainer& container,
                                           const Certificate& certificate,
                                           const std::string& entry_password);

}

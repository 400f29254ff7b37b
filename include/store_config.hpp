#pragma once

#include <string>

namespace strongbox {

// Key store configuration and sealing policy.
struct StoreConfig {
    // --- Backend ---
    std::string store_kind = "PKCS12";  // Matched case-insensitively

    // --- Sealing (PBKDF2 iteration counts) ---
    int key_iterations = 10000;   // Per-entry PKCS#8 encryption
    int safe_iterations = 10000;  // Encrypted certificate safe
    int mac_iterations = 10000;   // Whole-file integrity MAC

    // --- Persistence ---
    // Write to "<path>.tmp" then rename over the store. Off by default:
    // the plain rewrite truncates the file in place.
    bool atomic_persist = false;

    // --- Observability ---
    bool audit_logging = true;
};

/**
 * Applies STRONGBOX_* environment variables on top of `config`:
 *   STRONGBOX_STORE_KIND, STRONGBOX_KEY_ITERATIONS, STRONGBOX_SAFE_ITERATIONS,
 *   STRONGBOX_MAC_ITERATIONS, STRONGBOX_ATOMIC_PERSIST, STRONGBOX_AUDIT_LOG.
 * @throws std::invalid_argument on unparsable or non-positive values.
 */
void apply_env_overrides(StoreConfig& config);

// Parses "1/true/yes/on" and "0/false/no/off", case-insensitively.
bool parse_flag(const std::string& name, const std::string& value);

}

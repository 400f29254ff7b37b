#include "key_lookup.hpp"
#include "errors.hpp"
#include "audit_logger.hpp"
#include "metrics.hpp"

namespace strongbox {

std::optional<PrivateKey> find_private_key(const KeyStoreContainer& container,
                                           const PublicKey& public_key,
                                           const std::string& entry_password) {
    const bool logging = container.config().audit_logging;
    auto store = container.handle();

    for (const auto& alias : store->aliases()) {
        if (!store->is_key_entry(alias)) continue;

        auto certificate = store->certificate(alias);
        if (!certificate) continue;

        // Foreign stores may hold certificates whose key type no provider decodes.
        std::optional<PublicKey> certified;
        try {
            certified = certificate->public_key();
        } catch (const EncodingError&) {
            if (logging) {
                AuditLogger::log(AuditLogger::Level::WARNING, AuditLogger::EventType::LOOKUP_MISS, alias,
                                 "skipped entry with undecodable certificate key");
            }
            continue;
        }
        if (*certified != public_key) continue;

        try {
            auto key = store->recover_key(alias, entry_password);
            MetricsRegistry::instance().increment_counter(metric::LOOKUP_HITS);
            if (logging) {
                AuditLogger::log(AuditLogger::Level::INFO, AuditLogger::EventType::LOOKUP_HIT, alias);
            }
            return key;
        } catch (const KeyStoreError& e) {
            MetricsRegistry::instance().increment_counter(metric::RECOVERY_FAILURES);
            if (logging) {
                AuditLogger::log(AuditLogger::Level::WARNING, AuditLogger::EventType::RECOVERY_FAILURE,
                                 alias, e.what());
            }
            throw;
        }
    }

    MetricsRegistry::instance().increment_counter(metric::LOOKUP_MISSES);
    if (logging) {
        AuditLogger::log(AuditLogger::Level::INFO, AuditLogger::EventType::LOOKUP_MISS, "",
                         algorithm_name(public_key.algorithm()) + " key not in store");
    }
    return std::nullopt;
}

std::optional<PrivateKey> find_private_key(const KeyStoreContainer& container,
                                           const Certificate& certificate,
                                           const std::string& entry_password) {
    return find_private_key(container, certificate.public_key(), entry_password);
}

}

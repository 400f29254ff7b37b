#include "entry_mutator.hpp"
#include "audit_logger.hpp"

namespace strongbox {

void add_entry(KeyStoreContainer& container, const std::string& alias,
               const Certificate& certificate, const PrivateKey& private_key) {
    bool replaced = false;
    container.mutate([&](KeyStoreBackend& backend, const std::string& master_password) {
        replaced = backend.contains(alias);
        backend.set_key_entry(alias, private_key, certificate, master_password);
    });

    if (container.config().audit_logging) {
        AuditLogger::log(AuditLogger::Level::INFO, AuditLogger::EventType::ENTRY_ADDED, alias,
                         std::string(replaced ? "replaced " : "added ") + algorithm_name(private_key.algorithm())
                         + " key entry");
    }
}

void delete_entry(KeyStoreContainer& container, const std::string& alias) {
    bool removed = false;
    container.mutate([&](KeyStoreBackend& backend, const std::string&) {
        removed = backend.delete_entry(alias);
    });

    if (container.config().audit_logging) {
        AuditLogger::log(AuditLogger::Level::INFO, AuditLogger::EventType::ENTRY_DELETED, alias,
                         removed ? "removed" : "alias not present");
    }
}

}

#include "keystore_container.hpp"
#include "errors.hpp"
#include "audit_logger.hpp"
#include "metrics.hpp"
#include <openssl/crypto.h>
#include <filesystem>
#include <mutex>
#include <system_error>

namespace strongbox {

namespace {

void audit(const StoreConfig& config, AuditLogger::Level level, AuditLogger::EventType event,
           const std::string& message) {
    if (config.audit_logging) {
        AuditLogger::log(level, event, "", message);
    }
}

}

KeyStoreContainer::KeyStoreContainer(ConstructionTag, const std::string& path, const std::string& password,
                                     const StoreConfig& config, std::unique_ptr<KeyStoreBackend> backend)
    : path_(path)
    , password_(password)
    , config_(config)
    , backend_(std::move(backend))
{}

KeyStoreContainer::~KeyStoreContainer() {
    if (!password_.empty()) {
        OPENSSL_cleanse(&password_[0], password_.size());
    }
}

std::unique_ptr<KeyStoreContainer> KeyStoreContainer::open(const std::string& path, const std::string& password,
                                                           const StoreConfig& config) {
    std::unique_ptr<KeyStoreBackend> backend;
    try {
        backend = make_backend(config);
        backend->load(path, password);
    } catch (const LoadError& e) {
        MetricsRegistry::instance().increment_counter(metric::LOAD_FAILURES);
        audit(config, AuditLogger::Level::ERROR, AuditLogger::EventType::LOAD_FAILURE, e.what());
        throw;
    }

    MetricsRegistry::instance().increment_counter(metric::LOADS);
    MetricsRegistry::instance().set_gauge(metric::ENTRIES, static_cast<double>(backend->size()));
    audit(config, AuditLogger::Level::INFO, AuditLogger::EventType::STORE_OPENED,
          "kind=" + backend->kind() + " entries=" + std::to_string(backend->size()));

    return std::make_unique<KeyStoreContainer>(ConstructionTag(), path, password, config, std::move(backend));
}

std::unique_ptr<KeyStoreContainer> KeyStoreContainer::create(const std::string& path, const std::string& password,
                                                             const StoreConfig& config) {
    auto backend = make_backend(config);
    backend->clear();

    auto container = std::make_unique<KeyStoreContainer>(ConstructionTag(), path, password, config,
                                                         std::move(backend));
    container->persist();
    audit(config, AuditLogger::Level::INFO, AuditLogger::EventType::STORE_CREATED,
          "kind=" + container->store_kind());
    return container;
}

KeyStoreContainer::StoreHandle KeyStoreContainer::handle() const {
    return StoreHandle(mutex_, *backend_);
}

void KeyStoreContainer::persist() {
    std::unique_lock lock(mutex_);
    persist_locked();
}

void KeyStoreContainer::mutate(const Mutation& mutation) {
    std::unique_lock lock(mutex_);
    mutation(*backend_, password_);
    persist_locked();
}

// Caller holds the exclusive lock.
void KeyStoreContainer::persist_locked() {
    const std::string target = config_.atomic_persist ? path_ + ".tmp" : path_;
    try {
        backend_->persist(target, password_);
        if (config_.atomic_persist) {
            std::error_code ec;
            std::filesystem::rename(target, path_, ec);
            if (ec) {
                throw PersistError("Failed to move " + target + " over " + path_ + ": " + ec.message());
            }
        }
    } catch (const PersistError& e) {
        if (config_.atomic_persist) {
            std::error_code ec;
            std::filesystem::remove(target, ec);
            if (ec) {
                audit(config_, AuditLogger::Level::WARNING, AuditLogger::EventType::PERSIST_FAILURE,
                      "Could not remove " + target + ": " + ec.message());
            }
        }
        MetricsRegistry::instance().increment_counter(metric::PERSIST_FAILURES);
        audit(config_, AuditLogger::Level::ERROR, AuditLogger::EventType::PERSIST_FAILURE, e.what());
        throw;
    }

    MetricsRegistry::instance().increment_counter(metric::PERSISTS);
    MetricsRegistry::instance().set_gauge(metric::ENTRIES, static_cast<double>(backend_->size()));
    audit(config_, AuditLogger::Level::INFO, AuditLogger::EventType::STORE_PERSISTED,
          "entries=" + std::to_string(backend_->size()));
}

std::string KeyStoreContainer::store_kind() const {
    return backend_->kind();
}

size_t KeyStoreContainer::size() const {
    std::shared_lock lock(mutex_);
    return backend_->size();
}

std::vector<std::string> KeyStoreContainer::aliases() const {
    std::shared_lock lock(mutex_);
    return backend_->aliases();
}

bool KeyStoreContainer::contains(const std::string& alias) const {
    std::shared_lock lock(mutex_);
    return backend_->contains(alias);
}

}

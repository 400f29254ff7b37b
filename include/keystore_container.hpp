#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <shared_mutex>
#include "keystore_backend.hpp"
#include "store_config.hpp"

namespace strongbox {

// Owns a loaded key store: the backend, its file path and master password.
//
// The file is read once by open() and fully rewritten by persist(). Readers
// hold a shared lock, writers an exclusive one, so one container can be
// shared between threads. Nothing guards the file itself: two containers
// open on the same path will overwrite each other's changes.
class KeyStoreContainer {
public:
    // Read-only view of the loaded store. Holds the shared lock while alive.
    class StoreHandle {
    public:
        const KeyStoreBackend& backend() const { return backend_; }
        const KeyStoreBackend* operator->() const { return &backend_; }

    private:
        friend class KeyStoreContainer;
        StoreHandle(std::shared_mutex& mutex, const KeyStoreBackend& backend)
            : lock_(mutex), backend_(backend) {}

        std::shared_lock<std::shared_mutex> lock_;
        const KeyStoreBackend& backend_;
    };

    using Mutation = std::function<void(KeyStoreBackend& backend, const std::string& master_password)>;

    /**
     * Loads the store at `path` with the backend named by config.store_kind.
     * @throws LoadError if the file is unreadable, malformed, the password
     *         fails the integrity check or the store kind is unknown.
     */
    static std::unique_ptr<KeyStoreContainer> open(const std::string& path, const std::string& password,
                                                    const StoreConfig& config = StoreConfig());

    /**
     * Writes a new empty store at `path`, replacing any file there.
     * @throws PersistError if the file cannot be written.
     */
    static std::unique_ptr<KeyStoreContainer> create(const std::string& path, const std::string& password,
                                                     const StoreConfig& config = StoreConfig());

private:
    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };

public:
    // Reachable only through open() and create().
    KeyStoreContainer(ConstructionTag, const std::string& path, const std::string& password,
                      const StoreConfig& config, std::unique_ptr<KeyStoreBackend> backend);
    ~KeyStoreContainer();

    KeyStoreContainer(const KeyStoreContainer&) = delete;
    KeyStoreContainer& operator=(const KeyStoreContainer&) = delete;

    StoreHandle handle() const;

    /**
     * Serializes the full store to the container's path.
     * Without config.atomic_persist the file is truncated in place, so a
     * failure part-way leaves it damaged and memory and disk diverged.
     * @throws PersistError
     */
    void persist();

    // Runs `mutation` under the exclusive lock, then persists, whether or
    // not the mutation changed anything.
    void mutate(const Mutation& mutation);

    const std::string& path() const { return path_; }
    const StoreConfig& config() const { return config_; }
    std::string store_kind() const;

    size_t size() const;
    std::vector<std::string> aliases() const;
    bool contains(const std::string& alias) const;

private:
    void persist_locked();

    std::string path_;
    std::string password_;
    StoreConfig config_;
    std::unique_ptr<KeyStoreBackend> backend_;
    mutable std::shared_mutex mutex_;
};

}

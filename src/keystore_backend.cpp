#include "keystore_backend.hpp"
#include "pkcs12_backend.hpp"
#include "store_config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

namespace strongbox {

std::unique_ptr<KeyStoreBackend> make_backend(const StoreConfig& config) {
    std::string kind = config.store_kind;
    std::transform(kind.begin(), kind.end(), kind.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (kind == Pkcs12Backend::KIND) {
        return std::make_unique<Pkcs12Backend>(config);
    }
    throw LoadError("Unsupported key store kind: " + config.store_kind);
}

}

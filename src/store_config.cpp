#include "store_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace strongbox {

namespace {

int parse_iterations(const std::string& name, const char* value) {
    int parsed = 0;
    try {
        size_t used = 0;
        parsed = std::stoi(value, &used);
        if (used != std::string(value).size()) {
            throw std::invalid_argument(name);
        }
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " is not an integer: " + value);
    }
    if (parsed <= 0) {
        throw std::invalid_argument(name + " must be positive");
    }
    return parsed;
}

}

bool parse_flag(const std::string& name, const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument(name + " is not a boolean: " + value);
}

void apply_env_overrides(StoreConfig& config) {
    if (const char* e = std::getenv("STRONGBOX_STORE_KIND")) config.store_kind = e;

    if (const char* e = std::getenv("STRONGBOX_KEY_ITERATIONS")) {
        config.key_iterations = parse_iterations("STRONGBOX_KEY_ITERATIONS", e);
    }
    if (const char* e = std::getenv("STRONGBOX_SAFE_ITERATIONS")) {
        config.safe_iterations = parse_iterations("STRONGBOX_SAFE_ITERATIONS", e);
    }
    if (const char* e = std::getenv("STRONGBOX_MAC_ITERATIONS")) {
        config.mac_iterations = parse_iterations("STRONGBOX_MAC_ITERATIONS", e);
    }

    if (const char* e = std::getenv("STRONGBOX_ATOMIC_PERSIST")) {
        config.atomic_persist = parse_flag("STRONGBOX_ATOMIC_PERSIST", e);
    }
    if (const char* e = std::getenv("STRONGBOX_AUDIT_LOG")) {
        config.audit_logging = parse_flag("STRONGBOX_AUDIT_LOG", e);
    }
}

}

#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <atomic>
#include <cctype>
#include <ctime>
#include <exception>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace strongbox {

// Logs key store events with blinded aliases (salted hash).
class AuditLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        STORE_OPENED,
        STORE_CREATED,
        LOAD_FAILURE,
        STORE_PERSISTED,
        PERSIST_FAILURE,
        LOOKUP_HIT,
        LOOKUP_MISS,
        RECOVERY_FAILURE,
        ENTRY_ADDED,
        ENTRY_DELETED,
        DECODE_FAILURE
    };

    /**
     * Records a key store event.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param alias Entry alias concerned, blinded before logging. Empty if none.
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& alias,
                    const std::string& message = "") {
        if (!enabled_flag()) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "alias=" << (alias.empty() ? std::string("-") : blind(alias));

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        std::lock_guard<std::mutex> lock(mutex());
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    static void set_enabled(bool enabled) { enabled_flag() = enabled; }
    static bool enabled() { return enabled_flag(); }

    // Salted SHA-256 of the alias, first 6 bytes in hex.
    // The salt is random and rotates every 6 hours, so old log lines cannot
    // be tied back to an alias once the salt is gone.
    static std::string blind(const std::string& alias) {
        std::string salt = current_salt();
        std::string data = alias + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }

    static std::atomic<bool>& enabled_flag() {
        static std::atomic<bool> flag{true};
        return flag;
    }

    static std::string current_salt() {
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::lock_guard<std::mutex> lock(mutex());
        auto now_steady = std::chrono::steady_clock::now();
        if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
            unsigned char b[32];
            if (RAND_bytes(b, 32) != 1) {
                std::cerr << "[CRITICAL] CSPRNG failure in AuditLogger. Terminating instance for safety.\n";
                std::terminate();
            }
            std::stringstream salt_ss;
            for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
            log_salt = salt_ss.str();
            last_rotation = now_steady;
        }
        return log_salt;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::STORE_OPENED: return "STORE_OPENED";
            case EventType::STORE_CREATED: return "STORE_CREATED";
            case EventType::LOAD_FAILURE: return "LOAD_FAILURE";
            case EventType::STORE_PERSISTED: return "STORE_PERSISTED";
            case EventType::PERSIST_FAILURE: return "PERSIST_FAILURE";
            case EventType::LOOKUP_HIT: return "LOOKUP_HIT";
            case EventType::LOOKUP_MISS: return "LOOKUP_MISS";
            case EventType::RECOVERY_FAILURE: return "RECOVERY_FAILURE";
            case EventType::ENTRY_ADDED: return "ENTRY_ADDED";
            case EventType::ENTRY_DELETED: return "ENTRY_DELETED";
            case EventType::DECODE_FAILURE: return "DECODE_FAILURE";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}

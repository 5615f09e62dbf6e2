#pragma once

#include <atomic>
#include <string>
#include <string_view>

#include <sodium.h>

#include <trustlock/core/result.hpp>

namespace trustlock::utils {

    namespace detail {

        inline std::atomic<bool> &sodium_withheld() {
            static std::atomic<bool> withheld{false};
            return withheld;
        }

    } // namespace detail

    // sodium_init runs once per process and its outcome is cached.
    [[nodiscard]] inline bool sodium_initialized() {
        static const bool initialized = sodium_init() >= 0;
        return initialized;
    }

    [[nodiscard]] inline bool sodium_available() {
        return sodium_initialized() && !detail::sodium_withheld().load(std::memory_order_acquire);
    }

    // Makes key generation, signing and randomness report AlgorithmUnavailable while set.
    inline void withhold_sodium(bool withheld) {
        detail::sodium_withheld().store(withheld, std::memory_order_release);
    }

    [[nodiscard]] inline BoolResult require_sodium(std::string_view operation) {
        if (!sodium_available()) {
            return BoolResult::failure(Error::crypto_failure(
                CryptoFailureKind::AlgorithmUnavailable, "libsodium is unavailable for " + std::string(operation)));
        }
        return BoolResult::ok(true);
    }

} // namespace trustlock::utils

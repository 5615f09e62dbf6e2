#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <trustlock/cert/builder.hpp>
#include <trustlock/cert/distinguished_name.hpp>
#include <trustlock/cert/key_utils.hpp>
#include <trustlock/core/config.hpp>
#include <trustlock/core/result.hpp>

namespace trustlock::ca {

    // Everything derived from the CA key pair. Immutable once published.
    struct CaMaterial {
        cert::KeyPair key_pair;
        cert::DistinguishedName issuer;
        std::vector<uint8_t> key_identifier;
        cert::BuiltCertificate certificate; // self-signed trust anchor
        std::string certificate_pem;
    };

    /**
     * Owns the CA signing key pair for the lifetime of the context.
     *
     * The key pair is created on first use. Concurrent first callers serialise on
     * the creation lock; once the material is published every reader takes the
     * lock-free path. A failed creation publishes nothing, so the next call
     * tries again.
     */
    class CaSigningContext {
      public:
        explicit CaSigningContext(TrustConfig config);

        CaSigningContext(const CaSigningContext &) = delete;
        CaSigningContext &operator=(const CaSigningContext &) = delete;

        // No-op when the key pair already exists
        BoolResult initialize();

        [[nodiscard]] bool initialized() const noexcept;

        // Initialises on demand
        Result<std::shared_ptr<const CaMaterial>> material();

        [[nodiscard]] const TrustConfig &config() const noexcept { return config_; }

      private:
        Result<std::shared_ptr<const CaMaterial>> create_material() const;

        TrustConfig config_;
        std::mutex init_mutex_;
        std::atomic<std::shared_ptr<const CaMaterial>> material_;
    };

} // namespace trustlock::ca

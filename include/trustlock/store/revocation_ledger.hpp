#pragma once

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <trustlock/core/result.hpp>
#include <trustlock/device/device.hpp>

namespace trustlock {

    // Append-only list of revoked certificate serials. Entries are never changed or removed.
    class RevocationLedger {
      public:
        virtual ~RevocationLedger() = default;

        // Conflict when the serial is already revoked
        virtual BoolResult append(const RevocationEntry &entry) = 0;

        [[nodiscard]] virtual bool contains(std::string_view serial) const = 0;

        // Ordered by revoked_at, most recent first
        [[nodiscard]] virtual std::vector<RevocationEntry> entries_newest_first() const = 0;

        [[nodiscard]] virtual std::size_t size() const = 0;
    };

    class InMemoryRevocationLedger : public RevocationLedger {
      public:
        InMemoryRevocationLedger() = default;

        BoolResult append(const RevocationEntry &entry) override;
        [[nodiscard]] bool contains(std::string_view serial) const override;
        [[nodiscard]] std::vector<RevocationEntry> entries_newest_first() const override;
        [[nodiscard]] std::size_t size() const override;

      private:
        mutable std::shared_mutex mutex_;
        std::vector<RevocationEntry> entries_; // append order
        std::unordered_set<std::string> serials_;
    };

} // namespace trustlock

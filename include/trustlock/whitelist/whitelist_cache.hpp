#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>

#include <trustlock/store/device_registry.hpp>

namespace trustlock {

    using MacSet = std::unordered_set<std::string>;

    /**
     * Read-optimised projection of the MAC addresses of ACTIVE devices.
     *
     * Each snapshot is tagged with the generation it was built in. invalidate()
     * bumps the generation, which retires the published snapshot at once, even
     * one published late by a rebuild that raced with the invalidation.
     * Readers never block; concurrent misses may rebuild redundantly.
     */
    class WhitelistCache {
      public:
        explicit WhitelistCache(const DeviceRegistry &registry);

        [[nodiscard]] std::shared_ptr<const MacSet> get_or_rebuild();

        // Case-insensitive membership test against the current snapshot
        [[nodiscard]] bool contains(std::string_view mac_address);

        void invalidate() noexcept;

        [[nodiscard]] bool is_populated() const noexcept;
        [[nodiscard]] uint64_t rebuild_count() const noexcept { return rebuilds_.load(); }

      private:
        struct Snapshot {
            uint64_t generation{};
            std::shared_ptr<const MacSet> macs;
        };

        const DeviceRegistry &registry_;
        std::atomic<std::shared_ptr<const Snapshot>> snapshot_;
        std::atomic<uint64_t> generation_{0};
        std::atomic<uint64_t> rebuilds_{0};
    };

} // namespace trustlock

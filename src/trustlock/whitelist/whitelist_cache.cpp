#include <trustlock/whitelist/whitelist_cache.hpp>

#include <trustlock/core/log.hpp>
#include <trustlock/utils/common.hpp>

namespace trustlock {

    WhitelistCache::WhitelistCache(const DeviceRegistry &registry) : registry_(registry) {}

    std::shared_ptr<const MacSet> WhitelistCache::get_or_rebuild() {
        const auto generation = generation_.load();
        if (auto current = snapshot_.load(); current && current->generation == generation) {
            return current->macs;
        }

        auto macs = registry_.whitelisted_macs();
        auto rebuilt = std::make_shared<const Snapshot>(
            Snapshot{generation, std::make_shared<const MacSet>(macs.begin(), macs.end())});
        rebuilds_.fetch_add(1);
        snapshot_.store(rebuilt);
        log::logger()->debug("whitelist rebuilt with {} entries", rebuilt->macs->size());
        return rebuilt->macs;
    }

    bool WhitelistCache::contains(std::string_view mac_address) {
        auto macs = get_or_rebuild();
        return macs->count(utils::Common::to_upper(mac_address)) != 0;
    }

    void WhitelistCache::invalidate() noexcept {
        generation_.fetch_add(1);
        snapshot_.store(nullptr);
    }

    bool WhitelistCache::is_populated() const noexcept {
        auto current = snapshot_.load();
        return current && current->generation == generation_.load();
    }

} // namespace trustlock

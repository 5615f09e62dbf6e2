#include <trustlock/store/device_registry.hpp>

#include <algorithm>
#include <mutex>

#include <trustlock/utils/common.hpp>

namespace trustlock {

    using utils::Common;

    namespace {

        void newest_first(std::vector<Device> &devices) {
            std::sort(devices.begin(), devices.end(), [](const Device &a, const Device &b) {
                if (a.requested_at != b.requested_at) {
                    return a.requested_at > b.requested_at;
                }
                return a.device_id < b.device_id;
            });
        }

    } // namespace

    template <typename Predicate> std::vector<Device> InMemoryDeviceRegistry::collect(Predicate &&predicate) const {
        std::shared_lock lock(mutex_);
        std::vector<Device> out;
        for (const auto &[id, device] : devices_) {
            if (predicate(device)) {
                out.push_back(device);
            }
        }
        return out;
    }

    BoolResult InMemoryDeviceRegistry::insert(const Device &device) {
        if (device.device_id.empty()) {
            return BoolResult::failure(Error::invalid_input("device_id must not be empty"));
        }
        std::unique_lock lock(mutex_);
        if (devices_.count(device.device_id) != 0) {
            return BoolResult::failure(Error::conflict("device_id already exists", device.device_id));
        }
        if (device.certificate) {
            serial_index_[device.certificate->serial] = device.device_id;
        }
        devices_.emplace(device.device_id, device);
        return BoolResult::ok(true);
    }

    bool InMemoryDeviceRegistry::contains(std::string_view device_id) const {
        std::shared_lock lock(mutex_);
        return devices_.count(std::string(device_id)) != 0;
    }

    std::optional<Device> InMemoryDeviceRegistry::find_by_id(std::string_view device_id) const {
        std::shared_lock lock(mutex_);
        auto it = devices_.find(std::string(device_id));
        if (it == devices_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<Device> InMemoryDeviceRegistry::find_by_certificate_serial(std::string_view serial) const {
        std::shared_lock lock(mutex_);
        auto index = serial_index_.find(std::string(serial));
        if (index == serial_index_.end()) {
            return std::nullopt;
        }
        auto it = devices_.find(index->second);
        if (it == devices_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<Device> InMemoryDeviceRegistry::find_by_account(std::string_view account_token) const {
        auto out = collect([&](const Device &d) { return d.account_token == account_token; });
        newest_first(out);
        return out;
    }

    std::size_t InMemoryDeviceRegistry::count_for_account(std::string_view account_token,
                                                          const std::vector<DeviceStatus> &excluded) const {
        std::shared_lock lock(mutex_);
        return static_cast<std::size_t>(std::count_if(devices_.begin(), devices_.end(), [&](const auto &entry) {
            const auto &device = entry.second;
            return device.account_token == account_token &&
                   std::find(excluded.begin(), excluded.end(), device.status) == excluded.end();
        }));
    }

    bool InMemoryDeviceRegistry::exists_active_with_mac(std::string_view mac_address) const {
        return find_active_by_mac(mac_address).has_value();
    }

    std::optional<Device> InMemoryDeviceRegistry::find_active_by_mac(std::string_view mac_address) const {
        std::shared_lock lock(mutex_);
        for (const auto &[id, device] : devices_) {
            if (device.status == DeviceStatus::Active && Common::iequals(device.mac_address, mac_address)) {
                return device;
            }
        }
        return std::nullopt;
    }

    BoolResult InMemoryDeviceRegistry::compare_and_update(const Device &device, DeviceStatus expected) {
        std::unique_lock lock(mutex_);
        auto it = devices_.find(device.device_id);
        if (it == devices_.end()) {
            return BoolResult::failure(Error::not_found("device not found: " + device.device_id));
        }
        if (it->second.status != expected) {
            return BoolResult::failure(Error::invalid_state(std::string("device status changed to ") +
                                                            to_string(it->second.status)));
        }
        // last_seen_at is owned by touch_last_seen
        auto last_seen = it->second.last_seen_at;
        if (it->second.certificate && (!device.certificate || device.certificate->serial != it->second.certificate->serial)) {
            serial_index_.erase(it->second.certificate->serial);
        }
        it->second = device;
        it->second.last_seen_at = last_seen;
        if (device.certificate) {
            serial_index_[device.certificate->serial] = device.device_id;
        }
        return BoolResult::ok(true);
    }

    bool InMemoryDeviceRegistry::touch_last_seen(std::string_view device_id, Timestamp when) {
        std::unique_lock lock(mutex_);
        auto it = devices_.find(std::string(device_id));
        if (it == devices_.end()) {
            return false;
        }
        it->second.last_seen_at = when;
        return true;
    }

    std::vector<std::string> InMemoryDeviceRegistry::whitelisted_macs() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> macs;
        for (const auto &[id, device] : devices_) {
            if (device.status == DeviceStatus::Active) {
                macs.push_back(Common::to_upper(device.mac_address));
            }
        }
        return macs;
    }

    std::vector<Device> InMemoryDeviceRegistry::find_by_status(DeviceStatus status) const {
        auto out = collect([&](const Device &d) { return d.status == status; });
        newest_first(out);
        return out;
    }

    std::size_t InMemoryDeviceRegistry::count_by_status(DeviceStatus status) const {
        std::shared_lock lock(mutex_);
        return static_cast<std::size_t>(std::count_if(
            devices_.begin(), devices_.end(), [&](const auto &entry) { return entry.second.status == status; }));
    }

    std::vector<Device> InMemoryDeviceRegistry::search(std::string_view term) const {
        auto out = collect([&](const Device &d) {
            return Common::icontains(d.device_id, term) || Common::icontains(d.device_name, term) ||
                   Common::icontains(d.mac_address, term);
        });
        newest_first(out);
        return out;
    }

    std::vector<Device> InMemoryDeviceRegistry::find_expiring(Timestamp from, Timestamp to) const {
        auto out = collect([&](const Device &d) {
            return d.status == DeviceStatus::Active && d.certificate && d.certificate->expires_at >= from &&
                   d.certificate->expires_at <= to;
        });
        std::sort(out.begin(), out.end(), [](const Device &a, const Device &b) {
            return a.certificate->expires_at < b.certificate->expires_at;
        });
        return out;
    }

    std::size_t InMemoryDeviceRegistry::size() const {
        std::shared_lock lock(mutex_);
        return devices_.size();
    }

} // namespace trustlock

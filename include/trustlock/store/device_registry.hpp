#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <trustlock/core/result.hpp>
#include <trustlock/device/device.hpp>

namespace trustlock {

    /**
     * Durable store of device identities.
     *
     * Every call is atomic and works on whole records: a reader never sees a
     * device that is half way through an update. Implementations backed by a
     * database map compare_and_update onto a conditional UPDATE.
     */
    class DeviceRegistry {
      public:
        virtual ~DeviceRegistry() = default;

        // Conflict when the device_id is already taken
        virtual BoolResult insert(const Device &device) = 0;

        [[nodiscard]] virtual bool contains(std::string_view device_id) const = 0;
        [[nodiscard]] virtual std::optional<Device> find_by_id(std::string_view device_id) const = 0;
        [[nodiscard]] virtual std::optional<Device> find_by_certificate_serial(std::string_view serial) const = 0;

        // Newest request first
        [[nodiscard]] virtual std::vector<Device> find_by_account(std::string_view account_token) const = 0;
        [[nodiscard]] virtual std::size_t count_for_account(std::string_view account_token,
                                                            const std::vector<DeviceStatus> &excluded) const = 0;

        // MAC comparison ignores case
        [[nodiscard]] virtual bool exists_active_with_mac(std::string_view mac_address) const = 0;
        [[nodiscard]] virtual std::optional<Device> find_active_by_mac(std::string_view mac_address) const = 0;

        // Replaces the stored record only while its status still equals expected.
        // NotFound for an unknown id, InvalidState when the status moved on.
        virtual BoolResult compare_and_update(const Device &device, DeviceStatus expected) = 0;

        virtual bool touch_last_seen(std::string_view device_id, Timestamp when) = 0;

        // Uppercase MACs of every ACTIVE device
        [[nodiscard]] virtual std::vector<std::string> whitelisted_macs() const = 0;

        [[nodiscard]] virtual std::vector<Device> find_by_status(DeviceStatus status) const = 0;
        [[nodiscard]] virtual std::size_t count_by_status(DeviceStatus status) const = 0;

        // Case-insensitive match on device id, name or MAC
        [[nodiscard]] virtual std::vector<Device> search(std::string_view term) const = 0;

        // ACTIVE devices whose certificate expires in [from, to], soonest first
        [[nodiscard]] virtual std::vector<Device> find_expiring(Timestamp from, Timestamp to) const = 0;
    };

    class InMemoryDeviceRegistry : public DeviceRegistry {
      public:
        InMemoryDeviceRegistry() = default;

        BoolResult insert(const Device &device) override;

        [[nodiscard]] bool contains(std::string_view device_id) const override;
        [[nodiscard]] std::optional<Device> find_by_id(std::string_view device_id) const override;
        [[nodiscard]] std::optional<Device> find_by_certificate_serial(std::string_view serial) const override;
        [[nodiscard]] std::vector<Device> find_by_account(std::string_view account_token) const override;
        [[nodiscard]] std::size_t count_for_account(std::string_view account_token,
                                                    const std::vector<DeviceStatus> &excluded) const override;
        [[nodiscard]] bool exists_active_with_mac(std::string_view mac_address) const override;
        [[nodiscard]] std::optional<Device> find_active_by_mac(std::string_view mac_address) const override;
        BoolResult compare_and_update(const Device &device, DeviceStatus expected) override;
        bool touch_last_seen(std::string_view device_id, Timestamp when) override;
        [[nodiscard]] std::vector<std::string> whitelisted_macs() const override;
        [[nodiscard]] std::vector<Device> find_by_status(DeviceStatus status) const override;
        [[nodiscard]] std::size_t count_by_status(DeviceStatus status) const override;
        [[nodiscard]] std::vector<Device> search(std::string_view term) const override;
        [[nodiscard]] std::vector<Device> find_expiring(Timestamp from, Timestamp to) const override;

        [[nodiscard]] std::size_t size() const;

      private:
        template <typename Predicate> std::vector<Device> collect(Predicate &&predicate) const;

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, Device> devices_;
        std::unordered_map<std::string, std::string> serial_index_; // certificate serial -> device_id
    };

} // namespace trustlock

#include <trustlock/store/revocation_ledger.hpp>

#include <algorithm>
#include <mutex>

namespace trustlock {

    BoolResult InMemoryRevocationLedger::append(const RevocationEntry &entry) {
        if (entry.serial_number.empty()) {
            return BoolResult::failure(Error::invalid_input("revocation entry without serial number"));
        }
        std::unique_lock lock(mutex_);
        if (!serials_.insert(entry.serial_number).second) {
            return BoolResult::failure(
                Error::conflict("serial already revoked: " + entry.serial_number, entry.device_id));
        }
        entries_.push_back(entry);
        return BoolResult::ok(true);
    }

    bool InMemoryRevocationLedger::contains(std::string_view serial) const {
        std::shared_lock lock(mutex_);
        return serials_.count(std::string(serial)) != 0;
    }

    std::vector<RevocationEntry> InMemoryRevocationLedger::entries_newest_first() const {
        std::vector<RevocationEntry> out;
        {
            std::shared_lock lock(mutex_);
            out.assign(entries_.rbegin(), entries_.rend());
        }
        // Equal timestamps keep reverse append order
        std::stable_sort(out.begin(), out.end(),
                         [](const RevocationEntry &a, const RevocationEntry &b) { return a.revoked_at > b.revoked_at; });
        return out;
    }

    std::size_t InMemoryRevocationLedger::size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

} // namespace trustlock

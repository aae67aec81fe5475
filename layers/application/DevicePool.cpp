#include "DevicePool.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace application {

using device::DeviceRecord;
using device::DeviceState;

std::string poolStatusToString(PoolStatus status) {
    switch (status) {
        case PoolStatus::Ok:
            return "OK";
        case PoolStatus::UnknownDevice:
            return "UNKNOWN_DEVICE";
        case PoolStatus::NotAllocated:
            return "NOT_ALLOCATED";
        case PoolStatus::DeviceIgnored:
            return "DEVICE_IGNORED";
        case PoolStatus::DuplicateSerial:
            return "DUPLICATE_SERIAL";
        case PoolStatus::InvalidTransition:
            return "INVALID_TRANSITION";
        case PoolStatus::ShutDown:
            return "SHUT_DOWN";
    }
    return "UNKNOWN";
}

bool parsePoolStatus(const std::string& name, PoolStatus& status) {
    for (const auto candidate : {PoolStatus::Ok, PoolStatus::UnknownDevice, PoolStatus::NotAllocated,
                                 PoolStatus::DeviceIgnored, PoolStatus::DuplicateSerial,
                                 PoolStatus::InvalidTransition, PoolStatus::ShutDown}) {
        if (poolStatusToString(candidate) == name) {
            status = candidate;
            return true;
        }
    }
    return false;
}

class DevicePool::WaitRegistration {
public:
    explicit WaitRegistration(DevicePool& pool) : pool_(pool) {
        std::lock_guard<std::mutex> lock(pool_.mutex_);
        ++pool_.waiters_;
    }

    ~WaitRegistration() {
        std::lock_guard<std::mutex> lock(pool_.mutex_);
        --pool_.waiters_;
    }

    WaitRegistration(const WaitRegistration&) = delete;
    WaitRegistration& operator=(const WaitRegistration&) = delete;

private:
    DevicePool& pool_;
};

DevicePool::DevicePool(device::DeviceSelector selector)
    : selector_(std::move(selector)) {}

PoolStatus DevicePool::registerDevice(const std::string& serial, device::DeviceKind kind,
                                      std::shared_ptr<device::IDeviceProbe> probe) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutDown_) {
            return PoolStatus::ShutDown;
        }
        if (devices_.count(serial) != 0) {
            return PoolStatus::DuplicateSerial;
        }

        Slot slot;
        slot.record.serial = serial;
        slot.record.kind = kind;
        slot.record.state = DeviceState::Free;
        slot.record.probe = std::move(probe);
        slot.generation = nextGeneration_++;
        devices_.emplace(serial, std::move(slot));
        ++version_;
    }
    changed_.notify_all();
    spdlog::info("Registered {} device {}", device::kindToString(kind), serial);
    return PoolStatus::Ok;
}

PoolStatus DevicePool::deregisterDevice(const std::string& serial) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutDown_) {
            return PoolStatus::ShutDown;
        }
        auto it = devices_.find(serial);
        if (it == devices_.end()) {
            return PoolStatus::UnknownDevice;
        }
        devices_.erase(it);
        ++version_;
    }
    changed_.notify_all();
    spdlog::info("Deregistered device {}", serial);
    return PoolStatus::Ok;
}

std::optional<DeviceRecord> DevicePool::allocate(const device::SelectionCriteria& criteria) {
    return scanOnce(criteria);
}

std::optional<DeviceRecord> DevicePool::allocate(const device::SelectionCriteria& criteria,
                                                 std::chrono::milliseconds timeout,
                                                 const CancelToken* cancel) {
    if (timeout.count() <= 0) {
        return scanOnce(criteria);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    WaitRegistration registration(*this);

    while (true) {
        std::uint64_t seen = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutDown_ || (cancel != nullptr && cancel->cancelled())) {
                return std::nullopt;
            }
            seen = version_;
        }

        auto allocated = scanOnce(criteria);
        if (allocated) {
            return allocated;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        const bool woken = changed_.wait_until(lock, deadline, [&]() {
            return version_ != seen || shutDown_ || (cancel != nullptr && cancel->cancelled());
        });
        if (!woken) {
            spdlog::debug("Allocation wait timed out after {} ms", timeout.count());
            return std::nullopt;
        }
    }
}

PoolStatus DevicePool::free(const std::string& serial, device::FreeDeviceState resultingState) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutDown_) {
            return PoolStatus::ShutDown;
        }
        auto it = devices_.find(serial);
        if (it == devices_.end()) {
            return PoolStatus::UnknownDevice;
        }
        if (it->second.record.state != DeviceState::Allocated) {
            spdlog::warn("Free of {} rejected: device is {}", serial, device::stateToString(it->second.record.state));
            return PoolStatus::NotAllocated;
        }

        std::string reason;
        if (resultingState == device::FreeDeviceState::Unresponsive) {
            reason = "unresponsive";
        } else if (resultingState == device::FreeDeviceState::Unavailable) {
            reason = "released as unavailable";
        }
        setStateLocked(it->second, device::poolStateFor(resultingState), reason);
    }
    changed_.notify_all();
    return PoolStatus::Ok;
}

PoolStatus DevicePool::markUnavailable(const std::string& serial, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutDown_) {
            return PoolStatus::ShutDown;
        }
        auto it = devices_.find(serial);
        if (it == devices_.end()) {
            return PoolStatus::UnknownDevice;
        }
        if (it->second.record.state == DeviceState::Ignored) {
            return PoolStatus::DeviceIgnored;
        }
        setStateLocked(it->second, DeviceState::Unavailable, reason);
    }
    changed_.notify_all();
    return PoolStatus::Ok;
}

PoolStatus DevicePool::markIgnored(const std::string& serial) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutDown_) {
            return PoolStatus::ShutDown;
        }
        auto it = devices_.find(serial);
        if (it == devices_.end()) {
            return PoolStatus::UnknownDevice;
        }
        setStateLocked(it->second, DeviceState::Ignored, {});
    }
    changed_.notify_all();
    return PoolStatus::Ok;
}

PoolStatus DevicePool::markAvailable(const std::string& serial) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutDown_) {
            return PoolStatus::ShutDown;
        }
        auto it = devices_.find(serial);
        if (it == devices_.end()) {
            return PoolStatus::UnknownDevice;
        }
        const auto current = it->second.record.state;
        if (current == DeviceState::Ignored) {
            return PoolStatus::DeviceIgnored;
        }
        if (current != DeviceState::Unavailable) {
            return PoolStatus::InvalidTransition;
        }
        setStateLocked(it->second, DeviceState::Free, {});
    }
    changed_.notify_all();
    return PoolStatus::Ok;
}

PoolStatus DevicePool::include(const std::string& serial) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutDown_) {
            return PoolStatus::ShutDown;
        }
        auto it = devices_.find(serial);
        if (it == devices_.end()) {
            return PoolStatus::UnknownDevice;
        }
        if (it->second.record.state != DeviceState::Ignored) {
            return PoolStatus::InvalidTransition;
        }
        setStateLocked(it->second, DeviceState::Free, {});
    }
    changed_.notify_all();
    return PoolStatus::Ok;
}

void DevicePool::cancel(CancelToken& token) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token.cancelled_ = true;
    }
    changed_.notify_all();
}

void DevicePool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutDown_) {
            return;
        }
        shutDown_ = true;
        ++version_;
    }
    changed_.notify_all();
    spdlog::info("Device pool shut down");
}

bool DevicePool::isShutDown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutDown_;
}

std::optional<DeviceRecord> DevicePool::find(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(serial);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<DeviceRecord> DevicePool::snapshot() const {
    std::vector<DeviceRecord> result;
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(devices_.size());
    for (const auto& [_, slot] : devices_) {
        result.push_back(slot.record);
    }
    return result;
}

std::size_t DevicePool::pendingAllocations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_;
}

std::optional<DeviceRecord> DevicePool::scanOnce(const device::SelectionCriteria& criteria) {
    std::vector<Slot> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutDown_) {
            return std::nullopt;
        }
        for (const auto& [_, slot] : devices_) {
            if (slot.record.state == DeviceState::Free) {
                candidates.push_back(slot);
            }
        }
    }

    // Probes may block on the device, so matching runs without the pool lock.
    for (const auto& candidate : candidates) {
        bool matched = false;
        try {
            matched = selector_.matches(candidate.record, criteria);
        } catch (const std::exception& e) {
            spdlog::warn("Skipping {} during allocation: {}", candidate.record.serial, e.what());
            continue;
        }
        if (!matched) {
            continue;
        }

        DeviceRecord allocated;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutDown_) {
                return std::nullopt;
            }
            auto it = devices_.find(candidate.record.serial);
            if (it == devices_.end() || it->second.generation != candidate.generation ||
                it->second.record.state != DeviceState::Free) {
                continue;
            }
            setStateLocked(it->second, DeviceState::Allocated, {});
            allocated = it->second.record;
        }
        changed_.notify_all();
        return allocated;
    }
    return std::nullopt;
}

void DevicePool::setStateLocked(Slot& slot, DeviceState state, const std::string& reason) {
    const auto previous = slot.record.state;
    slot.record.state = state;
    slot.record.unavailableReason = state == DeviceState::Unavailable ? reason : std::string();
    ++version_;
    spdlog::info("{}: {} -> {}", slot.record.serial, device::stateToString(previous), device::stateToString(state));
}

} // namespace application

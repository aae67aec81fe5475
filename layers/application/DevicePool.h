#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "layers/device/DeviceRecord.h"
#include "layers/device/DeviceSelector.h"
#include "layers/device/SelectionCriteria.h"

namespace application {

enum class [[nodiscard]] PoolStatus {
    Ok,
    UnknownDevice,
    NotAllocated,
    DeviceIgnored,
    DuplicateSerial,
    InvalidTransition,
    ShutDown
};

std::string poolStatusToString(PoolStatus status);
bool parsePoolStatus(const std::string& name, PoolStatus& status);

// Cancels one pending allocation wait. Owned by the waiter, triggered through DevicePool::cancel.
class CancelToken {
public:
    bool cancelled() const noexcept { return cancelled_.load(); }

private:
    friend class DevicePool;
    std::atomic<bool> cancelled_{false};
};

class DevicePool {
public:
    explicit DevicePool(device::DeviceSelector selector = device::DeviceSelector());

    DevicePool(const DevicePool&) = delete;
    DevicePool& operator=(const DevicePool&) = delete;

    PoolStatus registerDevice(const std::string& serial, device::DeviceKind kind,
                              std::shared_ptr<device::IDeviceProbe> probe);
    PoolStatus deregisterDevice(const std::string& serial);

    // Single scan over Free devices. Empty when nothing matches.
    std::optional<device::DeviceRecord> allocate(const device::SelectionCriteria& criteria);
    // Re-scans whenever a device changes state until the timeout elapses or the token is cancelled.
    std::optional<device::DeviceRecord> allocate(const device::SelectionCriteria& criteria,
                                                 std::chrono::milliseconds timeout,
                                                 const CancelToken* cancel = nullptr);

    PoolStatus free(const std::string& serial,
                    device::FreeDeviceState resultingState = device::FreeDeviceState::Available);
    PoolStatus markUnavailable(const std::string& serial, const std::string& reason);
    PoolStatus markIgnored(const std::string& serial);
    PoolStatus markAvailable(const std::string& serial);
    PoolStatus include(const std::string& serial);

    void cancel(CancelToken& token);
    void shutdown();
    bool isShutDown() const;

    std::optional<device::DeviceRecord> find(const std::string& serial) const;
    std::vector<device::DeviceRecord> snapshot() const;
    std::size_t pendingAllocations() const;

    const device::DeviceSelector& selector() const noexcept { return selector_; }

private:
    struct Slot {
        device::DeviceRecord record;
        std::uint64_t generation = 0;
    };

    class WaitRegistration;

    std::optional<device::DeviceRecord> scanOnce(const device::SelectionCriteria& criteria);
    void setStateLocked(Slot& slot, device::DeviceState state, const std::string& reason);

    device::DeviceSelector selector_;

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::map<std::string, Slot> devices_;
    std::uint64_t version_ = 0;
    std::uint64_t nextGeneration_ = 1;
    std::size_t waiters_ = 0;
    bool shutDown_ = false;
};

} // namespace application

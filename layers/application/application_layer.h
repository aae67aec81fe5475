#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "CommandLedger.h"
#include "DevicePool.h"
#include "layers/device/DeviceSelector.h"

namespace application {

// Builds the telemetry adapter for a newly registered device.
using ProbeFactory = std::function<std::shared_ptr<device::IDeviceProbe>(const std::string& serial)>;

class ApplicationCore {
public:
    explicit ApplicationCore(device::EnvironmentLookup environment = device::processEnvironment());

    ApplicationCore(const ApplicationCore&) = delete;
    ApplicationCore& operator=(const ApplicationCore&) = delete;

    // Registers count placeholder devices named <prefix><index>, each with a probe from makeProbe.
    std::size_t registerPlaceholders(device::DeviceKind kind, const std::string& prefix, std::size_t count,
                                     const ProbeFactory& makeProbe);

    // Marks the device as running a command in the ledger.
    void beginCommand(const std::string& serial);
    // Records the outcome and releases the device into the state derived from the result.
    PoolStatus completeCommand(const std::string& serial, const CommandResult& result);

    DevicePool& pool() noexcept { return pool_; }
    const DevicePool& pool() const noexcept { return pool_; }
    CommandLedger& ledger() noexcept { return ledger_; }
    const CommandLedger& ledger() const noexcept { return ledger_; }

private:
    DevicePool pool_;
    CommandLedger ledger_;
};

} // namespace application

#include "application_layer.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace application {

ApplicationCore::ApplicationCore(device::EnvironmentLookup environment)
    : pool_(device::DeviceSelector(std::move(environment))) {}

std::size_t ApplicationCore::registerPlaceholders(device::DeviceKind kind, const std::string& prefix, std::size_t count,
                                                  const ProbeFactory& makeProbe) {
    std::size_t registered = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const auto serial = prefix + std::to_string(i);
        const auto status = pool_.registerDevice(serial, kind, makeProbe(serial));
        if (status != PoolStatus::Ok) {
            spdlog::warn("Could not register {}: {}", serial, poolStatusToString(status));
            continue;
        }
        ++registered;
    }
    return registered;
}

void ApplicationCore::beginCommand(const std::string& serial) {
    CommandResult executing;
    executing.status = CommandStatus::Executing;
    ledger_.record(serial, executing);
}

PoolStatus ApplicationCore::completeCommand(const std::string& serial, const CommandResult& result) {
    ledger_.record(serial, result);

    const auto freeState = result.freeDeviceState.value_or(device::FreeDeviceState::Available);
    const auto status = pool_.free(serial, freeState);
    if (status != PoolStatus::Ok) {
        spdlog::warn("Command on {} finished but device was not released: {}", serial, poolStatusToString(status));
    }
    return status;
}

} // namespace application

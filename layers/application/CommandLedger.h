#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "layers/device/DeviceRecord.h"

namespace application {

enum class CommandStatus {
    NoActiveCommand,
    NotAllocated,
    Executing,
    InvocationFailed,
    InvocationSuccess
};

std::string commandStatusToString(CommandStatus status);
bool parseCommandStatus(const std::string& name, CommandStatus& status);

struct CommandResult {
    CommandStatus status = CommandStatus::NotAllocated;
    std::optional<std::string> errorDetail;
    std::optional<device::FreeDeviceState> freeDeviceState;

    bool operator==(const CommandResult& other) const {
        return status == other.status && errorDetail == other.errorDetail && freeDeviceState == other.freeDeviceState;
    }
    bool operator!=(const CommandResult& other) const { return !(*this == other); }
};

// Latest command outcome per serial. Entries are overwritten, never appended.
class CommandLedger {
public:
    void record(const std::string& serial, const CommandResult& result);

    // NotAllocated when nothing was ever recorded for the serial.
    CommandResult lastResult(const std::string& serial) const;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CommandResult> results_;
};

} // namespace application

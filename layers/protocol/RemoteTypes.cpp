#include "RemoteTypes.h"

#include <type_traits>

namespace protocol {

std::string operationToString(OperationType type) {
    switch (type) {
        case OperationType::GetLastCommandResult:
            return "GetLastCommandResult";
        case OperationType::AllocateDevice:
            return "AllocateDevice";
        case OperationType::FreeDevice:
            return "FreeDevice";
        case OperationType::ListDevices:
            return "ListDevices";
        case OperationType::MarkUnavailable:
            return "MarkUnavailable";
        case OperationType::MarkIgnored:
            return "MarkIgnored";
        case OperationType::MarkAvailable:
            return "MarkAvailable";
        case OperationType::IncludeDevice:
            return "IncludeDevice";
        case OperationType::Close:
            return "Close";
        case OperationType::Error:
            return "Error";
    }
    return "Unknown";
}

bool parseOperation(const std::string& name, OperationType& type) {
    for (const auto candidate :
         {OperationType::GetLastCommandResult, OperationType::AllocateDevice, OperationType::FreeDevice,
          OperationType::ListDevices, OperationType::MarkUnavailable, OperationType::MarkIgnored,
          OperationType::MarkAvailable, OperationType::IncludeDevice, OperationType::Close, OperationType::Error}) {
        if (operationToString(candidate) == name) {
            type = candidate;
            return true;
        }
    }
    return false;
}

DeviceSummary summarize(const device::DeviceRecord& record) {
    DeviceSummary summary;
    summary.serial = record.serial;
    summary.kind = record.kind;
    summary.state = record.state;
    summary.reason = record.unavailableReason;
    return summary;
}

OperationType operationOf(const Request& request) {
    return std::visit(
        [](const auto& r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, GetLastCommandResultRequest>) {
                return OperationType::GetLastCommandResult;
            } else if constexpr (std::is_same_v<T, AllocateDeviceRequest>) {
                return OperationType::AllocateDevice;
            } else if constexpr (std::is_same_v<T, FreeDeviceRequest>) {
                return OperationType::FreeDevice;
            } else if constexpr (std::is_same_v<T, ListDevicesRequest>) {
                return OperationType::ListDevices;
            } else if constexpr (std::is_same_v<T, MarkUnavailableRequest>) {
                return OperationType::MarkUnavailable;
            } else if constexpr (std::is_same_v<T, MarkIgnoredRequest>) {
                return OperationType::MarkIgnored;
            } else if constexpr (std::is_same_v<T, MarkAvailableRequest>) {
                return OperationType::MarkAvailable;
            } else if constexpr (std::is_same_v<T, IncludeDeviceRequest>) {
                return OperationType::IncludeDevice;
            } else {
                return OperationType::Close;
            }
        },
        request);
}

OperationType operationOf(const Response& response) {
    return std::visit(
        [](const auto& r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, GetLastCommandResultResponse>) {
                return OperationType::GetLastCommandResult;
            } else if constexpr (std::is_same_v<T, AllocateDeviceResponse>) {
                return OperationType::AllocateDevice;
            } else if constexpr (std::is_same_v<T, PoolStatusResponse>) {
                return r.type;
            } else if constexpr (std::is_same_v<T, ListDevicesResponse>) {
                return OperationType::ListDevices;
            } else if constexpr (std::is_same_v<T, CloseResponse>) {
                return OperationType::Close;
            } else {
                return OperationType::Error;
            }
        },
        response);
}

} // namespace protocol

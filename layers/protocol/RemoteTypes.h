#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "layers/application/CommandLedger.h"
#include "layers/application/DevicePool.h"
#include "layers/device/DeviceRecord.h"
#include "layers/device/SelectionCriteria.h"

namespace protocol {

enum class OperationType {
    GetLastCommandResult,
    AllocateDevice,
    FreeDevice,
    ListDevices,
    MarkUnavailable,
    MarkIgnored,
    MarkAvailable,
    IncludeDevice,
    Close,
    Error
};

std::string operationToString(OperationType type);
bool parseOperation(const std::string& name, OperationType& type);

struct GetLastCommandResultRequest {
    std::string serial;
};

struct AllocateDeviceRequest {
    device::SelectionCriteria criteria;
    std::chrono::milliseconds timeout{0};
};

struct FreeDeviceRequest {
    std::string serial;
    device::FreeDeviceState freeDeviceState = device::FreeDeviceState::Available;
};

struct ListDevicesRequest {};

struct MarkUnavailableRequest {
    std::string serial;
    std::string reason;
};

struct MarkIgnoredRequest {
    std::string serial;
};

struct MarkAvailableRequest {
    std::string serial;
};

struct IncludeDeviceRequest {
    std::string serial;
};

struct CloseRequest {};

using Request = std::variant<GetLastCommandResultRequest, AllocateDeviceRequest, FreeDeviceRequest,
                             ListDevicesRequest, MarkUnavailableRequest, MarkIgnoredRequest,
                             MarkAvailableRequest, IncludeDeviceRequest, CloseRequest>;

struct DeviceSummary {
    std::string serial;
    device::DeviceKind kind = device::DeviceKind::Physical;
    device::DeviceState state = device::DeviceState::Free;
    std::string reason;
};

DeviceSummary summarize(const device::DeviceRecord& record);

struct GetLastCommandResultResponse {
    application::CommandResult result;
};

struct AllocateDeviceResponse {
    std::optional<DeviceSummary> device;
};

// Outcome of FreeDevice, MarkUnavailable, MarkIgnored, MarkAvailable and IncludeDevice.
struct PoolStatusResponse {
    OperationType type = OperationType::FreeDevice;
    application::PoolStatus status = application::PoolStatus::Ok;
};

struct ListDevicesResponse {
    std::vector<DeviceSummary> devices;
};

struct CloseResponse {};

struct ErrorResponse {
    std::string message;
};

using Response = std::variant<GetLastCommandResultResponse, AllocateDeviceResponse, PoolStatusResponse,
                              ListDevicesResponse, CloseResponse, ErrorResponse>;

OperationType operationOf(const Request& request);
OperationType operationOf(const Response& response);

} // namespace protocol

#include "protocol_layer.h"

#include <cstdint>
#include <limits>
#include <type_traits>

namespace protocol {

namespace {

constexpr const char* kType = "type";
constexpr const char* kSerial = "serial";
constexpr const char* kStatus = "status";
constexpr const char* kError = "error";
constexpr const char* kFreeDeviceState = "free_device_state";
constexpr const char* kReason = "reason";
constexpr const char* kTimeoutMs = "timeout_ms";
constexpr const char* kAllocated = "allocated";
constexpr const char* kKind = "kind";
constexpr const char* kState = "state";
constexpr const char* kResult = "result";
constexpr const char* kDevices = "devices";
constexpr const char* kMessage = "message";

constexpr const char* kSerials = "serials";
constexpr const char* kExcludeSerials = "exclude_serials";
constexpr const char* kProductTypes = "product_types";
constexpr const char* kProperties = "properties";
constexpr const char* kMinSdk = "min_sdk";
constexpr const char* kMaxSdk = "max_sdk";
constexpr const char* kMinBattery = "min_battery";
constexpr const char* kMaxBattery = "max_battery";
constexpr const char* kMinBatteryTemperature = "min_battery_temperature";
constexpr const char* kMaxBatteryTemperature = "max_battery_temperature";
constexpr const char* kRequireBatteryCheck = "require_battery_check";
constexpr const char* kRequireBatteryTemperatureCheck = "require_battery_temperature_check";
constexpr const char* kPhysical = "physical";
constexpr const char* kEmulator = "emulator";
constexpr const char* kNullDevice = "null_device";
constexpr const char* kTcpDevice = "tcp_device";
constexpr const char* kStubEmulator = "stub_emulator";

bool readString(const json::object& obj, const char* key, std::string& out, std::string& error) {
    if (!obj.contains(key)) {
        error = std::string("Missing required field: ") + key;
        return false;
    }
    if (!obj.at(key).is_string()) {
        error = std::string(key) + " must be string";
        return false;
    }
    out = obj.at(key).as_string().c_str();
    return true;
}

bool readOptionalString(const json::object& obj, const char* key, std::optional<std::string>& out, std::string& error) {
    out.reset();
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.at(key).is_string()) {
        error = std::string(key) + " must be string";
        return false;
    }
    out = std::string(obj.at(key).as_string().c_str());
    return true;
}

bool readOptionalInt(const json::object& obj, const char* key, std::optional<int>& out, std::string& error) {
    out.reset();
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.at(key).is_int64()) {
        error = std::string(key) + " must be integer";
        return false;
    }
    const auto value = obj.at(key).as_int64();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        error = std::string(key) + " out of range";
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool readOptionalBool(const json::object& obj, const char* key, std::optional<bool>& out, std::string& error) {
    out.reset();
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.at(key).is_bool()) {
        error = std::string(key) + " must be boolean";
        return false;
    }
    out = obj.at(key).as_bool();
    return true;
}

bool readFlag(const json::object& obj, const char* key, bool& out, std::string& error) {
    std::optional<bool> value;
    if (!readOptionalBool(obj, key, value, error)) {
        return false;
    }
    out = value.value_or(false);
    return true;
}

bool readStringSet(const json::object& obj, const char* key, std::set<std::string>& out, std::string& error) {
    out.clear();
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.at(key).is_array()) {
        error = std::string(key) + " must be array";
        return false;
    }
    for (const auto& item : obj.at(key).as_array()) {
        if (!item.is_string()) {
            error = std::string(key) + " must contain strings";
            return false;
        }
        out.insert(std::string(item.as_string().c_str()));
    }
    return true;
}

bool readStringMap(const json::object& obj, const char* key, std::map<std::string, std::string>& out,
                   std::string& error) {
    out.clear();
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.at(key).is_object()) {
        error = std::string(key) + " must be object";
        return false;
    }
    for (const auto& entry : obj.at(key).as_object()) {
        if (!entry.value().is_string()) {
            error = std::string(key) + " values must be strings";
            return false;
        }
        out.emplace(std::string(entry.key()), std::string(entry.value().as_string().c_str()));
    }
    return true;
}

json::array toArray(const std::set<std::string>& values) {
    json::array out;
    for (const auto& value : values) {
        out.emplace_back(value);
    }
    return out;
}

void putOptional(json::object& obj, const char* key, const std::optional<int>& value) {
    if (value) {
        obj[key] = *value;
    }
}

void putOptional(json::object& obj, const char* key, const std::optional<bool>& value) {
    if (value) {
        obj[key] = *value;
    }
}

void putFlag(json::object& obj, const char* key, bool value) {
    if (value) {
        obj[key] = true;
    }
}

void criteriaToJson(const device::SelectionCriteria& criteria, json::object& obj) {
    if (!criteria.serials.empty()) {
        obj[kSerials] = toArray(criteria.serials);
    }
    if (!criteria.excludedSerials.empty()) {
        obj[kExcludeSerials] = toArray(criteria.excludedSerials);
    }
    if (!criteria.productTypes.empty()) {
        obj[kProductTypes] = toArray(criteria.productTypes);
    }
    if (!criteria.properties.empty()) {
        json::object props;
        for (const auto& [name, value] : criteria.properties) {
            props[name] = value;
        }
        obj[kProperties] = props;
    }
    putOptional(obj, kMinSdk, criteria.minSdk);
    putOptional(obj, kMaxSdk, criteria.maxSdk);
    putOptional(obj, kMinBattery, criteria.minBattery);
    putOptional(obj, kMaxBattery, criteria.maxBattery);
    putOptional(obj, kMinBatteryTemperature, criteria.minBatteryTemperature);
    putOptional(obj, kMaxBatteryTemperature, criteria.maxBatteryTemperature);
    putOptional(obj, kRequireBatteryCheck, criteria.requireBatteryCheck);
    putOptional(obj, kRequireBatteryTemperatureCheck, criteria.requireBatteryTemperatureCheck);
    putFlag(obj, kPhysical, criteria.physicalRequested);
    putFlag(obj, kEmulator, criteria.emulatorRequested);
    putFlag(obj, kNullDevice, criteria.nullDeviceRequested);
    putFlag(obj, kTcpDevice, criteria.tcpDeviceRequested);
    putFlag(obj, kStubEmulator, criteria.stubEmulatorRequested);
}

bool jsonToCriteria(const json::object& obj, device::SelectionCriteria& out, std::string& error) {
    return readStringSet(obj, kSerials, out.serials, error) &&
           readStringSet(obj, kExcludeSerials, out.excludedSerials, error) &&
           readStringSet(obj, kProductTypes, out.productTypes, error) &&
           readStringMap(obj, kProperties, out.properties, error) &&
           readOptionalInt(obj, kMinSdk, out.minSdk, error) &&
           readOptionalInt(obj, kMaxSdk, out.maxSdk, error) &&
           readOptionalInt(obj, kMinBattery, out.minBattery, error) &&
           readOptionalInt(obj, kMaxBattery, out.maxBattery, error) &&
           readOptionalInt(obj, kMinBatteryTemperature, out.minBatteryTemperature, error) &&
           readOptionalInt(obj, kMaxBatteryTemperature, out.maxBatteryTemperature, error) &&
           readOptionalBool(obj, kRequireBatteryCheck, out.requireBatteryCheck, error) &&
           readOptionalBool(obj, kRequireBatteryTemperatureCheck, out.requireBatteryTemperatureCheck, error) &&
           readFlag(obj, kPhysical, out.physicalRequested, error) &&
           readFlag(obj, kEmulator, out.emulatorRequested, error) &&
           readFlag(obj, kNullDevice, out.nullDeviceRequested, error) &&
           readFlag(obj, kTcpDevice, out.tcpDeviceRequested, error) &&
           readFlag(obj, kStubEmulator, out.stubEmulatorRequested, error);
}

json::object summaryToJson(const DeviceSummary& summary) {
    json::object obj;
    obj[kSerial] = summary.serial;
    obj[kKind] = device::kindToString(summary.kind);
    obj[kState] = device::stateToString(summary.state);
    if (!summary.reason.empty()) {
        obj[kReason] = summary.reason;
    }
    return obj;
}

bool jsonToSummary(const json::value& value, DeviceSummary& out, std::string& error) {
    if (!value.is_object()) {
        error = "device entry must be object";
        return false;
    }
    const auto& obj = value.as_object();

    std::string kind;
    std::string state;
    if (!readString(obj, kSerial, out.serial, error) || !readString(obj, kKind, kind, error) ||
        !readString(obj, kState, state, error)) {
        return false;
    }
    if (!device::parseKind(kind, out.kind)) {
        error = "unrecognized kind '" + kind + "'";
        return false;
    }
    if (!device::parseState(state, out.state)) {
        error = "unrecognized state '" + state + "'";
        return false;
    }

    std::optional<std::string> reason;
    if (!readOptionalString(obj, kReason, reason, error)) {
        return false;
    }
    out.reason = reason.value_or(std::string());
    return true;
}

} // namespace

std::string ProtocolCodec::encodeRequest(const Request& request) const {
    return frame(requestToJson(request));
}

bool ProtocolCodec::decodeRequest(const std::string& line, Request& out, std::string& error) const {
    json::value payload;
    if (!parseLine(line, payload, error)) {
        return false;
    }
    return jsonToRequest(payload, out, error);
}

std::string ProtocolCodec::encodeResponse(const Response& response) const {
    return frame(responseToJson(response));
}

bool ProtocolCodec::decodeResponse(OperationType expected, const std::string& line, Response& out,
                                   std::string& error) const {
    json::value payload;
    if (!parseLine(line, payload, error)) {
        return false;
    }
    return jsonToResponse(expected, payload, out, error);
}

json::object ProtocolCodec::requestToJson(const Request& request) const {
    json::object obj;
    obj[kType] = operationToString(operationOf(request));

    std::visit(
        [&obj](const auto& r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, AllocateDeviceRequest>) {
                criteriaToJson(r.criteria, obj);
                if (r.timeout.count() > 0) {
                    obj[kTimeoutMs] = static_cast<std::int64_t>(r.timeout.count());
                }
            } else if constexpr (std::is_same_v<T, FreeDeviceRequest>) {
                obj[kSerial] = r.serial;
                obj[kFreeDeviceState] = device::freeStateToString(r.freeDeviceState);
            } else if constexpr (std::is_same_v<T, MarkUnavailableRequest>) {
                obj[kSerial] = r.serial;
                if (!r.reason.empty()) {
                    obj[kReason] = r.reason;
                }
            } else if constexpr (std::is_same_v<T, GetLastCommandResultRequest> ||
                                 std::is_same_v<T, MarkIgnoredRequest> ||
                                 std::is_same_v<T, MarkAvailableRequest> ||
                                 std::is_same_v<T, IncludeDeviceRequest>) {
                obj[kSerial] = r.serial;
            }
        },
        request);
    return obj;
}

bool ProtocolCodec::jsonToRequest(const json::value& payload, Request& out, std::string& error) const {
    if (!payload.is_object()) {
        error = "Request must be object";
        return false;
    }
    const auto& obj = payload.as_object();

    std::string typeName;
    if (!readString(obj, kType, typeName, error)) {
        return false;
    }
    OperationType type = OperationType::Error;
    if (!parseOperation(typeName, type)) {
        error = "Unknown operation type '" + typeName + "'";
        return false;
    }

    switch (type) {
        case OperationType::GetLastCommandResult: {
            GetLastCommandResultRequest request;
            if (!readString(obj, kSerial, request.serial, error)) {
                return false;
            }
            out = request;
            return true;
        }
        case OperationType::AllocateDevice: {
            AllocateDeviceRequest request;
            if (!jsonToCriteria(obj, request.criteria, error)) {
                return false;
            }
            std::optional<int> timeoutMs;
            if (!readOptionalInt(obj, kTimeoutMs, timeoutMs, error)) {
                return false;
            }
            if (timeoutMs && *timeoutMs < 0) {
                error = "timeout_ms must not be negative";
                return false;
            }
            request.timeout = std::chrono::milliseconds(timeoutMs.value_or(0));
            out = request;
            return true;
        }
        case OperationType::FreeDevice: {
            FreeDeviceRequest request;
            std::optional<std::string> state;
            if (!readString(obj, kSerial, request.serial, error) ||
                !readOptionalString(obj, kFreeDeviceState, state, error)) {
                return false;
            }
            if (state && !device::parseFreeState(*state, request.freeDeviceState)) {
                error = "unrecognized state '" + *state + "'";
                return false;
            }
            out = request;
            return true;
        }
        case OperationType::ListDevices:
            out = ListDevicesRequest{};
            return true;
        case OperationType::MarkUnavailable: {
            MarkUnavailableRequest request;
            std::optional<std::string> reason;
            if (!readString(obj, kSerial, request.serial, error) || !readOptionalString(obj, kReason, reason, error)) {
                return false;
            }
            request.reason = reason.value_or(std::string());
            out = request;
            return true;
        }
        case OperationType::MarkIgnored: {
            MarkIgnoredRequest request;
            if (!readString(obj, kSerial, request.serial, error)) {
                return false;
            }
            out = request;
            return true;
        }
        case OperationType::MarkAvailable: {
            MarkAvailableRequest request;
            if (!readString(obj, kSerial, request.serial, error)) {
                return false;
            }
            out = request;
            return true;
        }
        case OperationType::IncludeDevice: {
            IncludeDeviceRequest request;
            if (!readString(obj, kSerial, request.serial, error)) {
                return false;
            }
            out = request;
            return true;
        }
        case OperationType::Close:
            out = CloseRequest{};
            return true;
        case OperationType::Error:
            break;
    }

    error = "'" + typeName + "' is not a request type";
    return false;
}

json::object ProtocolCodec::responseToJson(const Response& response) const {
    json::object obj;
    obj[kType] = operationToString(operationOf(response));

    std::visit(
        [&obj](const auto& r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, GetLastCommandResultResponse>) {
                obj[kStatus] = application::commandStatusToString(r.result.status);
                if (r.result.errorDetail) {
                    obj[kError] = *r.result.errorDetail;
                }
                if (r.result.freeDeviceState) {
                    obj[kFreeDeviceState] = device::freeStateToString(*r.result.freeDeviceState);
                }
            } else if constexpr (std::is_same_v<T, AllocateDeviceResponse>) {
                obj[kAllocated] = r.device.has_value();
                if (r.device) {
                    obj[kSerial] = r.device->serial;
                    obj[kKind] = device::kindToString(r.device->kind);
                }
            } else if constexpr (std::is_same_v<T, PoolStatusResponse>) {
                obj[kResult] = application::poolStatusToString(r.status);
            } else if constexpr (std::is_same_v<T, ListDevicesResponse>) {
                json::array devices;
                for (const auto& summary : r.devices) {
                    devices.emplace_back(summaryToJson(summary));
                }
                obj[kDevices] = devices;
            } else if constexpr (std::is_same_v<T, ErrorResponse>) {
                obj[kMessage] = r.message;
            }
        },
        response);
    return obj;
}

bool ProtocolCodec::jsonToResponse(OperationType expected, const json::value& payload, Response& out,
                                   std::string& error) const {
    if (!payload.is_object()) {
        error = "Response must be object";
        return false;
    }
    const auto& obj = payload.as_object();

    std::string typeName;
    if (!readString(obj, kType, typeName, error)) {
        return false;
    }
    OperationType type = OperationType::Error;
    if (!parseOperation(typeName, type)) {
        error = "Unknown operation type '" + typeName + "'";
        return false;
    }

    if (type == OperationType::Error) {
        ErrorResponse response;
        if (!readString(obj, kMessage, response.message, error)) {
            return false;
        }
        out = response;
        return true;
    }
    if (type != expected) {
        error = "Expected " + operationToString(expected) + " response, got " + typeName;
        return false;
    }

    switch (type) {
        case OperationType::GetLastCommandResult: {
            GetLastCommandResultResponse response;
            std::string status;
            std::optional<std::string> freeState;
            if (!readString(obj, kStatus, status, error) ||
                !readOptionalString(obj, kError, response.result.errorDetail, error) ||
                !readOptionalString(obj, kFreeDeviceState, freeState, error)) {
                return false;
            }
            if (!application::parseCommandStatus(status, response.result.status)) {
                error = "unrecognized status '" + status + "'";
                return false;
            }
            if (freeState) {
                auto state = device::FreeDeviceState::Available;
                if (!device::parseFreeState(*freeState, state)) {
                    error = "unrecognized state '" + *freeState + "'";
                    return false;
                }
                response.result.freeDeviceState = state;
            }
            out = response;
            return true;
        }
        case OperationType::AllocateDevice: {
            AllocateDeviceResponse response;
            std::optional<bool> allocated;
            if (!readOptionalBool(obj, kAllocated, allocated, error)) {
                return false;
            }
            if (!allocated) {
                error = std::string("Missing required field: ") + kAllocated;
                return false;
            }
            if (*allocated) {
                DeviceSummary summary;
                std::string kind;
                if (!readString(obj, kSerial, summary.serial, error) || !readString(obj, kKind, kind, error)) {
                    return false;
                }
                if (!device::parseKind(kind, summary.kind)) {
                    error = "unrecognized kind '" + kind + "'";
                    return false;
                }
                summary.state = device::DeviceState::Allocated;
                response.device = summary;
            }
            out = response;
            return true;
        }
        case OperationType::FreeDevice:
        case OperationType::MarkUnavailable:
        case OperationType::MarkIgnored:
        case OperationType::MarkAvailable:
        case OperationType::IncludeDevice: {
            PoolStatusResponse response;
            response.type = type;
            std::string result;
            if (!readString(obj, kResult, result, error)) {
                return false;
            }
            if (!application::parsePoolStatus(result, response.status)) {
                error = "unrecognized result '" + result + "'";
                return false;
            }
            out = response;
            return true;
        }
        case OperationType::ListDevices: {
            ListDevicesResponse response;
            if (!obj.contains(kDevices) || !obj.at(kDevices).is_array()) {
                error = "devices must be array";
                return false;
            }
            for (const auto& item : obj.at(kDevices).as_array()) {
                DeviceSummary summary;
                if (!jsonToSummary(item, summary, error)) {
                    return false;
                }
                response.devices.push_back(summary);
            }
            out = response;
            return true;
        }
        case OperationType::Close:
            out = CloseResponse{};
            return true;
        case OperationType::Error:
            break;
    }

    error = "Unhandled response type " + typeName;
    return false;
}

bool ProtocolCodec::parseLine(const std::string& line, json::value& out, std::string& error) {
    if (line.size() > kMaxLineLength) {
        error = "Message exceeds " + std::to_string(kMaxLineLength) + " bytes";
        return false;
    }

    std::string body = line;
    while (!body.empty() && (body.back() == '\n' || body.back() == '\r')) {
        body.pop_back();
    }

    json::error_code ec;
    out = json::parse(body, ec);
    if (ec) {
        error = "Parse error: " + ec.message();
        return false;
    }
    return true;
}

std::string ProtocolCodec::frame(const json::object& object) {
    auto line = json::serialize(object);
    line.push_back('\n');
    return line;
}

} // namespace protocol

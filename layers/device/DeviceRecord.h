#pragma once

#include <memory>
#include <optional>
#include <string>

#include "IDeviceProbe.h"

namespace device {

enum class DeviceKind {
    Physical,
    Emulator,
    NullDevice,
    TcpDevice,
    StubEmulator,
    Fastboot
};

enum class DeviceState {
    Free,
    Allocated,
    Unavailable,
    Ignored
};

// State requested by whoever releases a device after running a command.
enum class FreeDeviceState {
    Available,
    Unavailable,
    Unresponsive,
    Ignore
};

namespace properties {
constexpr const char* kBoard = "ro.product.board";
constexpr const char* kVariant = "ro.product.vendor.device";
constexpr const char* kVariantLegacy = "ro.product.device";
constexpr const char* kSdkVersion = "ro.build.version.sdk";
} // namespace properties

struct DeviceRecord {
    std::string serial;
    DeviceKind kind = DeviceKind::Physical;
    DeviceState state = DeviceState::Free;
    std::string unavailableReason;
    std::shared_ptr<IDeviceProbe> probe;
};

// Null, tcp and stub emulator devices stand in for hardware and must be requested explicitly.
bool isVirtualKind(DeviceKind kind) noexcept;

std::string kindToString(DeviceKind kind);
bool parseKind(const std::string& name, DeviceKind& kind);

std::string stateToString(DeviceState state);
bool parseState(const std::string& name, DeviceState& state);

std::string freeStateToString(FreeDeviceState state);
bool parseFreeState(const std::string& name, FreeDeviceState& state);

// Pool state a released device lands in.
DeviceState poolStateFor(FreeDeviceState state) noexcept;

} // namespace device

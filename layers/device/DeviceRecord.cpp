#include "DeviceRecord.h"

namespace device {

bool isVirtualKind(DeviceKind kind) noexcept {
    return kind == DeviceKind::NullDevice || kind == DeviceKind::TcpDevice || kind == DeviceKind::StubEmulator;
}

std::string kindToString(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Physical:
            return "PHYSICAL";
        case DeviceKind::Emulator:
            return "EMULATOR";
        case DeviceKind::NullDevice:
            return "NULL_DEVICE";
        case DeviceKind::TcpDevice:
            return "TCP_DEVICE";
        case DeviceKind::StubEmulator:
            return "STUB_EMULATOR";
        case DeviceKind::Fastboot:
            return "FASTBOOT";
    }
    return "UNKNOWN";
}

bool parseKind(const std::string& name, DeviceKind& kind) {
    if (name == "PHYSICAL") {
        kind = DeviceKind::Physical;
        return true;
    }
    if (name == "EMULATOR") {
        kind = DeviceKind::Emulator;
        return true;
    }
    if (name == "NULL_DEVICE") {
        kind = DeviceKind::NullDevice;
        return true;
    }
    if (name == "TCP_DEVICE") {
        kind = DeviceKind::TcpDevice;
        return true;
    }
    if (name == "STUB_EMULATOR") {
        kind = DeviceKind::StubEmulator;
        return true;
    }
    if (name == "FASTBOOT") {
        kind = DeviceKind::Fastboot;
        return true;
    }
    return false;
}

std::string stateToString(DeviceState state) {
    switch (state) {
        case DeviceState::Free:
            return "FREE";
        case DeviceState::Allocated:
            return "ALLOCATED";
        case DeviceState::Unavailable:
            return "UNAVAILABLE";
        case DeviceState::Ignored:
            return "IGNORED";
    }
    return "UNKNOWN";
}

bool parseState(const std::string& name, DeviceState& state) {
    if (name == "FREE") {
        state = DeviceState::Free;
        return true;
    }
    if (name == "ALLOCATED") {
        state = DeviceState::Allocated;
        return true;
    }
    if (name == "UNAVAILABLE") {
        state = DeviceState::Unavailable;
        return true;
    }
    if (name == "IGNORED") {
        state = DeviceState::Ignored;
        return true;
    }
    return false;
}

std::string freeStateToString(FreeDeviceState state) {
    switch (state) {
        case FreeDeviceState::Available:
            return "AVAILABLE";
        case FreeDeviceState::Unavailable:
            return "UNAVAILABLE";
        case FreeDeviceState::Unresponsive:
            return "UNRESPONSIVE";
        case FreeDeviceState::Ignore:
            return "IGNORE";
    }
    return "UNKNOWN";
}

bool parseFreeState(const std::string& name, FreeDeviceState& state) {
    if (name == "AVAILABLE") {
        state = FreeDeviceState::Available;
        return true;
    }
    if (name == "UNAVAILABLE") {
        state = FreeDeviceState::Unavailable;
        return true;
    }
    if (name == "UNRESPONSIVE") {
        state = FreeDeviceState::Unresponsive;
        return true;
    }
    if (name == "IGNORE") {
        state = FreeDeviceState::Ignore;
        return true;
    }
    return false;
}

DeviceState poolStateFor(FreeDeviceState state) noexcept {
    switch (state) {
        case FreeDeviceState::Available:
            return DeviceState::Free;
        case FreeDeviceState::Unavailable:
        case FreeDeviceState::Unresponsive:
            return DeviceState::Unavailable;
        case FreeDeviceState::Ignore:
            return DeviceState::Ignored;
    }
    return DeviceState::Unavailable;
}

} // namespace device

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>

namespace device {

// Filter describing which devices a caller accepts. Empty sets and unset bounds are wildcards.
struct SelectionCriteria {
    std::set<std::string> serials;
    std::set<std::string> excludedSerials;
    std::set<std::string> productTypes;
    std::map<std::string, std::string> properties;

    std::optional<int> minSdk;
    std::optional<int> maxSdk;

    std::optional<int> minBattery;
    std::optional<int> maxBattery;
    // Degrees; device dumps report tenths of a degree.
    std::optional<int> minBatteryTemperature;
    std::optional<int> maxBatteryTemperature;

    std::optional<bool> requireBatteryCheck;
    std::optional<bool> requireBatteryTemperatureCheck;

    bool physicalRequested = false;
    bool emulatorRequested = false;
    bool nullDeviceRequested = false;
    bool tcpDeviceRequested = false;
    bool stubEmulatorRequested = false;

    bool hasBatteryBound() const noexcept { return minBattery.has_value() || maxBattery.has_value(); }
    bool hasTemperatureBound() const noexcept {
        return minBatteryTemperature.has_value() || maxBatteryTemperature.has_value();
    }
    bool hasSdkBound() const noexcept { return minSdk.has_value() || maxSdk.has_value(); }
    bool hasKindRequest() const noexcept {
        return physicalRequested || emulatorRequested || nullDeviceRequested || tcpDeviceRequested ||
               stubEmulatorRequested;
    }
};

} // namespace device

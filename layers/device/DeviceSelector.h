#pragma once

#include <functional>
#include <optional>
#include <set>
#include <string>

#include "DeviceRecord.h"
#include "SelectionCriteria.h"

namespace device {

using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment.
EnvironmentLookup processEnvironment();

class DeviceSelector {
public:
    static constexpr const char* kSerialVariable = "ANDROID_SERIAL";

    explicit DeviceSelector(EnvironmentLookup environment = processEnvironment());

    // Conjunctive match. Battery and temperature are fetched at most once per call and only
    // when a telemetry clause is reached. Probe failures make this record fail to match.
    bool matches(const DeviceRecord& record, const SelectionCriteria& criteria) const;

    // criteria.serials, or the serial named by ANDROID_SERIAL when the criteria carry none.
    std::set<std::string> effectiveSerials(const SelectionCriteria& criteria) const;

    static std::optional<std::string> productType(IDeviceProbe& probe);
    // Vendor variant key first, legacy key second.
    static std::optional<std::string> productVariant(IDeviceProbe& probe);
    // Tenths of a degree from a battery dump; empty for a missing or zero reading.
    static std::optional<int> parseBatteryTemperature(const std::string& dump);

private:
    static bool matchesKind(DeviceKind kind, const SelectionCriteria& criteria);
    bool matchesSerial(const std::string& serial, const SelectionCriteria& criteria) const;
    static bool matchesProductType(IDeviceProbe* probe, const SelectionCriteria& criteria);
    static bool matchesProperties(IDeviceProbe* probe, const SelectionCriteria& criteria);
    static bool matchesSdk(IDeviceProbe* probe, const SelectionCriteria& criteria);
    static bool matchesBattery(const DeviceRecord& record, const SelectionCriteria& criteria);
    static bool matchesBatteryTemperature(const DeviceRecord& record, const SelectionCriteria& criteria);

    EnvironmentLookup environment_;
};

} // namespace device

#include "DeviceSelector.h"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <sstream>
#include <utility>

namespace device {

namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

bool parseInt(const std::string& text, int& out) {
    const auto* begin = text.data();
    const auto* end = begin + text.size();
    const auto res = std::from_chars(begin, end, out);
    return res.ec == std::errc() && res.ptr == end && !text.empty();
}

std::optional<std::string> queryProperty(IDeviceProbe* probe, const std::string& name) {
    if (probe == nullptr) {
        return std::nullopt;
    }
    return probe->property(name);
}

bool withinBounds(int value, const std::optional<int>& min, const std::optional<int>& max) {
    if (min && value < *min) {
        return false;
    }
    if (max && value > *max) {
        return false;
    }
    return true;
}

bool withinBounds(std::int64_t value, const std::optional<std::int64_t>& min, const std::optional<std::int64_t>& max) {
    if (min && value < *min) {
        return false;
    }
    if (max && value > *max) {
        return false;
    }
    return true;
}

// Widened so that any int bound survives the scaling.
std::optional<std::int64_t> scaleToTenths(const std::optional<int>& degrees) {
    if (!degrees) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(*degrees) * 10;
}

std::optional<int> fetchBattery(const DeviceRecord& record) {
    if (!record.probe) {
        return std::nullopt;
    }
    try {
        return record.probe->battery();
    } catch (const std::exception& e) {
        spdlog::warn("Battery query failed for {}: {}", record.serial, e.what());
        return std::nullopt;
    }
}

std::optional<int> fetchBatteryTemperature(const DeviceRecord& record) {
    if (!record.probe) {
        return std::nullopt;
    }
    try {
        return DeviceSelector::parseBatteryTemperature(record.probe->batteryDump());
    } catch (const std::exception& e) {
        spdlog::warn("Battery dump failed for {}: {}", record.serial, e.what());
        return std::nullopt;
    }
}

} // namespace

EnvironmentLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

DeviceSelector::DeviceSelector(EnvironmentLookup environment)
    : environment_(std::move(environment)) {}

bool DeviceSelector::matches(const DeviceRecord& record, const SelectionCriteria& criteria) const {
    IDeviceProbe* probe = record.probe.get();

    if (!matchesKind(record.kind, criteria)) {
        return false;
    }
    if (!matchesSerial(record.serial, criteria)) {
        return false;
    }
    if (!matchesProductType(probe, criteria)) {
        spdlog::debug("{} rejected: product type", record.serial);
        return false;
    }
    if (!matchesProperties(probe, criteria)) {
        spdlog::debug("{} rejected: property mismatch", record.serial);
        return false;
    }
    if (!matchesSdk(probe, criteria)) {
        spdlog::debug("{} rejected: sdk level", record.serial);
        return false;
    }
    if (!matchesBattery(record, criteria)) {
        spdlog::debug("{} rejected: battery", record.serial);
        return false;
    }
    if (!matchesBatteryTemperature(record, criteria)) {
        spdlog::debug("{} rejected: battery temperature", record.serial);
        return false;
    }
    return true;
}

std::set<std::string> DeviceSelector::effectiveSerials(const SelectionCriteria& criteria) const {
    if (!criteria.serials.empty() || !environment_) {
        return criteria.serials;
    }
    const auto fromEnvironment = environment_(kSerialVariable);
    if (!fromEnvironment || fromEnvironment->empty()) {
        return {};
    }
    return {*fromEnvironment};
}

std::optional<std::string> DeviceSelector::productType(IDeviceProbe& probe) {
    return probe.property(properties::kBoard);
}

std::optional<std::string> DeviceSelector::productVariant(IDeviceProbe& probe) {
    auto variant = probe.property(properties::kVariant);
    if (variant) {
        return variant;
    }
    return probe.property(properties::kVariantLegacy);
}

std::optional<int> DeviceSelector::parseBatteryTemperature(const std::string& dump) {
    std::istringstream lines(dump);
    std::string line;
    while (std::getline(lines, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos || trim(line.substr(0, colon)) != "temperature") {
            continue;
        }
        int tenths = 0;
        if (!parseInt(trim(line.substr(colon + 1)), tenths) || tenths == 0) {
            return std::nullopt;
        }
        return tenths;
    }
    return std::nullopt;
}

bool DeviceSelector::matchesKind(DeviceKind kind, const SelectionCriteria& criteria) {
    if (criteria.physicalRequested) {
        return kind == DeviceKind::Physical;
    }
    if (criteria.emulatorRequested) {
        return kind == DeviceKind::Emulator;
    }
    if (criteria.nullDeviceRequested) {
        return kind == DeviceKind::NullDevice;
    }
    if (criteria.tcpDeviceRequested) {
        return kind == DeviceKind::TcpDevice;
    }
    if (criteria.stubEmulatorRequested) {
        return kind == DeviceKind::StubEmulator;
    }
    return !isVirtualKind(kind);
}

bool DeviceSelector::matchesSerial(const std::string& serial, const SelectionCriteria& criteria) const {
    const auto serials = effectiveSerials(criteria);
    if (!serials.empty() && serials.count(serial) == 0) {
        return false;
    }
    return criteria.excludedSerials.count(serial) == 0;
}

bool DeviceSelector::matchesProductType(IDeviceProbe* probe, const SelectionCriteria& criteria) {
    if (criteria.productTypes.empty()) {
        return true;
    }
    if (probe == nullptr) {
        return false;
    }

    const auto board = productType(*probe);
    if (board && criteria.productTypes.count(*board) != 0) {
        return true;
    }
    const auto variant = productVariant(*probe);
    return variant && criteria.productTypes.count(*variant) != 0;
}

bool DeviceSelector::matchesProperties(IDeviceProbe* probe, const SelectionCriteria& criteria) {
    for (const auto& [name, expected] : criteria.properties) {
        const auto actual = queryProperty(probe, name);
        if (!actual || *actual != expected) {
            return false;
        }
    }
    return true;
}

bool DeviceSelector::matchesSdk(IDeviceProbe* probe, const SelectionCriteria& criteria) {
    if (!criteria.hasSdkBound()) {
        return true;
    }
    const auto sdkText = queryProperty(probe, properties::kSdkVersion);
    int sdk = 0;
    if (!sdkText || !parseInt(trim(*sdkText), sdk)) {
        return false;
    }
    return withinBounds(sdk, criteria.minSdk, criteria.maxSdk);
}

bool DeviceSelector::matchesBattery(const DeviceRecord& record, const SelectionCriteria& criteria) {
    if (record.kind == DeviceKind::Fastboot) {
        return !criteria.hasBatteryBound();
    }
    if (record.kind != DeviceKind::Physical) {
        return true;
    }

    const bool required = criteria.requireBatteryCheck.value_or(criteria.hasBatteryBound());
    if (!required && !criteria.hasBatteryBound()) {
        return true;
    }

    const auto level = fetchBattery(record);
    if (!level) {
        return !required;
    }
    return withinBounds(*level, criteria.minBattery, criteria.maxBattery);
}

bool DeviceSelector::matchesBatteryTemperature(const DeviceRecord& record, const SelectionCriteria& criteria) {
    if (record.kind == DeviceKind::Fastboot) {
        return !criteria.hasTemperatureBound();
    }
    if (record.kind != DeviceKind::Physical) {
        return true;
    }

    const bool required = criteria.requireBatteryTemperatureCheck.value_or(criteria.hasTemperatureBound());
    if (!required && !criteria.hasTemperatureBound()) {
        return true;
    }

    const auto tenths = fetchBatteryTemperature(record);
    if (!tenths) {
        return !required;
    }
    return withinBounds(static_cast<std::int64_t>(*tenths), scaleToTenths(criteria.minBatteryTemperature),
                        scaleToTenths(criteria.maxBatteryTemperature));
}

} // namespace device

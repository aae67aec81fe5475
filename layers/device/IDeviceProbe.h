#pragma once
#include <optional>
#include <string>

namespace device {

// Live view of one device. Calls may block on the device link and may throw.
class IDeviceProbe
{
public:
    virtual ~IDeviceProbe() = default;

    virtual std::optional<std::string> property(const std::string& name) = 0;

    // Battery level in percent, empty when the device cannot report it.
    virtual std::optional<int> battery() = 0;

    // Raw battery service dump, "key: value" per line.
    virtual std::string batteryDump() = 0;
};

} // namespace device

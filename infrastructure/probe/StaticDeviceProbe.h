#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "layers/device/IDeviceProbe.h"

namespace probe {

// Probe answering from values set in memory. Backs virtual devices and tests.
class StaticDeviceProbe final : public device::IDeviceProbe
{
public:
    std::optional<std::string> property(const std::string& name) override;
    std::optional<int> battery() override;
    std::string batteryDump() override;

    void setProperty(const std::string& name, const std::string& value);
    void clearProperty(const std::string& name);
    void setBattery(std::optional<int> level);
    void setBatteryDump(std::string dump);
    // Makes every later query throw, as a dropped device link would.
    void setFailing(bool failing);

    int batteryQueries() const;
    int dumpQueries() const;

private:
    void throwIfFailing() const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> properties_;
    std::optional<int> battery_;
    std::string batteryDump_;
    bool failing_ = false;
    int batteryQueries_ = 0;
    int dumpQueries_ = 0;
};

} // namespace probe

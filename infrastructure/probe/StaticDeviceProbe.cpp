#include "StaticDeviceProbe.h"

#include <stdexcept>
#include <utility>

namespace probe {

std::optional<std::string> StaticDeviceProbe::property(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfFailing();
    auto it = properties_.find(name);
    if (it == properties_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int> StaticDeviceProbe::battery()
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++batteryQueries_;
    throwIfFailing();
    return battery_;
}

std::string StaticDeviceProbe::batteryDump()
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++dumpQueries_;
    throwIfFailing();
    return batteryDump_;
}

void StaticDeviceProbe::setProperty(const std::string& name, const std::string& value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    properties_[name] = value;
}

void StaticDeviceProbe::clearProperty(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    properties_.erase(name);
}

void StaticDeviceProbe::setBattery(std::optional<int> level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    battery_ = level;
}

void StaticDeviceProbe::setBatteryDump(std::string dump)
{
    std::lock_guard<std::mutex> lock(mutex_);
    batteryDump_ = std::move(dump);
}

void StaticDeviceProbe::setFailing(bool failing)
{
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ = failing;
}

int StaticDeviceProbe::batteryQueries() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return batteryQueries_;
}

int StaticDeviceProbe::dumpQueries() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return dumpQueries_;
}

void StaticDeviceProbe::throwIfFailing() const
{
    if (failing_) {
        throw std::runtime_error("device link lost");
    }
}

} // namespace probe

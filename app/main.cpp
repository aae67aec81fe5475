#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "infrastructure/probe/StaticDeviceProbe.h"
#include "layers/api/api_layer.h"
#include "layers/application/application_layer.h"

namespace {

struct DeviceOption {
    std::string serial;
    device::DeviceKind kind = device::DeviceKind::Physical;
};

struct StartupOptions {
    std::string bindAddress = "127.0.0.1";
    std::uint16_t port = 30103;
    std::uint16_t httpPort = 0;               // 0 disables the HTTP gateway
    std::uint64_t maxAllocateWaitMs = 30000;

    std::vector<DeviceOption> devices;
    std::size_t nullDevices = 0;
    std::size_t tcpDevices = 0;
    std::size_t stubEmulators = 0;

    std::string logLevel = "info";
    bool showHelp = false;
};

void printUsage() {
    std::cout
        << "Usage: device_broker [options]\n"
        << "Options:\n"
        << "  --bind <ip>                    Control socket bind address (default: 127.0.0.1)\n"
        << "  --port <port>                  Control socket port (default: 30103)\n"
        << "  --http-port <port>             HTTP JSON gateway port, 0 disables it (default: 0)\n"
        << "  --max-allocate-wait-ms <ms>    Upper bound for remote allocation waits (default: 30000)\n"
        << "\n"
        << "  Devices:\n"
        << "    --device <serial>[:<kind>]   Register a device, kind defaults to PHYSICAL (repeatable)\n"
        << "    --null-devices <n>           Register n null-device-<i> placeholders\n"
        << "    --tcp-devices <n>            Register n tcp-device-<i> placeholders\n"
        << "    --stub-emulators <n>         Register n emulator-<i> placeholders\n"
        << "\n"
        << "  Other:\n"
        << "    --log-level <level>          trace, debug, info, warn, error or off (default: info)\n"
        << "    --help                       Show this help\n";
}

template <typename UInt>
bool parseUnsigned(const std::string& text, UInt& out) {
    unsigned long long value = 0;
    const auto* begin = text.data();
    const auto* end = begin + text.size();
    const auto res = std::from_chars(begin, end, value);
    if (res.ec != std::errc() || res.ptr != end) {
        return false;
    }
    if (value > static_cast<unsigned long long>(std::numeric_limits<UInt>::max())) {
        return false;
    }
    out = static_cast<UInt>(value);
    return true;
}

bool parseDeviceOption(const std::string& text, DeviceOption& out) {
    const auto colon = text.find(':');
    out.serial = text.substr(0, colon);
    if (out.serial.empty()) {
        return false;
    }
    if (colon == std::string::npos) {
        out.kind = device::DeviceKind::Physical;
        return true;
    }
    return device::parseKind(text.substr(colon + 1), out.kind);
}

std::optional<StartupOptions> parseArgs(int argc, char* argv[], std::string& error) {
    StartupOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto getValue = [&](const std::string& key) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return std::nullopt;
            }
            ++i;
            return std::string(argv[i]);
        };

        if (arg == "--help") {
            options.showHelp = true;
            continue;
        }
        if (arg == "--bind") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.bindAddress = *value;
            continue;
        }
        if (arg == "--port" || arg == "--http-port") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            auto& target = arg == "--port" ? options.port : options.httpPort;
            if (!parseUnsigned(*value, target)) {
                error = "Invalid " + arg + " value: " + *value;
                return std::nullopt;
            }
            continue;
        }
        if (arg == "--max-allocate-wait-ms") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            if (!parseUnsigned(*value, options.maxAllocateWaitMs)) {
                error = "Invalid --max-allocate-wait-ms value: " + *value;
                return std::nullopt;
            }
            continue;
        }
        if (arg == "--device") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            DeviceOption deviceOption;
            if (!parseDeviceOption(*value, deviceOption)) {
                error = "Invalid --device value: " + *value;
                return std::nullopt;
            }
            options.devices.push_back(std::move(deviceOption));
            continue;
        }
        if (arg == "--null-devices" || arg == "--tcp-devices" || arg == "--stub-emulators") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            auto& target = arg == "--null-devices"  ? options.nullDevices
                           : arg == "--tcp-devices" ? options.tcpDevices
                                                    : options.stubEmulators;
            if (!parseUnsigned(*value, target)) {
                error = "Invalid " + arg + " value: " + *value;
                return std::nullopt;
            }
            continue;
        }
        if (arg == "--log-level") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.logLevel = *value;
            continue;
        }

        error = "Unknown argument: " + arg;
        return std::nullopt;
    }

    if (spdlog::level::from_str(options.logLevel) == spdlog::level::off && options.logLevel != "off") {
        error = "Unsupported --log-level: " + options.logLevel;
        return std::nullopt;
    }

    if (options.maxAllocateWaitMs >
        static_cast<std::uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max())) {
        error = "--max-allocate-wait-ms is out of range";
        return std::nullopt;
    }

    return options;
}

std::shared_ptr<device::IDeviceProbe> makeStaticProbe(const std::string&) {
    return std::make_shared<probe::StaticDeviceProbe>();
}

std::size_t registerDevices(application::ApplicationCore& appCore, const StartupOptions& options) {
    std::size_t registered = 0;
    for (const auto& deviceOption : options.devices) {
        const auto status = appCore.pool().registerDevice(deviceOption.serial, deviceOption.kind,
                                                          std::make_shared<probe::StaticDeviceProbe>());
        if (status != application::PoolStatus::Ok) {
            spdlog::warn("Skipping {}: {}", deviceOption.serial, application::poolStatusToString(status));
            continue;
        }
        ++registered;
    }

    registered += appCore.registerPlaceholders(device::DeviceKind::NullDevice, "null-device-", options.nullDevices,
                                           makeStaticProbe);
    registered += appCore.registerPlaceholders(device::DeviceKind::TcpDevice, "tcp-device-", options.tcpDevices,
                                           makeStaticProbe);
    registered += appCore.registerPlaceholders(device::DeviceKind::StubEmulator, "emulator-", options.stubEmulators,
                                           makeStaticProbe);
    return registered;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string parseError;
    const auto parsed = parseArgs(argc, argv, parseError);
    if (!parsed) {
        std::cerr << parseError << "\n\n";
        printUsage();
        return 2;
    }

    const auto options = *parsed;
    if (options.showHelp) {
        printUsage();
        return 0;
    }

    spdlog::set_level(spdlog::level::from_str(options.logLevel));

    application::ApplicationCore appCore;
    const auto registered = registerDevices(appCore, options);
    spdlog::info("Registered {} device(s)", registered);

    api::ServerOptions serverOptions;
    serverOptions.bindAddress = options.bindAddress;
    serverOptions.port = options.port;
    serverOptions.maxAllocateWait = std::chrono::milliseconds(options.maxAllocateWaitMs);

    api::RemoteServer server(appCore, serverOptions);
    std::optional<api::HttpJsonServer> gateway;
    try {
        server.start();
        if (options.httpPort != 0) {
            gateway.emplace(appCore, options.bindAddress, options.httpPort, serverOptions.maxAllocateWait);
            gateway->start();
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to start: {}", e.what());
        return 1;
    }

    server.wait();
    if (gateway) {
        gateway->stop();
    }
    appCore.pool().shutdown();
    spdlog::info("Device broker stopped");
    return 0;
}

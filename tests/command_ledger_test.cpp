#define BOOST_TEST_MODULE CommandLedger

#include <boost/test/unit_test.hpp>

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

#include "infrastructure/probe/StaticDeviceProbe.h"
#include "layers/application/application_layer.h"

using application::ApplicationCore;
using application::CommandLedger;
using application::CommandResult;
using application::CommandStatus;
using application::PoolStatus;

namespace application
{
  std::ostream&
  operator <<(std::ostream& out, PoolStatus status)
  {
    return out << poolStatusToString(status);
  }

  std::ostream&
  operator <<(std::ostream& out, CommandStatus status)
  {
    return out << commandStatusToString(status);
  }
}

static
device::EnvironmentLookup
no_environment()
{
  return [](const std::string&) { return std::optional<std::string>(); };
}

static
std::shared_ptr<device::IDeviceProbe>
static_probe(const std::string&)
{
  return std::make_shared<probe::StaticDeviceProbe>();
}

BOOST_AUTO_TEST_CASE(unknown_serial_is_not_allocated)
{
  CommandLedger ledger;
  auto result = ledger.lastResult("never-seen");
  BOOST_CHECK_EQUAL(result.status, CommandStatus::NotAllocated);
  BOOST_CHECK(!result.errorDetail);
  BOOST_CHECK(!result.freeDeviceState);
  BOOST_CHECK_EQUAL(ledger.size(), 0u);
}

BOOST_AUTO_TEST_CASE(latest_result_wins)
{
  CommandLedger ledger;
  CommandResult failed;
  failed.status = CommandStatus::InvocationFailed;
  failed.errorDetail = "boom";
  failed.freeDeviceState = device::FreeDeviceState::Unresponsive;
  ledger.record("serial1", failed);
  BOOST_CHECK(ledger.lastResult("serial1") == failed);

  CommandResult success;
  success.status = CommandStatus::InvocationSuccess;
  ledger.record("serial1", success);
  BOOST_CHECK(ledger.lastResult("serial1") == success);
  BOOST_CHECK(!ledger.lastResult("serial1").errorDetail);
  BOOST_CHECK_EQUAL(ledger.size(), 1u);
}

BOOST_AUTO_TEST_CASE(serials_are_independent)
{
  CommandLedger ledger;
  CommandResult executing;
  executing.status = CommandStatus::Executing;
  ledger.record("serial1", executing);
  BOOST_CHECK_EQUAL(ledger.lastResult("serial1").status, CommandStatus::Executing);
  BOOST_CHECK_EQUAL(ledger.lastResult("serial2").status, CommandStatus::NotAllocated);
}

BOOST_AUTO_TEST_CASE(concurrent_records)
{
  CommandLedger ledger;
  std::vector<std::thread> writers;
  for (int i = 0; i < 16; ++i)
    writers.emplace_back([&ledger, i] {
        CommandResult result;
        result.status = CommandStatus::InvocationSuccess;
        for (int n = 0; n < 100; ++n)
          ledger.record("serial" + std::to_string(i), result);
      });
  for (auto& writer: writers)
    writer.join();
  BOOST_CHECK_EQUAL(ledger.size(), 16u);
}

BOOST_AUTO_TEST_CASE(status_names)
{
  for (auto status: {CommandStatus::NoActiveCommand, CommandStatus::NotAllocated,
                     CommandStatus::Executing, CommandStatus::InvocationFailed,
                     CommandStatus::InvocationSuccess})
  {
    CommandStatus parsed = CommandStatus::NoActiveCommand;
    BOOST_CHECK(application::parseCommandStatus(application::commandStatusToString(status), parsed));
    BOOST_CHECK_EQUAL(parsed, status);
  }
  CommandStatus parsed = CommandStatus::NoActiveCommand;
  BOOST_CHECK(!application::parseCommandStatus("FINISHED", parsed));
  BOOST_CHECK_EQUAL(application::commandStatusToString(CommandStatus::InvocationFailed), "INVOCATION_FAILED");
}

BOOST_AUTO_TEST_CASE(command_lifecycle)
{
  ApplicationCore core(no_environment());
  BOOST_CHECK_EQUAL(core.registerPlaceholders(device::DeviceKind::NullDevice, "null-device-", 2, static_probe), 2u);

  device::SelectionCriteria criteria;
  criteria.nullDeviceRequested = true;
  auto allocated = core.pool().allocate(criteria);
  BOOST_REQUIRE(allocated);
  BOOST_CHECK_EQUAL(allocated->serial, "null-device-0");

  core.beginCommand(allocated->serial);
  BOOST_CHECK_EQUAL(core.ledger().lastResult(allocated->serial).status, CommandStatus::Executing);

  CommandResult failed;
  failed.status = CommandStatus::InvocationFailed;
  failed.errorDetail = "boom";
  failed.freeDeviceState = device::FreeDeviceState::Unavailable;
  BOOST_CHECK_EQUAL(core.completeCommand(allocated->serial, failed), PoolStatus::Ok);

  BOOST_CHECK(core.ledger().lastResult(allocated->serial) == failed);
  auto record = core.pool().find(allocated->serial);
  BOOST_REQUIRE(record);
  BOOST_CHECK(record->state == device::DeviceState::Unavailable);
}

BOOST_AUTO_TEST_CASE(completion_without_allocation_still_records)
{
  ApplicationCore core(no_environment());
  BOOST_CHECK_EQUAL(core.registerPlaceholders(device::DeviceKind::TcpDevice, "tcp-device-", 1, static_probe), 1u);
  CommandResult success;
  success.status = CommandStatus::InvocationSuccess;
  BOOST_CHECK_EQUAL(core.completeCommand("tcp-device-0", success), PoolStatus::NotAllocated);
  BOOST_CHECK(core.ledger().lastResult("tcp-device-0") == success);
}

BOOST_AUTO_TEST_CASE(duplicate_placeholders_are_skipped)
{
  ApplicationCore core(no_environment());
  BOOST_CHECK_EQUAL(core.registerPlaceholders(device::DeviceKind::StubEmulator, "emulator-", 2, static_probe), 2u);
  BOOST_CHECK_EQUAL(core.registerPlaceholders(device::DeviceKind::StubEmulator, "emulator-", 3, static_probe), 1u);
  BOOST_CHECK_EQUAL(core.pool().snapshot().size(), 3u);
}

BOOST_AUTO_TEST_CASE(placeholders_use_supplied_factory)
{
  ApplicationCore core(no_environment());
  std::vector<std::string> built;
  auto factory = [&built](const std::string& serial) {
    built.push_back(serial);
    auto probe = std::make_shared<probe::StaticDeviceProbe>();
    probe->setProperty(device::properties::kBoard, serial == "emulator-1" ? "walleye" : "sailfish");
    return probe;
  };
  BOOST_CHECK_EQUAL(core.registerPlaceholders(device::DeviceKind::StubEmulator, "emulator-", 2, factory), 2u);
  BOOST_REQUIRE_EQUAL(built.size(), 2u);
  BOOST_CHECK_EQUAL(built[0], "emulator-0");
  BOOST_CHECK_EQUAL(built[1], "emulator-1");

  device::SelectionCriteria criteria;
  criteria.stubEmulatorRequested = true;
  criteria.productTypes = {"walleye"};
  auto allocated = core.pool().allocate(criteria);
  BOOST_REQUIRE(allocated);
  BOOST_CHECK_EQUAL(allocated->serial, "emulator-1");
}

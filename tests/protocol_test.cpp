#define BOOST_TEST_MODULE Protocol

#include <boost/json.hpp>
#include <boost/test/unit_test.hpp>

#include <limits>
#include <string>

#include "layers/protocol/protocol_layer.h"

using protocol::OperationType;
using protocol::ProtocolCodec;

namespace json = boost::json;

static
json::object
parse_object(std::string const& line)
{
  auto value = json::parse(line);
  BOOST_REQUIRE(value.is_object());
  return value.as_object();
}

BOOST_AUTO_TEST_CASE(lines_are_newline_terminated)
{
  ProtocolCodec codec;
  auto line = codec.encodeRequest(protocol::ListDevicesRequest{});
  BOOST_REQUIRE(!line.empty());
  BOOST_CHECK_EQUAL(line.back(), '\n');
  BOOST_CHECK_EQUAL(line.find('\n'), line.size() - 1);
  BOOST_CHECK(parse_object(line).at("type").as_string() == "ListDevices");
}

BOOST_AUTO_TEST_CASE(last_command_result_round_trip)
{
  ProtocolCodec codec;
  application::CommandResult result;
  result.status = application::CommandStatus::InvocationFailed;
  result.errorDetail = "boom";
  result.freeDeviceState = device::FreeDeviceState::Unresponsive;

  auto line = codec.encodeResponse(protocol::GetLastCommandResultResponse{result});
  auto obj = parse_object(line);
  BOOST_CHECK(obj.at("status").as_string() == "INVOCATION_FAILED");
  BOOST_CHECK(obj.at("error").as_string() == "boom");
  BOOST_CHECK(obj.at("free_device_state").as_string() == "UNRESPONSIVE");

  protocol::Response decoded;
  std::string error;
  BOOST_REQUIRE(codec.decodeResponse(OperationType::GetLastCommandResult, line, decoded, error));
  auto const* typed = std::get_if<protocol::GetLastCommandResultResponse>(&decoded);
  BOOST_REQUIRE(typed);
  BOOST_CHECK(typed->result == result);
}

BOOST_AUTO_TEST_CASE(absent_optionals_are_omitted)
{
  ProtocolCodec codec;
  application::CommandResult result;
  result.status = application::CommandStatus::InvocationSuccess;
  auto obj = parse_object(codec.encodeResponse(protocol::GetLastCommandResultResponse{result}));
  BOOST_CHECK(!obj.contains("error"));
  BOOST_CHECK(!obj.contains("free_device_state"));

  auto allocate = parse_object(codec.encodeRequest(protocol::AllocateDeviceRequest{}));
  BOOST_CHECK_EQUAL(allocate.size(), 1u);
}

BOOST_AUTO_TEST_CASE(unknown_status_is_rejected)
{
  ProtocolCodec codec;
  protocol::Response decoded;
  std::string error;
  BOOST_CHECK(!codec.decodeResponse(OperationType::GetLastCommandResult,
                                    R"({"type":"GetLastCommandResult","status":"FINISHED"})", decoded, error));
  BOOST_CHECK_EQUAL(error, "unrecognized status 'FINISHED'");
}

BOOST_AUTO_TEST_CASE(unknown_request_type_is_rejected)
{
  ProtocolCodec codec;
  protocol::Request decoded;
  std::string error;
  BOOST_CHECK(!codec.decodeRequest(R"({"type":"RebootDevice","serial":"s"})", decoded, error));
  BOOST_CHECK_EQUAL(error, "Unknown operation type 'RebootDevice'");
  BOOST_CHECK(!codec.decodeRequest(R"({"type":"Error","message":"m"})", decoded, error));
}

BOOST_AUTO_TEST_CASE(malformed_input_is_rejected)
{
  ProtocolCodec codec;
  protocol::Request decoded;
  std::string error;
  BOOST_CHECK(!codec.decodeRequest("not json", decoded, error));
  BOOST_CHECK(!error.empty());
  BOOST_CHECK(!codec.decodeRequest("[1, 2]", decoded, error));
  BOOST_CHECK(!codec.decodeRequest(R"({"serial":"s"})", decoded, error));
  BOOST_CHECK(!codec.decodeRequest(R"({"type":"FreeDevice"})", decoded, error));
  BOOST_CHECK_EQUAL(error, "Missing required field: serial");
  BOOST_CHECK(!codec.decodeRequest(R"({"type":"AllocateDevice","min_battery":"high"})", decoded, error));
  BOOST_CHECK(!codec.decodeRequest(R"({"type":"AllocateDevice","timeout_ms":-5})", decoded, error));
  BOOST_CHECK(!codec.decodeRequest(R"({"type":"FreeDevice","serial":"s","free_device_state":"GONE"})",
                                   decoded, error));
}

BOOST_AUTO_TEST_CASE(oversized_line_is_rejected)
{
  ProtocolCodec codec;
  protocol::Request decoded;
  std::string error;
  std::string line = R"({"type":"ListDevices","pad":")" + std::string(ProtocolCodec::kMaxLineLength, 'x') + "\"}";
  BOOST_CHECK(!codec.decodeRequest(line, decoded, error));
}

BOOST_AUTO_TEST_CASE(criteria_round_trip)
{
  ProtocolCodec codec;
  protocol::AllocateDeviceRequest request;
  request.criteria.serials = {"serial1", "serial2"};
  request.criteria.excludedSerials = {"serial3"};
  request.criteria.productTypes = {"board1"};
  request.criteria.properties = {{"ro.debuggable", "1"}};
  request.criteria.minSdk = 21;
  request.criteria.maxBattery = 90;
  request.criteria.minBatteryTemperature = 10;
  request.criteria.requireBatteryCheck = false;
  request.criteria.stubEmulatorRequested = true;
  request.timeout = std::chrono::milliseconds(1500);

  auto line = codec.encodeRequest(request);
  auto obj = parse_object(line);
  BOOST_CHECK_EQUAL(obj.at("timeout_ms").as_int64(), 1500);
  BOOST_CHECK(obj.at("stub_emulator").as_bool());
  BOOST_CHECK(!obj.contains("physical"));

  protocol::Request decoded;
  std::string error;
  BOOST_REQUIRE(codec.decodeRequest(line, decoded, error));
  auto const* typed = std::get_if<protocol::AllocateDeviceRequest>(&decoded);
  BOOST_REQUIRE(typed);
  BOOST_CHECK(typed->criteria.serials == request.criteria.serials);
  BOOST_CHECK(typed->criteria.excludedSerials == request.criteria.excludedSerials);
  BOOST_CHECK(typed->criteria.productTypes == request.criteria.productTypes);
  BOOST_CHECK(typed->criteria.properties == request.criteria.properties);
  BOOST_CHECK(typed->criteria.minSdk == 21);
  BOOST_CHECK(!typed->criteria.maxSdk);
  BOOST_CHECK(typed->criteria.maxBattery == 90);
  BOOST_CHECK(typed->criteria.minBatteryTemperature == 10);
  BOOST_CHECK(typed->criteria.requireBatteryCheck == false);
  BOOST_CHECK(!typed->criteria.requireBatteryTemperatureCheck);
  BOOST_CHECK(typed->criteria.stubEmulatorRequested);
  BOOST_CHECK(!typed->criteria.physicalRequested);
  BOOST_CHECK(typed->timeout == std::chrono::milliseconds(1500));
}

BOOST_AUTO_TEST_CASE(error_response_decodes_for_any_operation)
{
  ProtocolCodec codec;
  auto line = codec.encodeResponse(protocol::ErrorResponse{"bad things"});
  protocol::Response decoded;
  std::string error;
  BOOST_REQUIRE(codec.decodeResponse(OperationType::AllocateDevice, line, decoded, error));
  auto const* typed = std::get_if<protocol::ErrorResponse>(&decoded);
  BOOST_REQUIRE(typed);
  BOOST_CHECK_EQUAL(typed->message, "bad things");
}

BOOST_AUTO_TEST_CASE(mismatched_response_type)
{
  ProtocolCodec codec;
  auto line = codec.encodeResponse(protocol::CloseResponse{});
  protocol::Response decoded;
  std::string error;
  BOOST_CHECK(!codec.decodeResponse(OperationType::ListDevices, line, decoded, error));
  BOOST_CHECK_EQUAL(error, "Expected ListDevices response, got Close");
}

BOOST_AUTO_TEST_CASE(device_list_and_pool_status)
{
  ProtocolCodec codec;
  protocol::ListDevicesResponse list;
  protocol::DeviceSummary summary;
  summary.serial = "serial1";
  summary.kind = device::DeviceKind::TcpDevice;
  summary.state = device::DeviceState::Unavailable;
  summary.reason = "usb reset";
  list.devices.push_back(summary);

  protocol::Response decoded;
  std::string error;
  BOOST_REQUIRE(codec.decodeResponse(OperationType::ListDevices, codec.encodeResponse(list), decoded, error));
  auto const& devices = std::get<protocol::ListDevicesResponse>(decoded).devices;
  BOOST_REQUIRE_EQUAL(devices.size(), 1u);
  BOOST_CHECK_EQUAL(devices[0].serial, "serial1");
  BOOST_CHECK(devices[0].kind == device::DeviceKind::TcpDevice);
  BOOST_CHECK(devices[0].state == device::DeviceState::Unavailable);
  BOOST_CHECK_EQUAL(devices[0].reason, "usb reset");

  protocol::PoolStatusResponse status{OperationType::MarkIgnored, application::PoolStatus::UnknownDevice};
  auto obj = parse_object(codec.encodeResponse(status));
  BOOST_CHECK(obj.at("type").as_string() == "MarkIgnored");
  BOOST_CHECK(obj.at("result").as_string() == "UNKNOWN_DEVICE");
}

BOOST_AUTO_TEST_CASE(allocation_miss)
{
  ProtocolCodec codec;
  auto line = codec.encodeResponse(protocol::AllocateDeviceResponse{});
  auto obj = parse_object(line);
  BOOST_CHECK(!obj.at("allocated").as_bool());
  BOOST_CHECK(!obj.contains("serial"));

  protocol::Response decoded;
  std::string error;
  BOOST_REQUIRE(codec.decodeResponse(OperationType::AllocateDevice, line, decoded, error));
  BOOST_CHECK(!std::get<protocol::AllocateDeviceResponse>(decoded).device);
}

BOOST_AUTO_TEST_CASE(extreme_temperature_bounds_decode)
{
  ProtocolCodec codec;
  protocol::Request decoded;
  std::string error;
  BOOST_REQUIRE(codec.decodeRequest(
    R"({"type":"AllocateDevice","max_battery_temperature":2147483647,"min_battery_temperature":-2147483648})",
    decoded, error));
  auto const& criteria = std::get<protocol::AllocateDeviceRequest>(decoded).criteria;
  BOOST_CHECK(criteria.maxBatteryTemperature == std::numeric_limits<int>::max());
  BOOST_CHECK(criteria.minBatteryTemperature == std::numeric_limits<int>::min());

  BOOST_CHECK(!codec.decodeRequest(R"({"type":"AllocateDevice","max_battery_temperature":2147483648})",
                                   decoded, error));
  BOOST_CHECK_EQUAL(error, "max_battery_temperature out of range");
}

BOOST_AUTO_TEST_CASE(unknown_free_state_in_result_is_rejected)
{
  ProtocolCodec codec;
  protocol::Response decoded;
  std::string error;
  BOOST_CHECK(!codec.decodeResponse(
    OperationType::GetLastCommandResult,
    R"({"type":"GetLastCommandResult","status":"INVOCATION_FAILED","free_device_state":"MELTED"})",
    decoded, error));
  BOOST_CHECK_EQUAL(error, "unrecognized state 'MELTED'");
}

BOOST_AUTO_TEST_CASE(unknown_device_entry_values_are_rejected)
{
  ProtocolCodec codec;
  protocol::Response decoded;
  std::string error;
  BOOST_CHECK(!codec.decodeResponse(
    OperationType::ListDevices,
    R"({"type":"ListDevices","devices":[{"serial":"s","kind":"TOASTER","state":"FREE"}]})",
    decoded, error));
  BOOST_CHECK_EQUAL(error, "unrecognized kind 'TOASTER'");

  BOOST_CHECK(!codec.decodeResponse(
    OperationType::ListDevices,
    R"({"type":"ListDevices","devices":[{"serial":"s","kind":"PHYSICAL","state":"BUSY"}]})",
    decoded, error));
  BOOST_CHECK_EQUAL(error, "unrecognized state 'BUSY'");

  BOOST_CHECK(!codec.decodeResponse(
    OperationType::AllocateDevice,
    R"({"type":"AllocateDevice","allocated":true,"serial":"s","kind":"TOASTER"})",
    decoded, error));
  BOOST_CHECK_EQUAL(error, "unrecognized kind 'TOASTER'");
}

#define BOOST_TEST_MODULE HttpGateway

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "infrastructure/probe/StaticDeviceProbe.h"
#include "layers/api/api_layer.h"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
using tcp = boost::asio::ip::tcp;

using namespace std::chrono_literals;

struct Reply
{
  unsigned status;
  json::object body;
};

static
Reply
post(std::uint16_t port, std::string const& body, http::verb verb = http::verb::post)
{
  boost::asio::io_context context;
  tcp::socket socket(context);
  socket.connect({boost::asio::ip::make_address("127.0.0.1"), port});

  http::request<http::string_body> request{verb, "/", 11};
  request.set(http::field::host, "127.0.0.1");
  request.set(http::field::content_type, "application/json");
  request.body() = body;
  request.prepare_payload();
  http::write(socket, request);

  beast::flat_buffer buffer;
  http::response<http::string_body> response;
  http::read(socket, buffer, response);

  auto value = json::parse(response.body());
  BOOST_REQUIRE(value.is_object());
  return Reply{response.result_int(), value.as_object()};
}

static
std::shared_ptr<device::IDeviceProbe>
static_probe(const std::string&)
{
  return std::make_shared<probe::StaticDeviceProbe>();
}

struct Fixture
{
  Fixture()
    : core([](const std::string&) { return std::optional<std::string>(); })
    , gateway(core, "127.0.0.1", 0, 1s)
  {
    BOOST_REQUIRE_EQUAL(core.registerPlaceholders(device::DeviceKind::TcpDevice, "tcp-device-", 2, static_probe), 2u);
    gateway.start();
    BOOST_REQUIRE_NE(gateway.port(), 0);
  }

  application::ApplicationCore core;
  api::HttpJsonServer gateway;
};

BOOST_FIXTURE_TEST_CASE(allocate_over_http, Fixture)
{
  auto reply = post(gateway.port(), R"({"type":"AllocateDevice","tcp_device":true})");
  BOOST_CHECK_EQUAL(reply.status, 200u);
  BOOST_CHECK(reply.body.at("type").as_string() == "AllocateDevice");
  BOOST_CHECK(reply.body.at("allocated").as_bool());
  BOOST_CHECK(reply.body.at("serial").as_string() == "tcp-device-0");

  auto freed = post(gateway.port(), R"({"type":"FreeDevice","serial":"tcp-device-0"})");
  BOOST_CHECK(freed.body.at("result").as_string() == "OK");
}

BOOST_FIXTURE_TEST_CASE(list_over_http, Fixture)
{
  auto reply = post(gateway.port(), R"({"type":"ListDevices"})");
  BOOST_CHECK_EQUAL(reply.status, 200u);
  BOOST_CHECK_EQUAL(reply.body.at("devices").as_array().size(), 2u);
}

BOOST_FIXTURE_TEST_CASE(bad_requests, Fixture)
{
  auto malformed = post(gateway.port(), "{not json");
  BOOST_CHECK_EQUAL(malformed.status, 400u);
  BOOST_CHECK(malformed.body.at("type").as_string() == "Error");

  auto unknown = post(gateway.port(), R"({"type":"RebootDevice"})");
  BOOST_CHECK_EQUAL(unknown.status, 400u);

  auto close = post(gateway.port(), R"({"type":"Close"})");
  BOOST_CHECK_EQUAL(close.status, 400u);

  auto get = post(gateway.port(), "", http::verb::get);
  BOOST_CHECK_EQUAL(get.status, 405u);
}

static
std::optional<std::string>
no_environment(const std::string&)
{
  return std::nullopt;
}

BOOST_AUTO_TEST_CASE(idle_client_does_not_stall_gateway)
{
  application::ApplicationCore core(no_environment);
  BOOST_REQUIRE_EQUAL(core.registerPlaceholders(device::DeviceKind::TcpDevice, "tcp-device-", 1, static_probe), 1u);
  api::HttpJsonServer gateway(core, "127.0.0.1", 0, 1s, 200ms);
  gateway.start();

  boost::asio::io_context context;
  tcp::socket idle(context);
  idle.connect({boost::asio::ip::make_address("127.0.0.1"), gateway.port()});

  auto const start = std::chrono::steady_clock::now();
  auto reply = post(gateway.port(), R"({"type":"ListDevices"})");
  BOOST_CHECK_EQUAL(reply.status, 200u);
  BOOST_CHECK_EQUAL(reply.body.at("devices").as_array().size(), 1u);
  BOOST_CHECK(std::chrono::steady_clock::now() - start < 5s);

  // The idle connection was dropped by the server.
  char byte;
  boost::system::error_code ec;
  idle.read_some(boost::asio::buffer(&byte, 1), ec);
  BOOST_CHECK(ec);
}

BOOST_AUTO_TEST_CASE(stop_aborts_idle_session)
{
  application::ApplicationCore core(no_environment);
  api::HttpJsonServer gateway(core, "127.0.0.1", 0, 1s, 60s);
  gateway.start();

  boost::asio::io_context context;
  tcp::socket idle(context);
  idle.connect({boost::asio::ip::make_address("127.0.0.1"), gateway.port()});
  std::this_thread::sleep_for(50ms);

  auto const start = std::chrono::steady_clock::now();
  gateway.stop();
  BOOST_CHECK(std::chrono::steady_clock::now() - start < 5s);
}

#include "transport_layer.h"

#include <istream>
#include <stdexcept>
#include <utility>

namespace transport {

LineChannel::LineChannel(tcp::socket socket, std::size_t maxLineLength)
    : socket_(std::move(socket)), buffer_(maxLineLength) {}

bool LineChannel::readLine(std::string& line, boost::system::error_code& ec) {
    boost::asio::read_until(socket_, buffer_, '\n', ec);
    if (ec) {
        return false;
    }

    std::istream stream(&buffer_);
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool LineChannel::writeLine(const std::string& line, boost::system::error_code& ec) {
    boost::asio::write(socket_, boost::asio::buffer(line), ec);
    return !ec;
}

void LineChannel::shutdown() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (closed_) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
}

void LineChannel::close() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

bool LineChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return closed_;
}

std::string LineChannel::peer() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (closed_) {
        return "closed";
    }
    boost::system::error_code ec;
    const auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

RemoteClient::RemoteClient() = default;

RemoteClient::~RemoteClient() {
    disconnect();
}

void RemoteClient::connect(const std::string& host, std::uint16_t port) {
    disconnect();

    tcp::socket socket(ioContext_);
    socket.connect({boost::asio::ip::make_address(host), port});
    channel_ = std::make_unique<LineChannel>(std::move(socket), protocol::ProtocolCodec::kMaxLineLength);
}

void RemoteClient::disconnect() {
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
}

template <typename T>
T RemoteClient::expect(const protocol::Response& response) {
    if (const auto* rejected = std::get_if<protocol::ErrorResponse>(&response)) {
        throw std::runtime_error("Server rejected request: " + rejected->message);
    }
    return std::get<T>(response);
}

protocol::Response RemoteClient::send(const protocol::Request& request) {
    writeLine(codec_.encodeRequest(request));

    const auto line = readLine();
    if (!line) {
        throw std::runtime_error("Connection closed before a response arrived");
    }

    protocol::Response response;
    std::string error;
    if (!codec_.decodeResponse(protocol::operationOf(request), *line, response, error)) {
        throw std::runtime_error("Invalid response: " + error);
    }
    return response;
}

std::optional<protocol::DeviceSummary> RemoteClient::allocateDevice(const device::SelectionCriteria& criteria,
                                                                    std::chrono::milliseconds timeout) {
    protocol::AllocateDeviceRequest request;
    request.criteria = criteria;
    request.timeout = timeout;
    return expect<protocol::AllocateDeviceResponse>(send(request)).device;
}

application::PoolStatus RemoteClient::freeDevice(const std::string& serial, device::FreeDeviceState state) {
    return expect<protocol::PoolStatusResponse>(send(protocol::FreeDeviceRequest{serial, state})).status;
}

application::CommandResult RemoteClient::lastCommandResult(const std::string& serial) {
    return expect<protocol::GetLastCommandResultResponse>(send(protocol::GetLastCommandResultRequest{serial})).result;
}

std::vector<protocol::DeviceSummary> RemoteClient::listDevices() {
    return expect<protocol::ListDevicesResponse>(send(protocol::ListDevicesRequest{})).devices;
}

void RemoteClient::closeServer() {
    expect<protocol::CloseResponse>(send(protocol::CloseRequest{}));
}

void RemoteClient::writeLine(const std::string& line) {
    if (!channel_) {
        throw std::runtime_error("Not connected");
    }
    boost::system::error_code ec;
    if (!channel_->writeLine(line, ec)) {
        throw std::runtime_error("Write failed: " + ec.message());
    }
}

std::optional<std::string> RemoteClient::readLine() {
    if (!channel_) {
        throw std::runtime_error("Not connected");
    }
    std::string line;
    boost::system::error_code ec;
    if (!channel_->readLine(line, ec)) {
        if (ec == boost::asio::error::eof) {
            return std::nullopt;
        }
        throw std::runtime_error("Read failed: " + ec.message());
    }
    return line;
}

} // namespace transport

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "layers/protocol/protocol_layer.h"

namespace transport {

using boost::asio::ip::tcp;

// Blocking newline-framed stream over a connected socket.
class LineChannel {
public:
    LineChannel(tcp::socket socket, std::size_t maxLineLength);

    LineChannel(const LineChannel&) = delete;
    LineChannel& operator=(const LineChannel&) = delete;

    // Returns false on EOF, I/O error or a line longer than the limit (ec is not_found then).
    bool readLine(std::string& line, boost::system::error_code& ec);
    bool writeLine(const std::string& line, boost::system::error_code& ec);

    // Wakes a reader blocked on another thread. shutdown() and close() may race each other safely;
    // both are no-ops once the channel is closed.
    void shutdown();
    void close();
    bool isClosed() const;

    std::string peer() const;

private:
    tcp::socket socket_;
    boost::asio::streambuf buffer_;
    mutable std::mutex stateMutex_;
    bool closed_ = false;
};

class RemoteClient {
public:
    RemoteClient();
    ~RemoteClient();

    RemoteClient(const RemoteClient&) = delete;
    RemoteClient& operator=(const RemoteClient&) = delete;

    // Throws boost::system::system_error when the server cannot be reached.
    void connect(const std::string& host, std::uint16_t port);
    void disconnect();
    bool isConnected() const noexcept { return channel_ != nullptr; }

    // Throws std::runtime_error on I/O failure or an undecodable reply.
    protocol::Response send(const protocol::Request& request);

    std::optional<protocol::DeviceSummary> allocateDevice(const device::SelectionCriteria& criteria,
                                                          std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
    application::PoolStatus freeDevice(const std::string& serial,
                                       device::FreeDeviceState state = device::FreeDeviceState::Available);
    application::CommandResult lastCommandResult(const std::string& serial);
    std::vector<protocol::DeviceSummary> listDevices();
    // Asks the server to stop accepting connections.
    void closeServer();

    // Raw line access for tooling and tests.
    void writeLine(const std::string& line);
    std::optional<std::string> readLine();

private:
    template <typename T>
    T expect(const protocol::Response& response);

    boost::asio::io_context ioContext_;
    std::unique_ptr<LineChannel> channel_;
    protocol::ProtocolCodec codec_;
};

} // namespace transport
